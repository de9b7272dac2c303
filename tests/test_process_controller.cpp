#include <catch2/catch.hpp>
#include "fakes.hpp"

using namespace instman;
using namespace instman::test;

TEST_CASE("start launches a stopped instance with its user data dir", "[controller]") {
    TestWorld world;
    const Instance instance = world.registry.create("A", world.temp.sub("a"), {"--verbose"});

    CHECK(world.controller.start(instance.id));

    REQUIRE(world.launcher.calls.size() == 1);
    CHECK(world.launcher.calls[0].first == kAppName);
    const std::vector<std::string> expected{"--user-data-dir=" + instance.user_data_dir, "--verbose"};
    CHECK(world.launcher.calls[0].second == expected);

    CHECK(world.controller.status(instance.id));
    CHECK(world.registry.get(instance.id).last_launch_args == expected);
}

TEST_CASE("start on a running instance is a no-op", "[controller]") {
    TestWorld world;
    const Instance instance = world.create("A");
    world.run(instance, 500);

    CHECK_FALSE(world.controller.start(instance.id));
    CHECK(world.launcher.calls.empty());
}

TEST_CASE("The default instance launches without a user data dir", "[controller]") {
    TestWorld world;
    const Instance def = world.registry.ensure_default();

    CHECK(world.controller.start(def.id));
    REQUIRE(world.launcher.calls.size() == 1);
    CHECK(world.launcher.calls[0].second.empty());
}

TEST_CASE("A failed launch is an external process error", "[controller]") {
    TestWorld world;
    const Instance instance = world.create("A");
    world.launcher.fail = true;

    CHECK_THROWS_AS(world.controller.start(instance.id), ExternalProcessError);
    CHECK_FALSE(world.registry.get(instance.id).last_launch_args);
    CHECK_FALSE(world.controller.status(instance.id));
}

TEST_CASE("Running state is matched by user data dir", "[controller]") {
    TestWorld world;
    const Instance def = world.registry.ensure_default();
    const Instance a = world.create("A");
    const Instance b = world.create("B");

    SECTION("process without a dir belongs to the default instance") {
        world.query.add_app(100, 1, {});
        CHECK(world.controller.status(def.id));
        CHECK_FALSE(world.controller.status(a.id));
    }

    SECTION("process with a dir belongs to its instance only") {
        world.run(a, 100);
        CHECK(world.controller.status(a.id));
        CHECK_FALSE(world.controller.status(b.id));
        CHECK_FALSE(world.controller.status(def.id));
    }

    SECTION("other programs do not count") {
        ProcessInfo other;
        other.pid = 100;
        other.parent_pid = 1;
        other.name = "editor";
        other.args = {"editor"};
        world.query.add(other);
        CHECK_FALSE(world.controller.status(def.id));
    }

    SECTION("running_instances scans once for all") {
        world.run(a, 100);
        world.run(b, 200);
        const auto running = world.controller.running_instances();
        REQUIRE(running.size() == 2);
        CHECK(running[0].id == a.id);
        CHECK(running[1].id == b.id);
    }
}

TEST_CASE("A process table failure reads as not running", "[controller]") {
    TestWorld world;
    const Instance instance = world.create("A");
    world.run(instance, 100);
    world.query.fail = true;

    CHECK_FALSE(world.controller.status(instance.id));
    CHECK_FALSE(world.controller.get_recent_errors().empty());
    CHECK(world.controller.running_instances().empty());
    CHECK_THROWS_AS(world.controller.stop(instance.id), ExternalProcessError);
    CHECK_THROWS_AS(world.controller.check_running(world.registry.get(instance.id)), TransientQueryError);
}

TEST_CASE("stop terminates the root process and keeps its arguments", "[controller]") {
    TestWorld world;
    const Instance instance = world.create("A");
    const std::string dir_arg = "--user-data-dir=" + instance.user_data_dir;
    world.query.add_app(100, 1, {dir_arg, "--flag"});
    world.query.add_app(101, 100, {"--type=renderer", dir_arg});
    world.query.add_app(102, 100, {"--type=gpu-process", dir_arg});

    world.controller.stop(instance.id);

    CHECK_FALSE(world.controller.status(instance.id));
    REQUIRE(world.killer.signals.size() == 1);
    CHECK(world.killer.signals[0] == std::make_pair(100, false));

    const auto args = world.registry.get(instance.id).last_launch_args;
    REQUIRE(args);
    CHECK(*args == std::vector<std::string>{dir_arg, "--flag"});
}

TEST_CASE("stop escalates to SIGKILL after the timeout", "[controller]") {
    TestWorld world;
    const Instance instance = world.create("A");
    world.run(instance, 100);
    world.killer.stubborn.insert(100);

    world.controller.stop(instance.id);

    CHECK_FALSE(world.controller.status(instance.id));
    REQUIRE(world.killer.tree_kills.size() == 1);
    CHECK(world.killer.tree_kills[0] == 100);
    CHECK(world.killer.signals.back() == std::make_pair(100, true));
}

TEST_CASE("stop on a stopped instance does nothing", "[controller]") {
    TestWorld world;
    const Instance instance = world.create("A");

    CHECK_NOTHROW(world.controller.stop(instance.id));
    CHECK(world.killer.signals.empty());
}

TEST_CASE("restart relaunches with the arguments of the stopped process", "[controller]") {
    TestWorld world;
    const Instance instance = world.create("A");
    const std::string dir_arg = "--user-data-dir=" + instance.user_data_dir;
    world.query.add_app(100, 1, {dir_arg, "--custom"});

    world.controller.restart(instance.id);

    REQUIRE(world.launcher.calls.size() == 1);
    CHECK(world.launcher.calls[0].second == std::vector<std::string>{dir_arg, "--custom"});
    CHECK(world.controller.status(instance.id));
    CHECK_FALSE(world.query.has(100));
}

TEST_CASE("Unknown instances are not found", "[controller]") {
    TestWorld world;

    CHECK_THROWS_AS(world.controller.start("missing"), NotFoundError);
    CHECK_THROWS_AS(world.controller.stop("missing"), NotFoundError);
    CHECK_THROWS_AS(world.controller.status("missing"), NotFoundError);
}
