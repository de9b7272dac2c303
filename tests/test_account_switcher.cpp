#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "linux/hook_account_switcher.hpp"
#include <cstdlib>

using namespace instman;
using namespace instman::test;

TEST_CASE("Without a hook the instance is restarted", "[switcher]") {
    TestWorld world;
    Instance instance = world.create("A");
    const std::string dir_arg = "--user-data-dir=" + instance.user_data_dir;
    world.query.add_app(100, 1, {dir_arg, "--kept"});

    HookAccountSwitcher switcher(world.controller, {});
    const SwitchResult result = switcher.switch_account(instance, "acc");

    CHECK(result.success);
    CHECK_FALSE(world.query.has(100));
    REQUIRE(world.launcher.calls.size() == 1);
    CHECK(world.launcher.calls[0].second == std::vector<std::string>{dir_arg, "--kept"});
    CHECK(instance.last_launch_args == std::vector<std::string>{dir_arg, "--kept"});
}

TEST_CASE("A failed relaunch is a failed switch", "[switcher]") {
    TestWorld world;
    Instance instance = world.create("A");
    world.run(instance, 100);
    world.launcher.fail = true;

    HookAccountSwitcher switcher(world.controller, {});
    const SwitchResult result = switcher.switch_account(instance, "acc");

    CHECK_FALSE(result.success);
    CHECK_FALSE(result.error_message.empty());
}

TEST_CASE("The hook gets the dir and account as arguments and environment", "[switcher]") {
    TestWorld world;
    Instance instance = world.create("A");

    const std::string script =
        "test \"$1\" = \"" + instance.user_data_dir + "\" && "
        "test \"$2\" = acc-7 && "
        "test \"$INSTMAN_ACCOUNT_ID\" = acc-7 && "
        "test \"$INSTMAN_INSTANCE_ID\" = \"" + instance.id + "\"";
    HookAccountSwitcher switcher(world.controller, {"/bin/sh", "-c", script, "hook"});

    const SwitchResult result = switcher.switch_account(instance, "acc-7");
    INFO(result.error_message);
    CHECK(result.success);
    CHECK(world.launcher.calls.empty());
}

TEST_CASE("The hook inherits the environment without changing ours", "[switcher]") {
    TestWorld world;
    Instance instance = world.create("A");
    ::setenv("INSTMAN_TEST_INHERITED", "yes", 1);
    ::setenv("INSTMAN_ACCOUNT_ID", "stale", 1);

    const std::string script =
        "test \"$INSTMAN_TEST_INHERITED\" = yes && "
        "test \"$INSTMAN_ACCOUNT_ID\" = acc-8 && "
        "test \"$(env | grep -c '^INSTMAN_ACCOUNT_ID=')\" = 1";
    HookAccountSwitcher switcher(world.controller, {"/bin/sh", "-c", script, "hook"});

    const SwitchResult result = switcher.switch_account(instance, "acc-8");
    INFO(result.error_message);
    CHECK(result.success);
    CHECK(std::string(std::getenv("INSTMAN_ACCOUNT_ID")) == "stale");

    ::unsetenv("INSTMAN_ACCOUNT_ID");
    ::unsetenv("INSTMAN_TEST_INHERITED");
}

TEST_CASE("Hook failures are reported", "[switcher]") {
    TestWorld world;
    Instance instance = world.create("A");

    SECTION("non-zero exit") {
        HookAccountSwitcher switcher(world.controller, {"/bin/sh", "-c", "exit 3", "hook"});
        const SwitchResult result = switcher.switch_account(instance, "acc");
        CHECK_FALSE(result.success);
        CHECK(result.error_message == "Switch hook exited with status 3");
    }

    SECTION("missing program") {
        HookAccountSwitcher switcher(world.controller, {"/nonexistent/instman-hook"});
        const SwitchResult result = switcher.switch_account(instance, "acc");
        CHECK_FALSE(result.success);
        CHECK_THAT(result.error_message, Catch::Contains("could not be executed"));
    }
}
