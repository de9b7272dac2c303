#include <catch2/catch.hpp>
#include "process_match.hpp"

using namespace instman;

namespace {

ProcessInfo process(int pid, int parent, const std::string& name, std::vector<std::string> args) {
    ProcessInfo p;
    p.pid = pid;
    p.parent_pid = parent;
    p.name = name;
    p.args = {name};
    p.args.insert(p.args.end(), args.begin(), args.end());
    return p;
}

Instance instance_at(const std::string& dir, bool is_default = false) {
    Instance instance;
    instance.id = dir;
    instance.user_data_dir = dir;
    instance.is_default = is_default;
    return instance;
}

} // namespace

TEST_CASE("find_user_data_dir_arg accepts both forms", "[match]") {
    CHECK(find_user_data_dir_arg({"app", "--user-data-dir=/a"}) == "/a");
    CHECK(find_user_data_dir_arg({"app", "--user-data-dir", "/b"}) == "/b");
    CHECK_FALSE(find_user_data_dir_arg({"app", "--user-data-dir"}));
    CHECK_FALSE(find_user_data_dir_arg({"app", "--other=/a"}));
}

TEST_CASE("process_belongs_to", "[match]") {
    const Instance def = instance_at("/home/u/.config/App", true);
    const Instance work = instance_at("/data/work");

    const auto plain = process(1, 0, "app", {});
    CHECK(process_belongs_to(plain, def, "app"));
    CHECK(process_belongs_to(process(1, 0, "App", {}), def, "app"));
    CHECK_FALSE(process_belongs_to(plain, work, "app"));
    CHECK_FALSE(process_belongs_to(process(1, 0, "other", {}), def, "app"));

    const auto with_dir = process(2, 0, "app", {"--user-data-dir=/data/work/"});
    CHECK(process_belongs_to(with_dir, work, "app"));
    CHECK_FALSE(process_belongs_to(with_dir, def, "app"));

    // The default instance also owns processes pointed at its own dir
    CHECK(process_belongs_to(process(3, 0, "app", {"--user-data-dir", "/home/u/.config/App"}), def, "app"));
}

TEST_CASE("find_root_processes climbs same-name parents", "[match]") {
    const Instance work = instance_at("/data/work");
    const std::string arg = "--user-data-dir=/data/work";
    const std::vector<ProcessInfo> table{
        process(1, 0, "init", {}),
        process(10, 1, "app", {arg}),
        process(11, 10, "app", {"--type=renderer", arg}),
        process(12, 11, "app", {"--type=utility", arg}),
        process(20, 1, "app", {"--user-data-dir=/data/other"}),
    };

    const auto all = find_instance_processes(table, work, "app", 99);
    CHECK(all.size() == 3);

    const auto roots = find_root_processes(table, work, "app", 99);
    REQUIRE(roots.size() == 1);
    CHECK(roots[0]->pid == 10);

    // The manager's own pid is never a match
    CHECK(find_instance_processes(table, work, "app", 10).size() == 2);
}

TEST_CASE("detect_running_user_data_dir skips helpers", "[match]") {
    const std::vector<ProcessInfo> table{
        process(5, 1, "app", {"--type=renderer", "--user-data-dir=/helper"}),
        process(6, 1, "app", {"--user-data-dir=/real/dir/"}),
    };

    CHECK(detect_running_user_data_dir(table, "app", 0) == "/real/dir");
    CHECK_FALSE(detect_running_user_data_dir(table, "app", 6));
    CHECK_FALSE(detect_running_user_data_dir({process(7, 1, "app", {})}, "app", 0));
}

TEST_CASE("Instance launch arguments", "[match]") {
    Instance instance = instance_at("/data/work");
    instance.extra_args = {"--x"};
    CHECK(instance.launch_args() == std::vector<std::string>{"--user-data-dir=/data/work", "--x"});

    instance.is_default = true;
    CHECK(instance.launch_args() == std::vector<std::string>{"--x"});

    CHECK(has_helper_marker({"--type=gpu-process"}));
    CHECK_FALSE(has_helper_marker({"--typed"}));
    CHECK(normalize_dir("/a/b/") == "/a/b");
    CHECK(normalize_dir("/a/./c/../b") == "/a/b");
}
