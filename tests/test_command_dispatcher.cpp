#include <catch2/catch.hpp>
#include "command_dispatcher.hpp"
#include "fakes.hpp"
#include <algorithm>

using namespace instman;
using namespace instman::test;

namespace {

struct DispatcherWorld : TestWorld {
    CommandDispatcher dispatcher{registry, bindings, controller, accounts, default_categories()};

    nlohmann::json call(const std::string& command, nlohmann::json args = nlohmann::json::object()) {
        return dispatcher.dispatch(command, args);
    }
};

} // namespace

TEST_CASE("Every command is registered", "[dispatcher]") {
    DispatcherWorld world;
    const auto names = world.dispatcher.command_names();

    for (const char* name : {
             "list_instances", "list_instance_summaries", "create_instance", "get_instance",
             "update_instance", "delete_instance", "bind_account_to_instance",
             "unbind_account_from_instance", "start_instance", "stop_instance", "restart_instance",
             "get_instance_status", "get_running_instances", "ensure_default_instance",
             "migrate_accounts_to_default_instance", "get_instances_for_account",
             "get_accounts_for_instance", "set_current_account_for_instance",
             "switch_account_in_instance", "prune_missing_accounts", "recommend_accounts"}) {
        INFO(name);
        CHECK(std::find(names.begin(), names.end(), name) != names.end());
    }
    CHECK(names.size() == 21);
}

TEST_CASE("Bad requests are validation errors", "[dispatcher]") {
    DispatcherWorld world;

    CHECK_THROWS_AS(world.call("no_such_command"), ValidationError);
    CHECK_THROWS_AS(world.call("get_instance"), ValidationError);
    CHECK_THROWS_AS(world.call("get_instance", {{"instanceId", 5}}), ValidationError);
    CHECK_THROWS_AS(world.call("list_instances", nlohmann::json::array()), ValidationError);
    CHECK_THROWS_AS(world.call("update_instance", {{"instance", {{"name", "x"}}}}), ValidationError);
    CHECK_THROWS_AS(world.call("get_instance", {{"instanceId", "missing"}}), NotFoundError);
}

TEST_CASE("Instance lifecycle through commands", "[dispatcher]") {
    DispatcherWorld world;

    const auto def = world.call("ensure_default_instance");
    CHECK(def["is_default"] == true);

    const auto created = world.call("create_instance", {
        {"name", "Work"},
        {"user_data_dir", world.temp.sub("work")},
        {"extraArgs", nlohmann::json::array({"--x"})}
    });
    const auto id = created["id"].get<std::string>();
    CHECK(created["extra_args"] == nlohmann::json::array({"--x"}));

    auto list = world.call("list_instances");
    REQUIRE(list.size() == 2);
    CHECK(list[0]["id"] == def["id"]);

    auto updated = world.call("get_instance", {{"instanceId", id}});
    updated["name"] = "Renamed";
    CHECK(world.call("update_instance", {{"instance", updated}}).is_null());
    CHECK(world.call("get_instance", {{"instance_id", id}})["name"] == "Renamed");

    const auto summaries = world.call("list_instance_summaries");
    CHECK(summaries[1]["name"] == "Renamed");

    CHECK_THROWS_AS(world.call("delete_instance", {{"instanceId", def["id"]}}), ConflictError);
    world.call("delete_instance", {{"instanceId", id}});
    CHECK(world.call("list_instances").size() == 1);
}

TEST_CASE("Process commands", "[dispatcher]") {
    DispatcherWorld world;
    const Instance instance = world.create("A");
    const nlohmann::json args = {{"instanceId", instance.id}};

    CHECK(world.call("get_instance_status", args) == false);
    CHECK(world.call("start_instance", args) == true);
    CHECK(world.call("start_instance", args) == false);
    CHECK(world.call("get_instance_status", args) == true);
    CHECK(world.call("get_running_instances").size() == 1);

    world.call("restart_instance", args);
    CHECK(world.launcher.calls.size() == 2);

    world.call("stop_instance", args);
    CHECK(world.call("get_instance_status", args) == false);
    CHECK(world.call("get_running_instances").empty());
}

TEST_CASE("Account commands", "[dispatcher]") {
    DispatcherWorld world;
    world.accounts.add("a1");
    world.accounts.add("a2");
    const Instance instance = world.create("A");
    const std::string id = instance.id;

    world.call("bind_account_to_instance", {{"accountId", "a1"}, {"instanceId", id}});
    CHECK(world.call("get_accounts_for_instance", {{"instanceId", id}}) == nlohmann::json::array({"a1"}));
    CHECK(world.call("get_instances_for_account", {{"accountId", "a1"}})[0]["id"] == id);

    world.call("set_current_account_for_instance", {{"instanceId", id}, {"accountId", "a1"}});
    CHECK(world.registry.get(id).current_account_id == "a1");

    world.call("switch_account_in_instance", {{"instanceId", id}, {"account_id", "a2"}});
    CHECK(world.registry.get(id).current_account_id == "a2");

    world.call("unbind_account_from_instance", {{"accountId", "a1"}, {"instanceId", id}});
    CHECK(world.call("get_accounts_for_instance", {{"instanceId", id}}) == nlohmann::json::array({"a2"}));

    world.call("bind_account_to_instance", {{"accountId", "ghost"}, {"instanceId", id}});
    CHECK(world.call("prune_missing_accounts") == 1);

    CHECK(world.call("migrate_accounts_to_default_instance") == 1);
    CHECK(world.call("migrate_accounts_to_default_instance") == 0);
}

TEST_CASE("recommend_accounts uses account quotas", "[dispatcher]") {
    DispatcherWorld world;

    Account account;
    account.id = "best";
    account.quota = QuotaSnapshot{"pro", {{"claude-opus", 90, {}}}};
    world.accounts.accounts.push_back(account);

    auto result = world.call("recommend_accounts");
    REQUIRE(result.size() == 1);
    CHECK(result[0]["account_id"] == "best");
    CHECK(result[0]["category"] == "claude");
    CHECK(result[0]["score"] == 90);

    CHECK(world.call("recommend_accounts", {{"excludeAccountId", "best"}}).empty());
}
