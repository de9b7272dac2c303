#include <catch2/catch.hpp>
#include "fakes.hpp"

using namespace instman;
using namespace instman::test;

TEST_CASE("bind and unbind", "[bindings]") {
    TestWorld world;
    const Instance instance = world.create("A");

    world.bindings.bind("acc1", instance.id);
    world.bindings.bind("acc2", instance.id);
    world.bindings.bind("acc1", instance.id);   // already bound

    CHECK(world.bindings.accounts_for_instance(instance.id) == std::vector<std::string>{"acc1", "acc2"});

    world.bindings.unbind("acc1", instance.id);
    world.bindings.unbind("missing", instance.id);
    CHECK(world.bindings.accounts_for_instance(instance.id) == std::vector<std::string>{"acc2"});

    world.bindings.unbind("acc2", instance.id);
    CHECK(world.registry.get(instance.id).account_ids.empty());
}

TEST_CASE("Binding validates its arguments", "[bindings]") {
    TestWorld world;
    const Instance instance = world.create("A");

    CHECK_THROWS_AS(world.bindings.bind("", instance.id), ValidationError);
    CHECK_THROWS_AS(world.bindings.bind("acc", "missing"), NotFoundError);
    CHECK_THROWS_AS(world.bindings.set_current_account(instance.id, "unbound"), ValidationError);
}

TEST_CASE("An account can be bound to several instances", "[bindings]") {
    TestWorld world;
    const Instance a = world.create("A");
    const Instance b = world.create("B");

    world.bindings.bind("shared", a.id);
    world.bindings.bind("shared", b.id);

    const auto owners = world.bindings.instances_for_account("shared");
    REQUIRE(owners.size() == 2);
    CHECK(owners[0].id == a.id);
    CHECK(owners[1].id == b.id);

    CHECK(world.bindings.forget_account("shared") == 2);
    CHECK(world.bindings.instances_for_account("shared").empty());
}

TEST_CASE("Unbinding the current account clears it", "[bindings]") {
    TestWorld world;
    const Instance instance = world.create("A");

    world.bindings.bind("acc", instance.id);
    world.bindings.set_current_account(instance.id, "acc");
    CHECK(world.registry.get(instance.id).current_account_id == "acc");

    world.bindings.unbind("acc", instance.id);
    CHECK_FALSE(world.registry.get(instance.id).current_account_id);
}

TEST_CASE("switch_account on a stopped instance", "[bindings]") {
    TestWorld world;
    const Instance instance = world.create("A");

    world.bindings.switch_account(instance.id, "acc");

    const Instance after = world.registry.get(instance.id);
    CHECK(after.account_ids == std::vector<std::string>{"acc"});
    CHECK(after.current_account_id == "acc");
    CHECK(world.switcher.calls.empty());
}

TEST_CASE("switch_account on a running instance goes through the switcher", "[bindings]") {
    TestWorld world;
    const Instance instance = world.create("A");
    world.run(instance, 500);

    world.bindings.switch_account(instance.id, "acc");

    REQUIRE(world.switcher.calls.size() == 1);
    CHECK(world.switcher.calls[0].first == instance.id);
    CHECK(world.switcher.calls[0].second == "acc");
    CHECK(world.registry.get(instance.id).current_account_id == "acc");

    // Already current: nothing to do
    world.bindings.switch_account(instance.id, "acc");
    CHECK(world.switcher.calls.size() == 1);
}

TEST_CASE("A failed live switch leaves bindings untouched", "[bindings]") {
    TestWorld world;
    const Instance instance = world.create("A");
    world.bindings.bind("old", instance.id);
    world.bindings.set_current_account(instance.id, "old");
    world.run(instance, 500);
    world.switcher.fail = true;

    CHECK_THROWS_AS(world.bindings.switch_account(instance.id, "new"), ExternalProcessError);

    const Instance after = world.registry.get(instance.id);
    CHECK(after.account_ids == std::vector<std::string>{"old"});
    CHECK(after.current_account_id == "old");
}

TEST_CASE("Migrating legacy accounts binds the unbound ones to the default", "[bindings]") {
    TestWorld world;
    world.accounts.add("a1");
    world.accounts.add("a2");
    world.accounts.add("a3");

    const Instance other = world.create("Other");
    world.bindings.bind("a2", other.id);

    CHECK(world.bindings.migrate_legacy_accounts() == 2);

    const auto def = world.registry.find_default();
    REQUIRE(def);
    CHECK(def->account_ids == std::vector<std::string>{"a1", "a3"});

    // Running it again changes nothing
    CHECK(world.bindings.migrate_legacy_accounts() == 0);
    CHECK(world.registry.get(def->id).account_ids == std::vector<std::string>{"a1", "a3"});
    CHECK(world.registry.get(other.id).account_ids == std::vector<std::string>{"a2"});
}

TEST_CASE("Pruning drops bindings of accounts that no longer exist", "[bindings]") {
    TestWorld world;
    world.accounts.add("kept");
    const Instance a = world.create("A");
    const Instance b = world.create("B");

    world.bindings.bind("kept", a.id);
    world.bindings.bind("gone", a.id);
    world.bindings.set_current_account(a.id, "gone");
    world.bindings.bind("gone", b.id);
    world.bindings.bind("gone-too", b.id);

    CHECK(world.bindings.prune_missing_accounts() == 3);

    const Instance after_a = world.registry.get(a.id);
    CHECK(after_a.account_ids == std::vector<std::string>{"kept"});
    CHECK_FALSE(after_a.current_account_id);
    CHECK(world.registry.get(b.id).account_ids.empty());

    CHECK(world.bindings.prune_missing_accounts() == 0);
}

TEST_CASE("Deleting an instance releases its accounts", "[bindings]") {
    TestWorld world;
    const Instance instance = world.create("A");
    world.bindings.bind("acc", instance.id);

    world.bindings.remove_instance(instance.id);

    CHECK(world.bindings.instances_for_account("acc").empty());
    CHECK_THROWS_AS(world.bindings.accounts_for_instance(instance.id), NotFoundError);
}

TEST_CASE("Pruning needs a complete account listing", "[bindings]") {
    TestWorld world;
    world.accounts.add("kept");
    world.accounts.skipped.push_back("accounts/half-written.json");
    const Instance instance = world.create("A");
    world.bindings.bind("kept", instance.id);
    world.bindings.bind("unlisted", instance.id);

    CHECK_THROWS_AS(world.bindings.prune_missing_accounts(), StorageError);
    CHECK(world.registry.get(instance.id).account_ids == std::vector<std::string>{"kept", "unlisted"});

    world.accounts.skipped.clear();
    CHECK(world.bindings.prune_missing_accounts() == 1);
}
