#include <catch2/catch.hpp>
#include "fakes.hpp"
#include "json_account_source.hpp"
#include "json_instance_store.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace instman;
using namespace instman::test;

namespace {

Instance record(const std::string& id, const std::string& dir) {
    Instance instance;
    instance.id = id;
    instance.name = "Instance " + id;
    instance.user_data_dir = dir;
    instance.account_ids = {"acc-" + id};
    instance.created_at = 100;
    return instance;
}

nlohmann::json read_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    return nlohmann::json::parse(file);
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << text;
}

} // namespace

TEST_CASE("Instance store persists records and the index", "[store]") {
    TempDir temp;

    {
        JsonInstanceStore store(temp.path());
        CHECK(store.load_all().empty());

        store.save(record("a", "/data/a"));
        store.save(record("b", "/data/b"));
        Instance renamed = record("a", "/data/a");
        renamed.name = "Renamed";
        store.save(renamed);
        store.remove("b");
    }

    const auto index = read_json(temp.path() / "instances.json");
    CHECK(index["version"] == "1.0");
    REQUIRE(index["instances"].size() == 1);
    CHECK(index["instances"][0]["id"] == "a");
    CHECK(index["instances"][0]["account_count"] == 1);
    CHECK_FALSE(std::filesystem::exists(temp.path() / "instances" / "b.json"));

    JsonInstanceStore reopened(temp.path());
    const auto loaded = reopened.load_all();
    REQUIRE(loaded.size() == 1);
    CHECK(loaded[0].name == "Renamed");
    CHECK(loaded[0].account_ids == std::vector<std::string>{"acc-a"});
}

TEST_CASE("Unreadable records are dropped from the index", "[store]") {
    TempDir temp;
    {
        JsonInstanceStore store(temp.path());
        store.save(record("good", "/data/good"));
        store.save(record("bad", "/data/bad"));
        store.save(record("lost", "/data/lost"));
    }
    write_text(temp.path() / "instances" / "bad.json", "{ not json");
    std::filesystem::remove(temp.path() / "instances" / "lost.json");

    JsonInstanceStore store(temp.path());
    const auto loaded = store.load_all();

    REQUIRE(loaded.size() == 1);
    CHECK(loaded[0].id == "good");
    CHECK(read_json(temp.path() / "instances.json")["instances"].size() == 1);
}

TEST_CASE("A corrupt index is a storage error", "[store]") {
    TempDir temp;
    write_text(temp.path() / "instances.json", "[1, 2");

    JsonInstanceStore store(temp.path());
    CHECK_THROWS_AS(store.load_all(), StorageError);
}

TEST_CASE("An empty index file starts empty", "[store]") {
    TempDir temp;
    write_text(temp.path() / "instances.json", "  \n");

    JsonInstanceStore store(temp.path());
    CHECK(store.load_all().empty());
}

TEST_CASE("The registry survives a restart on the JSON store", "[store]") {
    TempDir temp;
    std::string id;
    {
        JsonInstanceStore store(temp.path() / "state");
        InstanceRegistry registry(store, temp.sub("default"));
        registry.ensure_default();
        id = registry.create("Work", temp.sub("work")).id;
        registry.mutate(id, [](Instance& i) { i.bind_account("acc"); });
    }

    JsonInstanceStore store(temp.path() / "state");
    InstanceRegistry registry(store, temp.sub("default"));
    const auto list = registry.list();
    REQUIRE(list.size() == 2);
    CHECK(list[0].is_default);
    CHECK(registry.get(id).account_ids == std::vector<std::string>{"acc"});
}

TEST_CASE("Account source reads one file per account", "[accounts]") {
    TempDir temp;
    const auto dir = temp.path() / "accounts";

    SECTION("missing directory") {
        JsonAccountSource source(dir);
        CHECK_THROWS_AS(source.read_accounts(), StorageError);
    }

    SECTION("empty directory") {
        std::filesystem::create_directories(dir);
        JsonAccountSource source(dir);
        const auto listing = source.read_accounts();
        CHECK(listing.accounts.empty());
        CHECK(listing.complete());
    }

    SECTION("valid, malformed and duplicate files") {
        write_text(dir / "1.json", R"({"id": "one", "email": "one@example.com",
            "quota": {"subscription_tier": "pro", "models": [{"name": "m", "percentage": 50}]}})");
        write_text(dir / "2.json", R"({"id": "two", "email": "two@example.com"})");
        write_text(dir / "3.json", "{ broken");
        write_text(dir / "4.json", R"({"id": "one", "email": "dup@example.com"})");
        write_text(dir / "notes.txt", "ignored");

        JsonAccountSource source(dir);
        const auto listing = source.read_accounts();
        const auto& accounts = listing.accounts;

        REQUIRE(listing.skipped.size() == 1);
        CHECK(listing.skipped[0] == (dir / "3.json").string());
        CHECK_FALSE(listing.complete());

        REQUIRE(accounts.size() == 2);
        CHECK(accounts[0].id == "one");
        CHECK(accounts[0].email == "one@example.com");
        REQUIRE(accounts[0].quota);
        CHECK(accounts[0].model_percentage("M", ModelMatch::Exact) == 50);
        CHECK(accounts[1].id == "two");
        CHECK_FALSE(accounts[1].quota);
    }
}

TEST_CASE("Pruning refuses to run on an unreadable account store", "[accounts]") {
    TempDir temp;
    MemoryInstanceStore store;
    FakeProcessQuery query;
    FakeLauncher launcher{query};
    FakeKiller killer{query};
    FakeSwitcher switcher;
    InstanceRegistry registry(store, temp.sub("default"));
    ProcessController controller(registry, query, launcher, killer, test_controller_options());

    const auto dir = temp.path() / "accounts";
    JsonAccountSource source(dir);
    BindingManager bindings(registry, controller, source, switcher);

    const Instance instance = registry.create("A", temp.sub("a"));
    bindings.bind("acc1", instance.id);
    bindings.bind("acc2", instance.id);
    bindings.set_current_account(instance.id, "acc2");

    SECTION("directory missing") {
        CHECK_THROWS_AS(bindings.prune_missing_accounts(), StorageError);
    }

    SECTION("account file mid-rewrite") {
        write_text(dir / "acc1.json", R"({"id": "acc1"})");
        write_text(dir / "acc2.json", R"({"id": "ac)");
        CHECK_THROWS_AS(bindings.prune_missing_accounts(), StorageError);
    }

    const Instance after = registry.get(instance.id);
    CHECK(after.account_ids == std::vector<std::string>{"acc1", "acc2"});
    CHECK(after.current_account_id == "acc2");
}
