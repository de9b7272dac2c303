#include <catch2/catch.hpp>
#include "status_poller.hpp"
#include <atomic>
#include <thread>

using namespace instman;

namespace {

Instance named(const std::string& id) {
    Instance instance;
    instance.id = id;
    instance.name = id;
    instance.user_data_dir = "/data/" + id;
    return instance;
}

std::vector<Instance> three_instances() {
    return {named("up"), named("down"), named("broken")};
}

bool check_running(const Instance& instance) {
    if (instance.id == "broken") {
        throw TransientQueryError("cannot read /proc");
    }
    return instance.id == "up";
}

} // namespace

TEST_CASE("The initial snapshot is empty", "[poller]") {
    StatusPoller poller(three_instances, check_running, std::chrono::milliseconds(1000));

    auto snapshot = poller.get_snapshot();
    REQUIRE(snapshot);
    CHECK(snapshot->generation == 0);
    CHECK(snapshot->instances.empty());
}

TEST_CASE("A failing instance reads as stopped without holding up the others", "[poller]") {
    StatusPoller poller(three_instances, check_running, std::chrono::milliseconds(1000), 2);

    poller.poll_once();

    auto snapshot = poller.get_snapshot();
    CHECK(snapshot->generation == 1);
    CHECK(snapshot->instances.size() == 3);
    CHECK(snapshot->is_running("up"));
    CHECK_FALSE(snapshot->is_running("down"));
    CHECK_FALSE(snapshot->is_running("broken"));
    CHECK(snapshot->running_count() == 1);
    CHECK(poller.get_recent_errors().size() == 1);

    poller.poll_once();
    snapshot = poller.get_snapshot();
    CHECK(snapshot->generation == 2);
    CHECK_FALSE(snapshot->is_running("broken"));
    CHECK(snapshot->is_running("up"));
}

TEST_CASE("A failed listing keeps the previous snapshot", "[poller]") {
    bool fail = false;
    StatusPoller poller(
        [&fail]() -> std::vector<Instance> {
            if (fail) throw StorageError("unreadable");
            return {named("up")};
        },
        check_running, std::chrono::milliseconds(1000));

    poller.poll_once();
    fail = true;
    poller.poll_once();

    auto snapshot = poller.get_snapshot();
    CHECK(snapshot->generation == 1);
    CHECK(snapshot->is_running("up"));
    CHECK(poller.get_recent_errors().size() == 1);
}

TEST_CASE("Status checks run in parallel up to the worker count", "[poller]") {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<Instance> many;
    for (int i = 0; i < 8; ++i) {
        many.push_back(named("i" + std::to_string(i)));
    }

    StatusPoller poller(
        [&many] { return many; },
        [&](const Instance&) {
            const int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --active;
            return true;
        },
        std::chrono::milliseconds(1000), 4);

    poller.poll_once();

    CHECK(poller.get_snapshot()->running_count() == 8);
    CHECK(peak.load() <= 4);
    CHECK(peak.load() >= 1);
}

TEST_CASE("The background thread publishes snapshots and notifies", "[poller]") {
    std::atomic<int> notified{0};
    StatusPoller poller(three_instances, check_running, std::chrono::milliseconds(10));
    poller.set_on_updated([&notified] { ++notified; });

    poller.start();
    CHECK(poller.is_active());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (poller.get_snapshot()->generation < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    poller.stop();

    CHECK_FALSE(poller.is_active());
    CHECK(poller.get_snapshot()->generation >= 3);
    CHECK(notified.load() >= 3);
}

TEST_CASE("Starting an active poller does not add a second poll loop", "[poller]") {
    std::atomic<int> listings{0};
    StatusPoller poller(
        [&listings] {
            ++listings;
            return three_instances();
        },
        check_running, std::chrono::milliseconds(1000));

    poller.start();
    poller.start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (listings.load() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    CHECK(listings.load() == 1);
    CHECK(poller.get_snapshot()->generation == 1);
    poller.stop();
    CHECK_FALSE(poller.is_active());
}
