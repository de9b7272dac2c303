#include "status_poller.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace instman {

bool StatusSnapshot::is_running(const std::string& id) const {
    auto it = running.find(id);
    return it != running.end() && it->second;
}

size_t StatusSnapshot::running_count() const {
    return static_cast<size_t>(std::count_if(running.begin(), running.end(),
                                             [](const auto& entry) { return entry.second; }));
}

StatusPoller::StatusPoller(ListFn list, CheckFn check_running, std::chrono::milliseconds interval, size_t workers)
    : list_(std::move(list))
    , check_(std::move(check_running))
    , workers_(std::max<size_t>(workers, 1))
    , interval_ms_(interval.count())
{
    auto initial = std::make_shared<StatusSnapshot>();
    initial->timestamp = std::chrono::steady_clock::now();
    current_snapshot_ = initial;
}

StatusPoller::~StatusPoller() {
    stop();
}

void StatusPoller::start() {
    if (running_.exchange(true)) return;

    poll_thread_ = std::thread(&StatusPoller::poll_thread_func, this);
}

void StatusPoller::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard lock(cv_mutex_);
        cv_.notify_all();
    }

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

bool StatusPoller::is_active() const {
    return running_;
}

void StatusPoller::set_interval(std::chrono::milliseconds interval) {
    interval_ms_ = std::max<int64_t>(interval.count(), 1);
    std::lock_guard lock(cv_mutex_);
    cv_.notify_all(); // Wake up thread to adjust timing
}

std::chrono::milliseconds StatusPoller::interval() const {
    return std::chrono::milliseconds(interval_ms_.load());
}

std::shared_ptr<const StatusSnapshot> StatusPoller::get_snapshot() const {
    std::lock_guard lock(data_mutex_);
    return current_snapshot_;
}

void StatusPoller::refresh_now() {
    std::lock_guard lock(cv_mutex_);
    refresh_requested_ = true;
    cv_.notify_all();
}

void StatusPoller::pause() {
    paused_ = true;
}

void StatusPoller::resume() {
    paused_ = false;
    std::lock_guard lock(cv_mutex_);
    cv_.notify_all();  // Wake up to resume polling
}

bool StatusPoller::is_paused() const {
    return paused_;
}

void StatusPoller::set_on_updated(std::function<void()> callback) {
    std::lock_guard lock(data_mutex_);
    on_updated_ = std::move(callback);
}

void StatusPoller::add_error(const std::string& message) {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<QueryError> StatusPoller::get_recent_errors() {
    std::lock_guard lock(errors_mutex_);
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(10);
    std::vector<QueryError> result;
    for (const auto& err : recent_errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

void StatusPoller::poll_thread_func() {
    // Initial poll
    poll_once();

    while (running_) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_.load()), [this] {
                return !running_ || refresh_requested_;
            });
            refresh_requested_ = false;
        }

        if (running_ && !paused_) {
            poll_once();
        }
    }
}

void StatusPoller::poll_once() {
    std::lock_guard tick_lock(tick_mutex_);

    std::vector<Instance> instances;
    try {
        instances = list_();
    } catch (const std::exception& e) {
        spdlog::warn("Listing instances for status poll failed: {}", e.what());
        add_error(fmt::format("Listing instances failed: {}", e.what()));
        return;
    }

    const size_t count = instances.size();
    std::vector<char> results(count, 0);
    std::atomic<size_t> next{0};

    auto worker = [&] {
        while (true) {
            const size_t i = next.fetch_add(1);
            if (i >= count) break;
            try {
                results[i] = check_(instances[i]) ? 1 : 0;
            } catch (const std::exception& e) {
                // A failing instance reads as stopped and never holds up the others
                results[i] = 0;
                spdlog::warn("Status query for instance {} failed: {}", instances[i].name, e.what());
                add_error(fmt::format("{}: {}", instances[i].name, e.what()));
            }
        }
    };

    const size_t extra_threads = std::min(workers_, count) > 0 ? std::min(workers_, count) - 1 : 0;
    std::vector<std::thread> threads;
    threads.reserve(extra_threads);
    for (size_t i = 0; i < extra_threads; ++i) {
        threads.emplace_back(worker);
    }
    worker();
    for (auto& thread : threads) {
        thread.join();
    }

    auto snapshot = std::make_shared<StatusSnapshot>();
    snapshot->timestamp = std::chrono::steady_clock::now();
    for (size_t i = 0; i < count; ++i) {
        snapshot->running[instances[i].id] = results[i] != 0;
    }
    snapshot->instances = std::move(instances);

    std::function<void()> callback;
    {
        std::lock_guard lock(data_mutex_);
        snapshot->generation = ++generation_;
        current_snapshot_ = std::move(snapshot);
        callback = on_updated_;
    }

    // Notify callback outside of lock
    if (callback) {
        callback();
    }
}

} // namespace instman
