#pragma once

#include "errors.hpp"
#include "instance.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace instman {

// Result of one polling tick - returned to UI
struct StatusSnapshot {
    std::vector<Instance> instances;
    std::map<std::string, bool> running;   // instance id -> running

    std::chrono::steady_clock::time_point timestamp;
    uint64_t generation = 0;

    [[nodiscard]] bool is_running(const std::string& id) const;
    [[nodiscard]] size_t running_count() const;
};

// Background thread that refreshes the running state of every instance.
// Each tick queries instances independently on a bounded set of workers and
// publishes the whole result at once.
class StatusPoller {
public:
    using ListFn = std::function<std::vector<Instance>()>;
    using CheckFn = std::function<bool(const Instance&)>;

    StatusPoller(ListFn list, CheckFn check_running, std::chrono::milliseconds interval, size_t workers = 4);
    ~StatusPoller();

    StatusPoller(const StatusPoller&) = delete;
    StatusPoller& operator=(const StatusPoller&) = delete;

    // Start/stop the background polling thread
    void start();
    void stop();
    [[nodiscard]] bool is_active() const;

    void set_interval(std::chrono::milliseconds interval);
    [[nodiscard]] std::chrono::milliseconds interval() const;

    // Get the latest snapshot (thread-safe)
    [[nodiscard]] std::shared_ptr<const StatusSnapshot> get_snapshot() const;

    // Wake the thread for an immediate tick
    void refresh_now();

    // Run one tick on the calling thread
    void poll_once();

    void pause();
    void resume();
    [[nodiscard]] bool is_paused() const;

    // Called after each published snapshot, outside of any lock
    void set_on_updated(std::function<void()> callback);

    // Per-instance failures of the last 10 seconds for status bar display
    [[nodiscard]] std::vector<QueryError> get_recent_errors();

private:
    void poll_thread_func();
    void add_error(const std::string& message);

    ListFn list_;
    CheckFn check_;
    size_t workers_;

    // Background thread
    std::thread poll_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<int64_t> interval_ms_;
    bool refresh_requested_ = false;   // guarded by cv_mutex_
    std::condition_variable cv_;
    std::mutex cv_mutex_;

    // One tick at a time, whether from the thread or poll_once
    std::mutex tick_mutex_;

    mutable std::mutex data_mutex_;
    std::shared_ptr<const StatusSnapshot> current_snapshot_;
    uint64_t generation_ = 0;
    std::function<void()> on_updated_;

    std::mutex errors_mutex_;
    std::vector<QueryError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
};

} // namespace instman
