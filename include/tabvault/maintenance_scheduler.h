// @include/tabvault/maintenance_scheduler.h
#pragma once

#include "storage_error/result.h"
#include "types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tabvault {

struct MaintenanceTask {
    std::string name;
    int64_t interval_ms = 0;  // 0 runs on every tick
    std::function<storage::Status(Timestamp now)> run;
};

struct MaintenanceRunReport {
    std::string task;
    Timestamp started_at = 0;
    bool success = false;
    std::string error;  // empty on success
};

/**
 * @brief Runs registered periodic tasks when they fall due.
 *
 * tick() is the only place tasks execute, so callers can drive it from their own
 * timer or let start() drive it from a background thread. A task that fails or
 * throws is logged and still counts as run; it becomes due again one interval later.
 */
class MaintenanceScheduler {
public:
    explicit MaintenanceScheduler(ClockFn clock = systemNowMs);
    ~MaintenanceScheduler();

    MaintenanceScheduler(const MaintenanceScheduler&) = delete;
    MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

    // Replaces a task of the same name; a new task is due on the next tick
    void addTask(MaintenanceTask task);
    bool removeTask(const std::string& name);
    std::vector<std::string> taskNames() const;

    // Runs every due task in registration order
    std::vector<MaintenanceRunReport> tick(Timestamp now);
    // Runs every task regardless of its schedule
    std::vector<MaintenanceRunReport> runAll(Timestamp now);

    void start(std::chrono::milliseconds period);
    void stop();
    bool isRunning() const { return running_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        MaintenanceTask task;
        std::optional<Timestamp> last_run;
    };

    std::vector<MaintenanceRunReport> runMatching(Timestamp now, bool force);
    static MaintenanceRunReport runOne(const MaintenanceTask& task, Timestamp now);
    void threadLoop(std::chrono::milliseconds period);

    ClockFn clock_;

    mutable std::mutex tasks_mutex_;
    std::vector<Entry> tasks_;
    std::mutex run_mutex_;  // one tick at a time

    std::atomic<bool> running_{false};
    std::mutex thread_mutex_;
    std::condition_variable thread_cv_;
    std::thread thread_;
};

} // namespace tabvault
