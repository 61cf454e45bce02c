#include "tabvault/maintenance_scheduler.h"
#include "tabvault/debug_utils.h"

#include <algorithm>

namespace tabvault {

MaintenanceScheduler::MaintenanceScheduler(ClockFn clock)
    : clock_(clock ? std::move(clock) : ClockFn(systemNowMs)) {}

MaintenanceScheduler::~MaintenanceScheduler() {
    stop();
}

void MaintenanceScheduler::addTask(MaintenanceTask task) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const Entry& entry) { return entry.task.name == task.name; });
    if (it != tasks_.end()) {
        it->task = std::move(task);
        it->last_run.reset();
        return;
    }
    tasks_.push_back(Entry{std::move(task), std::nullopt});
}

bool MaintenanceScheduler::removeTask(const std::string& name) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const Entry& entry) { return entry.task.name == name; });
    if (it == tasks_.end()) return false;
    tasks_.erase(it);
    return true;
}

std::vector<std::string> MaintenanceScheduler::taskNames() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    std::vector<std::string> names;
    for (const auto& entry : tasks_) names.push_back(entry.task.name);
    return names;
}

std::vector<MaintenanceRunReport> MaintenanceScheduler::tick(Timestamp now) {
    return runMatching(now, false);
}

std::vector<MaintenanceRunReport> MaintenanceScheduler::runAll(Timestamp now) {
    return runMatching(now, true);
}

std::vector<MaintenanceRunReport> MaintenanceScheduler::runMatching(Timestamp now, bool force) {
    std::lock_guard<std::mutex> run_lock(run_mutex_);

    // Tasks run outside tasks_mutex_ so a task may add or remove tasks
    std::vector<MaintenanceTask> due;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (const auto& entry : tasks_) {
            bool is_due = force || !entry.last_run || now - *entry.last_run >= entry.task.interval_ms;
            if (is_due) due.push_back(entry.task);
        }
    }

    std::vector<MaintenanceRunReport> reports;
    for (const auto& task : due) {
        reports.push_back(runOne(task, now));
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (auto& entry : tasks_) {
            if (entry.task.name == task.name) entry.last_run = now;
        }
    }
    return reports;
}

MaintenanceRunReport MaintenanceScheduler::runOne(const MaintenanceTask& task, Timestamp now) {
    MaintenanceRunReport report;
    report.task = task.name;
    report.started_at = now;
    if (!task.run) {
        report.error = "Task has no callback";
        LOG_WARN("[MaintenanceScheduler] Task '{}' has no callback", task.name);
        return report;
    }
    try {
        auto status = task.run(now);
        if (status.isOk()) {
            report.success = true;
            LOG_TRACE("[MaintenanceScheduler] Task '{}' completed", task.name);
        } else {
            report.error = status.error().toString();
            LOG_WARN("[MaintenanceScheduler] Task '{}' failed: {}", task.name, report.error);
        }
    } catch (const storage::StorageError& e) {
        report.error = e.toString();
        LOG_ERROR("[MaintenanceScheduler] Task '{}' threw: {}", task.name, report.error);
    } catch (const std::exception& e) {
        report.error = e.what();
        LOG_ERROR("[MaintenanceScheduler] Task '{}' threw: {}", task.name, report.error);
    }
    return report;
}

void MaintenanceScheduler::start(std::chrono::milliseconds period) {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (running_.load(std::memory_order_relaxed)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(true, std::memory_order_relaxed);
    thread_ = std::thread(&MaintenanceScheduler::threadLoop, this, std::max(period, std::chrono::milliseconds(1)));
}

void MaintenanceScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        running_.store(false, std::memory_order_relaxed);
    }
    thread_cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void MaintenanceScheduler::threadLoop(std::chrono::milliseconds period) {
    LOG_INFO("[MaintenanceScheduler Thread {}] Started with a period of {} ms", std::this_thread::get_id(),
             period.count());
    while (running_.load(std::memory_order_relaxed)) {
        {
            std::unique_lock<std::mutex> lock(thread_mutex_);
            if (thread_cv_.wait_for(lock, period, [this] { return !running_.load(std::memory_order_relaxed); })) {
                break;
            }
        }
        tick(clock_());
    }
    LOG_INFO("[MaintenanceScheduler Thread {}] Stopped.", std::this_thread::get_id());
}

} // namespace tabvault
