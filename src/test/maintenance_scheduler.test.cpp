//src/test/maintenance_scheduler.test.cpp
#include "gtest/gtest.h"
#include "tabvault/config.h"
#include "tabvault/maintenance_scheduler.h"
#include "tabvault/storage_error/error_utils.h"

#include <atomic>
#include <thread>

using namespace tabvault;

namespace {

MaintenanceTask countingTask(const std::string& name, int64_t interval_ms, std::shared_ptr<std::atomic<int>> runs) {
    MaintenanceTask task;
    task.name = name;
    task.interval_ms = interval_ms;
    task.run = [runs](Timestamp) -> storage::Status {
        runs->fetch_add(1);
        return {};
    };
    return task;
}

} // namespace

TEST(MaintenanceSchedulerTest, TasksRunWhenDue) {
    MaintenanceScheduler scheduler;
    auto hourly = std::make_shared<std::atomic<int>>(0);
    auto daily = std::make_shared<std::atomic<int>>(0);
    scheduler.addTask(countingTask("integrity", kMillisPerHour, hourly));
    scheduler.addTask(countingTask("cleanup", kMillisPerDay, daily));

    const Timestamp start = 1700000000000;
    // Every task is due on its first tick
    EXPECT_EQ(scheduler.tick(start).size(), 2u);
    EXPECT_TRUE(scheduler.tick(start + 1000).empty());

    auto reports = scheduler.tick(start + kMillisPerHour);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].task, "integrity");
    EXPECT_TRUE(reports[0].success);
    EXPECT_EQ(reports[0].started_at, start + kMillisPerHour);

    scheduler.tick(start + kMillisPerDay);
    EXPECT_EQ(hourly->load(), 3);
    EXPECT_EQ(daily->load(), 2);
}

TEST(MaintenanceSchedulerTest, RunAllIgnoresTheSchedule) {
    MaintenanceScheduler scheduler;
    auto runs = std::make_shared<std::atomic<int>>(0);
    scheduler.addTask(countingTask("backup", kMillisPerDay, runs));
    scheduler.tick(0);
    EXPECT_EQ(scheduler.runAll(1).size(), 1u);
    EXPECT_EQ(runs->load(), 2);
}

TEST(MaintenanceSchedulerTest, FailuresAreReportedAndRescheduled) {
    MaintenanceScheduler scheduler;

    MaintenanceTask failing;
    failing.name = "failing";
    failing.interval_ms = 100;
    failing.run = [](Timestamp) -> storage::Status {
        return TABVAULT_ERROR(storage::ErrorCode::IO_WRITE_ERROR, "disk unavailable");
    };
    scheduler.addTask(failing);

    MaintenanceTask throwing;
    throwing.name = "throwing";
    throwing.interval_ms = 100;
    throwing.run = [](Timestamp) -> storage::Status { throw std::runtime_error("boom"); };
    scheduler.addTask(throwing);

    MaintenanceTask empty;
    empty.name = "empty";
    scheduler.addTask(empty);

    auto reports = scheduler.tick(1000);
    ASSERT_EQ(reports.size(), 3u);
    EXPECT_FALSE(reports[0].success);
    EXPECT_NE(reports[0].error.find("disk unavailable"), std::string::npos);
    EXPECT_FALSE(reports[1].success);
    EXPECT_EQ(reports[1].error, "boom");
    EXPECT_FALSE(reports[2].success);
    EXPECT_FALSE(reports[2].error.empty());

    // Interval 0 runs on every tick; the failed tasks wait one interval
    reports = scheduler.tick(1050);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].task, "empty");
    EXPECT_EQ(scheduler.tick(1100).size(), 3u);
}

TEST(MaintenanceSchedulerTest, TasksCanBeReplacedAndRemoved) {
    MaintenanceScheduler scheduler;
    auto first = std::make_shared<std::atomic<int>>(0);
    auto second = std::make_shared<std::atomic<int>>(0);
    scheduler.addTask(countingTask("stats", kMillisPerHour, first));
    scheduler.tick(0);

    scheduler.addTask(countingTask("stats", kMillisPerHour, second));
    EXPECT_EQ(scheduler.taskNames(), (std::vector<std::string>{"stats"}));
    scheduler.tick(1);
    EXPECT_EQ(first->load(), 1);
    EXPECT_EQ(second->load(), 1);

    EXPECT_TRUE(scheduler.removeTask("stats"));
    EXPECT_FALSE(scheduler.removeTask("stats"));
    EXPECT_TRUE(scheduler.tick(kMillisPerDay).empty());
}

TEST(MaintenanceSchedulerTest, BackgroundThreadDrivesTicks) {
    std::atomic<Timestamp> now{0};
    MaintenanceScheduler scheduler([&now]() { return now.fetch_add(10); });
    auto runs = std::make_shared<std::atomic<int>>(0);
    scheduler.addTask(countingTask("every-tick", 0, runs));

    scheduler.start(std::chrono::milliseconds(5));
    EXPECT_TRUE(scheduler.isRunning());
    for (int i = 0; i < 200 && runs->load() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_GE(runs->load(), 3);

    const int after_stop = runs->load();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(runs->load(), after_stop);
}
