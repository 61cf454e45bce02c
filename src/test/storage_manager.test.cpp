//src/test/storage_manager.test.cpp
#include "gtest/gtest.h"
#include "tabvault/storage_manager.h"
#include "test_fixtures.h"

#include <thread>

using namespace tabvault;
using testing_support::makeBoundary;
using testing_support::makeEvent;
using testing_support::makeSession;
using testing_support::makeTab;

class SessionStorageManagerTest : public ::testing::Test {
protected:
    std::string test_dir_;
    testing_support::ManualClock clock_;
    std::unique_ptr<SessionStorageManager> manager_;

    void SetUp() override {
        test_dir_ = testing_support::uniqueTestDir("storage_manager");
        testing_support::removeTestDir(test_dir_);
        manager_ = std::make_unique<SessionStorageManager>(persistentOptions(), clock_.fn());
        auto status = manager_->initialize();
        ASSERT_TRUE(status.isOk()) << status.error().toString();
    }

    void TearDown() override {
        if (manager_) {
            EXPECT_TRUE(manager_->shutdown().isOk());
            manager_.reset();
        }
        testing_support::removeTestDir(test_dir_);
    }

    StorageManagerOptions persistentOptions() const {
        StorageManagerOptions options;
        options.data_directory = test_dir_ + "/data";
        options.backup_directory = test_dir_ + "/backups";
        options.migration.log_level = "warn";
        return options;
    }

    // Session s1 in window 1 with two tabs, their events and a start boundary
    void populate() {
        Session session = makeSession("s1", "research", clock_.now());
        session.window_ids = {1};
        session.tabs.push_back(makeTab(1, "https://example.com/a", 1, clock_.now()));
        session.tabs.push_back(makeTab(2, "https://example.org/b", 1, clock_.now()));
        ASSERT_TRUE(manager_->createSession(session).isOk());
        for (const auto& tab : session.tabs) {
            ASSERT_TRUE(manager_->createTab(tab, "s1").isOk());
        }
        ASSERT_TRUE(manager_->createNavigationEvents({makeEvent(1, "https://example.com/a1", clock_.now() + 1),
                                                      makeEvent(2, "https://example.org/b1", clock_.now() + 2)},
                                                     "s1")
                        .isOk());
        ASSERT_TRUE(manager_->createBoundary(makeBoundary("b1", "s1", clock_.now())).isOk());
    }
};

TEST_F(SessionStorageManagerTest, RecordOperationsReturnDomainObjects) {
    populate();

    auto session = manager_->getSession("s1");
    ASSERT_TRUE(session.isOk());
    ASSERT_TRUE(session.value().has_value());
    EXPECT_EQ(session.value()->tag, "research");
    EXPECT_EQ(session.value()->tabs.size(), 2u);

    TabQuery tabs;
    tabs.session_ids = {"s1"};
    auto tab_results = manager_->queryTabs(tabs);
    ASSERT_TRUE(tab_results.isOk());
    EXPECT_EQ(tab_results.value().size(), 2u);

    auto event = manager_->getNavigationEvent(2, clock_.now() + 2);
    ASSERT_TRUE(event.isOk());
    ASSERT_TRUE(event.value().has_value());
    EXPECT_EQ(event.value()->url, "https://example.org/b1");

    BoundaryPatch patch;
    patch.reason = BoundaryReason::DOMAIN_CHANGE;
    auto boundary = manager_->updateBoundary("b1", patch);
    ASSERT_TRUE(boundary.isOk());
    EXPECT_EQ(boundary.value().reason, BoundaryReason::DOMAIN_CHANGE);

    BoundaryQuery by_reason;
    by_reason.reasons = {BoundaryReason::DOMAIN_CHANGE};
    auto boundaries = manager_->queryBoundaries(by_reason);
    ASSERT_TRUE(boundaries.isOk());
    ASSERT_EQ(boundaries.value().size(), 1u);
    EXPECT_EQ(boundaries.value()[0].id, "b1");

    ASSERT_TRUE(manager_->deleteSession("s1").isOk());
    auto gone = manager_->getTab(1);
    ASSERT_TRUE(gone.isOk());
    EXPECT_FALSE(gone.value().has_value());
}

TEST_F(SessionStorageManagerTest, InvalidOptionsFailInitialization) {
    StorageManagerOptions options;
    options.storage.batch_size = 0;
    SessionStorageManager manager(options, clock_.fn());
    auto status = manager.initialize();
    ASSERT_FALSE(status.isOk());
    EXPECT_EQ(status.error().code, storage::ErrorCode::INVALID_CONFIGURATION);
    EXPECT_FALSE(manager.isInitialized());
}

TEST_F(SessionStorageManagerTest, AutoCorrectionRepairsMissingWindowIds) {
    Session session = makeSession("s2", "work", clock_.now());
    session.window_ids = {1};
    Tab stray = makeTab(7, "https://example.com", 5, clock_.now());
    session.tabs.push_back(stray);
    ASSERT_TRUE(manager_->createSession(session).isOk());
    ASSERT_TRUE(manager_->createTab(stray, "s2").isOk());

    auto report = manager_->validateIntegrity(false);
    ASSERT_TRUE(report.isOk());
    EXPECT_FALSE(report.value().is_valid);
    ASSERT_EQ(report.value().errors.size(), 1u);
    EXPECT_TRUE(report.value().errors[0].can_auto_correct);

    auto corrected = manager_->validateIntegrity(true);
    ASSERT_TRUE(corrected.isOk());
    EXPECT_TRUE(corrected.value().is_valid);
    EXPECT_EQ(corrected.value().corrected_items, 1u);

    auto repaired = manager_->getSession("s2");
    ASSERT_TRUE(repaired.isOk());
    ASSERT_TRUE(repaired.value().has_value());
    EXPECT_EQ(repaired.value()->window_ids, (std::vector<WindowId>{1, 5}));

    auto rerun = manager_->validateIntegrity(false);
    ASSERT_TRUE(rerun.isOk());
    EXPECT_TRUE(rerun.value().errors.empty());
}

TEST_F(SessionStorageManagerTest, BackupAndRestore) {
    populate();
    auto backup = manager_->createBackup("before cleanup");
    ASSERT_TRUE(backup.isOk()) << backup.error().toString();
    EXPECT_EQ(backup.value().totalItems(), 6u);
    EXPECT_EQ(backup.value().description, "before cleanup");

    auto stats = manager_->engine().getMetadata();
    ASSERT_TRUE(stats.isOk());
    ASSERT_TRUE(stats.value().last_backup.has_value());
    EXPECT_EQ(*stats.value().last_backup, backup.value().timestamp);

    ASSERT_TRUE(manager_->deleteSession("s1").isOk());
    ASSERT_TRUE(manager_->createSession(makeSession("later", "work", clock_.now())).isOk());

    auto restored = manager_->restoreFromBackup(backup.value().id);
    ASSERT_TRUE(restored.isOk()) << restored.error().toString();
    EXPECT_EQ(restored.value().imported, 6u);
    EXPECT_TRUE(restored.value().success());

    auto session = manager_->getSession("s1");
    ASSERT_TRUE(session.isOk());
    EXPECT_TRUE(session.value().has_value());
    auto later = manager_->getSession("later");
    ASSERT_TRUE(later.isOk());
    EXPECT_FALSE(later.value().has_value());

    auto missing = manager_->restoreFromBackup("backup_does_not_exist");
    ASSERT_FALSE(missing.isOk());
    EXPECT_EQ(missing.error().code, storage::ErrorCode::BACKUP_NOT_FOUND);
}

TEST_F(SessionStorageManagerTest, RestoreWithoutOverwriteKeepsExistingRecords) {
    populate();
    auto backup = manager_->createBackup();
    ASSERT_TRUE(backup.isOk());

    SessionPatch patch;
    patch.tag = "edited";
    ASSERT_TRUE(manager_->updateSession("s1", patch).isOk());

    auto restored = manager_->restoreFromBackup(backup.value().id, false);
    ASSERT_TRUE(restored.isOk());
    EXPECT_EQ(restored.value().imported, 0u);
    EXPECT_EQ(restored.value().skipped, 6u);

    auto session = manager_->getSession("s1");
    ASSERT_TRUE(session.isOk());
    ASSERT_TRUE(session.value().has_value());
    EXPECT_EQ(session.value()->tag, "edited");
}

TEST_F(SessionStorageManagerTest, ExportThenImportIntoAnEmptyStore) {
    populate();
    auto exported = manager_->exportData();
    ASSERT_TRUE(exported.isOk());
    EXPECT_EQ(exported.value().item_counts.total(), 6u);

    ASSERT_TRUE(manager_->clearAllData().isOk());
    auto empty = manager_->getStorageStats();
    ASSERT_TRUE(empty.isOk());
    EXPECT_EQ(empty.value().sessions, 0);

    auto imported = manager_->importData(exported.value().data);
    ASSERT_TRUE(imported.isOk());
    EXPECT_EQ(imported.value().imported, 6u);
    EXPECT_EQ(imported.value().skipped, 0u);

    auto stats = manager_->getStorageStats();
    ASSERT_TRUE(stats.isOk());
    EXPECT_EQ(stats.value().sessions, 1);
    EXPECT_EQ(stats.value().tabs, 2);
    EXPECT_EQ(stats.value().navigation_events, 2);
    EXPECT_EQ(stats.value().boundaries, 1);
}

TEST_F(SessionStorageManagerTest, MaintenanceRunsDueTasks) {
    populate();
    auto reports = manager_->runMaintenance(clock_.now());
    ASSERT_EQ(reports.size(), 3u);
    for (const auto& report : reports) {
        EXPECT_TRUE(report.success) << report.task << ": " << report.error;
    }
    ASSERT_EQ(manager_->listBackups().size(), 1u);

    // Nothing is due again an hour later except the integrity check
    clock_.advance(kMillisPerHour);
    reports = manager_->runMaintenance(clock_.now());
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].task, SessionStorageManager::kIntegrityTask);
    EXPECT_EQ(manager_->listBackups().size(), 1u);

    auto meta = manager_->engine().getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().integrity_check.last_check, clock_.now());
}

TEST_F(SessionStorageManagerTest, DataAndBackupsSurviveRestart) {
    populate();
    auto backup = manager_->createBackup();
    ASSERT_TRUE(backup.isOk());
    ASSERT_TRUE(manager_->shutdown().isOk());

    manager_ = std::make_unique<SessionStorageManager>(persistentOptions(), clock_.fn());
    ASSERT_TRUE(manager_->initialize().isOk());

    auto info = manager_->getVersionInfo();
    ASSERT_TRUE(info.isOk());
    EXPECT_EQ(info.value().current, 1);
    EXPECT_TRUE(info.value().is_up_to_date);

    auto session = manager_->getSession("s1");
    ASSERT_TRUE(session.isOk());
    EXPECT_TRUE(session.value().has_value());

    auto backups = manager_->listBackups();
    ASSERT_EQ(backups.size(), 1u);
    EXPECT_EQ(backups[0].id, backup.value().id);
}

TEST_F(SessionStorageManagerTest, BackgroundMaintenanceRunsOnItsOwnThread) {
    populate();
    EXPECT_EQ(manager_->scheduler().taskNames().size(), 3u);

    manager_->startBackgroundMaintenance(std::chrono::milliseconds(5));
    EXPECT_TRUE(manager_->scheduler().isRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    manager_->stopBackgroundMaintenance();
    EXPECT_FALSE(manager_->scheduler().isRunning());

    // Every task is due on the first tick, so the backup task has run
    EXPECT_EQ(manager_->listBackups().size(), 1u);
}

TEST(SessionStorageManagerMemoryTest, InMemoryStoreNeedsNoDirectories) {
    testing_support::ManualClock clock;
    SessionStorageManager manager(StorageManagerOptions{}, clock.fn());
    ASSERT_TRUE(manager.initialize().isOk());
    ASSERT_TRUE(manager.createSession(makeSession("m1", "memory", clock.now())).isOk());

    SessionQuery query;
    query.search_text = "MEM";
    auto sessions = manager.querySessions(query);
    ASSERT_TRUE(sessions.isOk());
    ASSERT_EQ(sessions.value().size(), 1u);
    EXPECT_EQ(sessions.value()[0].id, "m1");
    EXPECT_TRUE(manager.shutdown().isOk());
}
