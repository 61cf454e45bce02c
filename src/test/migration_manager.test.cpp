//src/test/migration_manager.test.cpp
#include "gtest/gtest.h"
#include "tabvault/migration_manager.h"
#include "tabvault/storage_error/error_utils.h"
#include "test_fixtures.h"

using namespace tabvault;
using nlohmann::json;

class MigrationManagerTest : public ::testing::Test {
protected:
    std::string test_dir_;
    testing_support::ManualClock clock_;
    SchemaRegistry registry_;
    std::unique_ptr<RecordStore> store_;

    void SetUp() override {
        test_dir_ = testing_support::uniqueTestDir("migration_manager");
        testing_support::removeTestDir(test_dir_);
        auto opened = RecordStore::open(test_dir_);
        ASSERT_TRUE(opened.isOk()) << opened.error().toString();
        store_ = std::move(opened).value();
    }

    void TearDown() override {
        store_.reset();
        testing_support::removeTestDir(test_dir_);
    }

    MigrationConfig quietConfig() {
        MigrationConfig config;
        config.log_level = "warn";
        config.max_retries = 0;
        return config;
    }

    // Step 2 creates a scratch container and then fails
    static MigrationStep failingScratchStep() {
        MigrationStep step;
        step.version = 2;
        step.description = "Add scratch container";
        step.execute = [](SchemaUpgrade& upgrade) -> storage::Status {
            ContainerDescriptor scratch{"scratch", {"id"}, {}, 2};
            RETURN_IF_ERROR(upgrade.createContainer(scratch));
            return storage::StorageError(storage::ErrorCode::MIGRATION_FAILED, "index build interrupted");
        };
        step.rollback = [](SchemaUpgrade& upgrade) -> storage::Status {
            if (upgrade.hasContainer("scratch")) {
                return upgrade.deleteContainer("scratch");
            }
            return {};
        };
        return step;
    }

    static CollectionsReader emptyReader() {
        return [](RecordStore&) -> storage::Result<RecordCollections> { return RecordCollections{}; };
    }
};

TEST_F(MigrationManagerTest, InitialMigrationCreatesEveryContainerAndIndex) {
    MigrationManager manager(quietConfig(), registry_, nullptr, nullptr, clock_.fn());
    MigrationResult result = manager.performMigration(*store_, 0, 1);

    ASSERT_TRUE(result.success) << (result.errors.empty() ? "" : result.errors.front());
    EXPECT_EQ(result.steps_executed, 1);
    EXPECT_EQ(store_->version(), 1);
    for (const auto& container : registry_.containers()) {
        ASSERT_TRUE(store_->hasContainer(container.name)) << container.name;
        for (const auto& index : container.indexes) {
            EXPECT_TRUE(store_->hasIndex(container.name, index.name)) << container.name << "." << index.name;
        }
    }

    auto txn = store_->begin({containers::METADATA}, TransactionMode::READ_ONLY);
    auto metadata = txn->get(containers::METADATA, Key{int64_t{1}});
    ASSERT_TRUE(metadata.isOk());
    ASSERT_TRUE(metadata.value().has_value());
    EXPECT_EQ(metadata.value()->at("version"), 1);

    auto persisted = RecordStore::readPersistedVersion(test_dir_);
    ASSERT_TRUE(persisted.isOk());
    EXPECT_EQ(persisted.value(), 1);
}

TEST_F(MigrationManagerTest, SameVersionRunsNoSteps) {
    MigrationManager manager(quietConfig(), registry_, nullptr, nullptr, clock_.fn());
    MigrationResult result = manager.performMigration(*store_, 0, 0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.steps_executed, 0);
    EXPECT_EQ(store_->version(), 0);
}

TEST_F(MigrationManagerTest, DowngradeAndUnknownStepsFail) {
    MigrationManager manager(quietConfig(), registry_, nullptr, nullptr, clock_.fn());
    EXPECT_FALSE(manager.performMigration(*store_, 2, 1).success);

    auto steps = manager.getMigrationSteps(0, 3);
    ASSERT_FALSE(steps.isOk());
    EXPECT_EQ(steps.error().code, storage::ErrorCode::MIGRATION_STEP_NOT_FOUND);

    MigrationResult result = manager.performMigration(*store_, 0, 3);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errors.empty());
    EXPECT_FALSE(store_->hasContainer(containers::SESSIONS));
}

TEST_F(MigrationManagerTest, FailedStepRollsBackTheWholeRun) {
    MigrationManager manager(quietConfig(), registry_, nullptr, nullptr, clock_.fn());
    manager.registerStep(failingScratchStep());

    MigrationResult result = manager.performMigration(*store_, 0, 2);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.steps_executed, 1);
    EXPECT_FALSE(result.errors.empty());
    EXPECT_FALSE(store_->hasContainer("scratch"));
    EXPECT_FALSE(store_->hasContainer(containers::SESSIONS));
    EXPECT_EQ(store_->version(), 0);

    // The store accepts a new upgrade afterwards
    MigrationResult retry = manager.performMigration(*store_, 0, 1);
    EXPECT_TRUE(retry.success);
}

TEST_F(MigrationManagerTest, WithoutRollbackCompletedStepsAreKept) {
    MigrationConfig config = quietConfig();
    config.rollback_on_failure = false;
    MigrationManager manager(config, registry_, nullptr, nullptr, clock_.fn());
    manager.registerStep(failingScratchStep());

    MigrationResult result = manager.performMigration(*store_, 0, 2);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(store_->version(), 1);
    EXPECT_TRUE(store_->hasContainer(containers::SESSIONS));

    auto txn = store_->begin({containers::METADATA}, TransactionMode::READ_ONLY);
    auto metadata = txn->get(containers::METADATA, Key{int64_t{1}});
    ASSERT_TRUE(metadata.isOk());
    EXPECT_TRUE(metadata.value().has_value());
}

TEST_F(MigrationManagerTest, StepsAreRetried) {
    MigrationConfig config = quietConfig();
    config.max_retries = 2;
    MigrationManager manager(config, registry_, nullptr, nullptr, clock_.fn());

    auto attempts = std::make_shared<int>(0);
    MigrationStep flaky;
    flaky.version = 2;
    flaky.description = "Flaky step";
    flaky.execute = [attempts](SchemaUpgrade&) -> storage::Status {
        if (++*attempts < 2) {
            throw std::runtime_error("transient");
        }
        return {};
    };
    manager.registerStep(flaky);

    MigrationResult result = manager.performMigration(*store_, 0, 2);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(*attempts, 2);
    EXPECT_EQ(result.steps_executed, 2);
    EXPECT_EQ(store_->version(), 2);
}

TEST_F(MigrationManagerTest, UpgradeOfExistingStoreTakesABackupFirst) {
    IntegrityValidator validator(ValidatorConfig{}, "", makeDefaultChecksum(), clock_.fn());
    MigrationManager manager(quietConfig(), registry_, &validator, emptyReader(), clock_.fn());
    ASSERT_TRUE(manager.performMigration(*store_, 0, 1).success);
    EXPECT_TRUE(validator.listBackups().empty());

    MigrationStep noop;
    noop.version = 2;
    noop.description = "No schema change";
    noop.execute = [](SchemaUpgrade&) -> storage::Status { return {}; };
    manager.registerStep(noop);

    MigrationResult result = manager.performMigration(*store_, 1, 2);
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.backup_created.has_value());
    ASSERT_EQ(validator.listBackups().size(), 1u);
    EXPECT_EQ(validator.listBackups().front().id, *result.backup_created);
}

TEST_F(MigrationManagerTest, DisabledBackupsOnlyWarn) {
    ValidatorConfig no_backups;
    no_backups.enable_backups = false;
    IntegrityValidator validator(no_backups, "", makeDefaultChecksum(), clock_.fn());
    MigrationManager manager(quietConfig(), registry_, &validator, emptyReader(), clock_.fn());
    ASSERT_TRUE(manager.performMigration(*store_, 0, 1).success);

    MigrationStep noop;
    noop.version = 2;
    noop.description = "No schema change";
    noop.execute = [](SchemaUpgrade&) -> storage::Status { return {}; };
    manager.registerStep(noop);

    MigrationResult result = manager.performMigration(*store_, 1, 2);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.backup_created.has_value());
    EXPECT_FALSE(result.warnings.empty());
}

TEST_F(MigrationManagerTest, VersionInfoReadsTheManifest) {
    MigrationManager manager(quietConfig(), registry_, nullptr, nullptr, clock_.fn());

    auto before = manager.getVersionInfo(test_dir_);
    ASSERT_TRUE(before.isOk());
    EXPECT_EQ(before.value().current, 0);
    EXPECT_EQ(before.value().latest, 1);
    EXPECT_TRUE(before.value().migration_required);
    EXPECT_EQ(before.value().migration_steps.size(), 1u);

    ASSERT_TRUE(manager.performMigration(*store_, 0, 1).success);
    auto needed = manager.isMigrationNeeded(test_dir_);
    ASSERT_TRUE(needed.isOk());
    EXPECT_FALSE(needed.value());

    auto available = manager.getAvailableMigrations();
    ASSERT_EQ(available.size(), 1u);
    EXPECT_TRUE(available[0].has_rollback);
    EXPECT_TRUE(available[0].has_validation);
}

TEST_F(MigrationManagerTest, MigrationLevelLeavesTheProcessLevelAlone) {
    const log::Level before = log::getLevel();
    log::setLevel(log::Level::INFO);

    MigrationConfig config = quietConfig();
    config.log_level = "error";
    MigrationManager manager(config, registry_, nullptr, nullptr, clock_.fn());

    log::Level seen_during_step = log::Level::OFF;
    MigrationStep step;
    step.version = 2;
    step.description = "Observe the log level";
    step.execute = [&seen_during_step](SchemaUpgrade&) -> storage::Status {
        seen_during_step = log::getLevel();
        return {};
    };
    manager.registerStep(step);

    MigrationResult result = manager.performMigration(*store_, 0, 2);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(seen_during_step, log::Level::INFO);
    EXPECT_EQ(log::getLevel(), log::Level::INFO);
    log::setLevel(before);
}
