//src/test/integrity_validator.test.cpp
#include "gtest/gtest.h"
#include "tabvault/data_serializer.h"
#include "tabvault/integrity_validator.h"
#include "test_fixtures.h"

#include <algorithm>
#include <climits>
#include <filesystem>
#include <iterator>

using namespace tabvault;
using testing_support::ManualClock;
using testing_support::makeEvent;
using testing_support::makeSession;
using testing_support::makeTab;

namespace {

// Records every repair request and fails the ones it is told to
class RecordingCorrector : public RecordCorrector {
public:
    std::vector<std::string> calls;
    bool fail_schema_repairs = false;

    storage::Status recomputeChecksum(EntityType, const std::string& entity_id) override {
        calls.push_back("checksum:" + entity_id);
        return {};
    }
    storage::Status reassignNavigationEvent(const std::string& entity_id) override {
        calls.push_back("reassign:" + entity_id);
        return {};
    }
    storage::Status repairSchemaViolation(const ValidationError& error) override {
        calls.push_back("schema:" + error.entity_id);
        if (fail_schema_repairs) {
            return storage::StorageError(storage::ErrorCode::NOT_IMPLEMENTED, "refused");
        }
        return {};
    }
};

} // namespace

class IntegrityValidatorTest : public ::testing::Test {
protected:
    std::string test_dir_;
    ManualClock clock_;
    SessionDataSerializer serializer_{SerializerConfig{}, makeDefaultChecksum(), clock_.fn()};

    void SetUp() override {
        test_dir_ = testing_support::uniqueTestDir("integrity_validator");
        testing_support::removeTestDir(test_dir_);
    }

    void TearDown() override {
        testing_support::removeTestDir(test_dir_);
    }

    IntegrityValidator makeValidator(ValidatorConfig config = {}, const std::string& backup_dir = "") {
        return IntegrityValidator(config, backup_dir, makeDefaultChecksum(), clock_.fn());
    }

    StoredSession sessionWithOneTab(const std::string& id) {
        Session session = makeSession(id, "work", clock_.now());
        session.window_ids = {1};
        session.tabs.push_back(makeTab(1, "https://example.com", 1, clock_.now()));
        return serializer_.serializeSession(session);
    }

    RecordCollections sampleCollections() {
        RecordCollections collections;
        collections.sessions.push_back(sessionWithOneTab("S1"));
        collections.tabs.push_back(serializer_.serializeTab(makeTab(1, "https://example.com", 1, clock_.now()), "S1"));
        collections.navigation_events.push_back(
            serializer_.serializeNavigationEvent(makeEvent(1, "https://example.com/next", clock_.now() + 10), "S1"));
        collections.boundaries.push_back(
            serializer_.serializeBoundary(testing_support::makeBoundary("B1", "S1", clock_.now())));
        return collections;
    }
};

TEST_F(IntegrityValidatorTest, WellFormedRecordsPass) {
    IntegrityValidator validator = makeValidator();
    ValidationResult result = validator.validateCollections(sampleCollections());
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(IntegrityValidatorTest, TabPointingAtMissingSessionIsAHighSeverityError) {
    IntegrityValidator validator = makeValidator();
    RecordCollections collections = sampleCollections();

    ValidationResult before = validator.validateRelationships(collections.sessions, collections.tabs,
                                                              collections.navigation_events);
    EXPECT_TRUE(before.is_valid);

    collections.tabs.push_back(serializer_.serializeTab(makeTab(2, "https://other.org", 1, clock_.now()), "ghost"));
    ValidationResult after = validator.validateRelationships(collections.sessions, collections.tabs,
                                                             collections.navigation_events);
    EXPECT_FALSE(after.is_valid);
    ASSERT_EQ(after.errors.size(), 1u);
    const ValidationError& error = after.errors.front();
    EXPECT_EQ(error.type, ValidationErrorType::MISSING_REFERENCE);
    EXPECT_EQ(error.severity, ValidationSeverity::HIGH);
    EXPECT_EQ(error.entity_type, EntityType::TAB);
    EXPECT_EQ(error.entity_id, "2");
    EXPECT_FALSE(error.can_auto_correct);
}

TEST_F(IntegrityValidatorTest, EventWithMissingSessionIsCorrectableAndMissingTabOnlyWarns) {
    IntegrityValidator validator = makeValidator();
    RecordCollections collections = sampleCollections();
    collections.navigation_events.push_back(
        serializer_.serializeNavigationEvent(makeEvent(1, "https://example.com/x", clock_.now() + 20), "ghost"));
    collections.navigation_events.push_back(
        serializer_.serializeNavigationEvent(makeEvent(99, "https://example.com/y", clock_.now() + 30), "S1"));

    ValidationResult result = validator.validateRelationships(collections.sessions, collections.tabs,
                                                              collections.navigation_events);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].severity, ValidationSeverity::MEDIUM);
    EXPECT_TRUE(result.errors[0].can_auto_correct);
    EXPECT_EQ(result.errors[0].entity_id, navigationEventEntityId(1, clock_.now() + 20));

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].type, ValidationWarningType::ORPHANED_DATA);
}

TEST_F(IntegrityValidatorTest, SessionTabCountMismatchWarns) {
    IntegrityValidator validator = makeValidator();
    RecordCollections collections = sampleCollections();
    collections.tabs.clear();

    ValidationResult result = validator.validateRelationships(collections.sessions, collections.tabs,
                                                              collections.navigation_events);
    EXPECT_TRUE(std::any_of(result.warnings.begin(), result.warnings.end(), [](const ValidationWarning& w) {
        return w.type == ValidationWarningType::INCONSISTENT_TIMESTAMP && w.entity_id == "S1";
    }));
}

TEST_F(IntegrityValidatorTest, ChecksumMismatchIsReportedWithExpectedValue) {
    IntegrityValidator validator = makeValidator();
    StoredSession stored = sessionWithOneTab("S1");
    std::string original = stored.checksum;
    stored.checksum = "deadbeef";

    ValidationResult result = validator.validateSession(stored);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].type, ValidationErrorType::CHECKSUM_MISMATCH);
    EXPECT_EQ(result.errors[0].severity, ValidationSeverity::HIGH);
    EXPECT_TRUE(result.errors[0].can_auto_correct);
    EXPECT_EQ(result.errors[0].details.at("expected"), original);
    EXPECT_EQ(result.errors[0].details.at("actual"), "deadbeef");

    ValidatorConfig relaxed;
    relaxed.checksum_validation = false;
    EXPECT_TRUE(makeValidator(relaxed).validateSession(stored).is_valid);
}

TEST_F(IntegrityValidatorTest, SchemaViolationsPerRecordKind) {
    IntegrityValidator validator = makeValidator();

    Session session = makeSession("S1", "", 0);
    session.tabs.push_back(makeTab(1, "https://example.com", 9, clock_.now()));
    ValidationResult session_result = validator.validateSession(serializer_.serializeSession(session));
    auto correctable = std::count_if(session_result.errors.begin(), session_result.errors.end(),
                                     [](const ValidationError& e) { return e.can_auto_correct; });
    EXPECT_EQ(session_result.errors.size(), 3u);  // tag, createdAt, window 9
    EXPECT_EQ(correctable, 2);

    StoredTab tab = serializer_.serializeTab(makeTab(0, "", 0, clock_.now()), "");
    ValidationResult tab_result = validator.validateTab(tab);
    EXPECT_EQ(tab_result.errors.size(), 4u);

    StoredNavigationEvent event = serializer_.serializeNavigationEvent(makeEvent(3, "https://example.com", 5), "");
    ValidationResult event_result = validator.validateNavigationEvent(event);
    ASSERT_EQ(event_result.errors.size(), 1u);
    EXPECT_TRUE(event_result.errors[0].can_auto_correct);

    StoredSessionBoundary boundary = serializer_.serializeBoundary(testing_support::makeBoundary("B1", "", 0));
    EXPECT_EQ(validator.validateBoundary(boundary).errors.size(), 2u);

    ValidatorConfig disabled;
    disabled.enable_checks = false;
    EXPECT_TRUE(makeValidator(disabled).validateTab(tab).is_valid);
}

TEST_F(IntegrityValidatorTest, ValidateRecordDispatchesOnKind) {
    IntegrityValidator validator = makeValidator();
    RecordCollections collections = sampleCollections();

    EXPECT_TRUE(validator.validateRecord(collections.sessions[0]).is_valid);
    EXPECT_TRUE(validator.validateRecord(collections.navigation_events[0]).is_valid);
    EXPECT_TRUE(validator.validateRecord(DatabaseMetadata{}).is_valid);

    StoredTab broken = collections.tabs[0];
    broken.tab.url.clear();
    ValidationResult result = validator.validateRecord(broken);
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.errors[0].entity_type, EntityType::TAB);
}

TEST_F(IntegrityValidatorTest, AutoCorrectRoutesErrorsByType) {
    IntegrityValidator validator = makeValidator();
    std::vector<ValidationError> errors(4);
    errors[0].type = ValidationErrorType::CHECKSUM_MISMATCH;
    errors[0].entity_id = "S1";
    errors[0].can_auto_correct = true;
    errors[1].type = ValidationErrorType::MISSING_REFERENCE;
    errors[1].entity_type = EntityType::NAVIGATION_EVENT;
    errors[1].entity_id = "1_100";
    errors[1].can_auto_correct = true;
    errors[2].type = ValidationErrorType::SCHEMA_VIOLATION;
    errors[2].entity_id = "S2";
    errors[2].can_auto_correct = true;
    errors[3].type = ValidationErrorType::MISSING_REFERENCE;
    errors[3].entity_type = EntityType::TAB;
    errors[3].entity_id = "7";

    RecordingCorrector corrector;
    corrector.fail_schema_repairs = true;
    std::vector<ValidationError> remaining = validator.autoCorrectErrors(errors, &corrector);

    EXPECT_EQ(corrector.calls, (std::vector<std::string>{"checksum:S1", "reassign:1_100", "schema:S2"}));
    ASSERT_EQ(remaining.size(), 2u);
    EXPECT_EQ(remaining[0].entity_id, "S2");
    EXPECT_EQ(remaining[1].entity_id, "7");

    EXPECT_EQ(validator.autoCorrectErrors(errors, nullptr).size(), errors.size());
}

TEST_F(IntegrityValidatorTest, BackupRoundTripAndRetention) {
    ValidatorConfig config;
    config.max_backups = 2;
    IntegrityValidator validator = makeValidator(config);
    EXPECT_TRUE(validator.shouldCreateBackup(clock_.now()));

    auto first = validator.createBackup(sampleCollections(), "first");
    ASSERT_TRUE(first.isOk()) << first.error().toString();
    EXPECT_EQ(first.value().sessions, 1u);
    EXPECT_EQ(first.value().tabs, 1u);
    EXPECT_EQ(first.value().navigation_events, 1u);
    EXPECT_EQ(first.value().boundaries, 1u);
    EXPECT_FALSE(validator.shouldCreateBackup(clock_.now()));

    clock_.advance(1000);
    auto second = validator.createBackup(sampleCollections());
    ASSERT_TRUE(second.isOk());
    EXPECT_EQ(second.value().description.rfind("Automatic backup created at ", 0), 0u);
    clock_.advance(1000);
    auto third = validator.createBackup(sampleCollections(), "third");
    ASSERT_TRUE(third.isOk());

    std::vector<BackupManifest> backups = validator.listBackups();
    ASSERT_EQ(backups.size(), 2u);
    EXPECT_EQ(backups[0].id, third.value().id);
    EXPECT_EQ(backups[1].id, second.value().id);

    auto pruned = validator.restoreFromBackup(first.value().id);
    ASSERT_FALSE(pruned.isOk());
    EXPECT_EQ(pruned.error().code, storage::ErrorCode::BACKUP_NOT_FOUND);

    auto restored = validator.restoreFromBackup(third.value().id);
    ASSERT_TRUE(restored.isOk()) << restored.error().toString();
    EXPECT_EQ(restored.value().totalItems(), 4u);
    EXPECT_EQ(restored.value().sessions[0].session.id, "S1");

    ASSERT_TRUE(validator.deleteBackup(second.value().id).isOk());
    EXPECT_EQ(validator.listBackups().size(), 1u);
    EXPECT_EQ(validator.deleteBackup(second.value().id).error().code, storage::ErrorCode::BACKUP_NOT_FOUND);

    clock_.advance(config.backup_interval_ms);
    EXPECT_TRUE(validator.shouldCreateBackup(clock_.now()));
}

TEST_F(IntegrityValidatorTest, BackupsCanBeDisabled) {
    ValidatorConfig config;
    config.enable_backups = false;
    IntegrityValidator validator = makeValidator(config);
    EXPECT_FALSE(validator.shouldCreateBackup(clock_.now()));

    auto backup = validator.createBackup(sampleCollections());
    ASSERT_FALSE(backup.isOk());
    EXPECT_EQ(backup.error().code, storage::ErrorCode::BACKUPS_DISABLED);
}

TEST_F(IntegrityValidatorTest, PersistedBackupsAreFoundByANewValidator) {
    std::string backup_id;
    {
        IntegrityValidator validator = makeValidator({}, test_dir_);
        auto backup = validator.createBackup(sampleCollections(), "on disk");
        ASSERT_TRUE(backup.isOk()) << backup.error().toString();
        backup_id = backup.value().id;
    }

    IntegrityValidator reloaded = makeValidator({}, test_dir_);
    std::vector<BackupManifest> backups = reloaded.listBackups();
    ASSERT_EQ(backups.size(), 1u);
    EXPECT_EQ(backups[0].id, backup_id);
    EXPECT_EQ(backups[0].description, "on disk");
    ASSERT_TRUE(reloaded.lastBackupTime().has_value());

    auto restored = reloaded.restoreFromBackup(backup_id);
    ASSERT_TRUE(restored.isOk()) << restored.error().toString();
    EXPECT_EQ(restored.value().navigation_events.size(), 1u);
}

TEST_F(IntegrityValidatorTest, FailedManifestWriteLeavesNoPayloadBehind) {
    // Sized so the manifest path reaches PATH_MAX while the shorter payload path still fits
    const std::string backup_id_shape = "backup_" + std::to_string(clock_.now()) + "_" + std::string(6, '0');
    const size_t manifest_suffix = std::string(IntegrityValidator::kBackupManifestSuffix).size();
    const size_t target = PATH_MAX - 1 - backup_id_shape.size() - manifest_suffix;
    std::string backup_dir = test_dir_;
    while (target - backup_dir.size() > 202) {
        backup_dir += "/" + std::string(200, 'd');
    }
    backup_dir += "/" + std::string(target - backup_dir.size() - 1, 'e');
    ASSERT_EQ(backup_dir.size(), target);

    IntegrityValidator validator = makeValidator({}, backup_dir);
    auto backup = validator.createBackup(sampleCollections(), "too deep");
    ASSERT_FALSE(backup.isOk());
    EXPECT_TRUE(validator.listBackups().empty());

    ASSERT_TRUE(std::filesystem::is_directory(backup_dir));
    EXPECT_EQ(std::distance(std::filesystem::directory_iterator(backup_dir), std::filesystem::directory_iterator()), 0);
}
