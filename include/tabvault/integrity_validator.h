// @include/tabvault/integrity_validator.h
#pragma once

#include "checksum.h"
#include "config.h"
#include "record_codec.h"
#include "storage_error/result.h"
#include "types.h"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tabvault {

enum class ValidationErrorType { CHECKSUM_MISMATCH, MISSING_REFERENCE, DATA_CORRUPTION, SCHEMA_VIOLATION };

enum class ValidationSeverity { CRITICAL, HIGH, MEDIUM, LOW };

enum class EntityType { SESSION, TAB, NAVIGATION_EVENT, BOUNDARY };

enum class ValidationWarningType { ORPHANED_DATA, INCONSISTENT_TIMESTAMP, MISSING_METADATA, OUTDATED_SCHEMA };

NLOHMANN_JSON_SERIALIZE_ENUM(ValidationErrorType, {
    {ValidationErrorType::CHECKSUM_MISMATCH, "checksum_mismatch"},
    {ValidationErrorType::MISSING_REFERENCE, "missing_reference"},
    {ValidationErrorType::DATA_CORRUPTION, "data_corruption"},
    {ValidationErrorType::SCHEMA_VIOLATION, "schema_violation"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ValidationSeverity, {
    {ValidationSeverity::CRITICAL, "critical"},
    {ValidationSeverity::HIGH, "high"},
    {ValidationSeverity::MEDIUM, "medium"},
    {ValidationSeverity::LOW, "low"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(EntityType, {
    {EntityType::SESSION, "session"},
    {EntityType::TAB, "tab"},
    {EntityType::NAVIGATION_EVENT, "navigation_event"},
    {EntityType::BOUNDARY, "boundary"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ValidationWarningType, {
    {ValidationWarningType::ORPHANED_DATA, "orphaned_data"},
    {ValidationWarningType::INCONSISTENT_TIMESTAMP, "inconsistent_timestamp"},
    {ValidationWarningType::MISSING_METADATA, "missing_metadata"},
    {ValidationWarningType::OUTDATED_SCHEMA, "outdated_schema"},
})

struct ValidationError {
    ValidationErrorType type = ValidationErrorType::SCHEMA_VIOLATION;
    ValidationSeverity severity = ValidationSeverity::LOW;
    EntityType entity_type = EntityType::SESSION;
    std::string entity_id;  // navigation events: "<tabId>_<timestamp>"
    std::string message;
    nlohmann::json details = nlohmann::json::object();
    bool can_auto_correct = false;
};

struct ValidationWarning {
    ValidationWarningType type = ValidationWarningType::MISSING_METADATA;
    EntityType entity_type = EntityType::SESSION;
    std::string entity_id;
    std::string message;
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;
    std::vector<ValidationWarning> warnings;
    size_t corrected_items = 0;
    double validation_time_ms = 0.0;

    void merge(const ValidationResult& other);
};

void to_json(nlohmann::json& j, const ValidationError& error);
void to_json(nlohmann::json& j, const ValidationWarning& warning);
void to_json(nlohmann::json& j, const ValidationResult& result);

struct BackupManifest {
    std::string id;
    Timestamp timestamp = 0;
    int version = 1;
    std::string description;
    size_t sessions = 0;
    size_t tabs = 0;
    size_t navigation_events = 0;
    size_t boundaries = 0;
    int64_t size = 0;         // Bytes of the encoded payload before compression
    std::string checksum;     // Over the encoded payload
    uint64_t sequence = 0;    // Creation order, breaks timestamp ties

    size_t totalItems() const { return sessions + tabs + navigation_events + boundaries; }
};

void to_json(nlohmann::json& j, const BackupManifest& manifest);
void from_json(const nlohmann::json& j, BackupManifest& manifest);

/**
 * @brief Applies repairs for auto-correctable validation errors to persisted records.
 * Implemented by the storage engine; the validator itself never writes records.
 */
class RecordCorrector {
public:
    virtual ~RecordCorrector() = default;

    virtual storage::Status recomputeChecksum(EntityType entity_type, const std::string& entity_id) = 0;
    // Moves a navigation event to the session that owns its tab
    virtual storage::Status reassignNavigationEvent(const std::string& entity_id) = 0;
    // Repairs the timestamps or window ids named by a schema_violation error
    virtual storage::Status repairSchemaViolation(const ValidationError& error) = 0;
};

/**
 * @brief Per-record and cross-record validation, plus backup management.
 *
 * Validation is read-only and returns findings as data. Backups are kept in memory
 * and, when a backup directory is configured, on disk as a zstd-compressed CBOR
 * payload next to a JSON manifest.
 */
class IntegrityValidator {
public:
    static constexpr const char* kBackupPayloadSuffix = ".payload";
    static constexpr const char* kBackupManifestSuffix = ".manifest.json";

    explicit IntegrityValidator(ValidatorConfig config, std::string backup_dir = "",
                                std::shared_ptr<const ChecksumAlgorithm> checksum = nullptr,
                                ClockFn clock = systemNowMs);

    ValidationResult validateSession(const StoredSession& stored) const;
    ValidationResult validateTab(const StoredTab& stored) const;
    ValidationResult validateNavigationEvent(const StoredNavigationEvent& stored) const;
    ValidationResult validateBoundary(const StoredSessionBoundary& stored) const;
    ValidationResult validateRecord(const StoredRecord& record) const;

    ValidationResult validateRelationships(const std::vector<StoredSession>& sessions,
                                           const std::vector<StoredTab>& tabs,
                                           const std::vector<StoredNavigationEvent>& events) const;

    // Every record of the collections plus the relationship sweep
    ValidationResult validateCollections(const RecordCollections& collections) const;

    // --- Backups ---
    storage::Result<BackupManifest> createBackup(const RecordCollections& collections,
                                                 const std::string& description = "");
    storage::Result<RecordCollections> restoreFromBackup(const std::string& backup_id) const;
    std::vector<BackupManifest> listBackups() const;  // Newest first
    storage::Status deleteBackup(const std::string& backup_id);
    bool shouldCreateBackup(Timestamp now) const;
    std::optional<Timestamp> lastBackupTime() const;

    /**
     * @brief Routes correctable errors to the corrector.
     * @return The errors left uncorrected. Without a corrector every error is returned.
     */
    std::vector<ValidationError> autoCorrectErrors(const std::vector<ValidationError>& errors,
                                                   RecordCorrector* corrector) const;

    const ValidatorConfig& config() const { return config_; }

private:
    struct BackupEntry {
        BackupManifest manifest;
        std::vector<uint8_t> payload;  // CBOR of the collections
    };

    template<typename Semantic>
    void checkChecksum(ValidationResult& result, EntityType entity_type, const std::string& entity_id,
                       const Semantic& semantic, const std::string& stored_checksum) const;

    void loadBackupsFromDisk();
    storage::Status persistBackup(const BackupEntry& entry) const;
    storage::Status writeBackupFiles(const BackupEntry& entry, const std::filesystem::path& payload_path,
                                     const std::filesystem::path& manifest_path) const;
    void removeBackupFiles(const std::string& backup_id) const;
    void enforceRetentionLocked();

    ValidatorConfig config_;
    std::string backup_dir_;
    std::shared_ptr<const ChecksumAlgorithm> checksum_;
    ClockFn clock_;

    mutable std::mutex backups_mutex_;
    std::map<std::string, BackupEntry> backups_;
    uint64_t next_sequence_ = 1;
    std::optional<Timestamp> last_backup_time_;
};

} // namespace tabvault
