#include "tabvault/config.h"
#include "tabvault/checksum.h"
#include "tabvault/debug_utils.h"
#include "tabvault/storage_error/error_utils.h"

#include <fstream>

namespace tabvault {

void to_json(nlohmann::json& j, const SerializerConfig& config) {
    j = nlohmann::json{
        {"enableCompression", config.enable_compression},
        {"compressionThreshold", config.compression_threshold},
        {"enableOptimization", config.enable_optimization},
        {"preserveMetadata", config.preserve_metadata},
        {"compressionType", compressionTypeToString(config.compression_type)},
        {"compressionLevel", config.compression_level},
        {"checksumAlgorithm", config.checksum_algorithm},
    };
}

void from_json(const nlohmann::json& j, SerializerConfig& config) {
    SerializerConfig defaults;
    config.enable_compression = j.value("enableCompression", defaults.enable_compression);
    config.compression_threshold = j.value("compressionThreshold", defaults.compression_threshold);
    config.enable_optimization = j.value("enableOptimization", defaults.enable_optimization);
    config.preserve_metadata = j.value("preserveMetadata", defaults.preserve_metadata);
    config.compression_type = compressionTypeFromString(
        j.value("compressionType", compressionTypeToString(defaults.compression_type)));
    config.compression_level = j.value("compressionLevel", defaults.compression_level);
    config.checksum_algorithm = j.value("checksumAlgorithm", defaults.checksum_algorithm);
}

void to_json(nlohmann::json& j, const StorageConfig& config) {
    j = nlohmann::json{
        {"enableCompression", config.enable_compression},
        {"enableIntegrityChecks", config.enable_integrity_checks},
        {"maxSessionAge", config.max_session_age_ms},
        {"maxStorageSize", config.max_storage_size},
        {"batchSize", config.batch_size},
        {"indexingEnabled", config.indexing_enabled},
        {"runStartupMaintenance", config.run_startup_maintenance},
        {"journalCompactionBytes", config.journal_compaction_bytes},
    };
}

void from_json(const nlohmann::json& j, StorageConfig& config) {
    StorageConfig defaults;
    config.enable_compression = j.value("enableCompression", defaults.enable_compression);
    config.enable_integrity_checks = j.value("enableIntegrityChecks", defaults.enable_integrity_checks);
    config.max_session_age_ms = j.value("maxSessionAge", defaults.max_session_age_ms);
    config.max_storage_size = j.value("maxStorageSize", defaults.max_storage_size);
    config.batch_size = j.value("batchSize", defaults.batch_size);
    config.indexing_enabled = j.value("indexingEnabled", defaults.indexing_enabled);
    config.run_startup_maintenance = j.value("runStartupMaintenance", defaults.run_startup_maintenance);
    config.journal_compaction_bytes = j.value("journalCompactionBytes", defaults.journal_compaction_bytes);
}

void to_json(nlohmann::json& j, const ValidatorConfig& config) {
    j = nlohmann::json{
        {"enableChecks", config.enable_checks},
        {"enableBackups", config.enable_backups},
        {"backupInterval", config.backup_interval_ms},
        {"maxBackups", config.max_backups},
        {"checksumValidation", config.checksum_validation},
        {"relationshipValidation", config.relationship_validation},
        {"dataConsistencyChecks", config.data_consistency_checks},
    };
}

void from_json(const nlohmann::json& j, ValidatorConfig& config) {
    ValidatorConfig defaults;
    config.enable_checks = j.value("enableChecks", defaults.enable_checks);
    config.enable_backups = j.value("enableBackups", defaults.enable_backups);
    config.backup_interval_ms = j.value("backupInterval", defaults.backup_interval_ms);
    config.max_backups = j.value("maxBackups", defaults.max_backups);
    config.checksum_validation = j.value("checksumValidation", defaults.checksum_validation);
    config.relationship_validation = j.value("relationshipValidation", defaults.relationship_validation);
    config.data_consistency_checks = j.value("dataConsistencyChecks", defaults.data_consistency_checks);
}

void to_json(nlohmann::json& j, const MigrationConfig& config) {
    j = nlohmann::json{
        {"enableBackups", config.enable_backups},
        {"validateAfterMigration", config.validate_after_migration},
        {"maxRetries", config.max_retries},
        {"rollbackOnFailure", config.rollback_on_failure},
        {"logLevel", config.log_level},
    };
}

void from_json(const nlohmann::json& j, MigrationConfig& config) {
    MigrationConfig defaults;
    config.enable_backups = j.value("enableBackups", defaults.enable_backups);
    config.validate_after_migration = j.value("validateAfterMigration", defaults.validate_after_migration);
    config.max_retries = j.value("maxRetries", defaults.max_retries);
    config.rollback_on_failure = j.value("rollbackOnFailure", defaults.rollback_on_failure);
    config.log_level = j.value("logLevel", defaults.log_level);
}

void to_json(nlohmann::json& j, const StorageManagerOptions& options) {
    j = nlohmann::json{
        {"dataDirectory", options.data_directory},
        {"backupDirectory", options.backup_directory},
        {"storage", options.storage},
        {"validator", options.validator},
        {"migration", options.migration},
        {"serializer", options.serializer},
    };
}

void from_json(const nlohmann::json& j, StorageManagerOptions& options) {
    options.data_directory = j.value("dataDirectory", std::string());
    options.backup_directory = j.value("backupDirectory", std::string());
    options.storage = j.value("storage", StorageConfig{});
    options.validator = j.value("validator", ValidatorConfig{});
    options.migration = j.value("migration", MigrationConfig{});
    options.serializer = j.value("serializer", SerializerConfig{});
}

storage::Status validateConfig(const StorageManagerOptions& options) {
    using storage::ErrorCode;
    if (options.storage.batch_size == 0) {
        return TABVAULT_ERROR(ErrorCode::INVALID_CONFIGURATION, "storage.batchSize must be greater than zero");
    }
    if (options.storage.max_session_age_ms <= 0) {
        return TABVAULT_ERROR(ErrorCode::INVALID_CONFIGURATION, "storage.maxSessionAge must be positive");
    }
    if (options.storage.max_storage_size <= 0) {
        return TABVAULT_ERROR(ErrorCode::INVALID_CONFIGURATION, "storage.maxStorageSize must be positive");
    }
    if (options.validator.max_backups == 0) {
        return TABVAULT_ERROR(ErrorCode::INVALID_CONFIGURATION, "validator.maxBackups must be at least 1");
    }
    if (options.validator.backup_interval_ms <= 0) {
        return TABVAULT_ERROR(ErrorCode::INVALID_CONFIGURATION, "validator.backupInterval must be positive");
    }
    if (options.migration.max_retries < 0) {
        return TABVAULT_ERROR(ErrorCode::OPTION_OUT_OF_RANGE, "migration.maxRetries cannot be negative");
    }
    if (!makeChecksum(options.serializer.checksum_algorithm)) {
        return TABVAULT_ERROR(ErrorCode::INVALID_CONFIGURATION,
                              "Unknown serializer.checksumAlgorithm: " + options.serializer.checksum_algorithm);
    }
    return {};
}

storage::Result<StorageManagerOptions> loadOptionsFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return storage::StorageError(storage::ErrorCode::FILE_NOT_FOUND, "Cannot open options file")
            .withFilePath(path);
    }
    StorageManagerOptions options;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        options = j.get<StorageManagerOptions>();
    } catch (const nlohmann::json::exception& e) {
        return TABVAULT_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "Malformed options file")
            .withDetails(e.what())
            .withFilePath(path);
    }
    auto status = validateConfig(options);
    if (!status.isOk()) {
        return status.error();
    }
    LOG_INFO("[Config] Loaded options from {} (dataDirectory='{}')", path, options.data_directory);
    return options;
}

} // namespace tabvault
