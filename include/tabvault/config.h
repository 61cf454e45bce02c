// @include/tabvault/config.h
#pragma once

#include "compression_utils.h"
#include "storage_error/result.h"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace tabvault {

constexpr int64_t kMillisPerHour = 60LL * 60 * 1000;
constexpr int64_t kMillisPerDay = 24 * kMillisPerHour;

struct SerializerConfig {
    bool enable_compression = true;
    size_t compression_threshold = 1024;       // Bytes of encoded body before compression is tried
    bool enable_optimization = true;
    bool preserve_metadata = true;             // Verify checksums when reading records back
    CompressionType compression_type = CompressionType::ZSTD;
    int compression_level = 0;
    std::string checksum_algorithm = "crc32";  // "crc32" or "sha256"
};

struct StorageConfig {
    bool enable_compression = true;
    bool enable_integrity_checks = true;
    int64_t max_session_age_ms = 365 * kMillisPerDay;
    int64_t max_storage_size = 100LL * 1024 * 1024;
    size_t batch_size = 50;
    bool indexing_enabled = true;
    bool run_startup_maintenance = true;
    size_t journal_compaction_bytes = 4 * 1024 * 1024;
};

struct ValidatorConfig {
    bool enable_checks = true;
    bool enable_backups = true;
    int64_t backup_interval_ms = kMillisPerDay;
    size_t max_backups = 7;
    bool checksum_validation = true;
    bool relationship_validation = true;
    bool data_consistency_checks = true;
};

struct MigrationConfig {
    bool enable_backups = true;
    bool validate_after_migration = true;
    int max_retries = 3;
    bool rollback_on_failure = true;
    std::string log_level = "info";
};

struct StorageManagerOptions {
    std::string data_directory;    // Empty keeps the store in memory only
    std::string backup_directory;  // Empty keeps backups in memory only
    StorageConfig storage;
    ValidatorConfig validator;
    MigrationConfig migration;
    SerializerConfig serializer;
};

// Missing keys keep their defaults
void to_json(nlohmann::json& j, const SerializerConfig& config);
void from_json(const nlohmann::json& j, SerializerConfig& config);
void to_json(nlohmann::json& j, const StorageConfig& config);
void from_json(const nlohmann::json& j, StorageConfig& config);
void to_json(nlohmann::json& j, const ValidatorConfig& config);
void from_json(const nlohmann::json& j, ValidatorConfig& config);
void to_json(nlohmann::json& j, const MigrationConfig& config);
void from_json(const nlohmann::json& j, MigrationConfig& config);
void to_json(nlohmann::json& j, const StorageManagerOptions& options);
void from_json(const nlohmann::json& j, StorageManagerOptions& options);

storage::Status validateConfig(const StorageManagerOptions& options);

// Reads and validates a JSON options file
storage::Result<StorageManagerOptions> loadOptionsFromFile(const std::string& path);

} // namespace tabvault
