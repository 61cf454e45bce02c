// include/tabvault/storage_error/error_codes.h
#pragma once

namespace tabvault {
namespace storage {

/**
 * @brief Error codes for record store, session storage engine and maintenance operations
 */
enum class ErrorCode : int {
    // Success
    OK = 0,

    // Store Errors (1000-1999)
    STORAGE_CORRUPTION = 1001,
    STORAGE_FULL = 1002,
    STORAGE_NOT_INITIALIZED = 1004,
    STORAGE_ALREADY_INITIALIZED = 1005,
    STORAGE_VERSION_MISMATCH = 1006,
    STORAGE_RECOVERY_FAILED = 1008,
    STORAGE_BACKFILL_FAILED = 1009,
    CONTAINER_NOT_FOUND = 1010,
    CONTAINER_ALREADY_EXISTS = 1011,
    INDEX_NOT_FOUND = 1012,
    INDEX_ALREADY_EXISTS = 1013,

    // I/O and File System Errors (4000-4999)
    IO_READ_ERROR = 4001,
    IO_WRITE_ERROR = 4002,
    IO_SYNC_ERROR = 4005,
    FILE_NOT_FOUND = 4006,
    FILE_PERMISSION_DENIED = 4007,
    DIRECTORY_NOT_FOUND = 4009,

    // Data Validation Errors (5000-5999)
    INVALID_KEY = 5001,
    INVALID_VALUE = 5002,
    KEY_NOT_FOUND = 5003,
    DUPLICATE_KEY = 5004,
    CHECKSUM_MISMATCH = 5005,
    INVALID_DATA_FORMAT = 5006,
    SCHEMA_VIOLATION = 5007,
    ENCODING_ERROR = 5008,
    COMPRESSION_ERROR = 5009,

    // Concurrency / Transaction Errors (6000-6999)
    TRANSACTION_CONFLICT = 6003,
    TRANSACTION_SCOPE_VIOLATION = 6007,
    TRANSACTION_READ_ONLY = 6008,
    TRANSACTION_FINISHED = 6009,

    // Configuration Errors (8000-8999)
    INVALID_CONFIGURATION = 8001,
    MISSING_REQUIRED_OPTION = 8002,
    OPTION_OUT_OF_RANGE = 8003,

    // Backup / Migration Errors (9000-9999)
    BACKUP_NOT_FOUND = 9001,
    BACKUPS_DISABLED = 9002,
    BACKUP_FAILED = 9003,
    MIGRATION_STEP_NOT_FOUND = 9101,
    MIGRATION_FAILED = 9102,
    MIGRATION_VALIDATION_FAILED = 9103,
    ROLLBACK_FAILED = 9104,

    // Generic Errors (10000+)
    TIMEOUT = 10001,
    CANCELLED = 10002,
    NOT_IMPLEMENTED = 10003,
    INTERNAL_ERROR = 10004,
    UNKNOWN_ERROR = 10005
};

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    INFO,       // Informational, operation can continue
    WARNING,    // Operation succeeded but with issues
    ERROR,      // Operation failed but the store is stable
    CRITICAL,   // Store consistency may be compromised
    FATAL       // Store is unusable
};

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory {
    STORE,
    IO_FILESYSTEM,
    DATA_VALIDATION,
    TRANSACTION,
    CONFIGURATION,
    BACKUP_MIGRATION,
    GENERIC
};

} // namespace storage
} // namespace tabvault
