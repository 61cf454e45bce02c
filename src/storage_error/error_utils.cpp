// src/storage_error/error_utils.cpp
#include "tabvault/storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace tabvault {
namespace storage {
namespace error_utils {

// ErrorCode values lie outside magic_enum's default reflection range, so they are spelled out.
std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::STORAGE_CORRUPTION: return "STORAGE_CORRUPTION";
        case ErrorCode::STORAGE_FULL: return "STORAGE_FULL";
        case ErrorCode::STORAGE_NOT_INITIALIZED: return "STORAGE_NOT_INITIALIZED";
        case ErrorCode::STORAGE_ALREADY_INITIALIZED: return "STORAGE_ALREADY_INITIALIZED";
        case ErrorCode::STORAGE_VERSION_MISMATCH: return "STORAGE_VERSION_MISMATCH";
        case ErrorCode::STORAGE_RECOVERY_FAILED: return "STORAGE_RECOVERY_FAILED";
        case ErrorCode::STORAGE_BACKFILL_FAILED: return "STORAGE_BACKFILL_FAILED";
        case ErrorCode::CONTAINER_NOT_FOUND: return "CONTAINER_NOT_FOUND";
        case ErrorCode::CONTAINER_ALREADY_EXISTS: return "CONTAINER_ALREADY_EXISTS";
        case ErrorCode::INDEX_NOT_FOUND: return "INDEX_NOT_FOUND";
        case ErrorCode::INDEX_ALREADY_EXISTS: return "INDEX_ALREADY_EXISTS";
        case ErrorCode::IO_READ_ERROR: return "IO_READ_ERROR";
        case ErrorCode::IO_WRITE_ERROR: return "IO_WRITE_ERROR";
        case ErrorCode::IO_SYNC_ERROR: return "IO_SYNC_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_PERMISSION_DENIED: return "FILE_PERMISSION_DENIED";
        case ErrorCode::DIRECTORY_NOT_FOUND: return "DIRECTORY_NOT_FOUND";
        case ErrorCode::INVALID_KEY: return "INVALID_KEY";
        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        case ErrorCode::KEY_NOT_FOUND: return "KEY_NOT_FOUND";
        case ErrorCode::DUPLICATE_KEY: return "DUPLICATE_KEY";
        case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ErrorCode::INVALID_DATA_FORMAT: return "INVALID_DATA_FORMAT";
        case ErrorCode::SCHEMA_VIOLATION: return "SCHEMA_VIOLATION";
        case ErrorCode::ENCODING_ERROR: return "ENCODING_ERROR";
        case ErrorCode::COMPRESSION_ERROR: return "COMPRESSION_ERROR";
        case ErrorCode::TRANSACTION_CONFLICT: return "TRANSACTION_CONFLICT";
        case ErrorCode::TRANSACTION_SCOPE_VIOLATION: return "TRANSACTION_SCOPE_VIOLATION";
        case ErrorCode::TRANSACTION_READ_ONLY: return "TRANSACTION_READ_ONLY";
        case ErrorCode::TRANSACTION_FINISHED: return "TRANSACTION_FINISHED";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::MISSING_REQUIRED_OPTION: return "MISSING_REQUIRED_OPTION";
        case ErrorCode::OPTION_OUT_OF_RANGE: return "OPTION_OUT_OF_RANGE";
        case ErrorCode::BACKUP_NOT_FOUND: return "BACKUP_NOT_FOUND";
        case ErrorCode::BACKUPS_DISABLED: return "BACKUPS_DISABLED";
        case ErrorCode::BACKUP_FAILED: return "BACKUP_FAILED";
        case ErrorCode::MIGRATION_STEP_NOT_FOUND: return "MIGRATION_STEP_NOT_FOUND";
        case ErrorCode::MIGRATION_FAILED: return "MIGRATION_FAILED";
        case ErrorCode::MIGRATION_VALIDATION_FAILED: return "MIGRATION_VALIDATION_FAILED";
        case ErrorCode::ROLLBACK_FAILED: return "ROLLBACK_FAILED";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::NOT_IMPLEMENTED: return "NOT_IMPLEMENTED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_CODE";
}

std::string_view severityToString(ErrorSeverity severity) {
    return magic_enum::enum_name(severity);
}

std::string_view categoryToString(ErrorCategory category) {
    return magic_enum::enum_name(category);
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorSeverity::INFO;

        case ErrorCode::STORAGE_CORRUPTION:
        case ErrorCode::STORAGE_RECOVERY_FAILED:
            return ErrorSeverity::FATAL;

        case ErrorCode::STORAGE_FULL:
        case ErrorCode::STORAGE_VERSION_MISMATCH:
        case ErrorCode::MIGRATION_FAILED:
        case ErrorCode::ROLLBACK_FAILED:
        case ErrorCode::IO_SYNC_ERROR:
            return ErrorSeverity::CRITICAL;

        case ErrorCode::IO_READ_ERROR:
        case ErrorCode::IO_WRITE_ERROR:
        case ErrorCode::FILE_NOT_FOUND:
        case ErrorCode::FILE_PERMISSION_DENIED:
        case ErrorCode::CHECKSUM_MISMATCH:
        case ErrorCode::INVALID_DATA_FORMAT:
        case ErrorCode::ENCODING_ERROR:
        case ErrorCode::COMPRESSION_ERROR:
        case ErrorCode::SCHEMA_VIOLATION:
        case ErrorCode::TRANSACTION_CONFLICT:
        case ErrorCode::INVALID_CONFIGURATION:
        case ErrorCode::BACKUP_FAILED:
        case ErrorCode::MIGRATION_VALIDATION_FAILED:
        case ErrorCode::STORAGE_BACKFILL_FAILED:
            return ErrorSeverity::ERROR;

        case ErrorCode::BACKUPS_DISABLED:
        case ErrorCode::OPTION_OUT_OF_RANGE:
        case ErrorCode::STORAGE_ALREADY_INITIALIZED:
            return ErrorSeverity::WARNING;

        case ErrorCode::KEY_NOT_FOUND:
        case ErrorCode::BACKUP_NOT_FOUND:
        case ErrorCode::DUPLICATE_KEY:
        case ErrorCode::CANCELLED:
        case ErrorCode::NOT_IMPLEMENTED:
            return ErrorSeverity::INFO;

        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 1000 && code_value < 2000) {
        return ErrorCategory::STORE;
    } else if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::IO_FILESYSTEM;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::DATA_VALIDATION;
    } else if (code_value >= 6000 && code_value < 7000) {
        return ErrorCategory::TRANSACTION;
    } else if (code_value >= 8000 && code_value < 9000) {
        return ErrorCategory::CONFIGURATION;
    } else if (code_value >= 9000 && code_value < 10000) {
        return ErrorCategory::BACKUP_MIGRATION;
    }
    return ErrorCategory::GENERIC;
}

bool isStoreError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::STORE; }
bool isIoError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::IO_FILESYSTEM; }
bool isBackupOrMigrationError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::BACKUP_MIGRATION; }

bool isRecoverable(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

bool isCritical(ErrorCode code) {
    return !isRecoverable(code);
}

} // namespace error_utils
} // namespace storage
} // namespace tabvault
