// src/storage_error/storage_error.cpp
#include "tabvault/storage_error/storage_error.h"
#include "tabvault/storage_error/error_utils.h"

#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace tabvault {
namespace storage {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
}

StorageError& StorageError::withDetails(const std::string& details_param) {
    details = details_param;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    file_path = file;
    line_number = line;
    function_name = function;
    return *this;
}

StorageError& StorageError::withUnderlyingError(ErrorCode underlying) {
    underlying_error = underlying;
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    file_path = path;
    return *this;
}

bool StorageError::isRecoverable() const {
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

bool StorageError::requiresShutdown() const {
    return severity == ErrorSeverity::FATAL;
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    if (!details.empty()) {
        oss << " - " << details;
    }
    return oss.str();
}

std::string StorageError::toDetailedString() const {
    std::ostringstream oss;
    oss << "Error Details:\n";
    oss << "  Code: " << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << ")\n";
    oss << "  Severity: " << error_utils::severityToString(severity) << "\n";
    oss << "  Category: " << error_utils::categoryToString(category) << "\n";
    oss << "  Message: " << message << "\n";
    if (!details.empty()) {
        oss << "  Details: " << details << "\n";
    }
    if (!suggested_action.empty()) {
        oss << "  Suggested Action: " << suggested_action << "\n";
    }
    if (file_path && line_number && function_name) {
        oss << "  Location: " << *function_name << " at " << *file_path << ":" << *line_number << "\n";
    } else if (file_path) {
        oss << "  File Path: " << *file_path << "\n";
    }
    if (underlying_error) {
        oss << "  Underlying Error: " << error_utils::errorCodeToString(*underlying_error)
            << " (" << static_cast<int>(*underlying_error) << ")\n";
    }
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [key, value] : context) {
            oss << "    " << key << ": " << value << "\n";
        }
    }
    std::time_t time_val = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    gmtime_r(&time_val, &tm_buf);
    oss << "  Timestamp: " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S UTC") << "\n";
    return oss.str();
}

std::string StorageError::toJson() const {
    nlohmann::json j;
    j["code"] = static_cast<int>(code);
    j["code_name"] = std::string(error_utils::errorCodeToString(code));
    j["severity"] = std::string(error_utils::severityToString(severity));
    j["category"] = std::string(error_utils::categoryToString(category));
    j["message"] = message;
    if (!details.empty()) j["details"] = details;
    if (!suggested_action.empty()) j["suggested_action"] = suggested_action;
    if (file_path && line_number && function_name) {
        j["location"] = {{"file", *file_path}, {"line", *line_number}, {"function", *function_name}};
    } else if (file_path) {
        j["file_path"] = *file_path;
    }
    if (underlying_error) {
        j["underlying_error_code"] = static_cast<int>(*underlying_error);
        j["underlying_error_name"] = std::string(error_utils::errorCodeToString(*underlying_error));
    }
    if (!context.empty()) {
        j["context"] = context;
    }
    j["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
    return j.dump();
}

StorageError StorageError::corruption(const std::string& details_param) {
    return StorageError(ErrorCode::STORAGE_CORRUPTION, "Storage corruption detected")
        .withDetails(details_param)
        .withSuggestedAction("Restore the store from a backup or remove the corrupt file");
}

StorageError StorageError::ioError(const std::string& operation, const std::string& path) {
    return StorageError(ErrorCode::IO_WRITE_ERROR, "I/O operation failed")
        .withDetails("Operation: " + operation)
        .withFilePath(path)
        .withSuggestedAction("Check file permissions and disk space");
}

StorageError StorageError::keyNotFound(const std::string& container, const std::string& key) {
    return StorageError(ErrorCode::KEY_NOT_FOUND, "Record not found")
        .withDetails("Container: " + container + ", Key: " + key)
        .withContext("container", container)
        .withContext("key", key);
}

StorageError StorageError::invalidShape(const std::string& container, const std::string& reason) {
    return StorageError(ErrorCode::SCHEMA_VIOLATION, "Invalid record shape for container '" + container + "'")
        .withDetails(reason)
        .withContext("container", container);
}

StorageError StorageError::backupNotFound(const std::string& backup_id) {
    return StorageError(ErrorCode::BACKUP_NOT_FOUND, "Backup not found: " + backup_id)
        .withContext("backup_id", backup_id);
}

StorageError StorageError::backupsDisabled() {
    return StorageError(ErrorCode::BACKUPS_DISABLED, "Backups are disabled")
        .withSuggestedAction("Set enableBackups in the validator configuration");
}

StorageError StorageError::migrationStepNotFound(int version) {
    return StorageError(ErrorCode::MIGRATION_STEP_NOT_FOUND,
                        "Migration step not found for version " + std::to_string(version))
        .withContext("version", std::to_string(version));
}

StorageError StorageError::notInitialized(const std::string& operation) {
    return StorageError(ErrorCode::STORAGE_NOT_INITIALIZED, "Storage engine is not initialized")
        .withDetails("Operation: " + operation)
        .withSuggestedAction("Call initialize() and check its status before use");
}

} // namespace storage
} // namespace tabvault
