// include/tabvault/storage_error/storage_error.h
#pragma once

#include "error_codes.h"
#include <string>
#include <optional>
#include <chrono>
#include <unordered_map>

namespace tabvault {
namespace storage {

/**
 * @brief Detailed error information with context
 */
class StorageError {
public:
    ErrorCode code;
    ErrorSeverity severity; // Derived from code
    ErrorCategory category; // Derived from code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::optional<ErrorCode> underlying_error;
    std::unordered_map<std::string, std::string> context;

    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    // Builder pattern for detailed error construction
    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withUnderlyingError(ErrorCode underlying);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withFilePath(const std::string& path);

    bool isRecoverable() const;
    bool requiresShutdown() const;
    std::string toString() const;
    std::string toDetailedString() const;
    std::string toJson() const;

    // Factories for the operational errors surfaced by the public API
    static StorageError corruption(const std::string& details);
    static StorageError ioError(const std::string& operation, const std::string& path);
    static StorageError keyNotFound(const std::string& container, const std::string& key);
    static StorageError invalidShape(const std::string& container, const std::string& reason);
    static StorageError backupNotFound(const std::string& backup_id);
    static StorageError backupsDisabled();
    static StorageError migrationStepNotFound(int version);
    static StorageError notInitialized(const std::string& operation);
};

} // namespace storage
} // namespace tabvault
