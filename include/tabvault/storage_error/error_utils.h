// include/tabvault/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h"
#include "result.h"

#include <string_view>

namespace tabvault {
namespace storage {
namespace error_utils {

    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

    bool isStoreError(ErrorCode code);
    bool isIoError(ErrorCode code);
    bool isBackupOrMigrationError(ErrorCode code);
    bool isRecoverable(ErrorCode code);
    bool isCritical(ErrorCode code);

} // namespace error_utils
} // namespace storage
} // namespace tabvault

// Error construction with call-site location
#define TABVAULT_ERROR(code, message) \
    ::tabvault::storage::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define TABVAULT_ERROR_WITH_DETAILS(code, message, details) \
    ::tabvault::storage::StorageError(code, message, details).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define RETURN_IF_ERROR(result_expression) \
    do { \
        auto&& _tmp_status_macro_result = (result_expression); \
        if (!_tmp_status_macro_result.isOk()) { \
            return std::move(_tmp_status_macro_result.error()); \
        } \
    } while(0)

// var must already be declared
#define ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)
