#include "tabvault/integrity_validator.h"
#include "tabvault/compression_utils.h"
#include "tabvault/debug_utils.h"
#include "tabvault/serialization_utils.h"
#include "tabvault/storage_error/error_utils.h"
#include "tabvault/url_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace tabvault {

namespace {

constexpr size_t kBackupIdRandomChars = 6;

class ScopedTimer {
public:
    explicit ScopedTimer(double& out_ms) : out_ms_(out_ms), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() {
        out_ms_ = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }
private:
    double& out_ms_;
    std::chrono::steady_clock::time_point start_;
};

void addError(ValidationResult& result, ValidationErrorType type, ValidationSeverity severity,
              EntityType entity_type, const std::string& entity_id, const std::string& message,
              bool can_auto_correct, json details = json::object()) {
    ValidationError error;
    error.type = type;
    error.severity = severity;
    error.entity_type = entity_type;
    error.entity_id = entity_id;
    error.message = message;
    error.details = std::move(details);
    error.can_auto_correct = can_auto_correct;
    result.errors.push_back(std::move(error));
    result.is_valid = false;
}

void addWarning(ValidationResult& result, ValidationWarningType type, EntityType entity_type,
                const std::string& entity_id, const std::string& message) {
    result.warnings.push_back(ValidationWarning{type, entity_type, entity_id, message});
}

std::string toIsoUtc(Timestamp ms) {
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buffer;
}

} // namespace

void ValidationResult::merge(const ValidationResult& other) {
    is_valid = is_valid && other.is_valid;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    corrected_items += other.corrected_items;
}

void to_json(json& j, const ValidationError& error) {
    j = json{
        {"type", error.type},
        {"severity", error.severity},
        {"entityType", error.entity_type},
        {"entityId", error.entity_id},
        {"message", error.message},
        {"details", error.details},
        {"canAutoCorrect", error.can_auto_correct},
    };
}

void to_json(json& j, const ValidationWarning& warning) {
    j = json{
        {"type", warning.type},
        {"entityType", warning.entity_type},
        {"entityId", warning.entity_id},
        {"message", warning.message},
    };
}

void to_json(json& j, const ValidationResult& result) {
    j = json{
        {"isValid", result.is_valid},
        {"errors", result.errors},
        {"warnings", result.warnings},
        {"correctedItems", result.corrected_items},
        {"validationTime", result.validation_time_ms},
    };
}

void to_json(json& j, const BackupManifest& manifest) {
    j = json{
        {"id", manifest.id},
        {"timestamp", manifest.timestamp},
        {"version", manifest.version},
        {"description", manifest.description},
        {"size", manifest.size},
        {"itemCounts", {
            {"sessions", manifest.sessions},
            {"tabs", manifest.tabs},
            {"navigationEvents", manifest.navigation_events},
            {"boundaries", manifest.boundaries},
        }},
        {"integrity", {{"checksum", manifest.checksum}, {"isValid", true}}},
        {"sequence", manifest.sequence},
    };
}

void from_json(const json& j, BackupManifest& manifest) {
    j.at("id").get_to(manifest.id);
    j.at("timestamp").get_to(manifest.timestamp);
    manifest.version = j.value("version", 1);
    manifest.description = j.value("description", std::string());
    manifest.size = j.value("size", int64_t{0});
    json counts = j.value("itemCounts", json::object());
    manifest.sessions = counts.value("sessions", size_t{0});
    manifest.tabs = counts.value("tabs", size_t{0});
    manifest.navigation_events = counts.value("navigationEvents", size_t{0});
    manifest.boundaries = counts.value("boundaries", size_t{0});
    json integrity = j.value("integrity", json::object());
    manifest.checksum = integrity.value("checksum", std::string());
    manifest.sequence = j.value("sequence", uint64_t{0});
}

IntegrityValidator::IntegrityValidator(ValidatorConfig config, std::string backup_dir,
                                       std::shared_ptr<const ChecksumAlgorithm> checksum, ClockFn clock)
    : config_(std::move(config)),
      backup_dir_(std::move(backup_dir)),
      checksum_(checksum ? std::move(checksum) : makeDefaultChecksum()),
      clock_(clock ? std::move(clock) : ClockFn(systemNowMs)) {
    if (!backup_dir_.empty()) {
        loadBackupsFromDisk();
    }
}

// ===================================================================
// Per-record validation
// ===================================================================

template<typename Semantic>
void IntegrityValidator::checkChecksum(ValidationResult& result, EntityType entity_type, const std::string& entity_id,
                                       const Semantic& semantic, const std::string& stored_checksum) const {
    try {
        std::string expected = checksum_->digestJson(semanticFields(semantic));
        if (expected != stored_checksum) {
            addError(result, ValidationErrorType::CHECKSUM_MISMATCH, ValidationSeverity::HIGH, entity_type, entity_id,
                     "Checksum mismatch detected", true, json{{"expected", expected}, {"actual", stored_checksum}});
        }
    } catch (const std::exception& e) {
        addError(result, ValidationErrorType::DATA_CORRUPTION, ValidationSeverity::CRITICAL, entity_type, entity_id,
                 std::string("Failed to validate checksum: ") + e.what(), false);
    }
}

ValidationResult IntegrityValidator::validateSession(const StoredSession& stored) const {
    ValidationResult result;
    if (!config_.enable_checks) return result;
    ScopedTimer timer(result.validation_time_ms);
    const Session& session = stored.session;
    const EntityType kind = EntityType::SESSION;

    if (session.id.empty()) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::CRITICAL, kind, session.id,
                 "Session is missing an id", false);
    }
    if (session.tag.empty()) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::HIGH, kind, session.id,
                 "Session is missing a tag", false);
    }
    if (session.created_at <= 0) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::HIGH, kind, session.id,
                 "Session has an invalid createdAt", true, json{{"field", "createdAt"}, {"value", session.created_at}});
    }
    std::set<WindowId> known_windows(session.window_ids.begin(), session.window_ids.end());
    std::set<WindowId> reported;
    for (const auto& tab : session.tabs) {
        if (known_windows.count(tab.window_id) == 0 && reported.insert(tab.window_id).second) {
            addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::MEDIUM, kind, session.id,
                     "Tab window " + std::to_string(tab.window_id) + " is missing from windowIds", true,
                     json{{"field", "windowIds"}, {"windowId", tab.window_id}, {"tabId", tab.id}});
        }
    }

    if (session.updated_at <= 0) {
        addWarning(result, ValidationWarningType::MISSING_METADATA, kind, session.id, "Session has no updatedAt");
    } else if (session.created_at > session.updated_at) {
        addWarning(result, ValidationWarningType::INCONSISTENT_TIMESTAMP, kind, session.id,
                   "Session createdAt is after updatedAt");
    }

    if (config_.checksum_validation) {
        checkChecksum(result, kind, session.id, session, stored.checksum);
    }

    if (config_.data_consistency_checks) {
        std::set<std::string> derived;
        for (const auto& tab : session.tabs) {
            if (auto domain = url_utils::extractDomain(tab.url)) derived.insert(*domain);
        }
        std::set<std::string> declared(stored.domains.begin(), stored.domains.end());
        if (derived.size() != declared.size()) {
            addWarning(result, ValidationWarningType::INCONSISTENT_TIMESTAMP, kind, session.id,
                       "Session domains array does not match tab URLs");
        }
        if (stored.total_tab_count != static_cast<int64_t>(session.tabs.size())) {
            addWarning(result, ValidationWarningType::INCONSISTENT_TIMESTAMP, kind, session.id,
                       "Session totalTabCount mismatch: expected " + std::to_string(stored.total_tab_count) +
                           ", actual " + std::to_string(session.tabs.size()));
        }
    }
    return result;
}

ValidationResult IntegrityValidator::validateTab(const StoredTab& stored) const {
    ValidationResult result;
    if (!config_.enable_checks) return result;
    ScopedTimer timer(result.validation_time_ms);
    const Tab& tab = stored.tab;
    const EntityType kind = EntityType::TAB;
    const std::string id = std::to_string(tab.id);

    if (tab.id <= 0) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::CRITICAL, kind, id,
                 "Tab has an invalid id", false);
    }
    if (tab.url.empty()) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::HIGH, kind, id,
                 "Tab is missing a url", false);
    }
    if (stored.session_id.empty()) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::CRITICAL, kind, id,
                 "Tab is missing a sessionId", false);
    }
    if (tab.window_id <= 0) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::HIGH, kind, id,
                 "Tab has an invalid windowId", false);
    }
    if (tab.created_at <= 0) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::MEDIUM, kind, id,
                 "Tab has an invalid createdAt", true, json{{"field", "createdAt"}, {"value", tab.created_at}});
    }

    if (tab.created_at > tab.last_accessed) {
        addWarning(result, ValidationWarningType::INCONSISTENT_TIMESTAMP, kind, id, "Tab createdAt is after lastAccessed");
    }
    if (!tab.url.empty() && !url_utils::isValidUrl(tab.url)) {
        addWarning(result, ValidationWarningType::MISSING_METADATA, kind, id, "Tab url cannot be parsed");
    }

    if (config_.checksum_validation) {
        checkChecksum(result, kind, id, tab, stored.checksum);
    }
    return result;
}

ValidationResult IntegrityValidator::validateNavigationEvent(const StoredNavigationEvent& stored) const {
    ValidationResult result;
    if (!config_.enable_checks) return result;
    ScopedTimer timer(result.validation_time_ms);
    const NavigationEvent& event = stored.event;
    const EntityType kind = EntityType::NAVIGATION_EVENT;
    const std::string id = navigationEventEntityId(event.tab_id, event.timestamp);

    if (event.tab_id <= 0) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::CRITICAL, kind, id,
                 "Navigation event has an invalid tabId", false);
    }
    if (event.url.empty()) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::HIGH, kind, id,
                 "Navigation event is missing a url", false);
    }
    if (event.timestamp <= 0) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::CRITICAL, kind, id,
                 "Navigation event has an invalid timestamp", false);
    }
    if (stored.session_id.empty()) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::HIGH, kind, id,
                 "Navigation event is missing a sessionId", true, json{{"field", "sessionId"}});
    }

    if (!event.url.empty() && !url_utils::isValidUrl(event.url)) {
        addWarning(result, ValidationWarningType::MISSING_METADATA, kind, id, "Navigation event url cannot be parsed");
    }

    if (config_.checksum_validation) {
        checkChecksum(result, kind, id, event, stored.checksum);
    }
    return result;
}

ValidationResult IntegrityValidator::validateBoundary(const StoredSessionBoundary& stored) const {
    ValidationResult result;
    if (!config_.enable_checks) return result;
    ScopedTimer timer(result.validation_time_ms);
    const SessionBoundary& boundary = stored.boundary;
    const EntityType kind = EntityType::BOUNDARY;

    if (boundary.id.empty()) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::CRITICAL, kind, boundary.id,
                 "Boundary is missing an id", false);
    }
    if (boundary.session_id.empty()) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::HIGH, kind, boundary.id,
                 "Boundary is missing a sessionId", false);
    }
    if (boundary.timestamp <= 0) {
        addError(result, ValidationErrorType::SCHEMA_VIOLATION, ValidationSeverity::HIGH, kind, boundary.id,
                 "Boundary has an invalid timestamp", false);
    }

    if (config_.checksum_validation) {
        checkChecksum(result, kind, boundary.id, boundary, stored.checksum);
    }
    return result;
}

ValidationResult IntegrityValidator::validateRecord(const StoredRecord& record) const {
    return std::visit([this](const auto& stored) -> ValidationResult {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, StoredSession>) {
            return validateSession(stored);
        } else if constexpr (std::is_same_v<T, StoredTab>) {
            return validateTab(stored);
        } else if constexpr (std::is_same_v<T, StoredNavigationEvent>) {
            return validateNavigationEvent(stored);
        } else if constexpr (std::is_same_v<T, StoredSessionBoundary>) {
            return validateBoundary(stored);
        } else {
            static_assert(std::is_same_v<T, DatabaseMetadata>, "unhandled stored record kind");
            return ValidationResult{};
        }
    }, record);
}

// ===================================================================
// Cross-record validation
// ===================================================================

ValidationResult IntegrityValidator::validateRelationships(const std::vector<StoredSession>& sessions,
                                                           const std::vector<StoredTab>& tabs,
                                                           const std::vector<StoredNavigationEvent>& events) const {
    ValidationResult result;
    if (!config_.relationship_validation) return result;
    ScopedTimer timer(result.validation_time_ms);

    std::unordered_set<std::string> session_ids;
    for (const auto& stored : sessions) session_ids.insert(stored.session.id);
    std::unordered_set<TabId> tab_ids;
    std::unordered_map<std::string, int64_t> tabs_per_session;
    for (const auto& stored : tabs) {
        tab_ids.insert(stored.tab.id);
        ++tabs_per_session[stored.session_id];
    }

    for (const auto& stored : tabs) {
        if (session_ids.count(stored.session_id) == 0) {
            addError(result, ValidationErrorType::MISSING_REFERENCE, ValidationSeverity::HIGH, EntityType::TAB,
                     std::to_string(stored.tab.id), "Tab references non-existent session " + stored.session_id,
                     false, json{{"sessionId", stored.session_id}});
        }
    }

    for (const auto& stored : events) {
        const std::string id = navigationEventEntityId(stored.event.tab_id, stored.event.timestamp);
        if (session_ids.count(stored.session_id) == 0) {
            addError(result, ValidationErrorType::MISSING_REFERENCE, ValidationSeverity::MEDIUM,
                     EntityType::NAVIGATION_EVENT, id,
                     "Navigation event references non-existent session " + stored.session_id, true,
                     json{{"sessionId", stored.session_id}, {"tabId", stored.event.tab_id}});
        }
        if (tab_ids.count(stored.event.tab_id) == 0) {
            addWarning(result, ValidationWarningType::ORPHANED_DATA, EntityType::NAVIGATION_EVENT, id,
                       "Navigation event references non-existent tab " + std::to_string(stored.event.tab_id));
        }
    }

    for (const auto& stored : sessions) {
        auto it = tabs_per_session.find(stored.session.id);
        int64_t actual = it == tabs_per_session.end() ? 0 : it->second;
        if (stored.total_tab_count != actual) {
            addWarning(result, ValidationWarningType::INCONSISTENT_TIMESTAMP, EntityType::SESSION, stored.session.id,
                       "Session tab count mismatch: expected " + std::to_string(stored.total_tab_count) +
                           ", actual " + std::to_string(actual));
        }
    }
    return result;
}

ValidationResult IntegrityValidator::validateCollections(const RecordCollections& collections) const {
    ValidationResult result;
    double elapsed_ms = 0.0;
    {
        ScopedTimer timer(elapsed_ms);
        for (const auto& stored : collections.sessions) result.merge(validateSession(stored));
        for (const auto& stored : collections.tabs) result.merge(validateTab(stored));
        for (const auto& stored : collections.navigation_events) result.merge(validateNavigationEvent(stored));
        for (const auto& stored : collections.boundaries) result.merge(validateBoundary(stored));
        result.merge(validateRelationships(collections.sessions, collections.tabs, collections.navigation_events));
    }
    result.validation_time_ms = elapsed_ms;
    LOG_INFO("[IntegrityValidator] Validated {} records: {} errors, {} warnings ({} ms)",
             collections.totalItems(), result.errors.size(), result.warnings.size(), elapsed_ms);
    return result;
}

// ===================================================================
// Auto-correction
// ===================================================================

std::vector<ValidationError> IntegrityValidator::autoCorrectErrors(const std::vector<ValidationError>& errors,
                                                                   RecordCorrector* corrector) const {
    if (!corrector) {
        return errors;
    }
    std::vector<ValidationError> remaining;
    for (const auto& error : errors) {
        if (!error.can_auto_correct) {
            remaining.push_back(error);
            continue;
        }
        storage::Status status;
        switch (error.type) {
            case ValidationErrorType::CHECKSUM_MISMATCH:
                status = corrector->recomputeChecksum(error.entity_type, error.entity_id);
                break;
            case ValidationErrorType::MISSING_REFERENCE:
                if (error.entity_type == EntityType::NAVIGATION_EVENT) {
                    status = corrector->reassignNavigationEvent(error.entity_id);
                } else {
                    status = TABVAULT_ERROR(storage::ErrorCode::NOT_IMPLEMENTED, "No repair for this reference");
                }
                break;
            case ValidationErrorType::SCHEMA_VIOLATION:
                status = corrector->repairSchemaViolation(error);
                break;
            case ValidationErrorType::DATA_CORRUPTION:
                status = TABVAULT_ERROR(storage::ErrorCode::NOT_IMPLEMENTED, "Corrupt data cannot be repaired");
                break;
        }
        if (status.isOk()) {
            LOG_INFO("[IntegrityValidator] Corrected {} on {} {}", magic_enum::enum_name(error.type),
                     magic_enum::enum_name(error.entity_type), error.entity_id);
        } else {
            LOG_WARN("[IntegrityValidator] Could not correct {} on {}: {}", magic_enum::enum_name(error.type),
                     error.entity_id, status.error().toString());
            remaining.push_back(error);
        }
    }
    return remaining;
}

// ===================================================================
// Backups
// ===================================================================

storage::Result<BackupManifest> IntegrityValidator::createBackup(const RecordCollections& collections,
                                                                 const std::string& description) {
    if (!config_.enable_backups) {
        return storage::StorageError::backupsDisabled().withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    const Timestamp now = clock_();

    BackupEntry entry;
    entry.payload = json::to_cbor(json(collections));
    entry.manifest.id = "backup_" + std::to_string(now) + "_" + generateRandomHex(kBackupIdRandomChars);
    entry.manifest.timestamp = now;
    entry.manifest.description = description.empty() ? "Automatic backup created at " + toIsoUtc(now) : description;
    entry.manifest.sessions = collections.sessions.size();
    entry.manifest.tabs = collections.tabs.size();
    entry.manifest.navigation_events = collections.navigation_events.size();
    entry.manifest.boundaries = collections.boundaries.size();
    entry.manifest.size = static_cast<int64_t>(entry.payload.size());
    entry.manifest.checksum = checksum_->digest(std::string(entry.payload.begin(), entry.payload.end()));

    std::lock_guard<std::mutex> lock(backups_mutex_);
    entry.manifest.sequence = next_sequence_++;
    if (!backup_dir_.empty()) {
        auto status = persistBackup(entry);
        if (!status.isOk()) {
            return status.error();
        }
    }
    BackupManifest manifest = entry.manifest;
    backups_[manifest.id] = std::move(entry);
    last_backup_time_ = now;
    enforceRetentionLocked();

    LOG_INFO("[IntegrityValidator] Created backup {} ({} items, {} bytes)", manifest.id, manifest.totalItems(),
             manifest.size);
    return manifest;
}

storage::Result<RecordCollections> IntegrityValidator::restoreFromBackup(const std::string& backup_id) const {
    BackupManifest manifest;
    std::vector<uint8_t> payload;
    {
        std::lock_guard<std::mutex> lock(backups_mutex_);
        auto it = backups_.find(backup_id);
        if (it == backups_.end()) {
            return storage::StorageError::backupNotFound(backup_id).withLocation(__FILE__, __LINE__, __FUNCTION__);
        }
        manifest = it->second.manifest;
        payload = it->second.payload;
    }

    if (payload.empty() && !backup_dir_.empty()) {
        fs::path payload_path = fs::path(backup_dir_) / (backup_id + kBackupPayloadSuffix);
        std::ifstream in(payload_path, std::ios::binary);
        if (!in.is_open()) {
            return storage::StorageError(storage::ErrorCode::IO_READ_ERROR, "Cannot open backup payload")
                .withFilePath(payload_path.string());
        }
        std::vector<uint8_t> compressed;
        if (ReadFrame(in, compressed) != FrameReadStatus::OK) {
            return storage::StorageError::corruption("Backup payload frame is damaged")
                .withFilePath(payload_path.string());
        }
        try {
            payload = CompressionManager::decompress(compressed.data(), compressed.size(),
                                                     static_cast<size_t>(manifest.size), CompressionType::ZSTD);
        } catch (const std::runtime_error& e) {
            return TABVAULT_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Cannot decompress backup payload")
                .withDetails(e.what())
                .withFilePath(payload_path.string());
        }
    }

    std::string actual = checksum_->digest(std::string(payload.begin(), payload.end()));
    if (actual != manifest.checksum) {
        return TABVAULT_ERROR(storage::ErrorCode::CHECKSUM_MISMATCH, "Backup payload checksum mismatch")
            .withContext("backup_id", backup_id)
            .withDetails("expected " + manifest.checksum + ", actual " + actual);
    }
    try {
        RecordCollections collections = json::from_cbor(payload).get<RecordCollections>();
        LOG_INFO("[IntegrityValidator] Restored backup {} ({} items)", backup_id, collections.totalItems());
        return collections;
    } catch (const json::exception& e) {
        return TABVAULT_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Backup payload cannot be decoded")
            .withDetails(e.what())
            .withContext("backup_id", backup_id);
    }
}

std::vector<BackupManifest> IntegrityValidator::listBackups() const {
    std::vector<BackupManifest> manifests;
    {
        std::lock_guard<std::mutex> lock(backups_mutex_);
        for (const auto& [id, entry] : backups_) {
            manifests.push_back(entry.manifest);
        }
    }
    std::sort(manifests.begin(), manifests.end(), [](const BackupManifest& a, const BackupManifest& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.sequence > b.sequence;
    });
    return manifests;
}

storage::Status IntegrityValidator::deleteBackup(const std::string& backup_id) {
    std::lock_guard<std::mutex> lock(backups_mutex_);
    auto it = backups_.find(backup_id);
    if (it == backups_.end()) {
        return storage::StorageError::backupNotFound(backup_id).withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    backups_.erase(it);
    removeBackupFiles(backup_id);
    LOG_INFO("[IntegrityValidator] Deleted backup {}", backup_id);
    return {};
}

bool IntegrityValidator::shouldCreateBackup(Timestamp now) const {
    if (!config_.enable_backups) return false;
    std::lock_guard<std::mutex> lock(backups_mutex_);
    if (!last_backup_time_) return true;
    return now - *last_backup_time_ >= config_.backup_interval_ms;
}

std::optional<Timestamp> IntegrityValidator::lastBackupTime() const {
    std::lock_guard<std::mutex> lock(backups_mutex_);
    return last_backup_time_;
}

void IntegrityValidator::enforceRetentionLocked() {
    while (backups_.size() > config_.max_backups) {
        auto oldest = std::min_element(backups_.begin(), backups_.end(), [](const auto& a, const auto& b) {
            const BackupManifest& ma = a.second.manifest;
            const BackupManifest& mb = b.second.manifest;
            if (ma.timestamp != mb.timestamp) return ma.timestamp < mb.timestamp;
            return ma.sequence < mb.sequence;
        });
        std::string id = oldest->first;
        backups_.erase(oldest);
        removeBackupFiles(id);
        LOG_INFO("[IntegrityValidator] Pruned backup {} (retention {})", id, config_.max_backups);
    }
}

storage::Status IntegrityValidator::persistBackup(const BackupEntry& entry) const {
    std::error_code ec;
    fs::create_directories(backup_dir_, ec);
    if (ec) {
        return storage::StorageError::ioError("create_directories: " + ec.message(), backup_dir_);
    }
    fs::path payload_path = fs::path(backup_dir_) / (entry.manifest.id + kBackupPayloadSuffix);
    fs::path manifest_path = fs::path(backup_dir_) / (entry.manifest.id + kBackupManifestSuffix);
    storage::Status status = writeBackupFiles(entry, payload_path, manifest_path);
    if (!status.isOk()) {
        removeBackupFiles(entry.manifest.id);
    }
    return status;
}

storage::Status IntegrityValidator::writeBackupFiles(const BackupEntry& entry, const fs::path& payload_path,
                                                     const fs::path& manifest_path) const {
    try {
        std::vector<uint8_t> compressed = CompressionManager::compress(entry.payload.data(), entry.payload.size(),
                                                                       CompressionType::ZSTD);
        {
            std::ofstream payload_out(payload_path, std::ios::binary | std::ios::trunc);
            WriteFrame(payload_out, compressed);
            payload_out.flush();
            if (!payload_out) {
                return storage::StorageError::ioError("write backup payload", payload_path.string());
            }
        }
        std::ofstream manifest_out(manifest_path, std::ios::trunc);
        manifest_out << json(entry.manifest).dump(2);
        manifest_out.flush();
        if (!manifest_out) {
            return storage::StorageError::ioError("write backup manifest", manifest_path.string());
        }
    } catch (const std::exception& e) {
        return TABVAULT_ERROR(storage::ErrorCode::BACKUP_FAILED, "Cannot persist backup")
            .withDetails(e.what())
            .withContext("backup_id", entry.manifest.id);
    }
    return {};
}

void IntegrityValidator::removeBackupFiles(const std::string& backup_id) const {
    if (backup_dir_.empty()) return;
    std::error_code ec;
    fs::remove(fs::path(backup_dir_) / (backup_id + kBackupPayloadSuffix), ec);
    if (ec) {
        LOG_WARN("[IntegrityValidator] Cannot remove payload of backup {}: {}", backup_id, ec.message());
    }
    fs::remove(fs::path(backup_dir_) / (backup_id + kBackupManifestSuffix), ec);
    if (ec) {
        LOG_WARN("[IntegrityValidator] Cannot remove manifest of backup {}: {}", backup_id, ec.message());
    }
}

void IntegrityValidator::loadBackupsFromDisk() {
    std::error_code ec;
    if (!fs::is_directory(backup_dir_, ec)) {
        return;
    }
    const std::string suffix = kBackupManifestSuffix;
    std::lock_guard<std::mutex> lock(backups_mutex_);
    for (const auto& dir_entry : fs::directory_iterator(backup_dir_, ec)) {
        std::string filename = dir_entry.path().filename().string();
        if (filename.size() <= suffix.size() ||
            filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        try {
            std::ifstream in(dir_entry.path());
            BackupEntry entry;
            entry.manifest = json::parse(in).get<BackupManifest>();
            next_sequence_ = std::max(next_sequence_, entry.manifest.sequence + 1);
            if (!last_backup_time_ || entry.manifest.timestamp > *last_backup_time_) {
                last_backup_time_ = entry.manifest.timestamp;
            }
            std::string id = entry.manifest.id;
            backups_[id] = std::move(entry);
        } catch (const json::exception& e) {
            LOG_WARN("[IntegrityValidator] Ignoring unreadable backup manifest {}: {}", filename, e.what());
        }
    }
    if (ec) {
        LOG_WARN("[IntegrityValidator] Cannot list backup directory {}: {}", backup_dir_, ec.message());
    }
    enforceRetentionLocked();
    LOG_INFO("[IntegrityValidator] Found {} backups in {}", backups_.size(), backup_dir_);
}

} // namespace tabvault
