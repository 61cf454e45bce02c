#include "tabvault/storage_manager.h"
#include "tabvault/checksum.h"
#include "tabvault/debug_utils.h"
#include "tabvault/storage_error/error_utils.h"

namespace tabvault {

namespace {

ImportResult toImportResult(const IngestResult& ingest) {
    ImportResult result;
    result.imported = ingest.written;
    result.skipped = ingest.skipped;
    result.errors = ingest.errors;
    return result;
}

template<typename Stored, typename Domain, typename Convert>
std::vector<Domain> convertAll(const std::vector<Stored>& stored, Convert convert) {
    std::vector<Domain> out;
    out.reserve(stored.size());
    for (const auto& record : stored) {
        out.push_back(convert(record));
    }
    return out;
}

} // namespace

SessionStorageManager::SessionStorageManager(StorageManagerOptions options, ClockFn clock)
    : options_(std::move(options)), clock_(clock ? std::move(clock) : ClockFn(systemNowMs)) {
    serializer_ = std::make_unique<SessionDataSerializer>(
        options_.serializer, makeChecksum(options_.serializer.checksum_algorithm), clock_);
    validator_ = std::make_unique<IntegrityValidator>(options_.validator, options_.backup_directory,
                                                      serializer_->sharedChecksum(), clock_);

    const SessionDataSerializer* serializer = serializer_.get();
    migration_ = std::make_unique<MigrationManager>(
        options_.migration, registry_, validator_.get(),
        [serializer](RecordStore& store) { return readCollections(store, *serializer); }, clock_);

    engine_ = std::make_unique<StorageEngine>(options_.data_directory, options_.storage, registry_, *serializer_,
                                              *validator_, *migration_, clock_);
    exporter_ = std::make_unique<DataExport>(registry_, *serializer_, clock_);
    scheduler_ = std::make_unique<MaintenanceScheduler>(clock_);
    registerMaintenanceTasks();
}

SessionStorageManager::~SessionStorageManager() {
    scheduler_->stop();
}

storage::Status SessionStorageManager::initialize() {
    RETURN_IF_ERROR(validateConfig(options_));
    return engine_->initialize();
}

storage::Status SessionStorageManager::shutdown() {
    scheduler_->stop();
    return engine_->shutdown();
}

// ===================================================================
// Sessions
// ===================================================================

storage::Result<Session> SessionStorageManager::createSession(const Session& session) {
    return engine_->createSession(session).map(
        [this](const StoredSession& stored) { return serializer_->deserializeSession(stored); });
}

storage::Result<std::optional<Session>> SessionStorageManager::getSession(const std::string& session_id) {
    return engine_->getSession(session_id).map([this](const std::optional<StoredSession>& stored) {
        return stored ? std::optional<Session>(serializer_->deserializeSession(*stored)) : std::optional<Session>{};
    });
}

storage::Result<Session> SessionStorageManager::updateSession(const std::string& session_id, const SessionPatch& patch) {
    return engine_->updateSession(session_id, patch).map(
        [this](const StoredSession& stored) { return serializer_->deserializeSession(stored); });
}

storage::Status SessionStorageManager::deleteSession(const std::string& session_id) {
    return engine_->deleteSession(session_id);
}

storage::Result<std::vector<Session>> SessionStorageManager::querySessions(const SessionQuery& query,
                                                                           const QueryOptions& options) {
    return engine_->querySessions(query, options).map([this](const std::vector<StoredSession>& stored) {
        return convertAll<StoredSession, Session>(
            stored, [this](const StoredSession& s) { return serializer_->deserializeSession(s); });
    });
}

// ===================================================================
// Tabs
// ===================================================================

storage::Result<Tab> SessionStorageManager::createTab(const Tab& tab, const std::string& session_id) {
    return engine_->createTab(tab, session_id).map(
        [this](const StoredTab& stored) { return serializer_->deserializeTab(stored); });
}

storage::Result<std::optional<Tab>> SessionStorageManager::getTab(TabId tab_id) {
    return engine_->getTab(tab_id).map([this](const std::optional<StoredTab>& stored) {
        return stored ? std::optional<Tab>(serializer_->deserializeTab(*stored)) : std::optional<Tab>{};
    });
}

storage::Result<Tab> SessionStorageManager::updateTab(TabId tab_id, const TabPatch& patch) {
    return engine_->updateTab(tab_id, patch).map(
        [this](const StoredTab& stored) { return serializer_->deserializeTab(stored); });
}

storage::Status SessionStorageManager::deleteTab(TabId tab_id) {
    return engine_->deleteTab(tab_id);
}

storage::Result<std::vector<Tab>> SessionStorageManager::queryTabs(const TabQuery& query, const QueryOptions& options) {
    return engine_->queryTabs(query, options).map([this](const std::vector<StoredTab>& stored) {
        return convertAll<StoredTab, Tab>(stored, [this](const StoredTab& t) { return serializer_->deserializeTab(t); });
    });
}

// ===================================================================
// Navigation events
// ===================================================================

storage::Result<NavigationEvent> SessionStorageManager::createNavigationEvent(const NavigationEvent& event,
                                                                             const std::string& session_id) {
    return engine_->createNavigationEvent(event, session_id).map(
        [this](const StoredNavigationEvent& stored) { return serializer_->deserializeNavigationEvent(stored); });
}

storage::Result<std::vector<NavigationEvent>> SessionStorageManager::createNavigationEvents(
    const std::vector<NavigationEvent>& events, const std::string& session_id) {
    return engine_->createNavigationEvents(events, session_id)
        .map([this](const std::vector<StoredNavigationEvent>& stored) {
            return convertAll<StoredNavigationEvent, NavigationEvent>(
                stored, [this](const StoredNavigationEvent& e) { return serializer_->deserializeNavigationEvent(e); });
        });
}

storage::Result<std::optional<NavigationEvent>> SessionStorageManager::getNavigationEvent(TabId tab_id,
                                                                                         Timestamp timestamp) {
    return engine_->getNavigationEvent(tab_id, timestamp).map([this](const std::optional<StoredNavigationEvent>& stored) {
        return stored ? std::optional<NavigationEvent>(serializer_->deserializeNavigationEvent(*stored))
                      : std::optional<NavigationEvent>{};
    });
}

storage::Status SessionStorageManager::deleteNavigationEvent(TabId tab_id, Timestamp timestamp) {
    return engine_->deleteNavigationEvent(tab_id, timestamp);
}

storage::Result<std::vector<NavigationEvent>> SessionStorageManager::queryNavigationEvents(
    const NavigationEventQuery& query, const QueryOptions& options) {
    return engine_->queryNavigationEvents(query, options).map([this](const std::vector<StoredNavigationEvent>& stored) {
        return convertAll<StoredNavigationEvent, NavigationEvent>(
            stored, [this](const StoredNavigationEvent& e) { return serializer_->deserializeNavigationEvent(e); });
    });
}

// ===================================================================
// Boundaries
// ===================================================================

storage::Result<SessionBoundary> SessionStorageManager::createBoundary(const SessionBoundary& boundary) {
    return engine_->createBoundary(boundary).map(
        [this](const StoredSessionBoundary& stored) { return serializer_->deserializeBoundary(stored); });
}

storage::Result<std::optional<SessionBoundary>> SessionStorageManager::getBoundary(const std::string& boundary_id) {
    return engine_->getBoundary(boundary_id).map([this](const std::optional<StoredSessionBoundary>& stored) {
        return stored ? std::optional<SessionBoundary>(serializer_->deserializeBoundary(*stored))
                      : std::optional<SessionBoundary>{};
    });
}

storage::Result<SessionBoundary> SessionStorageManager::updateBoundary(const std::string& boundary_id,
                                                                       const BoundaryPatch& patch) {
    return engine_->updateBoundary(boundary_id, patch).map(
        [this](const StoredSessionBoundary& stored) { return serializer_->deserializeBoundary(stored); });
}

storage::Status SessionStorageManager::deleteBoundary(const std::string& boundary_id) {
    return engine_->deleteBoundary(boundary_id);
}

storage::Result<std::vector<SessionBoundary>> SessionStorageManager::queryBoundaries(const BoundaryQuery& query,
                                                                                     const QueryOptions& options) {
    return engine_->queryBoundaries(query, options).map([this](const std::vector<StoredSessionBoundary>& stored) {
        return convertAll<StoredSessionBoundary, SessionBoundary>(
            stored, [this](const StoredSessionBoundary& b) { return serializer_->deserializeBoundary(b); });
    });
}

// ===================================================================
// Health and maintenance
// ===================================================================

storage::Result<StorageStats> SessionStorageManager::getStorageStats() {
    return engine_->getStorageStats();
}

storage::Result<ValidationResult> SessionStorageManager::validateIntegrity(bool auto_correct) {
    RecordCollections collections;
    ASSIGN_OR_RETURN(collections, engine_->exportCollections());
    ValidationResult result = validator_->validateCollections(collections);

    if (auto_correct && !result.errors.empty()) {
        std::vector<ValidationError> remaining = validator_->autoCorrectErrors(result.errors, engine_.get());
        result.corrected_items = result.errors.size() - remaining.size();
        result.errors = std::move(remaining);
        result.is_valid = result.errors.empty();
        LOG_INFO("[SessionStorageManager] Auto-correction repaired {} of {} errors", result.corrected_items,
                 result.corrected_items + result.errors.size());
    }
    return result;
}

storage::Result<VersionInfo> SessionStorageManager::getVersionInfo() const {
    return migration_->getVersionInfo(options_.data_directory);
}

// ===================================================================
// Backups
// ===================================================================

storage::Result<BackupManifest> SessionStorageManager::createBackup(const std::string& description) {
    RecordCollections collections;
    ASSIGN_OR_RETURN(collections, engine_->exportCollections());
    BackupManifest manifest;
    ASSIGN_OR_RETURN(manifest, validator_->createBackup(collections, description));
    auto recorded = engine_->recordBackupTime(manifest.timestamp);
    if (!recorded.isOk()) {
        LOG_WARN("[SessionStorageManager] Backup {} created but its time was not recorded: {}", manifest.id,
                 recorded.error().toString());
    }
    return manifest;
}

storage::Status SessionStorageManager::deleteBackup(const std::string& backup_id) {
    return validator_->deleteBackup(backup_id);
}

storage::Result<ImportResult> SessionStorageManager::restoreFromBackup(const std::string& backup_id, bool overwrite) {
    RecordCollections collections;
    ASSIGN_OR_RETURN(collections, validator_->restoreFromBackup(backup_id));
    IngestResult ingest;
    if (overwrite) {
        ASSIGN_OR_RETURN(ingest, engine_->replaceAllData(collections));
    } else {
        ASSIGN_OR_RETURN(ingest, engine_->ingestCollections(collections, false));
    }
    LOG_INFO("[SessionStorageManager] Restored backup {}: {} records written, {} skipped", backup_id, ingest.written,
             ingest.skipped);
    return toImportResult(ingest);
}

// ===================================================================
// Export / import
// ===================================================================

storage::Result<ExportResult> SessionStorageManager::exportData(const ExportOptions& options) {
    RecordCollections collections;
    ASSIGN_OR_RETURN(collections, engine_->exportCollections());
    std::optional<DatabaseMetadata> metadata;
    if (options.include_metadata) {
        DatabaseMetadata meta;
        ASSIGN_OR_RETURN(meta, engine_->getMetadata());
        metadata = std::move(meta);
    }
    return exporter_->exportData(collections, options, metadata);
}

storage::Result<ImportResult> SessionStorageManager::importData(const std::string& document,
                                                                const ImportOptions& options) {
    ParsedImport parsed;
    ASSIGN_OR_RETURN(parsed, exporter_->parseImport(document, options));
    IngestResult ingest;
    ASSIGN_OR_RETURN(ingest, engine_->ingestCollections(parsed.collections, options.overwrite_existing));

    ImportResult result = toImportResult(ingest);
    result.skipped += parsed.skipped;
    result.errors.insert(result.errors.begin(), parsed.errors.begin(), parsed.errors.end());
    return result;
}

storage::Status SessionStorageManager::clearAllData() {
    return engine_->clearAllData();
}

// ===================================================================
// Scheduled maintenance
// ===================================================================

void SessionStorageManager::registerMaintenanceTasks() {
    scheduler_->addTask(MaintenanceTask{kBackupTask, options_.validator.backup_interval_ms,
                                        [this](Timestamp now) -> storage::Status {
                                            if (!validator_->shouldCreateBackup(now)) {
                                                return {};
                                            }
                                            BackupManifest manifest;
                                            ASSIGN_OR_RETURN(manifest, createBackup());
                                            LOG_INFO("[SessionStorageManager] Scheduled backup {} created",
                                                     manifest.id);
                                            return {};
                                        }});

    scheduler_->addTask(MaintenanceTask{kIntegrityTask, kMillisPerHour, [this](Timestamp) -> storage::Status {
                                            RETURN_IF_ERROR(engine_->runIntegrityCheck());
                                            return {};
                                        }});

    scheduler_->addTask(MaintenanceTask{kCleanupTask, kMillisPerDay, [this](Timestamp) -> storage::Status {
                                            RETURN_IF_ERROR(engine_->cleanupOldData());
                                            return engine_->updateStorageStats();
                                        }});
}

std::vector<MaintenanceRunReport> SessionStorageManager::runMaintenance(Timestamp now) {
    return scheduler_->tick(now);
}

void SessionStorageManager::startBackgroundMaintenance(std::chrono::milliseconds period) {
    scheduler_->start(period);
}

void SessionStorageManager::stopBackgroundMaintenance() {
    scheduler_->stop();
}

} // namespace tabvault
