// @include/tabvault/storage_manager.h
#pragma once

#include "config.h"
#include "data_export.h"
#include "data_serializer.h"
#include "integrity_validator.h"
#include "maintenance_scheduler.h"
#include "migration_manager.h"
#include "schema_registry.h"
#include "storage_engine.h"
#include "storage_error/result.h"
#include "types.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabvault {

/**
 * @brief Entry point of the session persistence subsystem.
 *
 * Owns the schema registry, serializer, validator, migration manager, storage engine,
 * exporter and maintenance scheduler, and wires them together. Record operations
 * take and return domain objects; the storage envelope stays internal.
 */
class SessionStorageManager {
public:
    static constexpr const char* kBackupTask = "backup";
    static constexpr const char* kIntegrityTask = "integrity_check";
    static constexpr const char* kCleanupTask = "cleanup";

    explicit SessionStorageManager(StorageManagerOptions options, ClockFn clock = systemNowMs);
    ~SessionStorageManager();

    SessionStorageManager(const SessionStorageManager&) = delete;
    SessionStorageManager& operator=(const SessionStorageManager&) = delete;

    storage::Status initialize();
    storage::Status shutdown();
    bool isInitialized() const { return engine_->isInitialized(); }

    // --- Sessions ---
    storage::Result<Session> createSession(const Session& session);
    storage::Result<std::optional<Session>> getSession(const std::string& session_id);
    storage::Result<Session> updateSession(const std::string& session_id, const SessionPatch& patch);
    storage::Status deleteSession(const std::string& session_id);
    storage::Result<std::vector<Session>> querySessions(const SessionQuery& query, const QueryOptions& options = {});

    // --- Tabs ---
    storage::Result<Tab> createTab(const Tab& tab, const std::string& session_id);
    storage::Result<std::optional<Tab>> getTab(TabId tab_id);
    storage::Result<Tab> updateTab(TabId tab_id, const TabPatch& patch);
    storage::Status deleteTab(TabId tab_id);
    storage::Result<std::vector<Tab>> queryTabs(const TabQuery& query, const QueryOptions& options = {});

    // --- Navigation events ---
    storage::Result<NavigationEvent> createNavigationEvent(const NavigationEvent& event, const std::string& session_id);
    storage::Result<std::vector<NavigationEvent>> createNavigationEvents(const std::vector<NavigationEvent>& events,
                                                                        const std::string& session_id);
    storage::Result<std::optional<NavigationEvent>> getNavigationEvent(TabId tab_id, Timestamp timestamp);
    storage::Status deleteNavigationEvent(TabId tab_id, Timestamp timestamp);
    storage::Result<std::vector<NavigationEvent>> queryNavigationEvents(const NavigationEventQuery& query,
                                                                       const QueryOptions& options = {});

    // --- Boundaries ---
    storage::Result<SessionBoundary> createBoundary(const SessionBoundary& boundary);
    storage::Result<std::optional<SessionBoundary>> getBoundary(const std::string& boundary_id);
    storage::Result<SessionBoundary> updateBoundary(const std::string& boundary_id, const BoundaryPatch& patch);
    storage::Status deleteBoundary(const std::string& boundary_id);
    storage::Result<std::vector<SessionBoundary>> queryBoundaries(const BoundaryQuery& query,
                                                                  const QueryOptions& options = {});

    // --- Health and maintenance ---
    storage::Result<StorageStats> getStorageStats();
    /**
     * @brief Validates every stored record and the references between them.
     * With auto_correct, correctable errors are repaired in place; the result then
     * lists only the errors that remain and counts the repairs in corrected_items.
     */
    storage::Result<ValidationResult> validateIntegrity(bool auto_correct = false);
    storage::Result<VersionInfo> getVersionInfo() const;

    // --- Backups ---
    storage::Result<BackupManifest> createBackup(const std::string& description = "");
    std::vector<BackupManifest> listBackups() const { return validator_->listBackups(); }
    storage::Status deleteBackup(const std::string& backup_id);
    // With overwrite the store is replaced in one transaction; otherwise existing records win
    storage::Result<ImportResult> restoreFromBackup(const std::string& backup_id, bool overwrite = true);

    // --- Export / import ---
    storage::Result<ExportResult> exportData(const ExportOptions& options = {});
    storage::Result<ImportResult> importData(const std::string& document, const ImportOptions& options = {});

    storage::Status clearAllData();

    // Runs the maintenance tasks that are due at `now`
    std::vector<MaintenanceRunReport> runMaintenance(Timestamp now);
    void startBackgroundMaintenance(std::chrono::milliseconds period);
    void stopBackgroundMaintenance();

    StorageEngine& engine() { return *engine_; }
    MaintenanceScheduler& scheduler() { return *scheduler_; }

private:
    void registerMaintenanceTasks();

    StorageManagerOptions options_;
    ClockFn clock_;
    SchemaRegistry registry_;
    std::unique_ptr<SessionDataSerializer> serializer_;
    std::unique_ptr<IntegrityValidator> validator_;
    std::unique_ptr<MigrationManager> migration_;
    std::unique_ptr<StorageEngine> engine_;
    std::unique_ptr<DataExport> exporter_;
    std::unique_ptr<MaintenanceScheduler> scheduler_;
};

} // namespace tabvault
