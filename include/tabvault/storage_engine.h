// @include/tabvault/storage_engine.h
#pragma once

#include "config.h"
#include "data_serializer.h"
#include "integrity_validator.h"
#include "migration_manager.h"
#include "record_store.h"
#include "schema_registry.h"
#include "storage_error/result.h"
#include "types.h"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tabvault {

// Inclusive on both ends
struct DateRange {
    Timestamp start = 0;
    Timestamp end = 0;

    bool contains(Timestamp t) const { return t >= start && t <= end; }
};

enum class SortOrder { ASCENDING, DESCENDING };

struct QueryOptions {
    size_t limit = 100;
    size_t offset = 0;
    SortOrder order = SortOrder::DESCENDING;
};

struct SessionQuery {
    std::vector<std::string> tags;
    std::optional<DateRange> date_range;
    std::vector<std::string> domains;     // substring of any derived domain
    std::optional<std::string> search_text;  // case-insensitive, over tag, purpose and notes
};

struct TabQuery {
    std::vector<std::string> session_ids;
    std::vector<WindowId> window_ids;
    std::vector<std::string> domains;
    std::optional<DateRange> date_range;
};

struct NavigationEventQuery {
    std::vector<std::string> session_ids;
    std::vector<TabId> tab_ids;
    std::vector<std::string> domains;
    std::optional<DateRange> date_range;
};

struct BoundaryQuery {
    std::vector<std::string> session_ids;
    std::vector<BoundaryReason> reasons;
    std::optional<DateRange> date_range;
};

// Partial updates; unset fields keep their stored value
struct SessionPatch {
    std::optional<std::string> tag;
    std::optional<std::vector<Tab>> tabs;
    std::optional<std::vector<WindowId>> window_ids;
    std::optional<SessionMetadata> metadata;
};

struct TabPatch {
    std::optional<std::string> url;
    std::optional<std::string> title;
    std::optional<std::string> favicon;
    std::optional<WindowId> window_id;
    std::optional<int64_t> time_spent;
    std::optional<int64_t> scroll_position;
    std::optional<std::map<std::string, std::string>> form_data;
    std::optional<bool> is_active;
    std::optional<int64_t> interaction_count;
    std::optional<int64_t> focus_time;
};

struct NavigationEventPatch {
    std::optional<std::string> url;
    std::optional<std::string> referrer;
    std::optional<TransitionType> transition_type;
};

struct BoundaryPatch {
    std::optional<BoundaryType> type;
    std::optional<BoundaryReason> reason;
    std::optional<BoundaryMetadata> metadata;
};

struct IngestResult {
    size_t written = 0;
    size_t skipped = 0;
    std::vector<std::string> errors;
};

// Reads and decodes every record container present in the store
storage::Result<RecordCollections> readCollections(RecordStore& store, const SessionDataSerializer& serializer);

/**
 * @brief CRUD, queries and maintenance over the session record store.
 *
 * Every operation runs in its own transaction scoped to the containers it touches;
 * there is no lock spanning operations, so concurrent writes to one record are
 * last-write-wins. Creation validates the primary-key shape before writing and does
 * not check foreign references. Deletes of sessions and tabs cascade in a single
 * transaction.
 */
class StorageEngine : public RecordCorrector {
public:
    static constexpr size_t kMaxScannedRecords = 10000;
    static constexpr size_t kCleanupBatchLimit = 1000;

    StorageEngine(std::string data_dir, StorageConfig config, const SchemaRegistry& registry,
                  const SessionDataSerializer& serializer, IntegrityValidator& validator,
                  MigrationManager& migration, ClockFn clock = systemNowMs);
    ~StorageEngine() override;

    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    /**
     * @brief Opens the store, runs pending migrations, creates missing containers and indexes,
     * ensures the metadata record and runs startup maintenance.
     * Idempotent; concurrent callers share one in-flight attempt. A failed attempt may be retried.
     */
    storage::Status initialize();
    bool isInitialized() const;
    // Compacts and closes the store; initialize() may be called again afterwards
    storage::Status shutdown();

    // --- Sessions ---
    storage::Result<StoredSession> createSession(const Session& session);
    storage::Result<std::optional<StoredSession>> getSession(const std::string& session_id);
    storage::Result<StoredSession> updateSession(const std::string& session_id, const SessionPatch& patch);
    storage::Status deleteSession(const std::string& session_id);
    storage::Result<std::vector<StoredSession>> querySessions(const SessionQuery& query, const QueryOptions& options = {});

    // --- Tabs ---
    storage::Result<StoredTab> createTab(const Tab& tab, const std::string& session_id);
    storage::Result<std::optional<StoredTab>> getTab(TabId tab_id);
    storage::Result<StoredTab> updateTab(TabId tab_id, const TabPatch& patch);
    storage::Status deleteTab(TabId tab_id);
    storage::Result<std::vector<StoredTab>> queryTabs(const TabQuery& query, const QueryOptions& options = {});

    // --- Navigation events ---
    storage::Result<StoredNavigationEvent> createNavigationEvent(const NavigationEvent& event,
                                                                 const std::string& session_id);
    // Chunks of batchSize, one transaction per chunk; all events share one batch id
    storage::Result<std::vector<StoredNavigationEvent>> createNavigationEvents(const std::vector<NavigationEvent>& events,
                                                                               const std::string& session_id);
    storage::Result<std::optional<StoredNavigationEvent>> getNavigationEvent(TabId tab_id, Timestamp timestamp);
    storage::Result<StoredNavigationEvent> updateNavigationEvent(TabId tab_id, Timestamp timestamp,
                                                                 const NavigationEventPatch& patch);
    storage::Status deleteNavigationEvent(TabId tab_id, Timestamp timestamp);
    storage::Result<std::vector<StoredNavigationEvent>> queryNavigationEvents(const NavigationEventQuery& query,
                                                                              const QueryOptions& options = {});

    // --- Boundaries ---
    storage::Result<StoredSessionBoundary> createBoundary(const SessionBoundary& boundary);
    storage::Result<std::optional<StoredSessionBoundary>> getBoundary(const std::string& boundary_id);
    storage::Result<StoredSessionBoundary> updateBoundary(const std::string& boundary_id, const BoundaryPatch& patch);
    storage::Status deleteBoundary(const std::string& boundary_id);
    storage::Result<std::vector<StoredSessionBoundary>> queryBoundaries(const BoundaryQuery& query,
                                                                        const QueryOptions& options = {});

    // --- Metadata and maintenance ---
    storage::Result<DatabaseMetadata> getMetadata();
    storage::Result<StorageStats> getStorageStats();
    // Deletes (with cascade) sessions created at or before now - maxSessionAge; returns how many
    storage::Result<size_t> cleanupOldData();
    storage::Status updateStorageStats();
    storage::Result<ValidationResult> runIntegrityCheck();
    storage::Status recordBackupTime(Timestamp when);

    // --- Administration ---
    storage::Status clearAllData();
    storage::Result<RecordCollections> exportCollections();
    // Writes stored records back; without overwrite, records whose key exists are skipped
    storage::Result<IngestResult> ingestCollections(const RecordCollections& collections, bool overwrite);
    // Swaps the whole store for `collections` in one transaction; any invalid record fails it unchanged
    storage::Result<IngestResult> replaceAllData(const RecordCollections& collections);

    // --- RecordCorrector ---
    storage::Status recomputeChecksum(EntityType entity_type, const std::string& entity_id) override;
    storage::Status reassignNavigationEvent(const std::string& entity_id) override;
    storage::Status repairSchemaViolation(const ValidationError& error) override;

    const StorageConfig& config() const { return config_; }
    const std::string& dataDirectory() const { return data_dir_; }

private:
    struct Counters {
        int64_t sessions = 0;
        int64_t tabs = 0;
        int64_t navigation_events = 0;
        int64_t boundaries = 0;
    };

    struct ScanPlan {
        std::string index;  // empty for the primary key
        KeyRange range;
        ScanDirection direction = ScanDirection::BACKWARD;
    };

    storage::Status doInitialize();
    storage::Status ensureSchema(RecordStore& store);
    storage::Status ensureMetadata(RecordStore& store);
    void runStartupMaintenance();

    storage::Result<std::shared_ptr<RecordStore>> requireStore(const char* operation);

    // Adds the deltas to the metadata counters inside an open transaction, clamping at zero
    storage::Status adjustCounters(StoreTransaction& txn, const Counters& delta);
    storage::Result<DatabaseMetadata> readMetadata(StoreTransaction& txn);

    // Scans `plan`, decoding and filtering documents until limit matches past offset
    template<typename Stored, typename Decode, typename Match>
    storage::Result<std::vector<Stored>> runQuery(const char* container, const ScanPlan& plan,
                                                  const QueryOptions& options, Decode decode, Match match);
    ScanDirection directionFor(const QueryOptions& options) const;

    storage::Status deleteSessionInTxn(StoreTransaction& txn, const std::string& session_id, Counters& removed);
    storage::Status deleteTabEventsInTxn(StoreTransaction& txn, TabId tab_id, Counters& removed);

    storage::Status putSession(StoreTransaction& txn, StoredSession& stored);

    std::string data_dir_;
    StorageConfig config_;
    const SchemaRegistry& registry_;
    const SessionDataSerializer& serializer_;
    IntegrityValidator& validator_;
    MigrationManager& migration_;
    ClockFn clock_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<RecordStore> store_;
    int metadata_version_ = 0;  // key of the metadata record, set before store_ is published
    std::shared_future<storage::Status> init_future_;
};

} // namespace tabvault
