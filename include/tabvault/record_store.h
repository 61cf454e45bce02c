// @include/tabvault/record_store.h
#pragma once

#include "encoding_utils.h"
#include "schema_registry.h"
#include "storage_error/result.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tabvault {

class RecordStore;

enum class TransactionMode { READ_ONLY, READ_WRITE };

enum class ScanDirection { FORWARD, BACKWARD };

enum class TransactionPhase { ACTIVE, COMMITTED, ABORTED };

/**
 * @brief Bounds over primary or index keys.
 * A bound that is a prefix of a longer composite key matches every key with that prefix,
 * so KeyRange::only({tabId}) selects all [tabId, timestamp] keys of the tab.
 */
struct KeyRange {
    std::optional<Key> lower;
    std::optional<Key> upper;
    bool lower_open = false;
    bool upper_open = false;

    static KeyRange all() { return KeyRange{}; }
    static KeyRange only(Key key) { return KeyRange{key, key, false, false}; }
    static KeyRange bound(Key lower, Key upper, bool lower_open = false, bool upper_open = false) {
        return KeyRange{std::move(lower), std::move(upper), lower_open, upper_open};
    }
    static KeyRange lowerBound(Key lower, bool open = false) { return KeyRange{std::move(lower), std::nullopt, open, false}; }
    static KeyRange upperBound(Key upper, bool open = false) { return KeyRange{std::nullopt, std::move(upper), false, open}; }
};

// Return false to stop the scan
using ScanVisitor = std::function<bool(const nlohmann::json& document)>;

struct RecordStoreOptions {
    size_t journal_compaction_bytes = 4 * 1024 * 1024;
};

/**
 * @brief A unit of work over a declared set of containers.
 *
 * Writes are buffered until commit() and are visible to this transaction's own reads.
 * Commit applies the whole write set under the store's exclusive lock and appends one
 * journal frame; on failure the store is left unchanged. Destroying an active
 * transaction aborts it.
 */
class StoreTransaction {
public:
    ~StoreTransaction();

    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    storage::Result<std::optional<nlohmann::json>> get(const std::string& container, const Key& key);
    // The primary key is read from the document through the container's key path
    storage::Status put(const std::string& container, const nlohmann::json& document);
    // Removing an absent key is not an error
    storage::Status remove(const std::string& container, const Key& key);
    storage::Status clear(const std::string& container);

    /**
     * @brief Visits documents in key order of `index` (empty name for the primary key).
     * Multi-entry indexes visit a document once per matching entry.
     */
    storage::Status scan(const std::string& container, const std::string& index, const KeyRange& range,
                         ScanDirection direction, const ScanVisitor& visitor);
    // The first document in scan order, reading only the entries at that end of the index
    storage::Result<std::optional<nlohmann::json>> first(const std::string& container, const std::string& index,
                                                         ScanDirection direction,
                                                         const KeyRange& range = KeyRange::all());
    storage::Result<size_t> count(const std::string& container, const std::string& index = "",
                                  const KeyRange& range = KeyRange::all());
    storage::Result<std::vector<nlohmann::json>> getAll(const std::string& container);

    storage::Status commit();
    void abort();

    TransactionPhase phase() const { return phase_; }
    bool isActive() const { return phase_ == TransactionPhase::ACTIVE; }
    TransactionMode mode() const { return mode_; }

private:
    friend class RecordStore;

    struct PendingWrite {
        Key key;
        std::optional<nlohmann::json> document;  // nullopt marks a delete
    };

    struct PendingContainer {
        bool cleared = false;
        std::map<std::string, PendingWrite> writes;  // by encoded primary key
    };

    StoreTransaction(RecordStore& store, std::vector<std::string> scope, TransactionMode mode);

    storage::Status checkUsable(const std::string& container, bool for_write) const;
    // The document as this transaction sees it: own writes first, then committed state
    std::optional<nlohmann::json> readVisible(const std::string& container, const std::string& pk) const;

    RecordStore& store_;
    std::set<std::string> scope_;
    TransactionMode mode_;
    TransactionPhase phase_ = TransactionPhase::ACTIVE;
    std::map<std::string, PendingContainer> pending_;
};

/**
 * @brief Schema changes applied while upgrading to a new version.
 *
 * Each change takes effect immediately and records an undo entry. abort() replays the
 * undo entries in reverse; commit() persists the manifest at the target version. Only
 * one upgrade may be open at a time.
 */
class SchemaUpgrade {
public:
    ~SchemaUpgrade();

    SchemaUpgrade(const SchemaUpgrade&) = delete;
    SchemaUpgrade& operator=(const SchemaUpgrade&) = delete;

    int oldVersion() const { return old_version_; }
    int newVersion() const { return new_version_; }
    // Lowers or raises the version commit() records; never below oldVersion()
    storage::Status setTargetVersion(int version);

    storage::Status createContainer(const ContainerDescriptor& descriptor);
    storage::Status deleteContainer(const std::string& name);
    // Builds the index over existing records
    storage::Status createIndex(const std::string& container, const IndexDescriptor& index);
    storage::Status deleteIndex(const std::string& container, const std::string& index_name);

    bool hasContainer(const std::string& name) const;
    bool hasIndex(const std::string& container, const std::string& index_name) const;

    storage::Status commit();
    void abort();

    bool isActive() const { return active_; }

private:
    friend class RecordStore;
    SchemaUpgrade(RecordStore& store, int old_version, int new_version);

    RecordStore& store_;
    int old_version_;
    int new_version_;
    bool active_ = true;
    std::vector<std::function<void()>> undo_log_;  // run under the store's exclusive lock
};

/**
 * @brief Containers of JSON documents with ordered secondary indexes.
 *
 * State lives in memory. A non-empty data directory makes it durable through three files:
 * MANIFEST.json (version, container definitions), snapshot.dat (a CRC-framed CBOR image)
 * and journal.log (one CRC-framed CBOR frame per committed transaction). Opening loads
 * the snapshot and replays the journal; a torn or corrupt journal tail is truncated.
 */
class RecordStore {
public:
    static constexpr const char* kManifestFile = "MANIFEST.json";
    static constexpr const char* kSnapshotFile = "snapshot.dat";
    static constexpr const char* kJournalFile = "journal.log";

    static storage::Result<std::unique_ptr<RecordStore>> open(const std::string& data_dir,
                                                              RecordStoreOptions options = {});

    // Version recorded in the manifest, 0 when the directory holds no store
    static storage::Result<int> readPersistedVersion(const std::string& data_dir);

    ~RecordStore();

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    // Compacts and releases the journal; the store is unusable afterwards
    storage::Status close();
    bool isOpen() const { return open_.load(); }

    int version() const;
    bool isPersistent() const { return !data_dir_.empty(); }
    const std::string& dataDirectory() const { return data_dir_; }

    std::vector<std::string> containerNames() const;
    std::optional<ContainerDescriptor> describeContainer(const std::string& name) const;
    bool hasContainer(const std::string& name) const;
    bool hasIndex(const std::string& container, const std::string& index_name) const;

    std::unique_ptr<StoreTransaction> begin(std::vector<std::string> scope, TransactionMode mode);
    storage::Result<std::unique_ptr<SchemaUpgrade>> beginUpgrade(int new_version);

    // Writes a fresh snapshot and empties the journal
    storage::Status compact();

    uint64_t journalBytes() const { return journal_bytes_.load(); }
    // Sum of the CBOR-encoded document sizes
    int64_t approximateSize() const;

private:
    friend class StoreTransaction;
    friend class SchemaUpgrade;

    struct IndexState {
        IndexDescriptor descriptor;
        std::set<std::pair<std::string, std::string>> entries;  // (encoded index key, encoded primary key)
    };

    struct ContainerState {
        ContainerDescriptor descriptor;
        std::map<std::string, nlohmann::json> records;  // by encoded primary key
        std::map<std::string, IndexState> indexes;
    };

    RecordStore(std::string data_dir, RecordStoreOptions options);

    storage::Status load();
    storage::Status loadManifest();
    storage::Status loadSnapshot();
    storage::Status replayJournal();
    storage::Status openJournalForAppend(bool truncate);

    // All *Locked members expect mutex_ to be held exclusively
    storage::Status persistLocked();
    storage::Status writeManifestLocked() const;
    storage::Status writeSnapshotLocked() const;
    storage::Status appendJournalLocked(const nlohmann::json& frame);
    storage::Status applyOpsLocked(const nlohmann::json& ops, bool replaying);
    void insertLocked(ContainerState& container, const std::string& pk, nlohmann::json document);
    void eraseLocked(ContainerState& container, const std::string& pk);

    static std::optional<Key> primaryKeyOf(const ContainerDescriptor& descriptor, const nlohmann::json& document);
    static std::vector<std::string> indexKeysOf(const IndexDescriptor& index, const nlohmann::json& document);

    const ContainerState* findContainer(const std::string& name) const;
    ContainerState* findContainer(const std::string& name);

    std::string data_dir_;
    RecordStoreOptions options_;
    std::atomic<bool> open_{true};
    int version_ = 0;
    uint64_t last_txn_id_ = 0;
    uint64_t snapshot_txn_id_ = 0;
    std::map<std::string, ContainerState> containers_;
    std::ofstream journal_;
    std::atomic<uint64_t> journal_bytes_{0};
    bool upgrade_active_ = false;
    mutable std::shared_mutex mutex_;
};

} // namespace tabvault
