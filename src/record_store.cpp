#include "tabvault/record_store.h"
#include "tabvault/debug_utils.h"
#include "tabvault/serialization_utils.h"
#include "tabvault/storage_error/error_utils.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace tabvault {

namespace {

// magic + length + crc32
constexpr uint64_t kFrameOverhead = 12;

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

struct EncodedRange {
    std::optional<std::string> lower;
    std::optional<std::string> upper;
    bool lower_open = false;
    bool upper_open = false;

    explicit EncodedRange(const KeyRange& range)
        : lower_open(range.lower_open), upper_open(range.upper_open) {
        if (range.lower) lower = encodeKey(*range.lower);
        if (range.upper) upper = encodeKey(*range.upper);
    }

    bool contains(const std::string& key) const {
        if (lower) {
            if (lower_open ? (key <= *lower || startsWith(key, *lower)) : key < *lower) return false;
        }
        if (upper) {
            if (startsWith(key, *upper)) return !upper_open;
            if (key > *upper) return false;
        }
        return true;
    }

    // Keys arrive in ascending order; true once no later key can match
    bool pastUpper(const std::string& key) const {
        if (!upper) return false;
        if (upper_open) return key >= *upper;
        return key > *upper && !startsWith(key, *upper);
    }

    // Keys arrive in descending order; true once no later key can match
    bool beforeLower(const std::string& key) const {
        if (!lower) return false;
        return lower_open ? (key <= *lower || startsWith(key, *lower)) : key < *lower;
    }

    // Exclusive end of the range in ascending order, nullopt when unbounded
    std::optional<std::string> endKey() const {
        if (!upper) return std::nullopt;
        if (upper_open) return upper;
        std::string successor = *upper;
        while (!successor.empty()) {
            auto last = static_cast<unsigned char>(successor.back());
            if (last != 0xff) {
                successor.back() = static_cast<char>(last + 1);
                return successor;
            }
            successor.pop_back();
        }
        return std::nullopt;
    }
};

using ScanEntry = std::pair<std::string, std::string>;  // (sort key, encoded primary key)
using RecordMap = std::map<std::string, json>;
using IndexEntries = std::set<ScanEntry>;

// Committed entries are read in batches that double up to the maximum, so the store lock
// is never held while visiting and an early stop reads little more than it visited
constexpr size_t kFirstScanBatch = 1;
constexpr size_t kMaxScanBatch = 256;

// The records map is its own primary index: sort key and primary key coincide
ScanEntry entryOf(const RecordMap::value_type& item) { return {item.first, item.first}; }
ScanEntry entryOf(const ScanEntry& item) { return item; }

std::string seekKeyOf(const RecordMap&, const std::string& sort_key, const std::string&) { return sort_key; }
ScanEntry seekKeyOf(const IndexEntries&, const std::string& sort_key, const std::string& pk) { return {sort_key, pk}; }

// Up to `limit` in-range entries that follow `cursor` in scan order
template<typename Entries, typename Skip>
std::vector<ScanEntry> collectBatch(const Entries& entries, const EncodedRange& range, ScanDirection direction,
                                    const std::optional<ScanEntry>& cursor, size_t limit, const Skip& skip) {
    std::vector<ScanEntry> batch;
    auto accept = [&](const ScanEntry& entry) {
        if (range.contains(entry.first) && !skip(entry.second)) batch.push_back(entry);
        return batch.size() < limit;
    };
    if (direction == ScanDirection::FORWARD) {
        auto it = entries.begin();
        if (cursor) {
            it = entries.upper_bound(seekKeyOf(entries, cursor->first, cursor->second));
        } else if (range.lower) {
            it = entries.lower_bound(seekKeyOf(entries, *range.lower, std::string()));
        }
        for (; it != entries.end(); ++it) {
            ScanEntry entry = entryOf(*it);
            if (range.pastUpper(entry.first) || !accept(entry)) break;
        }
    } else {
        auto start = entries.end();
        if (cursor) {
            start = entries.lower_bound(seekKeyOf(entries, cursor->first, cursor->second));
        } else if (auto end_key = range.endKey()) {
            start = entries.lower_bound(seekKeyOf(entries, *end_key, std::string()));
        }
        for (auto it = std::make_reverse_iterator(start); it != entries.rend(); ++it) {
            ScanEntry entry = entryOf(*it);
            if (range.beforeLower(entry.first) || !accept(entry)) break;
        }
    }
    return batch;
}

storage::StorageError containerNotFound(const std::string& name) {
    return storage::StorageError(storage::ErrorCode::CONTAINER_NOT_FOUND, "Unknown container: " + name)
        .withContext("container", name);
}

} // namespace

// ===================================================================
// StoreTransaction
// ===================================================================

StoreTransaction::StoreTransaction(RecordStore& store, std::vector<std::string> scope, TransactionMode mode)
    : store_(store), scope_(scope.begin(), scope.end()), mode_(mode) {}

StoreTransaction::~StoreTransaction() {
    if (isActive()) {
        abort();
    }
}

storage::Status StoreTransaction::checkUsable(const std::string& container, bool for_write) const {
    using storage::ErrorCode;
    if (phase_ != TransactionPhase::ACTIVE) {
        return TABVAULT_ERROR(ErrorCode::TRANSACTION_FINISHED, "Transaction is no longer active");
    }
    if (scope_.count(container) == 0) {
        return TABVAULT_ERROR(ErrorCode::TRANSACTION_SCOPE_VIOLATION,
                              "Container '" + container + "' is outside the transaction scope")
            .withContext("container", container);
    }
    if (for_write && mode_ == TransactionMode::READ_ONLY) {
        return TABVAULT_ERROR(ErrorCode::TRANSACTION_READ_ONLY, "Write attempted in a read-only transaction")
            .withContext("container", container);
    }
    std::shared_lock<std::shared_mutex> lock(store_.mutex_);
    if (!store_.open_) {
        return storage::StorageError::notInitialized("transaction on " + container);
    }
    if (!store_.findContainer(container)) {
        return containerNotFound(container);
    }
    return {};
}

std::optional<json> StoreTransaction::readVisible(const std::string& container, const std::string& pk) const {
    auto pending_it = pending_.find(container);
    if (pending_it != pending_.end()) {
        auto write_it = pending_it->second.writes.find(pk);
        if (write_it != pending_it->second.writes.end()) {
            return write_it->second.document;
        }
        if (pending_it->second.cleared) {
            return std::nullopt;
        }
    }
    std::shared_lock<std::shared_mutex> lock(store_.mutex_);
    const auto* state = store_.findContainer(container);
    if (!state) return std::nullopt;
    auto it = state->records.find(pk);
    if (it == state->records.end()) return std::nullopt;
    return it->second;
}

storage::Result<std::optional<json>> StoreTransaction::get(const std::string& container, const Key& key) {
    RETURN_IF_ERROR(checkUsable(container, false));
    return readVisible(container, encodeKey(key));
}

storage::Status StoreTransaction::put(const std::string& container, const json& document) {
    RETURN_IF_ERROR(checkUsable(container, true));
    std::optional<Key> key;
    {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        const auto* state = store_.findContainer(container);
        if (!state) {
            return containerNotFound(container);
        }
        key = RecordStore::primaryKeyOf(state->descriptor, document);
    }
    if (!key) {
        return TABVAULT_ERROR(storage::ErrorCode::INVALID_KEY, "Document has no usable primary key")
            .withContext("container", container);
    }
    std::string pk = encodeKey(*key);
    pending_[container].writes[pk] = PendingWrite{std::move(*key), document};
    return {};
}

storage::Status StoreTransaction::remove(const std::string& container, const Key& key) {
    RETURN_IF_ERROR(checkUsable(container, true));
    pending_[container].writes[encodeKey(key)] = PendingWrite{key, std::nullopt};
    return {};
}

storage::Status StoreTransaction::clear(const std::string& container) {
    RETURN_IF_ERROR(checkUsable(container, true));
    PendingContainer cleared;
    cleared.cleared = true;
    pending_[container] = std::move(cleared);
    return {};
}

storage::Status StoreTransaction::scan(const std::string& container, const std::string& index, const KeyRange& range,
                                       ScanDirection direction, const ScanVisitor& visitor) {
    RETURN_IF_ERROR(checkUsable(container, false));
    EncodedRange encoded(range);
    const PendingContainer* pending = nullptr;
    auto pending_it = pending_.find(container);
    if (pending_it != pending_.end()) pending = &pending_it->second;

    auto resolve = [&](const RecordStore::ContainerState*& state,
                       const RecordStore::IndexState*& idx) -> storage::Status {
        state = store_.findContainer(container);
        if (!state) {
            return containerNotFound(container);
        }
        idx = nullptr;
        if (!index.empty()) {
            auto idx_it = state->indexes.find(index);
            if (idx_it == state->indexes.end()) {
                return TABVAULT_ERROR(storage::ErrorCode::INDEX_NOT_FOUND, "Unknown index: " + index)
                    .withContext("container", container);
            }
            idx = &idx_it->second;
        }
        return {};
    };

    const bool forward = direction == ScanDirection::FORWARD;
    auto precedes = [forward](const ScanEntry& a, const ScanEntry& b) { return forward ? a < b : b < a; };
    auto overridden = [pending](const std::string& pk) { return pending && pending->writes.count(pk) > 0; };

    // This transaction's own writes, merged into the committed stream in scan order
    std::vector<ScanEntry> own;
    {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        const RecordStore::ContainerState* state = nullptr;
        const RecordStore::IndexState* idx = nullptr;
        RETURN_IF_ERROR(resolve(state, idx));
        if (pending) {
            for (const auto& [pk, write] : pending->writes) {
                if (!write.document) continue;
                if (!idx) {
                    if (encoded.contains(pk)) own.emplace_back(pk, pk);
                    continue;
                }
                for (const auto& key : RecordStore::indexKeysOf(idx->descriptor, *write.document)) {
                    if (encoded.contains(key)) own.emplace_back(key, pk);
                }
            }
        }
    }
    std::sort(own.begin(), own.end(), precedes);
    size_t own_pos = 0;
    auto visitOwn = [&](const ScanEntry& entry) { return visitor(*pending->writes.at(entry.second).document); };

    std::optional<ScanEntry> cursor;
    size_t batch_size = kFirstScanBatch;
    bool committed_done = pending && pending->cleared;
    while (!committed_done) {
        std::vector<std::pair<ScanEntry, json>> batch;
        {
            std::shared_lock<std::shared_mutex> lock(store_.mutex_);
            const RecordStore::ContainerState* state = nullptr;
            const RecordStore::IndexState* idx = nullptr;
            RETURN_IF_ERROR(resolve(state, idx));
            std::vector<ScanEntry> entries =
                idx ? collectBatch(idx->entries, encoded, direction, cursor, batch_size, overridden)
                    : collectBatch(state->records, encoded, direction, cursor, batch_size, overridden);
            committed_done = entries.size() < batch_size;
            batch_size = std::min(batch_size * 2, kMaxScanBatch);
            if (!entries.empty()) cursor = entries.back();
            batch.reserve(entries.size());
            for (auto& entry : entries) {
                auto record = state->records.find(entry.second);
                if (record == state->records.end()) continue;
                batch.emplace_back(std::move(entry), record->second);
            }
        }
        for (const auto& [entry, document] : batch) {
            while (own_pos < own.size() && precedes(own[own_pos], entry)) {
                if (!visitOwn(own[own_pos++])) return {};
            }
            if (!visitor(document)) return {};
        }
    }
    for (; own_pos < own.size(); ++own_pos) {
        if (!visitOwn(own[own_pos])) return {};
    }
    return {};
}

storage::Result<std::optional<json>> StoreTransaction::first(const std::string& container, const std::string& index,
                                                             ScanDirection direction, const KeyRange& range) {
    std::optional<json> found;
    RETURN_IF_ERROR(scan(container, index, range, direction, [&found](const json& document) {
        found = document;
        return false;
    }));
    return found;
}

storage::Result<size_t> StoreTransaction::count(const std::string& container, const std::string& index,
                                                const KeyRange& range) {
    size_t total = 0;
    RETURN_IF_ERROR(scan(container, index, range, ScanDirection::FORWARD, [&total](const json&) {
        ++total;
        return true;
    }));
    return total;
}

storage::Result<std::vector<json>> StoreTransaction::getAll(const std::string& container) {
    std::vector<json> documents;
    RETURN_IF_ERROR(scan(container, "", KeyRange::all(), ScanDirection::FORWARD, [&documents](const json& doc) {
        documents.push_back(doc);
        return true;
    }));
    return documents;
}

void StoreTransaction::abort() {
    if (phase_ != TransactionPhase::ACTIVE) return;
    pending_.clear();
    phase_ = TransactionPhase::ABORTED;
}

storage::Status StoreTransaction::commit() {
    using storage::ErrorCode;
    if (phase_ != TransactionPhase::ACTIVE) {
        return TABVAULT_ERROR(ErrorCode::TRANSACTION_FINISHED, "Transaction is no longer active");
    }
    bool has_writes = std::any_of(pending_.begin(), pending_.end(), [](const auto& item) {
        return item.second.cleared || !item.second.writes.empty();
    });
    if (mode_ == TransactionMode::READ_ONLY || !has_writes) {
        pending_.clear();
        phase_ = TransactionPhase::COMMITTED;
        return {};
    }

    json ops = json::array();
    for (const auto& [name, pending] : pending_) {
        if (pending.cleared) {
            ops.push_back({{"c", name}, {"op", "clear"}});
        }
        for (const auto& [pk, write] : pending.writes) {
            if (write.document) {
                ops.push_back({{"c", name}, {"op", "put"}, {"v", *write.document}});
            } else {
                ops.push_back({{"c", name}, {"op", "del"}, {"k", keyToJson(write.key)}});
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(store_.mutex_);
    auto fail = [this](storage::StorageError error) -> storage::Status {
        pending_.clear();
        phase_ = TransactionPhase::ABORTED;
        return error;
    };
    if (!store_.open_) {
        return fail(storage::StorageError::notInitialized("commit"));
    }

    for (const auto& [name, pending] : pending_) {
        const auto* state = store_.findContainer(name);
        if (!state) {
            return fail(containerNotFound(name));
        }
        for (const auto& [index_name, idx] : state->indexes) {
            if (!idx.descriptor.unique) continue;
            std::map<std::string, std::string> claimed;
            for (const auto& [pk, write] : pending.writes) {
                if (!write.document) continue;
                for (const auto& key : RecordStore::indexKeysOf(idx.descriptor, *write.document)) {
                    auto [claim_it, inserted] = claimed.emplace(key, pk);
                    bool conflict = !inserted && claim_it->second != pk;
                    if (!conflict && !pending.cleared) {
                        for (auto e = idx.entries.lower_bound({key, std::string()});
                             e != idx.entries.end() && e->first == key; ++e) {
                            if (e->second != pk && pending.writes.count(e->second) == 0) {
                                conflict = true;
                                break;
                            }
                        }
                    }
                    if (conflict) {
                        return fail(TABVAULT_ERROR(ErrorCode::DUPLICATE_KEY,
                                                   "Unique index '" + index_name + "' violated")
                                        .withContext("container", name)
                                        .withDetails("Key: " + format_key_for_print(key)));
                    }
                }
            }
        }
    }

    uint64_t txn_id = store_.last_txn_id_ + 1;
    auto appended = store_.appendJournalLocked(json{{"txn", txn_id}, {"ops", ops}});
    if (!appended.isOk()) {
        return fail(std::move(appended).error());
    }
    store_.last_txn_id_ = txn_id;
    auto applied = store_.applyOpsLocked(ops, /*replaying=*/false);
    pending_.clear();
    phase_ = TransactionPhase::COMMITTED;

    if (store_.isPersistent() && store_.journal_bytes_.load() > store_.options_.journal_compaction_bytes) {
        auto compacted = store_.persistLocked();
        if (!compacted.isOk()) {
            LOG_WARN("[RecordStore] Journal compaction after txn {} failed: {}", txn_id, compacted.error().toString());
        }
    }
    return applied;
}

// ===================================================================
// SchemaUpgrade
// ===================================================================

SchemaUpgrade::SchemaUpgrade(RecordStore& store, int old_version, int new_version)
    : store_(store), old_version_(old_version), new_version_(new_version) {}

SchemaUpgrade::~SchemaUpgrade() {
    if (active_) {
        abort();
    }
}

storage::Status SchemaUpgrade::createContainer(const ContainerDescriptor& descriptor) {
    using storage::ErrorCode;
    if (!active_) {
        return TABVAULT_ERROR(ErrorCode::TRANSACTION_FINISHED, "Schema upgrade is no longer active");
    }
    if (descriptor.name.empty() || descriptor.key_path.empty()) {
        return TABVAULT_ERROR(ErrorCode::SCHEMA_VIOLATION, "Container needs a name and a key path");
    }
    std::unique_lock<std::shared_mutex> lock(store_.mutex_);
    if (store_.containers_.count(descriptor.name) > 0) {
        return TABVAULT_ERROR(ErrorCode::CONTAINER_ALREADY_EXISTS, "Container already exists: " + descriptor.name);
    }
    RecordStore::ContainerState state;
    state.descriptor = descriptor;
    for (const auto& index : descriptor.indexes) {
        if (!index.isValid()) {
            return TABVAULT_ERROR(ErrorCode::SCHEMA_VIOLATION, "Invalid index definition: " + index.name)
                .withContext("container", descriptor.name);
        }
        state.indexes[index.name] = RecordStore::IndexState{index, {}};
    }
    store_.containers_.emplace(descriptor.name, std::move(state));

    std::string name = descriptor.name;
    undo_log_.push_back([this, name]() { store_.containers_.erase(name); });
    LOG_INFO("[SchemaUpgrade v{}] Created container '{}' with {} indexes", new_version_, name, descriptor.indexes.size());
    return {};
}

storage::Status SchemaUpgrade::deleteContainer(const std::string& name) {
    if (!active_) {
        return TABVAULT_ERROR(storage::ErrorCode::TRANSACTION_FINISHED, "Schema upgrade is no longer active");
    }
    std::unique_lock<std::shared_mutex> lock(store_.mutex_);
    auto it = store_.containers_.find(name);
    if (it == store_.containers_.end()) {
        return containerNotFound(name);
    }
    auto saved = std::make_shared<RecordStore::ContainerState>(std::move(it->second));
    store_.containers_.erase(it);
    undo_log_.push_back([this, name, saved]() { store_.containers_.emplace(name, std::move(*saved)); });
    LOG_INFO("[SchemaUpgrade v{}] Deleted container '{}'", new_version_, name);
    return {};
}

storage::Status SchemaUpgrade::createIndex(const std::string& container, const IndexDescriptor& index) {
    using storage::ErrorCode;
    if (!active_) {
        return TABVAULT_ERROR(ErrorCode::TRANSACTION_FINISHED, "Schema upgrade is no longer active");
    }
    if (!index.isValid()) {
        return TABVAULT_ERROR(ErrorCode::SCHEMA_VIOLATION, "Invalid index definition: " + index.name)
            .withContext("container", container);
    }
    std::unique_lock<std::shared_mutex> lock(store_.mutex_);
    auto* state = store_.findContainer(container);
    if (!state) {
        return containerNotFound(container);
    }
    if (state->indexes.count(index.name) > 0) {
        return TABVAULT_ERROR(ErrorCode::INDEX_ALREADY_EXISTS, "Index already exists: " + index.name)
            .withContext("container", container);
    }

    RecordStore::IndexState built{index, {}};
    for (const auto& [pk, document] : state->records) {
        for (const auto& key : RecordStore::indexKeysOf(index, document)) {
            if (index.unique) {
                auto existing = built.entries.lower_bound({key, std::string()});
                if (existing != built.entries.end() && existing->first == key) {
                    return TABVAULT_ERROR(ErrorCode::STORAGE_BACKFILL_FAILED,
                                          "Duplicate values prevent building unique index " + index.name)
                        .withContext("container", container);
                }
            }
            built.entries.emplace(key, pk);
        }
    }
    size_t backfilled = built.entries.size();
    state->indexes[index.name] = std::move(built);
    state->descriptor.indexes.push_back(index);

    std::string index_name = index.name;
    undo_log_.push_back([this, container, index_name]() {
        auto* target = store_.findContainer(container);
        if (!target) return;
        target->indexes.erase(index_name);
        auto& list = target->descriptor.indexes;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const IndexDescriptor& d) { return d.name == index_name; }),
                   list.end());
    });
    LOG_INFO("[SchemaUpgrade v{}] Created index '{}.{}' ({} entries backfilled)", new_version_, container, index_name, backfilled);
    return {};
}

storage::Status SchemaUpgrade::deleteIndex(const std::string& container, const std::string& index_name) {
    if (!active_) {
        return TABVAULT_ERROR(storage::ErrorCode::TRANSACTION_FINISHED, "Schema upgrade is no longer active");
    }
    std::unique_lock<std::shared_mutex> lock(store_.mutex_);
    auto* state = store_.findContainer(container);
    if (!state) {
        return containerNotFound(container);
    }
    auto it = state->indexes.find(index_name);
    if (it == state->indexes.end()) {
        return TABVAULT_ERROR(storage::ErrorCode::INDEX_NOT_FOUND, "Unknown index: " + index_name)
            .withContext("container", container);
    }
    auto saved = std::make_shared<RecordStore::IndexState>(std::move(it->second));
    state->indexes.erase(it);
    auto& list = state->descriptor.indexes;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const IndexDescriptor& d) { return d.name == index_name; }),
               list.end());
    undo_log_.push_back([this, container, index_name, saved]() {
        auto* target = store_.findContainer(container);
        if (!target) return;
        target->descriptor.indexes.push_back(saved->descriptor);
        target->indexes[index_name] = std::move(*saved);
    });
    LOG_INFO("[SchemaUpgrade v{}] Deleted index '{}.{}'", new_version_, container, index_name);
    return {};
}

storage::Status SchemaUpgrade::setTargetVersion(int version) {
    if (!active_) {
        return TABVAULT_ERROR(storage::ErrorCode::TRANSACTION_FINISHED, "Schema upgrade is no longer active");
    }
    if (version < old_version_) {
        return TABVAULT_ERROR(storage::ErrorCode::STORAGE_VERSION_MISMATCH,
                              "Upgrade target " + std::to_string(version) + " is below the current version " +
                                  std::to_string(old_version_));
    }
    new_version_ = version;
    return {};
}

bool SchemaUpgrade::hasContainer(const std::string& name) const {
    return store_.hasContainer(name);
}

bool SchemaUpgrade::hasIndex(const std::string& container, const std::string& index_name) const {
    return store_.hasIndex(container, index_name);
}

storage::Status SchemaUpgrade::commit() {
    if (!active_) {
        return TABVAULT_ERROR(storage::ErrorCode::TRANSACTION_FINISHED, "Schema upgrade is no longer active");
    }
    std::unique_lock<std::shared_mutex> lock(store_.mutex_);
    int previous = store_.version_;
    store_.version_ = new_version_;
    auto status = store_.persistLocked();
    if (!status.isOk()) {
        store_.version_ = previous;
        for (auto it = undo_log_.rbegin(); it != undo_log_.rend(); ++it) {
            (*it)();
        }
    } else {
        LOG_INFO("[RecordStore] Schema upgraded from version {} to {}", old_version_, new_version_);
    }
    undo_log_.clear();
    active_ = false;
    store_.upgrade_active_ = false;
    return status;
}

void SchemaUpgrade::abort() {
    if (!active_) return;
    std::unique_lock<std::shared_mutex> lock(store_.mutex_);
    for (auto it = undo_log_.rbegin(); it != undo_log_.rend(); ++it) {
        (*it)();
    }
    LOG_WARN("[SchemaUpgrade v{}] Aborted; reverted {} schema changes", new_version_, undo_log_.size());
    undo_log_.clear();
    active_ = false;
    store_.upgrade_active_ = false;
}

// ===================================================================
// RecordStore
// ===================================================================

RecordStore::RecordStore(std::string data_dir, RecordStoreOptions options)
    : data_dir_(std::move(data_dir)), options_(options) {}

RecordStore::~RecordStore() {
    if (open_) {
        auto status = close();
        if (!status.isOk()) {
            LOG_ERROR("[RecordStore] Close during destruction failed: {}", status.error().toString());
        }
    }
}

storage::Result<std::unique_ptr<RecordStore>> RecordStore::open(const std::string& data_dir,
                                                                RecordStoreOptions options) {
    std::unique_ptr<RecordStore> store(new RecordStore(data_dir, options));
    auto status = store->load();
    if (!status.isOk()) {
        store->open_ = false;
        return status.error();
    }
    LOG_INFO("[RecordStore] Opened {} at schema version {} ({} containers, last txn {})",
             data_dir.empty() ? std::string("<memory>") : data_dir, store->version_,
             store->containers_.size(), store->last_txn_id_);
    return std::move(store);
}

storage::Result<int> RecordStore::readPersistedVersion(const std::string& data_dir) {
    if (data_dir.empty()) {
        return 0;
    }
    fs::path manifest_path = fs::path(data_dir) / kManifestFile;
    std::error_code ec;
    if (!fs::exists(manifest_path, ec)) {
        return 0;
    }
    try {
        std::ifstream in(manifest_path);
        json manifest = json::parse(in);
        return manifest.at("version").get<int>();
    } catch (const json::exception& e) {
        return storage::StorageError::corruption(std::string("Unreadable manifest: ") + e.what())
            .withFilePath(manifest_path.string());
    }
}

storage::Status RecordStore::load() {
    if (!isPersistent()) {
        return {};
    }
    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        return storage::StorageError::ioError("create_directories: " + ec.message(), data_dir_);
    }
    RETURN_IF_ERROR(loadManifest());
    RETURN_IF_ERROR(loadSnapshot());
    RETURN_IF_ERROR(replayJournal());
    return {};
}

storage::Status RecordStore::loadManifest() {
    fs::path manifest_path = fs::path(data_dir_) / kManifestFile;
    std::error_code ec;
    if (!fs::exists(manifest_path, ec)) {
        version_ = 0;
        return writeManifestLocked();
    }
    try {
        std::ifstream in(manifest_path);
        json manifest = json::parse(in);
        version_ = manifest.at("version").get<int>();
        last_txn_id_ = manifest.value("lastTxnId", uint64_t{0});
        for (const auto& descriptor : manifest.value("containers", std::vector<ContainerDescriptor>{})) {
            ContainerState state;
            state.descriptor = descriptor;
            for (const auto& index : descriptor.indexes) {
                state.indexes[index.name] = IndexState{index, {}};
            }
            containers_.emplace(descriptor.name, std::move(state));
        }
    } catch (const json::exception& e) {
        return storage::StorageError::corruption(std::string("Unreadable manifest: ") + e.what())
            .withFilePath(manifest_path.string());
    }
    return {};
}

storage::Status RecordStore::loadSnapshot() {
    fs::path snapshot_path = fs::path(data_dir_) / kSnapshotFile;
    std::error_code ec;
    if (!fs::exists(snapshot_path, ec)) {
        return {};
    }
    std::ifstream in(snapshot_path, std::ios::binary);
    if (!in.is_open()) {
        return storage::StorageError(storage::ErrorCode::IO_READ_ERROR, "Cannot open snapshot")
            .withFilePath(snapshot_path.string());
    }
    std::vector<uint8_t> payload;
    FrameReadStatus status = ReadFrame(in, payload);
    if (status != FrameReadStatus::OK) {
        return storage::StorageError::corruption("Snapshot frame is damaged")
            .withFilePath(snapshot_path.string());
    }
    json image;
    try {
        image = json::from_cbor(payload);
    } catch (const json::exception& e) {
        return storage::StorageError::corruption(std::string("Snapshot payload is not valid CBOR: ") + e.what())
            .withFilePath(snapshot_path.string());
    }

    snapshot_txn_id_ = image.value("txn", uint64_t{0});
    last_txn_id_ = std::max(last_txn_id_, snapshot_txn_id_);
    size_t loaded = 0;
    json containers = image.value("containers", json::object());
    for (const auto& item : containers.items()) {
        ContainerState* state = findContainer(item.key());
        if (!state) {
            LOG_WARN("[RecordStore] Snapshot holds container '{}' absent from the manifest; ignoring it", item.key());
            continue;
        }
        for (const auto& document : item.value()) {
            auto key = primaryKeyOf(state->descriptor, document);
            if (!key) {
                LOG_WARN("[RecordStore] Snapshot document in '{}' has no primary key; skipping", item.key());
                continue;
            }
            insertLocked(*state, encodeKey(*key), document);
            ++loaded;
        }
    }
    LOG_INFO("[RecordStore] Loaded {} records from snapshot (txn {})", loaded, snapshot_txn_id_);
    return {};
}

storage::Status RecordStore::replayJournal() {
    fs::path journal_path = fs::path(data_dir_) / kJournalFile;
    std::error_code ec;
    if (!fs::exists(journal_path, ec)) {
        return openJournalForAppend(false);
    }

    std::ifstream in(journal_path, std::ios::binary);
    if (!in.is_open()) {
        return storage::StorageError(storage::ErrorCode::IO_READ_ERROR, "Cannot open journal")
            .withFilePath(journal_path.string());
    }
    uint64_t valid_end = 0;
    size_t replayed = 0;
    bool damaged_tail = false;
    std::vector<uint8_t> payload;
    while (true) {
        FrameReadStatus status = ReadFrame(in, payload);
        if (status == FrameReadStatus::END_OF_STREAM) break;
        if (status != FrameReadStatus::OK) {
            LOG_WARN("[RecordStore] {} journal frame at offset {} in {}; discarding the tail",
                     status == FrameReadStatus::TRUNCATED ? "Torn" : "Corrupt", valid_end, journal_path.string());
            damaged_tail = true;
            break;
        }
        json frame;
        try {
            frame = json::from_cbor(payload);
        } catch (const json::exception& e) {
            LOG_WARN("[RecordStore] Undecodable journal frame at offset {}: {}; discarding the tail", valid_end, e.what());
            damaged_tail = true;
            break;
        }
        uint64_t txn = frame.value("txn", uint64_t{0});
        if (txn > snapshot_txn_id_) {
            RETURN_IF_ERROR(applyOpsLocked(frame.value("ops", json::array()), /*replaying=*/true));
            last_txn_id_ = std::max(last_txn_id_, txn);
            ++replayed;
        }
        valid_end += kFrameOverhead + payload.size();
    }
    in.close();

    if (damaged_tail) {
        fs::resize_file(journal_path, valid_end, ec);
        if (ec) {
            return storage::StorageError::ioError("truncate journal: " + ec.message(), journal_path.string());
        }
    }
    if (replayed > 0) {
        LOG_INFO("[RecordStore] Replayed {} journal transactions (last txn {})", replayed, last_txn_id_);
    }
    return openJournalForAppend(false);
}

storage::Status RecordStore::openJournalForAppend(bool truncate) {
    fs::path journal_path = fs::path(data_dir_) / kJournalFile;
    if (journal_.is_open()) {
        journal_.close();
    }
    journal_.clear();
    journal_.open(journal_path, std::ios::binary | (truncate ? std::ios::trunc : std::ios::app));
    if (!journal_.is_open()) {
        return storage::StorageError::ioError("open journal", journal_path.string());
    }
    std::error_code ec;
    uint64_t size = truncate ? 0 : fs::file_size(journal_path, ec);
    journal_bytes_.store(ec ? 0 : size);
    return {};
}

storage::Status RecordStore::appendJournalLocked(const json& frame) {
    if (!isPersistent()) {
        return {};
    }
    std::vector<uint8_t> payload = json::to_cbor(frame);
    try {
        WriteFrame(journal_, payload);
        journal_.flush();
        if (!journal_) {
            throw std::runtime_error("journal flush failed");
        }
    } catch (const std::exception& e) {
        fs::path journal_path = fs::path(data_dir_) / kJournalFile;
        LOG_ERROR("[RecordStore] Journal append failed: {}", e.what());
        journal_.close();
        std::error_code ec;
        fs::resize_file(journal_path, journal_bytes_.load(), ec);
        auto reopened = openJournalForAppend(false);
        if (!reopened.isOk()) {
            LOG_ERROR("[RecordStore] Journal could not be reopened: {}", reopened.error().toString());
        }
        return storage::StorageError::ioError(std::string("append journal frame: ") + e.what(), journal_path.string());
    }
    journal_bytes_ += kFrameOverhead + payload.size();
    return {};
}

storage::Status RecordStore::applyOpsLocked(const json& ops, bool replaying) {
    for (const auto& op : ops) {
        std::string name = op.value("c", std::string());
        std::string kind = op.value("op", std::string());
        ContainerState* state = findContainer(name);
        if (!state) {
            if (replaying) {
                LOG_WARN("[RecordStore] Journal references unknown container '{}'; skipping op", name);
                continue;
            }
            return containerNotFound(name);
        }
        if (kind == "put") {
            const json& document = op.at("v");
            auto key = primaryKeyOf(state->descriptor, document);
            if (!key) {
                LOG_WARN("[RecordStore] Put without a primary key in '{}'; skipping op", name);
                continue;
            }
            insertLocked(*state, encodeKey(*key), document);
        } else if (kind == "del") {
            auto key = keyFromJson(op.value("k", json()));
            if (!key) {
                LOG_WARN("[RecordStore] Delete with a malformed key in '{}'; skipping op", name);
                continue;
            }
            eraseLocked(*state, encodeKey(*key));
        } else if (kind == "clear") {
            state->records.clear();
            for (auto& [index_name, idx] : state->indexes) {
                idx.entries.clear();
            }
        } else {
            LOG_WARN("[RecordStore] Unknown journal op '{}'; skipping", kind);
        }
    }
    return {};
}

void RecordStore::insertLocked(ContainerState& container, const std::string& pk, json document) {
    auto existing = container.records.find(pk);
    if (existing != container.records.end()) {
        for (auto& [index_name, idx] : container.indexes) {
            for (const auto& key : indexKeysOf(idx.descriptor, existing->second)) {
                idx.entries.erase({key, pk});
            }
        }
    }
    for (auto& [index_name, idx] : container.indexes) {
        for (auto& key : indexKeysOf(idx.descriptor, document)) {
            idx.entries.emplace(std::move(key), pk);
        }
    }
    container.records[pk] = std::move(document);
}

void RecordStore::eraseLocked(ContainerState& container, const std::string& pk) {
    auto existing = container.records.find(pk);
    if (existing == container.records.end()) return;
    for (auto& [index_name, idx] : container.indexes) {
        for (const auto& key : indexKeysOf(idx.descriptor, existing->second)) {
            idx.entries.erase({key, pk});
        }
    }
    container.records.erase(existing);
}

storage::Status RecordStore::writeManifestLocked() const {
    if (!isPersistent()) {
        return {};
    }
    json manifest;
    manifest["database"] = SchemaRegistry::kDatabaseName;
    manifest["version"] = version_;
    manifest["lastTxnId"] = last_txn_id_;
    json descriptors = json::array();
    for (const auto& [name, state] : containers_) {
        descriptors.push_back(state.descriptor);
    }
    manifest["containers"] = std::move(descriptors);

    fs::path final_path = fs::path(data_dir_) / kManifestFile;
    fs::path temp_path = final_path;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        out << manifest.dump(2);
        out.flush();
        if (!out) {
            return storage::StorageError::ioError("write manifest", temp_path.string());
        }
    }
    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        return storage::StorageError::ioError("rename manifest: " + ec.message(), final_path.string());
    }
    return {};
}

storage::Status RecordStore::writeSnapshotLocked() const {
    json image;
    image["txn"] = last_txn_id_;
    json containers = json::object();
    for (const auto& [name, state] : containers_) {
        json documents = json::array();
        for (const auto& [pk, document] : state.records) {
            documents.push_back(document);
        }
        containers[name] = std::move(documents);
    }
    image["containers"] = std::move(containers);

    fs::path final_path = fs::path(data_dir_) / kSnapshotFile;
    fs::path temp_path = final_path;
    temp_path += ".tmp";
    try {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return storage::StorageError::ioError("open snapshot", temp_path.string());
        }
        WriteFrame(out, json::to_cbor(image));
        out.flush();
        if (!out) {
            return storage::StorageError::ioError("flush snapshot", temp_path.string());
        }
    } catch (const std::exception& e) {
        return storage::StorageError::ioError(std::string("write snapshot: ") + e.what(), temp_path.string());
    }
    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        return storage::StorageError::ioError("rename snapshot: " + ec.message(), final_path.string());
    }
    return {};
}

storage::Status RecordStore::persistLocked() {
    if (!isPersistent()) {
        return {};
    }
    RETURN_IF_ERROR(writeManifestLocked());
    RETURN_IF_ERROR(writeSnapshotLocked());
    snapshot_txn_id_ = last_txn_id_;
    RETURN_IF_ERROR(openJournalForAppend(/*truncate=*/true));
    LOG_TRACE("[RecordStore] Compacted {} at txn {}", data_dir_, last_txn_id_);
    return {};
}

storage::Status RecordStore::close() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!open_) {
        return {};
    }
    auto status = persistLocked();
    if (journal_.is_open()) {
        journal_.close();
    }
    open_ = false;
    return status;
}

int RecordStore::version() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return version_;
}

std::vector<std::string> RecordStore::containerNames() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, state] : containers_) {
        names.push_back(name);
    }
    return names;
}

std::optional<ContainerDescriptor> RecordStore::describeContainer(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto* state = findContainer(name);
    if (!state) return std::nullopt;
    return state->descriptor;
}

bool RecordStore::hasContainer(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return findContainer(name) != nullptr;
}

bool RecordStore::hasIndex(const std::string& container, const std::string& index_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto* state = findContainer(container);
    return state && state->indexes.count(index_name) > 0;
}

std::unique_ptr<StoreTransaction> RecordStore::begin(std::vector<std::string> scope, TransactionMode mode) {
    return std::unique_ptr<StoreTransaction>(new StoreTransaction(*this, std::move(scope), mode));
}

storage::Result<std::unique_ptr<SchemaUpgrade>> RecordStore::beginUpgrade(int new_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!open_) {
        return storage::StorageError::notInitialized("beginUpgrade");
    }
    if (upgrade_active_) {
        return TABVAULT_ERROR(storage::ErrorCode::TRANSACTION_CONFLICT, "Another schema upgrade is in progress");
    }
    if (new_version < version_) {
        return TABVAULT_ERROR(storage::ErrorCode::STORAGE_VERSION_MISMATCH,
                              "Cannot downgrade schema from " + std::to_string(version_) + " to " +
                                  std::to_string(new_version));
    }
    upgrade_active_ = true;
    return std::unique_ptr<SchemaUpgrade>(new SchemaUpgrade(*this, version_, new_version));
}

storage::Status RecordStore::compact() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!open_) {
        return storage::StorageError::notInitialized("compact");
    }
    return persistLocked();
}

int64_t RecordStore::approximateSize() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    int64_t total = 0;
    for (const auto& [name, state] : containers_) {
        for (const auto& [pk, document] : state.records) {
            total += static_cast<int64_t>(pk.size() + json::to_cbor(document).size());
        }
    }
    return total;
}

std::optional<Key> RecordStore::primaryKeyOf(const ContainerDescriptor& descriptor, const json& document) {
    if (descriptor.key_path.empty()) return std::nullopt;
    Key key;
    for (const auto& field : descriptor.key_path) {
        const json* value = resolveField(document, field);
        if (!value) return std::nullopt;
        auto part = keyValueFromJson(*value);
        if (!part) return std::nullopt;
        key.push_back(std::move(*part));
    }
    return key;
}

std::vector<std::string> RecordStore::indexKeysOf(const IndexDescriptor& index, const json& document) {
    std::vector<std::string> keys;
    if (index.key_path.size() == 1) {
        const json* value = resolveField(document, index.key_path.front());
        if (!value) return keys;
        if (index.multi_entry && value->is_array()) {
            std::set<std::string> distinct;
            for (const auto& element : *value) {
                if (auto part = keyValueFromJson(element)) {
                    distinct.insert(encodeKeyValue(*part));
                }
            }
            keys.assign(distinct.begin(), distinct.end());
        } else if (auto part = keyValueFromJson(*value)) {
            keys.push_back(encodeKeyValue(*part));
        }
        return keys;
    }
    Key parts;
    for (const auto& field : index.key_path) {
        const json* value = resolveField(document, field);
        if (!value) return keys;
        auto part = keyValueFromJson(*value);
        if (!part) return keys;
        parts.push_back(std::move(*part));
    }
    keys.push_back(encodeKey(parts));
    return keys;
}

const RecordStore::ContainerState* RecordStore::findContainer(const std::string& name) const {
    auto it = containers_.find(name);
    return it == containers_.end() ? nullptr : &it->second;
}

RecordStore::ContainerState* RecordStore::findContainer(const std::string& name) {
    auto it = containers_.find(name);
    return it == containers_.end() ? nullptr : &it->second;
}

} // namespace tabvault
