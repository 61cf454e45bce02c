#include "tabvault/storage_engine.h"
#include "tabvault/checksum.h"
#include "tabvault/debug_utils.h"
#include "tabvault/record_codec.h"
#include "tabvault/storage_error/error_utils.h"
#include "tabvault/url_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <algorithm>
#include <charconv>
#include <limits>
#include <set>

namespace tabvault {

namespace {

using storage::ErrorCode;
using storage::StorageError;

const std::vector<std::string>& recordContainers() {
    static const std::vector<std::string> names = {
        containers::SESSIONS, containers::TABS, containers::NAVIGATION_EVENTS, containers::SESSION_BOUNDARIES,
    };
    return names;
}

std::vector<std::string> allContainers() {
    std::vector<std::string> names = recordContainers();
    names.push_back(containers::METADATA);
    return names;
}

Key sessionKey(const std::string& id) { return Key{id}; }
Key tabKey(TabId id) { return Key{int64_t{id}}; }
Key eventKey(TabId tab_id, Timestamp timestamp) { return Key{int64_t{tab_id}, int64_t{timestamp}}; }
Key boundaryKey(const std::string& id) { return Key{id}; }

// Primary key of a persisted document, as declared by its container
std::optional<Key> documentKey(const SchemaRegistry& registry, const std::string& container, const json& document) {
    const ContainerDescriptor* descriptor = registry.findContainer(container);
    if (!descriptor) return std::nullopt;
    Key key;
    for (const auto& field : descriptor->key_path) {
        const json* value = resolveField(document, field);
        if (!value) return std::nullopt;
        auto part = keyValueFromJson(*value);
        if (!part) return std::nullopt;
        key.push_back(std::move(*part));
    }
    return key;
}

bool parseTabId(const std::string& text, TabId& tab_id) {
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, tab_id);
    return ec == std::errc() && ptr == end;
}

template<typename T>
bool containsValue(const std::vector<T>& values, const T& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool anyDomainMatches(const std::vector<std::string>& wanted, const std::vector<std::string>& domains) {
    for (const auto& needle : wanted) {
        for (const auto& domain : domains) {
            if (domain.find(needle) != std::string::npos) return true;
        }
    }
    return false;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& lowered_needle) {
    return url_utils::toLower(haystack).find(lowered_needle) != std::string::npos;
}

std::string joinMessages(const std::vector<std::string>& messages) {
    std::string joined;
    for (const auto& message : messages) {
        if (!joined.empty()) joined += "; ";
        joined += message;
    }
    return joined;
}

} // namespace

// ===================================================================
// Collection reads
// ===================================================================

storage::Result<RecordCollections> readCollections(RecordStore& store, const SessionDataSerializer& serializer) {
    std::vector<std::string> scope;
    for (const auto& name : recordContainers()) {
        if (store.hasContainer(name)) scope.push_back(name);
    }
    RecordCollections collections;
    auto txn = store.begin(scope, TransactionMode::READ_ONLY);

    auto readAll = [&](const char* container, auto decode, auto& out) -> storage::Status {
        if (!store.hasContainer(container)) return {};
        std::vector<json> documents;
        ASSIGN_OR_RETURN(documents, txn->getAll(container));
        for (const auto& document : documents) {
            auto decoded = decode(document);
            if (decoded.isOk()) {
                out.push_back(std::move(decoded).value());
            } else {
                LOG_WARN("[StorageEngine] Skipping undecodable {} record: {}", container, decoded.error().toString());
            }
        }
        return {};
    };

    RETURN_IF_ERROR(readAll(containers::SESSIONS,
                            [&](const json& d) { return serializer.decodeSession(d); }, collections.sessions));
    RETURN_IF_ERROR(readAll(containers::TABS,
                            [&](const json& d) { return serializer.decodeTab(d); }, collections.tabs));
    RETURN_IF_ERROR(readAll(containers::NAVIGATION_EVENTS,
                            [&](const json& d) { return serializer.decodeNavigationEvent(d); },
                            collections.navigation_events));
    RETURN_IF_ERROR(readAll(containers::SESSION_BOUNDARIES,
                            [&](const json& d) { return serializer.decodeBoundary(d); }, collections.boundaries));
    return collections;
}

// ===================================================================
// Lifecycle
// ===================================================================

StorageEngine::StorageEngine(std::string data_dir, StorageConfig config, const SchemaRegistry& registry,
                             const SessionDataSerializer& serializer, IntegrityValidator& validator,
                             MigrationManager& migration, ClockFn clock)
    : data_dir_(std::move(data_dir)),
      config_(std::move(config)),
      registry_(registry),
      serializer_(serializer),
      validator_(validator),
      migration_(migration),
      clock_(clock ? std::move(clock) : ClockFn(systemNowMs)) {}

StorageEngine::~StorageEngine() {
    auto status = shutdown();
    if (!status.isOk()) {
        LOG_ERROR("[StorageEngine] Shutdown during destruction failed: {}", status.error().toString());
    }
}

storage::Status StorageEngine::initialize() {
    std::promise<storage::Status> promise;
    std::shared_future<storage::Status> future;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!init_future_.valid()) {
            init_future_ = promise.get_future().share();
            owner = true;
        }
        future = init_future_;
    }
    if (owner) {
        storage::Status status;
        try {
            status = doInitialize();
        } catch (const std::exception& e) {
            status = TABVAULT_ERROR(ErrorCode::INTERNAL_ERROR, "Initialization threw an exception").withDetails(e.what());
        }
        if (!status.isOk()) {
            LOG_ERROR("[StorageEngine] Initialization failed.\n{}", status.error().toDetailedString());
            std::lock_guard<std::mutex> lock(state_mutex_);
            init_future_ = std::shared_future<storage::Status>();
        }
        promise.set_value(status);
    }
    return future.get();
}

bool StorageEngine::isInitialized() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return store_ && store_->isOpen();
}

storage::Status StorageEngine::doInitialize() {
    LOG_INFO("[StorageEngine] Opening {} (data dir: '{}')", SchemaRegistry::kDatabaseName, data_dir_);
    RecordStoreOptions store_options;
    store_options.journal_compaction_bytes = config_.journal_compaction_bytes;

    std::unique_ptr<RecordStore> opened;
    ASSIGN_OR_RETURN(opened, RecordStore::open(data_dir_, store_options));
    std::shared_ptr<RecordStore> store(std::move(opened));

    const int latest = registry_.latestVersion();
    if (store->version() < latest) {
        MigrationResult migration = migration_.performMigration(*store, store->version(), latest);
        for (const auto& warning : migration.warnings) {
            LOG_WARN("[StorageEngine] Migration warning: {}", warning);
        }
        if (!migration.success) {
            return TABVAULT_ERROR(ErrorCode::MIGRATION_FAILED,
                                  "Schema migration to version " + std::to_string(latest) + " failed")
                .withDetails(joinMessages(migration.errors));
        }
    }

    RETURN_IF_ERROR(ensureSchema(*store));
    metadata_version_ = store->version();
    RETURN_IF_ERROR(ensureMetadata(*store));

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        store_ = store;
    }
    LOG_INFO("[StorageEngine] Initialized at schema version {}", store->version());

    if (config_.run_startup_maintenance) {
        runStartupMaintenance();
    }
    return {};
}

storage::Status StorageEngine::ensureSchema(RecordStore& store) {
    std::vector<const ContainerDescriptor*> missing_containers;
    std::vector<std::pair<std::string, IndexDescriptor>> missing_indexes;
    std::vector<ContainerDescriptor> expected = registry_.containersAtVersion(store.version());
    for (const auto& container : expected) {
        if (!store.hasContainer(container.name)) {
            missing_containers.push_back(&container);
            continue;
        }
        for (const auto& index : container.indexes) {
            if (!store.hasIndex(container.name, index.name)) {
                missing_indexes.emplace_back(container.name, index);
            }
        }
    }
    if (missing_containers.empty() && missing_indexes.empty()) {
        return {};
    }

    std::unique_ptr<SchemaUpgrade> upgrade;
    ASSIGN_OR_RETURN(upgrade, store.beginUpgrade(store.version()));
    for (const ContainerDescriptor* container : missing_containers) {
        RETURN_IF_ERROR(upgrade->createContainer(*container));
    }
    for (const auto& [container, index] : missing_indexes) {
        RETURN_IF_ERROR(upgrade->createIndex(container, index));
    }
    LOG_INFO("[StorageEngine] Added {} missing containers and {} missing indexes", missing_containers.size(),
             missing_indexes.size());
    return upgrade->commit();
}

storage::Status StorageEngine::ensureMetadata(RecordStore& store) {
    auto txn = store.begin({containers::METADATA}, TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::METADATA, Key{int64_t{metadata_version_}}));
    if (existing) {
        return {};
    }
    DatabaseMetadata meta;
    meta.version = metadata_version_;
    meta.created_at = clock_();
    meta.last_modified = meta.created_at;
    RETURN_IF_ERROR(txn->put(containers::METADATA, json(meta)));
    return txn->commit();
}

void StorageEngine::runStartupMaintenance() {
    auto cleaned = cleanupOldData();
    if (!cleaned.isOk()) {
        LOG_WARN("[StorageEngine] Startup cleanup failed: {}", cleaned.error().toString());
    }
    auto stats = updateStorageStats();
    if (!stats.isOk()) {
        LOG_WARN("[StorageEngine] Startup stats refresh failed: {}", stats.error().toString());
    }
    auto check = runIntegrityCheck();
    if (!check.isOk()) {
        LOG_WARN("[StorageEngine] Startup integrity check failed: {}", check.error().toString());
    }
}

storage::Status StorageEngine::shutdown() {
    std::shared_ptr<RecordStore> store;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        store = std::move(store_);
        store_.reset();
        init_future_ = std::shared_future<storage::Status>();
    }
    if (!store || !store->isOpen()) {
        return {};
    }
    auto status = store->close();
    if (status.isOk()) {
        LOG_INFO("[StorageEngine] Shutdown complete");
    }
    return status;
}

storage::Result<std::shared_ptr<RecordStore>> StorageEngine::requireStore(const char* operation) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (store_ && store_->isOpen()) {
            return store_;
        }
    }
    RETURN_IF_ERROR(initialize());
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!store_) {
        return StorageError::notInitialized(operation);
    }
    return store_;
}

// ===================================================================
// Metadata counters
// ===================================================================

storage::Result<DatabaseMetadata> StorageEngine::readMetadata(StoreTransaction& txn) {
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn.get(containers::METADATA, Key{int64_t{metadata_version_}}));
    if (!document) {
        DatabaseMetadata meta;
        meta.version = metadata_version_;
        meta.created_at = clock_();
        return meta;
    }
    return document->get<DatabaseMetadata>();
}

storage::Status StorageEngine::adjustCounters(StoreTransaction& txn, const Counters& delta) {
    if (delta.sessions == 0 && delta.tabs == 0 && delta.navigation_events == 0 && delta.boundaries == 0) {
        return {};
    }
    DatabaseMetadata meta;
    ASSIGN_OR_RETURN(meta, readMetadata(txn));
    auto bump = [](int64_t& counter, int64_t by) { counter = std::max<int64_t>(0, counter + by); };
    bump(meta.total_sessions, delta.sessions);
    bump(meta.total_tabs, delta.tabs);
    bump(meta.total_navigation_events, delta.navigation_events);
    bump(meta.total_boundaries, delta.boundaries);
    meta.last_modified = clock_();
    return txn.put(containers::METADATA, json(meta));
}

// ===================================================================
// Queries
// ===================================================================

ScanDirection StorageEngine::directionFor(const QueryOptions& options) const {
    return options.order == SortOrder::DESCENDING ? ScanDirection::BACKWARD : ScanDirection::FORWARD;
}

template<typename Stored, typename Decode, typename Match>
storage::Result<std::vector<Stored>> StorageEngine::runQuery(const char* container, const ScanPlan& plan,
                                                             const QueryOptions& options, Decode decode, Match match) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("query"));
    std::vector<Stored> results;
    if (options.limit == 0) {
        return results;
    }

    auto txn = store->begin({container}, TransactionMode::READ_ONLY);
    size_t scanned = 0;
    size_t matched = 0;
    std::set<std::string> seen;  // multi-entry indexes visit a record once per entry
    auto status = txn->scan(container, plan.index, plan.range, plan.direction, [&](const json& document) {
        if (++scanned > kMaxScannedRecords) {
            LOG_WARN("[StorageEngine] Query on {} stopped after scanning {} records", container, kMaxScannedRecords);
            return false;
        }
        auto key = documentKey(registry_, container, document);
        if (key && !seen.insert(encodeKey(*key)).second) {
            return true;
        }
        auto decoded = decode(document);
        if (!decoded.isOk()) {
            LOG_WARN("[StorageEngine] Skipping undecodable {} record: {}", container, decoded.error().toString());
            return true;
        }
        if (!match(decoded.value())) {
            return true;
        }
        if (matched++ < options.offset) {
            return true;
        }
        results.push_back(std::move(decoded).value());
        return results.size() < options.limit;
    });
    RETURN_IF_ERROR(status);
    return results;
}

storage::Result<std::vector<StoredSession>> StorageEngine::querySessions(const SessionQuery& query,
                                                                         const QueryOptions& options) {
    ScanPlan plan;
    plan.direction = directionFor(options);
    if (!config_.indexing_enabled) {
        plan.index.clear();
    } else if (query.date_range) {
        plan.index = "by_created_at";
        plan.range = KeyRange::bound(Key{int64_t{query.date_range->start}}, Key{int64_t{query.date_range->end}});
    } else if (query.tags.size() == 1) {
        plan.index = "by_tag";
        plan.range = KeyRange::only(Key{query.tags.front()});
    } else {
        plan.index = "by_updated_at";
    }

    std::optional<std::string> needle;
    if (query.search_text && !query.search_text->empty()) {
        needle = url_utils::toLower(*query.search_text);
    }
    auto match = [&query, &needle](const StoredSession& stored) {
        const Session& session = stored.session;
        if (!query.tags.empty() && !containsValue(query.tags, session.tag)) return false;
        if (query.date_range && !query.date_range->contains(session.created_at)) return false;
        if (!query.domains.empty() && !anyDomainMatches(query.domains, stored.domains)) return false;
        if (needle) {
            bool hit = containsIgnoreCase(session.tag, *needle) ||
                       (session.metadata.purpose && containsIgnoreCase(*session.metadata.purpose, *needle)) ||
                       (session.metadata.notes && containsIgnoreCase(*session.metadata.notes, *needle));
            if (!hit) return false;
        }
        return true;
    };
    return runQuery<StoredSession>(containers::SESSIONS, plan, options,
                                   [this](const json& d) { return serializer_.decodeSession(d); }, match);
}

storage::Result<std::vector<StoredTab>> StorageEngine::queryTabs(const TabQuery& query, const QueryOptions& options) {
    ScanPlan plan;
    plan.direction = directionFor(options);
    if (!config_.indexing_enabled) {
        plan.index.clear();
    } else if (query.date_range) {
        plan.index = "by_created_at";
        plan.range = KeyRange::bound(Key{int64_t{query.date_range->start}}, Key{int64_t{query.date_range->end}});
    } else if (query.session_ids.size() == 1) {
        plan.index = "by_session_id";
        plan.range = KeyRange::only(Key{query.session_ids.front()});
    } else if (query.window_ids.size() == 1) {
        plan.index = "by_window_id";
        plan.range = KeyRange::only(Key{int64_t{query.window_ids.front()}});
    } else {
        plan.index = "by_created_at";
    }

    auto match = [&query](const StoredTab& stored) {
        if (!query.session_ids.empty() && !containsValue(query.session_ids, stored.session_id)) return false;
        if (!query.window_ids.empty() && !containsValue(query.window_ids, stored.tab.window_id)) return false;
        if (!query.domains.empty() && !anyDomainMatches(query.domains, {stored.domain})) return false;
        if (query.date_range && !query.date_range->contains(stored.tab.created_at)) return false;
        return true;
    };
    return runQuery<StoredTab>(containers::TABS, plan, options,
                               [this](const json& d) { return serializer_.decodeTab(d); }, match);
}

storage::Result<std::vector<StoredNavigationEvent>> StorageEngine::queryNavigationEvents(
    const NavigationEventQuery& query, const QueryOptions& options) {
    ScanPlan plan;
    plan.direction = directionFor(options);
    if (!config_.indexing_enabled) {
        plan.index.clear();
    } else if (query.date_range) {
        plan.index = "by_timestamp";
        plan.range = KeyRange::bound(Key{int64_t{query.date_range->start}}, Key{int64_t{query.date_range->end}});
    } else if (query.session_ids.size() == 1) {
        plan.index = "by_session_id";
        plan.range = KeyRange::only(Key{query.session_ids.front()});
    } else if (query.tab_ids.size() == 1) {
        plan.index = "by_tab_id";
        plan.range = KeyRange::only(Key{int64_t{query.tab_ids.front()}});
    } else {
        plan.index = "by_timestamp";
    }

    auto match = [&query](const StoredNavigationEvent& stored) {
        if (!query.session_ids.empty() && !containsValue(query.session_ids, stored.session_id)) return false;
        if (!query.tab_ids.empty() && !containsValue(query.tab_ids, stored.event.tab_id)) return false;
        if (!query.domains.empty() && !anyDomainMatches(query.domains, {stored.domain})) return false;
        if (query.date_range && !query.date_range->contains(stored.event.timestamp)) return false;
        return true;
    };
    return runQuery<StoredNavigationEvent>(containers::NAVIGATION_EVENTS, plan, options,
                                           [this](const json& d) { return serializer_.decodeNavigationEvent(d); },
                                           match);
}

storage::Result<std::vector<StoredSessionBoundary>> StorageEngine::queryBoundaries(const BoundaryQuery& query,
                                                                                   const QueryOptions& options) {
    ScanPlan plan;
    plan.direction = directionFor(options);
    if (!config_.indexing_enabled) {
        plan.index.clear();
    } else if (query.date_range) {
        plan.index = "by_timestamp";
        plan.range = KeyRange::bound(Key{int64_t{query.date_range->start}}, Key{int64_t{query.date_range->end}});
    } else if (query.session_ids.size() == 1) {
        plan.index = "by_session_id";
        plan.range = KeyRange::only(Key{query.session_ids.front()});
    } else if (query.reasons.size() == 1) {
        plan.index = "by_reason";
        plan.range = KeyRange::only(Key{json(query.reasons.front()).get<std::string>()});
    } else {
        plan.index = "by_timestamp";
    }

    auto match = [&query](const StoredSessionBoundary& stored) {
        const SessionBoundary& boundary = stored.boundary;
        if (!query.session_ids.empty() && !containsValue(query.session_ids, boundary.session_id)) return false;
        if (!query.reasons.empty() && !containsValue(query.reasons, boundary.reason)) return false;
        if (query.date_range && !query.date_range->contains(boundary.timestamp)) return false;
        return true;
    };
    return runQuery<StoredSessionBoundary>(containers::SESSION_BOUNDARIES, plan, options,
                                           [this](const json& d) { return serializer_.decodeBoundary(d); }, match);
}

// ===================================================================
// Sessions
// ===================================================================

storage::Status StorageEngine::putSession(StoreTransaction& txn, StoredSession& stored) {
    return txn.put(containers::SESSIONS, serializer_.toDocument(stored));
}

storage::Result<StoredSession> StorageEngine::createSession(const Session& session) {
    RETURN_IF_ERROR(registry_.validateShape(containers::SESSIONS, json(session)));
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("createSession"));

    EncodedSession encoded = serializer_.encodeSession(session);
    auto txn = store->begin({containers::SESSIONS, containers::METADATA}, TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::SESSIONS, sessionKey(session.id)));
    RETURN_IF_ERROR(txn->put(containers::SESSIONS, encoded.document));
    if (!existing) {
        Counters delta;
        delta.sessions = 1;
        RETURN_IF_ERROR(adjustCounters(*txn, delta));
    }
    RETURN_IF_ERROR(txn->commit());
    LOG_INFO("[StorageEngine] Created session {} ({} tabs, {} bytes{})", session.id, session.tabs.size(),
             encoded.stored.size, encoded.stored.compressed ? ", compressed" : "");
    return encoded.stored;
}

storage::Result<std::optional<StoredSession>> StorageEngine::getSession(const std::string& session_id) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("getSession"));
    auto txn = store->begin({containers::SESSIONS}, TransactionMode::READ_ONLY);
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn->get(containers::SESSIONS, sessionKey(session_id)));
    if (!document) {
        return std::optional<StoredSession>{};
    }
    StoredSession stored;
    ASSIGN_OR_RETURN(stored, serializer_.decodeSession(*document));
    return std::optional<StoredSession>(std::move(stored));
}

storage::Result<StoredSession> StorageEngine::updateSession(const std::string& session_id, const SessionPatch& patch) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("updateSession"));
    auto txn = store->begin({containers::SESSIONS}, TransactionMode::READ_WRITE);
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn->get(containers::SESSIONS, sessionKey(session_id)));
    if (!document) {
        return StorageError::keyNotFound(containers::SESSIONS, session_id).withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    StoredSession previous;
    ASSIGN_OR_RETURN(previous, serializer_.decodeSession(*document));

    Session updated = previous.session;
    if (patch.tag) updated.tag = *patch.tag;
    if (patch.tabs) updated.tabs = *patch.tabs;
    if (patch.window_ids) updated.window_ids = *patch.window_ids;
    if (patch.metadata) updated.metadata = *patch.metadata;
    updated.updated_at = clock_();

    EncodedSession encoded = serializer_.reencodeSession(previous, updated);
    RETURN_IF_ERROR(txn->put(containers::SESSIONS, encoded.document));
    RETURN_IF_ERROR(txn->commit());
    LOG_INFO("[StorageEngine] Updated session {} (version {})", session_id, encoded.stored.version);
    return encoded.stored;
}

storage::Status StorageEngine::deleteSessionInTxn(StoreTransaction& txn, const std::string& session_id,
                                                  Counters& removed) {
    RETURN_IF_ERROR(txn.remove(containers::SESSIONS, sessionKey(session_id)));
    removed.sessions += 1;

    struct Dependent {
        const char* container;
        int64_t Counters::*counter;
    };
    const Dependent dependents[] = {
        {containers::TABS, &Counters::tabs},
        {containers::NAVIGATION_EVENTS, &Counters::navigation_events},
        {containers::SESSION_BOUNDARIES, &Counters::boundaries},
    };
    for (const auto& dependent : dependents) {
        std::vector<Key> keys;
        RETURN_IF_ERROR(txn.scan(dependent.container, "by_session_id", KeyRange::only(sessionKey(session_id)),
                                 ScanDirection::FORWARD, [&](const json& document) {
                                     if (auto key = documentKey(registry_, dependent.container, document)) {
                                         keys.push_back(std::move(*key));
                                     }
                                     return true;
                                 }));
        for (const auto& key : keys) {
            RETURN_IF_ERROR(txn.remove(dependent.container, key));
        }
        removed.*(dependent.counter) += static_cast<int64_t>(keys.size());
    }
    return {};
}

storage::Status StorageEngine::deleteSession(const std::string& session_id) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("deleteSession"));
    auto txn = store->begin(allContainers(), TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::SESSIONS, sessionKey(session_id)));
    if (!existing) {
        return StorageError::keyNotFound(containers::SESSIONS, session_id).withLocation(__FILE__, __LINE__, __FUNCTION__);
    }

    Counters removed;
    RETURN_IF_ERROR(deleteSessionInTxn(*txn, session_id, removed));
    Counters delta{-removed.sessions, -removed.tabs, -removed.navigation_events, -removed.boundaries};
    RETURN_IF_ERROR(adjustCounters(*txn, delta));
    RETURN_IF_ERROR(txn->commit());
    LOG_INFO("[StorageEngine] Deleted session {} with {} tabs, {} navigation events and {} boundaries", session_id,
             removed.tabs, removed.navigation_events, removed.boundaries);
    return {};
}

// ===================================================================
// Tabs
// ===================================================================

storage::Result<StoredTab> StorageEngine::createTab(const Tab& tab, const std::string& session_id) {
    StoredTab stored = serializer_.serializeTab(tab, session_id);
    json document = serializer_.toDocument(stored);
    RETURN_IF_ERROR(registry_.validateShape(containers::TABS, document));
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("createTab"));

    auto txn = store->begin({containers::TABS, containers::METADATA}, TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::TABS, tabKey(tab.id)));
    RETURN_IF_ERROR(txn->put(containers::TABS, document));
    if (!existing) {
        Counters delta;
        delta.tabs = 1;
        RETURN_IF_ERROR(adjustCounters(*txn, delta));
    }
    RETURN_IF_ERROR(txn->commit());
    LOG_TRACE("[StorageEngine] Created tab {} in session {}", tab.id, session_id);
    return stored;
}

storage::Result<std::optional<StoredTab>> StorageEngine::getTab(TabId tab_id) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("getTab"));
    auto txn = store->begin({containers::TABS}, TransactionMode::READ_ONLY);
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn->get(containers::TABS, tabKey(tab_id)));
    if (!document) {
        return std::optional<StoredTab>{};
    }
    StoredTab stored;
    ASSIGN_OR_RETURN(stored, serializer_.decodeTab(*document));
    return std::optional<StoredTab>(std::move(stored));
}

storage::Result<StoredTab> StorageEngine::updateTab(TabId tab_id, const TabPatch& patch) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("updateTab"));
    auto txn = store->begin({containers::TABS}, TransactionMode::READ_WRITE);
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn->get(containers::TABS, tabKey(tab_id)));
    if (!document) {
        return StorageError::keyNotFound(containers::TABS, std::to_string(tab_id))
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    StoredTab previous;
    ASSIGN_OR_RETURN(previous, serializer_.decodeTab(*document));

    Tab tab = previous.tab;
    if (patch.url) tab.url = *patch.url;
    if (patch.title) tab.title = *patch.title;
    if (patch.favicon) tab.favicon = *patch.favicon;
    if (patch.window_id) tab.window_id = *patch.window_id;
    if (patch.time_spent) tab.time_spent = *patch.time_spent;
    if (patch.scroll_position) tab.scroll_position = *patch.scroll_position;
    if (patch.form_data) tab.form_data = *patch.form_data;
    tab.last_accessed = clock_();

    StoredTab updated = serializer_.serializeTab(tab, previous.session_id);
    updated.is_active = patch.is_active.value_or(previous.is_active);
    updated.interaction_count = patch.interaction_count.value_or(previous.interaction_count);
    updated.focus_time = patch.focus_time.value_or(previous.focus_time);
    updated.navigation_count = previous.navigation_count;
    updated.first_navigation_at = previous.first_navigation_at;
    updated.last_navigation_at = previous.last_navigation_at;
    updated.version = previous.version + 1;

    RETURN_IF_ERROR(txn->put(containers::TABS, serializer_.toDocument(updated)));
    RETURN_IF_ERROR(txn->commit());
    return updated;
}

storage::Status StorageEngine::deleteTabEventsInTxn(StoreTransaction& txn, TabId tab_id, Counters& removed) {
    std::vector<Key> keys;
    RETURN_IF_ERROR(txn.scan(containers::NAVIGATION_EVENTS, "by_tab_id", KeyRange::only(tabKey(tab_id)),
                             ScanDirection::FORWARD, [&](const json& document) {
                                 if (auto key = documentKey(registry_, containers::NAVIGATION_EVENTS, document)) {
                                     keys.push_back(std::move(*key));
                                 }
                                 return true;
                             }));
    for (const auto& key : keys) {
        RETURN_IF_ERROR(txn.remove(containers::NAVIGATION_EVENTS, key));
    }
    removed.navigation_events += static_cast<int64_t>(keys.size());
    return {};
}

storage::Status StorageEngine::deleteTab(TabId tab_id) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("deleteTab"));
    auto txn = store->begin({containers::TABS, containers::NAVIGATION_EVENTS, containers::METADATA},
                            TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::TABS, tabKey(tab_id)));
    if (!existing) {
        return StorageError::keyNotFound(containers::TABS, std::to_string(tab_id))
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    Counters removed;
    RETURN_IF_ERROR(txn->remove(containers::TABS, tabKey(tab_id)));
    removed.tabs = 1;
    RETURN_IF_ERROR(deleteTabEventsInTxn(*txn, tab_id, removed));
    RETURN_IF_ERROR(adjustCounters(*txn, Counters{0, -removed.tabs, -removed.navigation_events, 0}));
    RETURN_IF_ERROR(txn->commit());
    LOG_TRACE("[StorageEngine] Deleted tab {} with {} navigation events", tab_id, removed.navigation_events);
    return {};
}

// ===================================================================
// Navigation events
// ===================================================================

storage::Result<StoredNavigationEvent> StorageEngine::createNavigationEvent(const NavigationEvent& event,
                                                                           const std::string& session_id) {
    StoredNavigationEvent stored = serializer_.serializeNavigationEvent(event, session_id);
    json document = serializer_.toDocument(stored);
    RETURN_IF_ERROR(registry_.validateShape(containers::NAVIGATION_EVENTS, document));
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("createNavigationEvent"));

    auto txn = store->begin({containers::NAVIGATION_EVENTS, containers::METADATA}, TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::NAVIGATION_EVENTS, eventKey(event.tab_id, event.timestamp)));
    RETURN_IF_ERROR(txn->put(containers::NAVIGATION_EVENTS, document));
    if (!existing) {
        Counters delta;
        delta.navigation_events = 1;
        RETURN_IF_ERROR(adjustCounters(*txn, delta));
    }
    RETURN_IF_ERROR(txn->commit());
    return stored;
}

storage::Result<std::vector<StoredNavigationEvent>> StorageEngine::createNavigationEvents(
    const std::vector<NavigationEvent>& events, const std::string& session_id) {
    std::vector<StoredNavigationEvent> created;
    if (events.empty()) {
        return created;
    }
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("createNavigationEvents"));

    const std::string batch_id = "batch_" + std::to_string(clock_()) + "_" + generateRandomHex(6);
    const size_t chunk_size = std::max<size_t>(1, config_.batch_size);
    for (size_t start = 0; start < events.size(); start += chunk_size) {
        const size_t end = std::min(events.size(), start + chunk_size);
        std::vector<StoredNavigationEvent> chunk;
        auto txn = store->begin({containers::NAVIGATION_EVENTS, containers::METADATA}, TransactionMode::READ_WRITE);
        Counters delta;
        for (size_t i = start; i < end; ++i) {
            const NavigationEvent& event = events[i];
            StoredNavigationEvent stored = serializer_.serializeNavigationEvent(event, session_id, batch_id);
            json document = serializer_.toDocument(stored);
            RETURN_IF_ERROR(registry_.validateShape(containers::NAVIGATION_EVENTS, document));
            std::optional<json> existing;
            ASSIGN_OR_RETURN(existing, txn->get(containers::NAVIGATION_EVENTS, eventKey(event.tab_id, event.timestamp)));
            RETURN_IF_ERROR(txn->put(containers::NAVIGATION_EVENTS, document));
            if (!existing) delta.navigation_events += 1;
            chunk.push_back(std::move(stored));
        }
        RETURN_IF_ERROR(adjustCounters(*txn, delta));
        RETURN_IF_ERROR(txn->commit());
        created.insert(created.end(), std::make_move_iterator(chunk.begin()), std::make_move_iterator(chunk.end()));
    }
    LOG_INFO("[StorageEngine] Stored {} navigation events for session {} (batch {})", created.size(), session_id,
             batch_id);
    return created;
}

storage::Result<std::optional<StoredNavigationEvent>> StorageEngine::getNavigationEvent(TabId tab_id,
                                                                                        Timestamp timestamp) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("getNavigationEvent"));
    auto txn = store->begin({containers::NAVIGATION_EVENTS}, TransactionMode::READ_ONLY);
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn->get(containers::NAVIGATION_EVENTS, eventKey(tab_id, timestamp)));
    if (!document) {
        return std::optional<StoredNavigationEvent>{};
    }
    StoredNavigationEvent stored;
    ASSIGN_OR_RETURN(stored, serializer_.decodeNavigationEvent(*document));
    return std::optional<StoredNavigationEvent>(std::move(stored));
}

storage::Result<StoredNavigationEvent> StorageEngine::updateNavigationEvent(TabId tab_id, Timestamp timestamp,
                                                                           const NavigationEventPatch& patch) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("updateNavigationEvent"));
    auto txn = store->begin({containers::NAVIGATION_EVENTS}, TransactionMode::READ_WRITE);
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn->get(containers::NAVIGATION_EVENTS, eventKey(tab_id, timestamp)));
    if (!document) {
        return StorageError::keyNotFound(containers::NAVIGATION_EVENTS, navigationEventEntityId(tab_id, timestamp))
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    StoredNavigationEvent previous;
    ASSIGN_OR_RETURN(previous, serializer_.decodeNavigationEvent(*document));

    NavigationEvent event = previous.event;
    if (patch.url) event.url = *patch.url;
    if (patch.referrer) event.referrer = *patch.referrer;
    if (patch.transition_type) event.transition_type = *patch.transition_type;

    StoredNavigationEvent updated = serializer_.serializeNavigationEvent(event, previous.session_id, previous.batch_id);
    updated.version = previous.version + 1;
    RETURN_IF_ERROR(txn->put(containers::NAVIGATION_EVENTS, serializer_.toDocument(updated)));
    RETURN_IF_ERROR(txn->commit());
    return updated;
}

storage::Status StorageEngine::deleteNavigationEvent(TabId tab_id, Timestamp timestamp) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("deleteNavigationEvent"));
    auto txn = store->begin({containers::NAVIGATION_EVENTS, containers::METADATA}, TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::NAVIGATION_EVENTS, eventKey(tab_id, timestamp)));
    if (!existing) {
        return StorageError::keyNotFound(containers::NAVIGATION_EVENTS, navigationEventEntityId(tab_id, timestamp))
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    RETURN_IF_ERROR(txn->remove(containers::NAVIGATION_EVENTS, eventKey(tab_id, timestamp)));
    RETURN_IF_ERROR(adjustCounters(*txn, Counters{0, 0, -1, 0}));
    return txn->commit();
}

// ===================================================================
// Boundaries
// ===================================================================

storage::Result<StoredSessionBoundary> StorageEngine::createBoundary(const SessionBoundary& boundary) {
    StoredSessionBoundary stored = serializer_.serializeBoundary(boundary);
    json document = serializer_.toDocument(stored);
    RETURN_IF_ERROR(registry_.validateShape(containers::SESSION_BOUNDARIES, document));
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("createBoundary"));

    auto txn = store->begin({containers::SESSION_BOUNDARIES, containers::METADATA}, TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::SESSION_BOUNDARIES, boundaryKey(boundary.id)));
    RETURN_IF_ERROR(txn->put(containers::SESSION_BOUNDARIES, document));
    if (!existing) {
        RETURN_IF_ERROR(adjustCounters(*txn, Counters{0, 0, 0, 1}));
    }
    RETURN_IF_ERROR(txn->commit());
    return stored;
}

storage::Result<std::optional<StoredSessionBoundary>> StorageEngine::getBoundary(const std::string& boundary_id) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("getBoundary"));
    auto txn = store->begin({containers::SESSION_BOUNDARIES}, TransactionMode::READ_ONLY);
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn->get(containers::SESSION_BOUNDARIES, boundaryKey(boundary_id)));
    if (!document) {
        return std::optional<StoredSessionBoundary>{};
    }
    StoredSessionBoundary stored;
    ASSIGN_OR_RETURN(stored, serializer_.decodeBoundary(*document));
    return std::optional<StoredSessionBoundary>(std::move(stored));
}

storage::Result<StoredSessionBoundary> StorageEngine::updateBoundary(const std::string& boundary_id,
                                                                     const BoundaryPatch& patch) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("updateBoundary"));
    auto txn = store->begin({containers::SESSION_BOUNDARIES}, TransactionMode::READ_WRITE);
    std::optional<json> document;
    ASSIGN_OR_RETURN(document, txn->get(containers::SESSION_BOUNDARIES, boundaryKey(boundary_id)));
    if (!document) {
        return StorageError::keyNotFound(containers::SESSION_BOUNDARIES, boundary_id)
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    StoredSessionBoundary previous;
    ASSIGN_OR_RETURN(previous, serializer_.decodeBoundary(*document));

    SessionBoundary boundary = previous.boundary;
    if (patch.type) boundary.type = *patch.type;
    if (patch.reason) boundary.reason = *patch.reason;
    if (patch.metadata) boundary.metadata = *patch.metadata;

    StoredSessionBoundary updated = serializer_.serializeBoundary(boundary);
    updated.version = previous.version + 1;
    RETURN_IF_ERROR(txn->put(containers::SESSION_BOUNDARIES, serializer_.toDocument(updated)));
    RETURN_IF_ERROR(txn->commit());
    return updated;
}

storage::Status StorageEngine::deleteBoundary(const std::string& boundary_id) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("deleteBoundary"));
    auto txn = store->begin({containers::SESSION_BOUNDARIES, containers::METADATA}, TransactionMode::READ_WRITE);
    std::optional<json> existing;
    ASSIGN_OR_RETURN(existing, txn->get(containers::SESSION_BOUNDARIES, boundaryKey(boundary_id)));
    if (!existing) {
        return StorageError::keyNotFound(containers::SESSION_BOUNDARIES, boundary_id)
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    RETURN_IF_ERROR(txn->remove(containers::SESSION_BOUNDARIES, boundaryKey(boundary_id)));
    RETURN_IF_ERROR(adjustCounters(*txn, Counters{0, 0, 0, -1}));
    return txn->commit();
}

// ===================================================================
// Metadata and maintenance
// ===================================================================

storage::Result<DatabaseMetadata> StorageEngine::getMetadata() {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("getMetadata"));
    auto txn = store->begin({containers::METADATA}, TransactionMode::READ_ONLY);
    return readMetadata(*txn);
}

storage::Result<StorageStats> StorageEngine::getStorageStats() {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("getStorageStats"));
    auto txn = store->begin({containers::SESSIONS, containers::METADATA}, TransactionMode::READ_ONLY);
    DatabaseMetadata meta;
    ASSIGN_OR_RETURN(meta, readMetadata(*txn));

    StorageStats stats;
    stats.sessions = meta.total_sessions;
    stats.tabs = meta.total_tabs;
    stats.navigation_events = meta.total_navigation_events;
    stats.boundaries = meta.total_boundaries;
    stats.storage_size = meta.storage_size;
    stats.integrity_status = meta.integrity_check.is_valid;

    auto firstCreatedAt = [&](ScanDirection direction, Timestamp& out) -> storage::Status {
        std::optional<json> document;
        ASSIGN_OR_RETURN(document, txn->first(containers::SESSIONS, "by_created_at", direction));
        if (document) out = document->value("createdAt", Timestamp{0});
        return {};
    };
    RETURN_IF_ERROR(firstCreatedAt(ScanDirection::FORWARD, stats.oldest_record));
    RETURN_IF_ERROR(firstCreatedAt(ScanDirection::BACKWARD, stats.newest_record));
    return stats;
}

storage::Result<size_t> StorageEngine::cleanupOldData() {
    const Timestamp cutoff = clock_() - config_.max_session_age_ms;
    SessionQuery query;
    query.date_range = DateRange{std::numeric_limits<Timestamp>::min(), cutoff};
    QueryOptions options;
    options.limit = kCleanupBatchLimit;
    options.order = SortOrder::ASCENDING;

    std::vector<StoredSession> stale;
    ASSIGN_OR_RETURN(stale, querySessions(query, options));
    size_t deleted = 0;
    for (const auto& stored : stale) {
        auto status = deleteSession(stored.session.id);
        if (status.isOk()) {
            ++deleted;
        } else {
            LOG_WARN("[StorageEngine] Could not remove stale session {}: {}", stored.session.id,
                     status.error().toString());
        }
    }
    if (deleted > 0) {
        LOG_INFO("[StorageEngine] Cleaned up {} sessions older than {}", deleted, cutoff);
    }
    return deleted;
}

storage::Status StorageEngine::updateStorageStats() {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("updateStorageStats"));
    auto txn = store->begin(allContainers(), TransactionMode::READ_WRITE);

    size_t sessions = 0, tabs = 0, events = 0, boundaries = 0;
    ASSIGN_OR_RETURN(sessions, txn->count(containers::SESSIONS));
    ASSIGN_OR_RETURN(tabs, txn->count(containers::TABS));
    ASSIGN_OR_RETURN(events, txn->count(containers::NAVIGATION_EVENTS));
    ASSIGN_OR_RETURN(boundaries, txn->count(containers::SESSION_BOUNDARIES));

    DatabaseMetadata meta;
    ASSIGN_OR_RETURN(meta, readMetadata(*txn));
    meta.total_sessions = static_cast<int64_t>(sessions);
    meta.total_tabs = static_cast<int64_t>(tabs);
    meta.total_navigation_events = static_cast<int64_t>(events);
    meta.total_boundaries = static_cast<int64_t>(boundaries);
    meta.storage_size = store->approximateSize();
    meta.last_modified = clock_();
    RETURN_IF_ERROR(txn->put(containers::METADATA, json(meta)));
    RETURN_IF_ERROR(txn->commit());

    if (meta.storage_size > config_.max_storage_size) {
        LOG_WARN("[StorageEngine] Storage size {} exceeds the configured maximum of {} bytes", meta.storage_size,
                 config_.max_storage_size);
    }
    return {};
}

storage::Result<ValidationResult> StorageEngine::runIntegrityCheck() {
    if (!config_.enable_integrity_checks) {
        return ValidationResult{};
    }
    RecordCollections collections;
    ASSIGN_OR_RETURN(collections, exportCollections());
    ValidationResult result =
        validator_.validateRelationships(collections.sessions, collections.tabs, collections.navigation_events);

    IntegrityCheckRecord check;
    check.last_check = clock_();
    check.is_valid = result.is_valid;
    for (const auto& error : result.errors) {
        check.errors.push_back(error.message);
    }

    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("runIntegrityCheck"));
    auto txn = store->begin({containers::METADATA}, TransactionMode::READ_WRITE);
    DatabaseMetadata meta;
    ASSIGN_OR_RETURN(meta, readMetadata(*txn));
    meta.integrity_check = check;
    meta.last_modified = check.last_check;
    RETURN_IF_ERROR(txn->put(containers::METADATA, json(meta)));
    RETURN_IF_ERROR(txn->commit());

    if (!result.is_valid) {
        LOG_WARN("[StorageEngine] Integrity check found {} issues", result.errors.size());
    }
    return result;
}

storage::Status StorageEngine::recordBackupTime(Timestamp when) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("recordBackupTime"));
    auto txn = store->begin({containers::METADATA}, TransactionMode::READ_WRITE);
    DatabaseMetadata meta;
    ASSIGN_OR_RETURN(meta, readMetadata(*txn));
    meta.last_backup = when;
    RETURN_IF_ERROR(txn->put(containers::METADATA, json(meta)));
    return txn->commit();
}

// ===================================================================
// Administration
// ===================================================================

storage::Status StorageEngine::clearAllData() {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("clearAllData"));
    auto txn = store->begin(allContainers(), TransactionMode::READ_WRITE);
    for (const auto& name : allContainers()) {
        RETURN_IF_ERROR(txn->clear(name));
    }
    DatabaseMetadata meta;
    meta.version = metadata_version_;
    meta.created_at = clock_();
    meta.last_modified = meta.created_at;
    RETURN_IF_ERROR(txn->put(containers::METADATA, json(meta)));
    RETURN_IF_ERROR(txn->commit());
    LOG_INFO("[StorageEngine] All data cleared");
    return {};
}

storage::Result<RecordCollections> StorageEngine::exportCollections() {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("exportCollections"));
    return readCollections(*store, serializer_);
}

storage::Result<IngestResult> StorageEngine::ingestCollections(const RecordCollections& collections, bool overwrite) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("ingestCollections"));
    IngestResult result;
    const size_t chunk_size = std::max<size_t>(1, config_.batch_size);

    auto ingest = [&](const char* container, const auto& records, auto to_document,
                      int64_t Counters::*counter) -> storage::Status {
        for (size_t start = 0; start < records.size(); start += chunk_size) {
            const size_t end = std::min(records.size(), start + chunk_size);
            auto txn = store->begin({container, containers::METADATA}, TransactionMode::READ_WRITE);
            Counters delta;
            for (size_t i = start; i < end; ++i) {
                json document = to_document(records[i]);
                auto shape = registry_.validateShape(container, document);
                if (!shape.isOk()) {
                    ++result.skipped;
                    result.errors.push_back(shape.error().message);
                    continue;
                }
                auto key = documentKey(registry_, container, document);
                if (!key) {
                    ++result.skipped;
                    result.errors.push_back(std::string("Unusable primary key in ") + container);
                    continue;
                }
                std::optional<json> existing;
                ASSIGN_OR_RETURN(existing, txn->get(container, *key));
                if (existing && !overwrite) {
                    ++result.skipped;
                    continue;
                }
                RETURN_IF_ERROR(txn->put(container, document));
                ++result.written;
                if (!existing) delta.*counter += 1;
            }
            RETURN_IF_ERROR(adjustCounters(*txn, delta));
            RETURN_IF_ERROR(txn->commit());
        }
        return {};
    };

    RETURN_IF_ERROR(ingest(containers::SESSIONS, collections.sessions, [this](const StoredSession& stored) {
        StoredSession copy = stored;
        return serializer_.toDocument(copy);
    }, &Counters::sessions));
    RETURN_IF_ERROR(ingest(containers::TABS, collections.tabs,
                           [this](const StoredTab& stored) { return serializer_.toDocument(stored); }, &Counters::tabs));
    RETURN_IF_ERROR(ingest(containers::NAVIGATION_EVENTS, collections.navigation_events,
                           [this](const StoredNavigationEvent& stored) { return serializer_.toDocument(stored); },
                           &Counters::navigation_events));
    RETURN_IF_ERROR(ingest(containers::SESSION_BOUNDARIES, collections.boundaries,
                           [this](const StoredSessionBoundary& stored) { return serializer_.toDocument(stored); },
                           &Counters::boundaries));

    LOG_INFO("[StorageEngine] Ingested {} records ({} skipped)", result.written, result.skipped);
    return result;
}

storage::Result<IngestResult> StorageEngine::replaceAllData(const RecordCollections& collections) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("replaceAllData"));

    // Every document is built and checked before the store is touched
    std::vector<std::pair<const char*, json>> documents;
    std::set<std::pair<std::string, std::string>> keys;
    Counters totals;
    auto stage = [&](const char* container, json document, int64_t Counters::*counter) -> storage::Status {
        RETURN_IF_ERROR(registry_.validateShape(container, document));
        auto key = documentKey(registry_, container, document);
        if (!key) {
            return TABVAULT_ERROR(ErrorCode::INVALID_KEY, std::string("Unusable primary key in ") + container);
        }
        if (keys.emplace(container, encodeKey(*key)).second) totals.*counter += 1;
        documents.emplace_back(container, std::move(document));
        return {};
    };
    for (const auto& stored : collections.sessions) {
        StoredSession copy = stored;
        RETURN_IF_ERROR(stage(containers::SESSIONS, serializer_.toDocument(copy), &Counters::sessions));
    }
    for (const auto& stored : collections.tabs) {
        RETURN_IF_ERROR(stage(containers::TABS, serializer_.toDocument(stored), &Counters::tabs));
    }
    for (const auto& stored : collections.navigation_events) {
        RETURN_IF_ERROR(stage(containers::NAVIGATION_EVENTS, serializer_.toDocument(stored),
                              &Counters::navigation_events));
    }
    for (const auto& stored : collections.boundaries) {
        RETURN_IF_ERROR(stage(containers::SESSION_BOUNDARIES, serializer_.toDocument(stored), &Counters::boundaries));
    }

    auto txn = store->begin(allContainers(), TransactionMode::READ_WRITE);
    DatabaseMetadata previous;
    ASSIGN_OR_RETURN(previous, readMetadata(*txn));
    for (const auto& name : recordContainers()) {
        RETURN_IF_ERROR(txn->clear(name));
    }
    for (const auto& [container, document] : documents) {
        RETURN_IF_ERROR(txn->put(container, document));
    }
    DatabaseMetadata meta = previous;
    meta.version = metadata_version_;
    meta.last_modified = clock_();
    meta.total_sessions = totals.sessions;
    meta.total_tabs = totals.tabs;
    meta.total_navigation_events = totals.navigation_events;
    meta.total_boundaries = totals.boundaries;
    RETURN_IF_ERROR(txn->put(containers::METADATA, json(meta)));
    RETURN_IF_ERROR(txn->commit());

    IngestResult result;
    result.written = documents.size();
    LOG_INFO("[StorageEngine] Replaced all data with {} records", result.written);
    return result;
}

// ===================================================================
// RecordCorrector
// ===================================================================

storage::Status StorageEngine::recomputeChecksum(EntityType entity_type, const std::string& entity_id) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("recomputeChecksum"));

    switch (entity_type) {
        case EntityType::SESSION: {
            auto txn = store->begin({containers::SESSIONS}, TransactionMode::READ_WRITE);
            std::optional<json> document;
            ASSIGN_OR_RETURN(document, txn->get(containers::SESSIONS, sessionKey(entity_id)));
            if (!document) return StorageError::keyNotFound(containers::SESSIONS, entity_id);
            StoredSession stored;
            ASSIGN_OR_RETURN(stored, serializer_.decodeSession(*document));
            serializer_.restampChecksum(stored);
            RETURN_IF_ERROR(putSession(*txn, stored));
            return txn->commit();
        }
        case EntityType::TAB: {
            TabId tab_id = 0;
            if (!parseTabId(entity_id, tab_id)) {
                return TABVAULT_ERROR(ErrorCode::INVALID_KEY, "Malformed tab id: " + entity_id);
            }
            auto txn = store->begin({containers::TABS}, TransactionMode::READ_WRITE);
            std::optional<json> document;
            ASSIGN_OR_RETURN(document, txn->get(containers::TABS, tabKey(tab_id)));
            if (!document) return StorageError::keyNotFound(containers::TABS, entity_id);
            StoredTab stored;
            ASSIGN_OR_RETURN(stored, serializer_.decodeTab(*document));
            serializer_.restampChecksum(stored);
            RETURN_IF_ERROR(txn->put(containers::TABS, serializer_.toDocument(stored)));
            return txn->commit();
        }
        case EntityType::NAVIGATION_EVENT: {
            TabId tab_id = 0;
            Timestamp timestamp = 0;
            if (!parseNavigationEventEntityId(entity_id, tab_id, timestamp)) {
                return TABVAULT_ERROR(ErrorCode::INVALID_KEY, "Malformed navigation event id: " + entity_id);
            }
            auto txn = store->begin({containers::NAVIGATION_EVENTS}, TransactionMode::READ_WRITE);
            std::optional<json> document;
            ASSIGN_OR_RETURN(document, txn->get(containers::NAVIGATION_EVENTS, eventKey(tab_id, timestamp)));
            if (!document) return StorageError::keyNotFound(containers::NAVIGATION_EVENTS, entity_id);
            StoredNavigationEvent stored;
            ASSIGN_OR_RETURN(stored, serializer_.decodeNavigationEvent(*document));
            serializer_.restampChecksum(stored);
            RETURN_IF_ERROR(txn->put(containers::NAVIGATION_EVENTS, serializer_.toDocument(stored)));
            return txn->commit();
        }
        case EntityType::BOUNDARY: {
            auto txn = store->begin({containers::SESSION_BOUNDARIES}, TransactionMode::READ_WRITE);
            std::optional<json> document;
            ASSIGN_OR_RETURN(document, txn->get(containers::SESSION_BOUNDARIES, boundaryKey(entity_id)));
            if (!document) return StorageError::keyNotFound(containers::SESSION_BOUNDARIES, entity_id);
            StoredSessionBoundary stored;
            ASSIGN_OR_RETURN(stored, serializer_.decodeBoundary(*document));
            serializer_.restampChecksum(stored);
            RETURN_IF_ERROR(txn->put(containers::SESSION_BOUNDARIES, serializer_.toDocument(stored)));
            return txn->commit();
        }
    }
    return TABVAULT_ERROR(ErrorCode::INVALID_VALUE,
                          "Unknown entity type " + std::to_string(magic_enum::enum_integer(entity_type)));
}

storage::Status StorageEngine::reassignNavigationEvent(const std::string& entity_id) {
    TabId tab_id = 0;
    Timestamp timestamp = 0;
    if (!parseNavigationEventEntityId(entity_id, tab_id, timestamp)) {
        return TABVAULT_ERROR(ErrorCode::INVALID_KEY, "Malformed navigation event id: " + entity_id);
    }
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("reassignNavigationEvent"));
    auto txn = store->begin({containers::NAVIGATION_EVENTS, containers::TABS, containers::SESSIONS},
                            TransactionMode::READ_WRITE);

    std::optional<json> event_document;
    ASSIGN_OR_RETURN(event_document, txn->get(containers::NAVIGATION_EVENTS, eventKey(tab_id, timestamp)));
    if (!event_document) return StorageError::keyNotFound(containers::NAVIGATION_EVENTS, entity_id);
    std::optional<json> tab_document;
    ASSIGN_OR_RETURN(tab_document, txn->get(containers::TABS, tabKey(tab_id)));
    if (!tab_document) {
        return TABVAULT_ERROR(ErrorCode::KEY_NOT_FOUND, "No tab to take the owning session from")
            .withContext("event", entity_id);
    }

    StoredTab tab;
    ASSIGN_OR_RETURN(tab, serializer_.decodeTab(*tab_document));
    std::optional<json> session_document;
    ASSIGN_OR_RETURN(session_document, txn->get(containers::SESSIONS, sessionKey(tab.session_id)));
    if (!session_document) {
        return TABVAULT_ERROR(ErrorCode::KEY_NOT_FOUND, "Owning tab references a missing session")
            .withContext("event", entity_id)
            .withContext("session", tab.session_id);
    }

    StoredNavigationEvent stored;
    ASSIGN_OR_RETURN(stored, serializer_.decodeNavigationEvent(*event_document));
    stored.session_id = tab.session_id;
    stored.version += 1;
    RETURN_IF_ERROR(txn->put(containers::NAVIGATION_EVENTS, serializer_.toDocument(stored)));
    RETURN_IF_ERROR(txn->commit());
    LOG_INFO("[StorageEngine] Reassigned navigation event {} to session {}", entity_id, tab.session_id);
    return {};
}

storage::Status StorageEngine::repairSchemaViolation(const ValidationError& error) {
    std::shared_ptr<RecordStore> store;
    ASSIGN_OR_RETURN(store, requireStore("repairSchemaViolation"));
    const Timestamp now = clock_();

    switch (error.entity_type) {
        case EntityType::SESSION: {
            auto txn = store->begin({containers::SESSIONS}, TransactionMode::READ_WRITE);
            std::optional<json> document;
            ASSIGN_OR_RETURN(document, txn->get(containers::SESSIONS, sessionKey(error.entity_id)));
            if (!document) return StorageError::keyNotFound(containers::SESSIONS, error.entity_id);
            StoredSession stored;
            ASSIGN_OR_RETURN(stored, serializer_.decodeSession(*document));
            Session& session = stored.session;
            if (session.created_at <= 0) {
                session.created_at = session.updated_at > 0 ? session.updated_at : now;
            }
            for (const auto& tab : session.tabs) {
                if (!containsValue(session.window_ids, tab.window_id)) {
                    session.window_ids.push_back(tab.window_id);
                }
            }
            serializer_.restampChecksum(stored);
            RETURN_IF_ERROR(putSession(*txn, stored));
            return txn->commit();
        }
        case EntityType::TAB: {
            TabId tab_id = 0;
            if (!parseTabId(error.entity_id, tab_id)) {
                return TABVAULT_ERROR(ErrorCode::INVALID_KEY, "Malformed tab id: " + error.entity_id);
            }
            auto txn = store->begin({containers::TABS}, TransactionMode::READ_WRITE);
            std::optional<json> document;
            ASSIGN_OR_RETURN(document, txn->get(containers::TABS, tabKey(tab_id)));
            if (!document) return StorageError::keyNotFound(containers::TABS, error.entity_id);
            StoredTab stored;
            ASSIGN_OR_RETURN(stored, serializer_.decodeTab(*document));
            if (stored.tab.created_at <= 0) {
                stored.tab.created_at = stored.tab.last_accessed > 0 ? stored.tab.last_accessed : now;
            }
            serializer_.restampChecksum(stored);
            RETURN_IF_ERROR(txn->put(containers::TABS, serializer_.toDocument(stored)));
            return txn->commit();
        }
        case EntityType::NAVIGATION_EVENT:
            return reassignNavigationEvent(error.entity_id);
        case EntityType::BOUNDARY:
            break;
    }
    return TABVAULT_ERROR(ErrorCode::NOT_IMPLEMENTED, "No repair for this schema violation")
        .withContext("entityType", std::string(magic_enum::enum_name(error.entity_type)))
        .withContext("entity", error.entity_id);
}

} // namespace tabvault
