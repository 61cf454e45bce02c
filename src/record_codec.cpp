#include "tabvault/record_codec.h"

namespace tabvault {

namespace {

template<typename T>
void readOptional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->template get<T>();
    } else {
        out.reset();
    }
}

template<typename T>
void writeOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template<typename T>
T readOr(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->template get<T>();
}

} // namespace

// --- Tab ---

void to_json(json& j, const Tab& tab) {
    j = json{
        {"id", tab.id},
        {"url", tab.url},
        {"title", tab.title},
        {"windowId", tab.window_id},
        {"createdAt", tab.created_at},
        {"lastAccessed", tab.last_accessed},
        {"timeSpent", tab.time_spent},
        {"scrollPosition", tab.scroll_position},
    };
    writeOptional(j, "favicon", tab.favicon);
    writeOptional(j, "formData", tab.form_data);
}

void from_json(const json& j, Tab& tab) {
    tab.id = readOr<TabId>(j, "id", 0);
    tab.url = readOr<std::string>(j, "url", "");
    tab.title = readOr<std::string>(j, "title", "");
    tab.window_id = readOr<WindowId>(j, "windowId", 0);
    tab.created_at = readOr<Timestamp>(j, "createdAt", 0);
    tab.last_accessed = readOr<Timestamp>(j, "lastAccessed", 0);
    tab.time_spent = readOr<int64_t>(j, "timeSpent", 0);
    tab.scroll_position = readOr<int64_t>(j, "scrollPosition", 0);
    readOptional(j, "favicon", tab.favicon);
    readOptional(j, "formData", tab.form_data);
}

// --- Session ---

void to_json(json& j, const SessionMetadata& meta) {
    j = json{
        {"isPrivate", meta.is_private},
        {"totalTime", meta.total_time},
        {"pageCount", meta.page_count},
        {"domain", meta.domain},
    };
    writeOptional(j, "purpose", meta.purpose);
    writeOptional(j, "notes", meta.notes);
}

void from_json(const json& j, SessionMetadata& meta) {
    meta.is_private = readOr<bool>(j, "isPrivate", false);
    meta.total_time = readOr<int64_t>(j, "totalTime", 0);
    meta.page_count = readOr<int64_t>(j, "pageCount", 0);
    meta.domain = readOr<std::vector<std::string>>(j, "domain", {});
    readOptional(j, "purpose", meta.purpose);
    readOptional(j, "notes", meta.notes);
}

void to_json(json& j, const Session& session) {
    j = json{
        {"id", session.id},
        {"tag", session.tag},
        {"createdAt", session.created_at},
        {"updatedAt", session.updated_at},
        {"tabs", session.tabs},
        {"windowIds", session.window_ids},
        {"metadata", session.metadata},
    };
}

void from_json(const json& j, Session& session) {
    session.id = readOr<std::string>(j, "id", "");
    session.tag = readOr<std::string>(j, "tag", "");
    session.created_at = readOr<Timestamp>(j, "createdAt", 0);
    session.updated_at = readOr<Timestamp>(j, "updatedAt", 0);
    session.tabs = readOr<std::vector<Tab>>(j, "tabs", {});
    session.window_ids = readOr<std::vector<WindowId>>(j, "windowIds", {});
    session.metadata = readOr<SessionMetadata>(j, "metadata", SessionMetadata{});
}

// --- NavigationEvent ---

void to_json(json& j, const NavigationEvent& event) {
    j = json{
        {"tabId", event.tab_id},
        {"url", event.url},
        {"timestamp", event.timestamp},
        {"transitionType", event.transition_type},
    };
    writeOptional(j, "referrer", event.referrer);
}

void from_json(const json& j, NavigationEvent& event) {
    event.tab_id = readOr<TabId>(j, "tabId", 0);
    event.url = readOr<std::string>(j, "url", "");
    event.timestamp = readOr<Timestamp>(j, "timestamp", 0);
    event.transition_type = readOr<TransitionType>(j, "transitionType", TransitionType::LINK);
    readOptional(j, "referrer", event.referrer);
}

// --- SessionBoundary ---

void to_json(json& j, const BoundaryMetadata& meta) {
    j = json::object();
    writeOptional(j, "idleDuration", meta.idle_duration);
    writeOptional(j, "navigationGap", meta.navigation_gap);
    writeOptional(j, "domainFrom", meta.domain_from);
    writeOptional(j, "domainTo", meta.domain_to);
    writeOptional(j, "tabsInvolved", meta.tabs_involved);
    writeOptional(j, "windowsInvolved", meta.windows_involved);
}

void from_json(const json& j, BoundaryMetadata& meta) {
    readOptional(j, "idleDuration", meta.idle_duration);
    readOptional(j, "navigationGap", meta.navigation_gap);
    readOptional(j, "domainFrom", meta.domain_from);
    readOptional(j, "domainTo", meta.domain_to);
    readOptional(j, "tabsInvolved", meta.tabs_involved);
    readOptional(j, "windowsInvolved", meta.windows_involved);
}

void to_json(json& j, const SessionBoundary& boundary) {
    j = json{
        {"id", boundary.id},
        {"type", boundary.type},
        {"reason", boundary.reason},
        {"timestamp", boundary.timestamp},
        {"sessionId", boundary.session_id},
        {"metadata", boundary.metadata},
    };
}

void from_json(const json& j, SessionBoundary& boundary) {
    boundary.id = readOr<std::string>(j, "id", "");
    boundary.type = readOr<BoundaryType>(j, "type", BoundaryType::START);
    boundary.reason = readOr<BoundaryReason>(j, "reason", BoundaryReason::USER_INITIATED);
    boundary.timestamp = readOr<Timestamp>(j, "timestamp", 0);
    boundary.session_id = readOr<std::string>(j, "sessionId", "");
    boundary.metadata = readOr<BoundaryMetadata>(j, "metadata", BoundaryMetadata{});
}

// --- Stored records: the domain fields are flattened next to the envelope ---

void to_json(json& j, const StoredSession& stored) {
    j = stored.session;
    j["version"] = stored.version;
    j["lastModified"] = stored.last_modified;
    j["size"] = stored.size;
    j["compressed"] = stored.compressed;
    j["domains"] = stored.domains;
    j["totalTabCount"] = stored.total_tab_count;
    j["totalNavigationEvents"] = stored.total_navigation_events;
    j["checksum"] = stored.checksum;
    j["isValid"] = stored.is_valid;
}

void from_json(const json& j, StoredSession& stored) {
    stored.session = j.get<Session>();
    stored.version = readOr<int>(j, "version", kInitialRecordVersion);
    stored.last_modified = readOr<Timestamp>(j, "lastModified", 0);
    stored.size = readOr<int64_t>(j, "size", 0);
    stored.compressed = readOr<bool>(j, "compressed", false);
    stored.domains = readOr<std::vector<std::string>>(j, "domains", {});
    stored.total_tab_count = readOr<int64_t>(j, "totalTabCount", 0);
    stored.total_navigation_events = readOr<int64_t>(j, "totalNavigationEvents", 0);
    stored.checksum = readOr<std::string>(j, "checksum", "");
    stored.is_valid = readOr<bool>(j, "isValid", true);
}

void to_json(json& j, const StoredTab& stored) {
    j = stored.tab;
    j["sessionId"] = stored.session_id;
    j["domain"] = stored.domain;
    j["isActive"] = stored.is_active;
    j["interactionCount"] = stored.interaction_count;
    j["focusTime"] = stored.focus_time;
    j["version"] = stored.version;
    j["lastModified"] = stored.last_modified;
    j["navigationCount"] = stored.navigation_count;
    writeOptional(j, "firstNavigationAt", stored.first_navigation_at);
    writeOptional(j, "lastNavigationAt", stored.last_navigation_at);
    j["checksum"] = stored.checksum;
}

void from_json(const json& j, StoredTab& stored) {
    stored.tab = j.get<Tab>();
    stored.session_id = readOr<std::string>(j, "sessionId", "");
    stored.domain = readOr<std::string>(j, "domain", "");
    stored.is_active = readOr<bool>(j, "isActive", false);
    stored.interaction_count = readOr<int64_t>(j, "interactionCount", 0);
    stored.focus_time = readOr<int64_t>(j, "focusTime", 0);
    stored.version = readOr<int>(j, "version", kInitialRecordVersion);
    stored.last_modified = readOr<Timestamp>(j, "lastModified", 0);
    stored.navigation_count = readOr<int64_t>(j, "navigationCount", 0);
    readOptional(j, "firstNavigationAt", stored.first_navigation_at);
    readOptional(j, "lastNavigationAt", stored.last_navigation_at);
    stored.checksum = readOr<std::string>(j, "checksum", "");
}

void to_json(json& j, const StoredNavigationEvent& stored) {
    j = stored.event;
    j["sessionId"] = stored.session_id;
    j["domain"] = stored.domain;
    j["version"] = stored.version;
    writeOptional(j, "batchId", stored.batch_id);
    j["checksum"] = stored.checksum;
}

void from_json(const json& j, StoredNavigationEvent& stored) {
    stored.event = j.get<NavigationEvent>();
    stored.session_id = readOr<std::string>(j, "sessionId", "");
    stored.domain = readOr<std::string>(j, "domain", "");
    stored.version = readOr<int>(j, "version", kInitialRecordVersion);
    readOptional(j, "batchId", stored.batch_id);
    stored.checksum = readOr<std::string>(j, "checksum", "");
}

void to_json(json& j, const StoredSessionBoundary& stored) {
    j = stored.boundary;
    j["tabCount"] = stored.tab_count;
    j["windowCount"] = stored.window_count;
    j["version"] = stored.version;
    j["checksum"] = stored.checksum;
}

void from_json(const json& j, StoredSessionBoundary& stored) {
    stored.boundary = j.get<SessionBoundary>();
    stored.tab_count = readOr<int64_t>(j, "tabCount", 0);
    stored.window_count = readOr<int64_t>(j, "windowCount", 0);
    stored.version = readOr<int>(j, "version", kInitialRecordVersion);
    stored.checksum = readOr<std::string>(j, "checksum", "");
}

void to_json(json& j, const IntegrityCheckRecord& check) {
    j = json{{"lastCheck", check.last_check}, {"isValid", check.is_valid}, {"errors", check.errors}};
}

void from_json(const json& j, IntegrityCheckRecord& check) {
    check.last_check = readOr<Timestamp>(j, "lastCheck", 0);
    check.is_valid = readOr<bool>(j, "isValid", true);
    check.errors = readOr<std::vector<std::string>>(j, "errors", {});
}

void to_json(json& j, const DatabaseMetadata& meta) {
    j = json{
        {"version", meta.version},
        {"createdAt", meta.created_at},
        {"lastModified", meta.last_modified},
        {"totalSessions", meta.total_sessions},
        {"totalTabs", meta.total_tabs},
        {"totalNavigationEvents", meta.total_navigation_events},
        {"totalBoundaries", meta.total_boundaries},
        {"storageSize", meta.storage_size},
        {"integrityCheck", meta.integrity_check},
    };
    writeOptional(j, "lastBackup", meta.last_backup);
}

void from_json(const json& j, DatabaseMetadata& meta) {
    meta.version = readOr<int>(j, "version", 0);
    meta.created_at = readOr<Timestamp>(j, "createdAt", 0);
    meta.last_modified = readOr<Timestamp>(j, "lastModified", 0);
    meta.total_sessions = readOr<int64_t>(j, "totalSessions", 0);
    meta.total_tabs = readOr<int64_t>(j, "totalTabs", 0);
    meta.total_navigation_events = readOr<int64_t>(j, "totalNavigationEvents", 0);
    meta.total_boundaries = readOr<int64_t>(j, "totalBoundaries", 0);
    meta.storage_size = readOr<int64_t>(j, "storageSize", 0);
    meta.integrity_check = readOr<IntegrityCheckRecord>(j, "integrityCheck", IntegrityCheckRecord{});
    readOptional(j, "lastBackup", meta.last_backup);
}

void to_json(json& j, const RecordCollections& collections) {
    j = json{
        {"sessions", collections.sessions},
        {"tabs", collections.tabs},
        {"navigationEvents", collections.navigation_events},
        {"boundaries", collections.boundaries},
    };
}

void from_json(const json& j, RecordCollections& collections) {
    collections.sessions = readOr<std::vector<StoredSession>>(j, "sessions", {});
    collections.tabs = readOr<std::vector<StoredTab>>(j, "tabs", {});
    collections.navigation_events = readOr<std::vector<StoredNavigationEvent>>(j, "navigationEvents", {});
    collections.boundaries = readOr<std::vector<StoredSessionBoundary>>(j, "boundaries", {});
}

void to_json(json& j, const StorageStats& stats) {
    j = json{
        {"sessions", stats.sessions},
        {"tabs", stats.tabs},
        {"navigationEvents", stats.navigation_events},
        {"boundaries", stats.boundaries},
        {"storageSize", stats.storage_size},
        {"oldestRecord", stats.oldest_record},
        {"newestRecord", stats.newest_record},
        {"integrityStatus", stats.integrity_status},
    };
}

// --- Semantic projections ---

json semanticFields(const Session& session) {
    return json{
        {"id", session.id},
        {"tag", session.tag},
        {"createdAt", session.created_at},
        {"tabs", session.tabs},
        {"windowIds", session.window_ids},
        {"metadata", session.metadata},
    };
}

json semanticFields(const Tab& tab) {
    return json(tab);
}

json semanticFields(const NavigationEvent& event) {
    return json(event);
}

json semanticFields(const SessionBoundary& boundary) {
    return json(boundary);
}

} // namespace tabvault
