// @include/tabvault/types.h
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <functional>

namespace tabvault {

using Timestamp = int64_t;   // Milliseconds since the Unix epoch
using TabId = int64_t;
using WindowId = int64_t;

// Injected time source so maintenance windows and staleness checks are testable.
using ClockFn = std::function<Timestamp()>;
Timestamp systemNowMs();

enum class TransitionType {
    LINK,
    TYPED,
    BOOKMARK,
    AUTO_BOOKMARK,
    AUTO_SUBFRAME,
    MANUAL_SUBFRAME,
    GENERATED,
    START_PAGE,
    FORM_SUBMIT,
    RELOAD,
    KEYWORD,
    KEYWORD_GENERATED
};

enum class BoundaryType { START, END };

enum class BoundaryReason {
    USER_INITIATED,
    IDLE_TIMEOUT,
    NAVIGATION_GAP,
    DOMAIN_CHANGE,
    WINDOW_CLOSED
};

// --- Domain records (inbound from collaborators) ---

struct Tab {
    TabId id = 0;
    std::string url;
    std::string title;
    std::optional<std::string> favicon;
    WindowId window_id = 0;
    Timestamp created_at = 0;
    Timestamp last_accessed = 0;
    int64_t time_spent = 0;
    int64_t scroll_position = 0;
    std::optional<std::map<std::string, std::string>> form_data;
};

struct SessionMetadata {
    std::optional<std::string> purpose;
    std::optional<std::string> notes;
    bool is_private = false;
    int64_t total_time = 0;
    int64_t page_count = 0;
    std::vector<std::string> domain;
};

struct Session {
    std::string id;
    std::string tag;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
    std::vector<Tab> tabs;
    std::vector<WindowId> window_ids;
    SessionMetadata metadata;
};

struct NavigationEvent {
    TabId tab_id = 0;
    std::string url;
    std::optional<std::string> referrer;
    Timestamp timestamp = 0;
    TransitionType transition_type = TransitionType::LINK;
};

struct BoundaryMetadata {
    std::optional<int64_t> idle_duration;
    std::optional<int64_t> navigation_gap;
    std::optional<std::string> domain_from;
    std::optional<std::string> domain_to;
    std::optional<std::vector<TabId>> tabs_involved;
    std::optional<std::vector<WindowId>> windows_involved;
};

struct SessionBoundary {
    std::string id;
    BoundaryType type = BoundaryType::START;
    BoundaryReason reason = BoundaryReason::USER_INITIATED;
    Timestamp timestamp = 0;
    std::string session_id;
    BoundaryMetadata metadata;
};

// --- Stored records (domain record plus storage envelope) ---

constexpr int kInitialRecordVersion = 1;

struct StoredSession {
    Session session;
    int version = kInitialRecordVersion;
    Timestamp last_modified = 0;
    int64_t size = 0;
    bool compressed = false;
    std::vector<std::string> domains;
    int64_t total_tab_count = 0;
    int64_t total_navigation_events = 0;
    std::string checksum;
    bool is_valid = true;
};

struct StoredTab {
    Tab tab;
    std::string session_id;
    std::string domain;
    bool is_active = false;
    int64_t interaction_count = 0;
    int64_t focus_time = 0;
    int version = kInitialRecordVersion;
    Timestamp last_modified = 0;
    int64_t navigation_count = 0;
    std::optional<Timestamp> first_navigation_at;
    std::optional<Timestamp> last_navigation_at;
    std::string checksum;
};

struct StoredNavigationEvent {
    NavigationEvent event;
    std::string session_id;
    std::string domain;
    int version = kInitialRecordVersion;
    std::optional<std::string> batch_id;
    std::string checksum;
};

struct StoredSessionBoundary {
    SessionBoundary boundary;
    int64_t tab_count = 0;
    int64_t window_count = 0;
    int version = kInitialRecordVersion;
    std::string checksum;
};

struct IntegrityCheckRecord {
    Timestamp last_check = 0;
    bool is_valid = true;
    std::vector<std::string> errors;
};

struct DatabaseMetadata {
    int version = 0;
    Timestamp created_at = 0;
    Timestamp last_modified = 0;
    std::optional<Timestamp> last_backup;
    int64_t total_sessions = 0;
    int64_t total_tabs = 0;
    int64_t total_navigation_events = 0;
    int64_t total_boundaries = 0;
    int64_t storage_size = 0;
    IntegrityCheckRecord integrity_check;
};

// One alternative per container; consumers dispatch with std::visit.
using StoredRecord = std::variant<StoredSession, StoredTab, StoredNavigationEvent,
                                  StoredSessionBoundary, DatabaseMetadata>;

// Full snapshot of the record containers, used for backups, export and sweeps.
struct RecordCollections {
    std::vector<StoredSession> sessions;
    std::vector<StoredTab> tabs;
    std::vector<StoredNavigationEvent> navigation_events;
    std::vector<StoredSessionBoundary> boundaries;

    size_t totalItems() const {
        return sessions.size() + tabs.size() + navigation_events.size() + boundaries.size();
    }
};

struct StorageStats {
    int64_t sessions = 0;
    int64_t tabs = 0;
    int64_t navigation_events = 0;
    int64_t boundaries = 0;
    int64_t storage_size = 0;
    Timestamp oldest_record = 0;
    Timestamp newest_record = 0;
    bool integrity_status = true;
};

// Navigation events have no scalar id; validators and correctors address them as "<tabId>_<timestamp>".
std::string navigationEventEntityId(TabId tab_id, Timestamp timestamp);
bool parseNavigationEventEntityId(const std::string& entity_id, TabId& tab_id, Timestamp& timestamp);

} // namespace tabvault
