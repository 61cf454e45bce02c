// @src/test/test_fixtures.h
#pragma once

#include "tabvault/types.h"

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>

namespace tabvault {
namespace testing_support {

inline std::string uniqueTestDir(const std::string& suite) {
    return "./test_data_" + suite + "_" + std::to_string(time(nullptr)) + "_" + std::to_string(rand());
}

// Manually advanced clock shared by every component of a test
class ManualClock {
public:
    explicit ManualClock(Timestamp start = 1700000000000) : now_(std::make_shared<std::atomic<Timestamp>>(start)) {}

    Timestamp now() const { return now_->load(); }
    void set(Timestamp value) { now_->store(value); }
    void advance(Timestamp delta) { now_->fetch_add(delta); }

    ClockFn fn() const {
        auto now = now_;
        return [now]() { return now->load(); };
    }

private:
    std::shared_ptr<std::atomic<Timestamp>> now_;
};

inline Tab makeTab(TabId id, const std::string& url, WindowId window_id, Timestamp created_at) {
    Tab tab;
    tab.id = id;
    tab.url = url;
    tab.title = "Tab " + std::to_string(id);
    tab.window_id = window_id;
    tab.created_at = created_at;
    tab.last_accessed = created_at;
    return tab;
}

inline Session makeSession(const std::string& id, const std::string& tag, Timestamp created_at) {
    Session session;
    session.id = id;
    session.tag = tag;
    session.created_at = created_at;
    session.updated_at = created_at;
    return session;
}

inline NavigationEvent makeEvent(TabId tab_id, const std::string& url, Timestamp timestamp) {
    NavigationEvent event;
    event.tab_id = tab_id;
    event.url = url;
    event.timestamp = timestamp;
    event.transition_type = TransitionType::LINK;
    return event;
}

inline SessionBoundary makeBoundary(const std::string& id, const std::string& session_id, Timestamp timestamp,
                                    BoundaryReason reason = BoundaryReason::USER_INITIATED) {
    SessionBoundary boundary;
    boundary.id = id;
    boundary.session_id = session_id;
    boundary.timestamp = timestamp;
    boundary.type = BoundaryType::START;
    boundary.reason = reason;
    return boundary;
}

inline void removeTestDir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

} // namespace testing_support
} // namespace tabvault
