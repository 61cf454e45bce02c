// @include/tabvault/record_codec.h
#pragma once

#include "types.h"
#include <nlohmann/json.hpp>

namespace tabvault {

using json = nlohmann::json;

NLOHMANN_JSON_SERIALIZE_ENUM(TransitionType, {
    {TransitionType::LINK, "link"},
    {TransitionType::TYPED, "typed"},
    {TransitionType::BOOKMARK, "bookmark"},
    {TransitionType::AUTO_BOOKMARK, "auto_bookmark"},
    {TransitionType::AUTO_SUBFRAME, "auto_subframe"},
    {TransitionType::MANUAL_SUBFRAME, "manual_subframe"},
    {TransitionType::GENERATED, "generated"},
    {TransitionType::START_PAGE, "start_page"},
    {TransitionType::FORM_SUBMIT, "form_submit"},
    {TransitionType::RELOAD, "reload"},
    {TransitionType::KEYWORD, "keyword"},
    {TransitionType::KEYWORD_GENERATED, "keyword_generated"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(BoundaryType, {
    {BoundaryType::START, "start"},
    {BoundaryType::END, "end"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(BoundaryReason, {
    {BoundaryReason::USER_INITIATED, "user_initiated"},
    {BoundaryReason::IDLE_TIMEOUT, "idle_timeout"},
    {BoundaryReason::NAVIGATION_GAP, "navigation_gap"},
    {BoundaryReason::DOMAIN_CHANGE, "domain_change"},
    {BoundaryReason::WINDOW_CLOSED, "window_closed"},
})

// Field names follow the persisted camelCase layout. Readers are lenient: a
// missing field takes its default so that damaged records still load and are
// reported by the integrity validator instead of failing the whole container.

void to_json(json& j, const Tab& tab);
void from_json(const json& j, Tab& tab);
void to_json(json& j, const SessionMetadata& meta);
void from_json(const json& j, SessionMetadata& meta);
void to_json(json& j, const Session& session);
void from_json(const json& j, Session& session);
void to_json(json& j, const NavigationEvent& event);
void from_json(const json& j, NavigationEvent& event);
void to_json(json& j, const BoundaryMetadata& meta);
void from_json(const json& j, BoundaryMetadata& meta);
void to_json(json& j, const SessionBoundary& boundary);
void from_json(const json& j, SessionBoundary& boundary);

void to_json(json& j, const StoredSession& stored);
void from_json(const json& j, StoredSession& stored);
void to_json(json& j, const StoredTab& stored);
void from_json(const json& j, StoredTab& stored);
void to_json(json& j, const StoredNavigationEvent& stored);
void from_json(const json& j, StoredNavigationEvent& stored);
void to_json(json& j, const StoredSessionBoundary& stored);
void from_json(const json& j, StoredSessionBoundary& stored);
void to_json(json& j, const IntegrityCheckRecord& check);
void from_json(const json& j, IntegrityCheckRecord& check);
void to_json(json& j, const DatabaseMetadata& meta);
void from_json(const json& j, DatabaseMetadata& meta);
void to_json(json& j, const RecordCollections& collections);
void from_json(const json& j, RecordCollections& collections);
void to_json(json& j, const StorageStats& stats);

/**
 * @brief Projections onto the checksummed (semantic) fields of each record kind.
 * Storage envelope fields never appear here, so re-stamping a record leaves its checksum unchanged.
 */
json semanticFields(const Session& session);
json semanticFields(const Tab& tab);
json semanticFields(const NavigationEvent& event);
json semanticFields(const SessionBoundary& boundary);

} // namespace tabvault
