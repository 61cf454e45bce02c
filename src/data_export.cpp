#include "tabvault/data_export.h"
#include "tabvault/debug_utils.h"
#include "tabvault/record_codec.h"
#include "tabvault/storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <algorithm>
#include <set>
#include <sstream>
#include <type_traits>

namespace tabvault {

namespace {

using storage::ErrorCode;

std::string escapeCsv(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string escaped = "\"";
    for (char c : value) {
        if (c == '"') escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::string joinDomains(const std::vector<std::string>& domains) {
    std::string joined;
    for (const auto& domain : domains) {
        if (!joined.empty()) joined += "; ";
        joined += domain;
    }
    return joined;
}

void writeRow(std::ostringstream& out, const std::vector<std::string>& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) out << ',';
        out << escapeCsv(cells[i]);
    }
    out << '\n';
}

} // namespace

void to_json(nlohmann::json& j, const ItemCounts& counts) {
    j = nlohmann::json{
        {"sessions", counts.sessions},
        {"tabs", counts.tabs},
        {"navigationEvents", counts.navigation_events},
        {"boundaries", counts.boundaries},
    };
}

void to_json(nlohmann::json& j, const ExportResult& result) {
    j = nlohmann::json{
        {"format", result.format},
        {"size", result.size},
        {"itemCounts", result.item_counts},
        {"metadata", {{"exportedAt", result.exported_at}, {"version", result.version}, {"checksum", result.checksum}}},
    };
}

void to_json(nlohmann::json& j, const ImportResult& result) {
    j = nlohmann::json{
        {"success", result.success()},
        {"imported", result.imported},
        {"skipped", result.skipped},
        {"errors", result.errors},
    };
}

DataExport::DataExport(const SchemaRegistry& registry, const SessionDataSerializer& serializer, ClockFn clock)
    : registry_(registry), serializer_(serializer), clock_(clock ? std::move(clock) : ClockFn(systemNowMs)) {}

RecordCollections DataExport::applyFilter(const RecordCollections& collections, const ExportFilter& filter) {
    const std::set<std::string> ids(filter.session_ids.begin(), filter.session_ids.end());
    auto wanted = [&](const std::string& session_id, Timestamp when) {
        if (!ids.empty() && ids.count(session_id) == 0) return false;
        if (filter.date_range && (when < filter.date_range->first || when > filter.date_range->second)) return false;
        return true;
    };

    RecordCollections filtered;
    for (const auto& stored : collections.sessions) {
        if (wanted(stored.session.id, stored.session.created_at)) filtered.sessions.push_back(stored);
    }
    for (const auto& stored : collections.tabs) {
        if (wanted(stored.session_id, stored.tab.created_at)) filtered.tabs.push_back(stored);
    }
    for (const auto& stored : collections.navigation_events) {
        if (wanted(stored.session_id, stored.event.timestamp)) filtered.navigation_events.push_back(stored);
    }
    for (const auto& stored : collections.boundaries) {
        if (wanted(stored.boundary.session_id, stored.boundary.timestamp)) filtered.boundaries.push_back(stored);
    }
    return filtered;
}

storage::Result<ExportResult> DataExport::exportData(const RecordCollections& collections,
                                                     const ExportOptions& options,
                                                     const std::optional<DatabaseMetadata>& metadata) const {
    const Timestamp now = clock_();
    RecordCollections filtered = applyFilter(collections, options.filter);

    ExportResult result;
    result.format = options.format;
    result.exported_at = now;
    result.version = kFormatVersion;
    result.item_counts.sessions = filtered.sessions.size();
    result.item_counts.tabs = filtered.tabs.size();
    result.item_counts.navigation_events = filtered.navigation_events.size();
    result.item_counts.boundaries = filtered.boundaries.size();

    try {
        result.checksum = serializer_.calculateSecureHash(json(filtered).dump());
        switch (options.format) {
            case ExportFormat::JSON:
                result.data = toJsonDocument(filtered, options, metadata, now);
                break;
            case ExportFormat::CSV:
                result.data = toCsvDocument(filtered);
                break;
        }
    } catch (const std::exception& e) {
        return TABVAULT_ERROR(ErrorCode::INVALID_DATA_FORMAT, "Export failed").withDetails(e.what());
    }
    result.size = result.data.size();
    LOG_INFO("[DataExport] Exported {} items as {} ({} bytes)", result.item_counts.total(),
             magic_enum::enum_name(options.format), result.size);
    return result;
}

std::string DataExport::toJsonDocument(const RecordCollections& collections, const ExportOptions& options,
                                       const std::optional<DatabaseMetadata>& metadata, Timestamp now) const {
    json header = {
        {"version", kFormatVersion},
        {"schemaVersion", registry_.latestVersion()},
        {"exportedAt", now},
        {"format", options.format},
    };
    if (options.include_metadata && metadata) {
        header["database"] = *metadata;
    }
    json document = {{"metadata", header}, {"data", collections}};
    return document.dump(2);
}

std::string DataExport::toCsvDocument(const RecordCollections& collections) const {
    std::ostringstream out;
    writeRow(out, {"kind", "id", "sessionId", "timestamp", "url", "title", "domain", "detail"});
    for (const auto& stored : collections.sessions) {
        const Session& session = stored.session;
        writeRow(out, {"session", session.id, session.id, std::to_string(session.created_at), "", session.tag,
                       joinDomains(stored.domains), session.metadata.purpose.value_or("")});
    }
    for (const auto& stored : collections.tabs) {
        const Tab& tab = stored.tab;
        writeRow(out, {"tab", std::to_string(tab.id), stored.session_id, std::to_string(tab.created_at), tab.url,
                       tab.title, stored.domain, "window " + std::to_string(tab.window_id)});
    }
    for (const auto& stored : collections.navigation_events) {
        const NavigationEvent& event = stored.event;
        writeRow(out, {"navigation_event", navigationEventEntityId(event.tab_id, event.timestamp), stored.session_id,
                       std::to_string(event.timestamp), event.url, "", stored.domain,
                       json(event.transition_type).get<std::string>()});
    }
    return out.str();
}

storage::Result<ParsedImport> DataExport::parseImport(const std::string& document, const ImportOptions& options) const {
    json parsed = json::parse(document, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return TABVAULT_ERROR(ErrorCode::INVALID_DATA_FORMAT, "Import document is not a JSON object");
    }
    const json& data = parsed.contains("data") ? parsed["data"] : parsed;
    if (!data.is_object()) {
        return TABVAULT_ERROR(ErrorCode::INVALID_DATA_FORMAT, "Import document has no data object");
    }

    ParsedImport result;
    auto readArray = [&](const char* field, const char* container, auto& out) {
        using Stored = typename std::decay_t<decltype(out)>::value_type;
        auto it = data.find(field);
        if (it == data.end()) return;
        if (!it->is_array()) {
            result.errors.push_back(std::string("Field '") + field + "' is not an array");
            return;
        }
        for (const auto& record : *it) {
            if (options.validate_data) {
                auto shape = registry_.validateShape(container, record);
                if (!shape.isOk()) {
                    ++result.skipped;
                    result.errors.push_back(shape.error().message);
                    continue;
                }
            }
            try {
                out.push_back(record.get<Stored>());
            } catch (const json::exception& e) {
                ++result.skipped;
                result.errors.push_back(std::string("Undecodable ") + container + " record: " + e.what());
            }
        }
    };

    readArray("sessions", containers::SESSIONS, result.collections.sessions);
    readArray("tabs", containers::TABS, result.collections.tabs);
    readArray("navigationEvents", containers::NAVIGATION_EVENTS, result.collections.navigation_events);
    readArray("boundaries", containers::SESSION_BOUNDARIES, result.collections.boundaries);

    LOG_INFO("[DataExport] Parsed {} importable items ({} skipped)", result.collections.totalItems(), result.skipped);
    return result;
}

} // namespace tabvault
