// @include/tabvault/data_export.h
#pragma once

#include "data_serializer.h"
#include "schema_registry.h"
#include "storage_error/result.h"
#include "types.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tabvault {

enum class ExportFormat { JSON, CSV };

NLOHMANN_JSON_SERIALIZE_ENUM(ExportFormat, {
    {ExportFormat::JSON, "json"},
    {ExportFormat::CSV, "csv"},
})

struct ExportFilter {
    std::optional<std::pair<Timestamp, Timestamp>> date_range;  // inclusive
    std::vector<std::string> session_ids;
};

struct ExportOptions {
    ExportFormat format = ExportFormat::JSON;
    bool include_metadata = true;
    ExportFilter filter;
};

struct ItemCounts {
    size_t sessions = 0;
    size_t tabs = 0;
    size_t navigation_events = 0;
    size_t boundaries = 0;

    size_t total() const { return sessions + tabs + navigation_events + boundaries; }
};

struct ExportResult {
    ExportFormat format = ExportFormat::JSON;
    std::string data;
    size_t size = 0;
    ItemCounts item_counts;
    Timestamp exported_at = 0;
    std::string version;
    std::string checksum;  // SHA-256 over the exported records
};

struct ImportOptions {
    bool overwrite_existing = false;
    bool validate_data = true;
};

struct ImportResult {
    size_t imported = 0;
    size_t skipped = 0;
    std::vector<std::string> errors;

    bool success() const { return errors.empty(); }
};

// Records decoded from an import document, before they are written anywhere
struct ParsedImport {
    RecordCollections collections;
    size_t skipped = 0;
    std::vector<std::string> errors;
};

void to_json(nlohmann::json& j, const ItemCounts& counts);
void to_json(nlohmann::json& j, const ExportResult& result);
void to_json(nlohmann::json& j, const ImportResult& result);

/**
 * @brief Renders record collections as portable JSON or CSV documents and parses
 * JSON documents back into collections.
 *
 * The JSON layout is {"metadata": {...}, "data": {"sessions", "tabs",
 * "navigationEvents", "boundaries"}}; stored records are written uncompressed.
 * CSV is export only.
 */
class DataExport {
public:
    static constexpr const char* kFormatVersion = "1.0.0";

    DataExport(const SchemaRegistry& registry, const SessionDataSerializer& serializer,
               ClockFn clock = systemNowMs);

    storage::Result<ExportResult> exportData(const RecordCollections& collections, const ExportOptions& options,
                                             const std::optional<DatabaseMetadata>& metadata = std::nullopt) const;

    storage::Result<ParsedImport> parseImport(const std::string& document, const ImportOptions& options) const;

    static RecordCollections applyFilter(const RecordCollections& collections, const ExportFilter& filter);

private:
    std::string toJsonDocument(const RecordCollections& collections, const ExportOptions& options,
                               const std::optional<DatabaseMetadata>& metadata, Timestamp now) const;
    std::string toCsvDocument(const RecordCollections& collections) const;

    const SchemaRegistry& registry_;
    const SessionDataSerializer& serializer_;
    ClockFn clock_;
};

} // namespace tabvault
