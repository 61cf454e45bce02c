// @include/tabvault/schema_registry.h
#pragma once

#include "storage_error/result.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tabvault {

namespace containers {
inline constexpr const char* SESSIONS = "sessions";
inline constexpr const char* TABS = "tabs";
inline constexpr const char* NAVIGATION_EVENTS = "navigation_events";
inline constexpr const char* SESSION_BOUNDARIES = "session_boundaries";
inline constexpr const char* METADATA = "metadata";
} // namespace containers

// Resolves a dotted field path ("metadata.purpose") inside a record; nullptr when absent.
const nlohmann::json* resolveField(const nlohmann::json& record, const std::string& path);

struct IndexDescriptor {
    std::string name;
    std::vector<std::string> key_path;  // One field, or several for a compound key
    bool unique = false;
    bool multi_entry = false;           // Array values produce one entry per element
    int since_version = 1;

    bool isValid() const { return !name.empty() && !key_path.empty() && !(multi_entry && key_path.size() > 1); }
    bool operator==(const IndexDescriptor& other) const;
};

struct ContainerDescriptor {
    std::string name;
    std::vector<std::string> key_path;  // Primary key; more than one field means a composite key
    std::vector<IndexDescriptor> indexes;
    int since_version = 1;

    bool isCompositeKey() const { return key_path.size() > 1; }
    const IndexDescriptor* findIndex(const std::string& index_name) const;
};

void to_json(nlohmann::json& j, const IndexDescriptor& index);
void from_json(const nlohmann::json& j, IndexDescriptor& index);
void to_json(nlohmann::json& j, const ContainerDescriptor& container);
void from_json(const nlohmann::json& j, ContainerDescriptor& container);

/**
 * @brief Declares the containers of the session store and their secondary indexes.
 *
 * Pure data: the registry performs no I/O. The engine consults it when opening
 * the store and before every write, and migration steps use it to know what a
 * schema version must contain.
 */
class SchemaRegistry {
public:
    static constexpr const char* kDatabaseName = "TabKillerSessions";
    static constexpr int kLatestVersion = 1;

    SchemaRegistry();

    const std::vector<ContainerDescriptor>& containers() const { return containers_; }
    const ContainerDescriptor* findContainer(const std::string& name) const;

    // Containers that exist once the schema reaches `version` (with indexes of that version)
    std::vector<ContainerDescriptor> containersAtVersion(int version) const;

    int latestVersion() const { return kLatestVersion; }

    /**
     * @brief Checks that a candidate record carries every primary-key field of its container.
     * Composite keys require all parts. Null values and empty strings count as missing.
     * @param missing_field Receives the first missing field name when the check fails.
     */
    bool hasRequiredKeys(const std::string& container, const nlohmann::json& record,
                         std::string* missing_field = nullptr) const;

    // Same check reported as SCHEMA_VIOLATION for the write path
    storage::Status validateShape(const std::string& container, const nlohmann::json& record) const;

    // Documentation of what an upgrade does; never executed.
    std::vector<std::string> migrationInstructions(int from_version, int to_version) const;

private:
    std::vector<ContainerDescriptor> containers_;
};

} // namespace tabvault
