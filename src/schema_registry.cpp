#include "tabvault/schema_registry.h"
#include "tabvault/storage_error/error_utils.h"

#include <algorithm>

namespace tabvault {

namespace {

IndexDescriptor makeIndex(const std::string& name, const std::string& field, bool multi_entry = false) {
    IndexDescriptor index;
    index.name = name;
    index.key_path = {field};
    index.multi_entry = multi_entry;
    return index;
}

} // namespace

const nlohmann::json* resolveField(const nlohmann::json& record, const std::string& path) {
    const nlohmann::json* current = &record;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!current->is_object()) return nullptr;
        auto it = current->find(part);
        if (it == current->end()) return nullptr;
        current = &(*it);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return current;
}

bool IndexDescriptor::operator==(const IndexDescriptor& other) const {
    return name == other.name && key_path == other.key_path &&
           unique == other.unique && multi_entry == other.multi_entry;
}

const IndexDescriptor* ContainerDescriptor::findIndex(const std::string& index_name) const {
    auto it = std::find_if(indexes.begin(), indexes.end(),
                           [&](const IndexDescriptor& idx) { return idx.name == index_name; });
    return it == indexes.end() ? nullptr : &(*it);
}

void to_json(nlohmann::json& j, const IndexDescriptor& index) {
    j = nlohmann::json{
        {"name", index.name},
        {"keyPath", index.key_path},
        {"unique", index.unique},
        {"multiEntry", index.multi_entry},
        {"sinceVersion", index.since_version},
    };
}

void from_json(const nlohmann::json& j, IndexDescriptor& index) {
    j.at("name").get_to(index.name);
    j.at("keyPath").get_to(index.key_path);
    index.unique = j.value("unique", false);
    index.multi_entry = j.value("multiEntry", false);
    index.since_version = j.value("sinceVersion", 1);
}

void to_json(nlohmann::json& j, const ContainerDescriptor& container) {
    j = nlohmann::json{
        {"name", container.name},
        {"keyPath", container.key_path},
        {"indexes", container.indexes},
        {"sinceVersion", container.since_version},
    };
}

void from_json(const nlohmann::json& j, ContainerDescriptor& container) {
    j.at("name").get_to(container.name);
    j.at("keyPath").get_to(container.key_path);
    container.indexes = j.value("indexes", std::vector<IndexDescriptor>{});
    container.since_version = j.value("sinceVersion", 1);
}

SchemaRegistry::SchemaRegistry() {
    ContainerDescriptor sessions;
    sessions.name = containers::SESSIONS;
    sessions.key_path = {"id"};
    sessions.indexes = {
        makeIndex("by_tag", "tag"),
        makeIndex("by_created_at", "createdAt"),
        makeIndex("by_updated_at", "updatedAt"),
        makeIndex("by_domain", "domains", /*multi_entry=*/true),
    };

    ContainerDescriptor tabs;
    tabs.name = containers::TABS;
    tabs.key_path = {"id"};
    tabs.indexes = {
        makeIndex("by_session_id", "sessionId"),
        makeIndex("by_window_id", "windowId"),
        makeIndex("by_url", "url"),
        makeIndex("by_domain", "domain"),
        makeIndex("by_created_at", "createdAt"),
    };

    ContainerDescriptor navigation_events;
    navigation_events.name = containers::NAVIGATION_EVENTS;
    navigation_events.key_path = {"tabId", "timestamp"};
    navigation_events.indexes = {
        makeIndex("by_tab_id", "tabId"),
        makeIndex("by_session_id", "sessionId"),
        makeIndex("by_timestamp", "timestamp"),
        makeIndex("by_url", "url"),
        makeIndex("by_domain", "domain"),
    };

    ContainerDescriptor boundaries;
    boundaries.name = containers::SESSION_BOUNDARIES;
    boundaries.key_path = {"id"};
    boundaries.indexes = {
        makeIndex("by_session_id", "sessionId"),
        makeIndex("by_timestamp", "timestamp"),
        makeIndex("by_reason", "reason"),
    };

    ContainerDescriptor metadata;
    metadata.name = containers::METADATA;
    metadata.key_path = {"version"};

    containers_ = {sessions, tabs, navigation_events, boundaries, metadata};
}

const ContainerDescriptor* SchemaRegistry::findContainer(const std::string& name) const {
    auto it = std::find_if(containers_.begin(), containers_.end(),
                           [&](const ContainerDescriptor& c) { return c.name == name; });
    return it == containers_.end() ? nullptr : &(*it);
}

std::vector<ContainerDescriptor> SchemaRegistry::containersAtVersion(int version) const {
    std::vector<ContainerDescriptor> result;
    for (const auto& container : containers_) {
        if (container.since_version > version) continue;
        ContainerDescriptor copy = container;
        copy.indexes.erase(std::remove_if(copy.indexes.begin(), copy.indexes.end(),
                                          [version](const IndexDescriptor& idx) { return idx.since_version > version; }),
                           copy.indexes.end());
        result.push_back(std::move(copy));
    }
    return result;
}

bool SchemaRegistry::hasRequiredKeys(const std::string& container, const nlohmann::json& record,
                                     std::string* missing_field) const {
    const ContainerDescriptor* descriptor = findContainer(container);
    if (!descriptor) {
        if (missing_field) *missing_field = "<unknown container>";
        return false;
    }
    if (!record.is_object()) {
        if (missing_field) *missing_field = "<record is not an object>";
        return false;
    }
    for (const auto& field : descriptor->key_path) {
        const nlohmann::json* value = resolveField(record, field);
        bool missing = value == nullptr || value->is_null() ||
                       (value->is_string() && value->get_ref<const std::string&>().empty());
        if (missing) {
            if (missing_field) *missing_field = field;
            return false;
        }
    }
    return true;
}

storage::Status SchemaRegistry::validateShape(const std::string& container, const nlohmann::json& record) const {
    std::string missing;
    if (!hasRequiredKeys(container, record, &missing)) {
        return storage::StorageError::invalidShape(container, "Missing required key field: " + missing)
            .withLocation(__FILE__, __LINE__, __FUNCTION__);
    }
    return {};
}

std::vector<std::string> SchemaRegistry::migrationInstructions(int from_version, int to_version) const {
    std::vector<std::string> instructions;
    if (from_version < 1 && to_version >= 1) {
        instructions.push_back("Create initial schema with sessions, tabs, navigation_events, session_boundaries, and metadata stores");
        instructions.push_back("Add all required indexes for efficient querying");
    }
    for (int version = std::max(from_version + 1, 2); version <= to_version; ++version) {
        for (const auto& container : containers_) {
            if (container.since_version == version) {
                instructions.push_back("Create container " + container.name);
            }
            for (const auto& index : container.indexes) {
                if (index.since_version == version && container.since_version < version) {
                    instructions.push_back("Add index " + index.name + " to " + container.name);
                }
            }
        }
    }
    return instructions;
}

} // namespace tabvault
