// @include/tabvault/migration_manager.h
#pragma once

#include "config.h"
#include "debug_utils.h"
#include "integrity_validator.h"
#include "record_store.h"
#include "schema_registry.h"
#include "storage_error/result.h"
#include "types.h"

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tabvault {

struct MigrationStep {
    int version = 0;           // Target schema version of the step
    std::string description;
    std::function<storage::Status(SchemaUpgrade&)> execute;
    std::function<storage::Status(SchemaUpgrade&)> rollback;    // optional
    std::function<storage::Status(const RecordStore&)> validate; // optional
};

struct MigrationResult {
    bool success = false;
    int from_version = 0;
    int to_version = 0;
    int steps_executed = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    double execution_time_ms = 0.0;
    std::optional<std::string> backup_created;  // id of the pre-migration backup
};

struct VersionInfo {
    int current = 0;
    int latest = 0;
    bool is_up_to_date = true;
    bool migration_required = false;
    std::vector<std::string> migration_steps;  // descriptions, in execution order
};

struct MigrationStepInfo {
    int version = 0;
    std::string description;
    bool has_rollback = false;
    bool has_validation = false;
};

void to_json(nlohmann::json& j, const MigrationResult& result);
void to_json(nlohmann::json& j, const VersionInfo& info);

// Reads every record container of a store; used for the pre-migration backup and the referential sweep
using CollectionsReader = std::function<storage::Result<RecordCollections>(RecordStore&)>;

/**
 * @brief Ordered registry of schema upgrade steps and the runner that applies them.
 *
 * A run opens one SchemaUpgrade on the store and executes the steps between the two
 * versions in increasing order. On failure with rollbackOnFailure, the failing step and
 * every step already applied in the run are rolled back in reverse order and the upgrade
 * is aborted. Without rollback, the steps that completed are committed.
 */
class MigrationManager {
public:
    MigrationManager(MigrationConfig config, const SchemaRegistry& registry,
                     IntegrityValidator* validator = nullptr, CollectionsReader reader = nullptr,
                     ClockFn clock = systemNowMs);

    // Replaces any step registered for the same version
    void registerStep(MigrationStep step);

    storage::Result<std::vector<MigrationStep>> getMigrationSteps(int from_version, int to_version) const;
    std::vector<MigrationStepInfo> getAvailableMigrations() const;

    MigrationResult performMigration(RecordStore& store, int old_version, int new_version);

    // Inspects the manifest only; the store is neither opened nor upgraded
    storage::Result<VersionInfo> getVersionInfo(const std::string& data_dir) const;
    storage::Result<bool> isMigrationNeeded(const std::string& data_dir) const;

    const MigrationConfig& config() const { return config_; }

private:
    void registerBuiltInSteps();

    MigrationResult executeSteps(RecordStore& store, SchemaUpgrade& upgrade, const std::vector<MigrationStep>& steps,
                                 MigrationResult result);
    storage::Status attemptStep(const MigrationStep& step, SchemaUpgrade& upgrade) const;
    void rollbackSteps(const std::vector<const MigrationStep*>& applied, SchemaUpgrade& upgrade,
                       std::vector<std::string>& errors) const;
    void validateStructure(const RecordStore& store, int version, const std::vector<MigrationStep>& steps,
                           std::vector<std::string>& errors) const;
    void sweepReferences(RecordStore& store, std::vector<std::string>& warnings) const;
    storage::Status stampMetadataVersion(RecordStore& store, int version) const;
    bool logs(log::Level level) const { return level >= log_level_; }

    MigrationConfig config_;
    const SchemaRegistry& registry_;
    IntegrityValidator* validator_;
    CollectionsReader reader_;
    ClockFn clock_;
    log::Level log_level_;
    std::map<int, MigrationStep> steps_;
};

} // namespace tabvault
