#include "tabvault/migration_manager.h"
#include "tabvault/debug_utils.h"
#include "tabvault/record_codec.h"
#include "tabvault/storage_error/error_utils.h"

#include <algorithm>
#include <chrono>

// Migration messages are dropped below the configured migration level; the process level still applies
#define MIGRATION_LOG(level, ...) \
    do { \
        if (logs(::tabvault::log::Level::level)) LOG_##level(__VA_ARGS__); \
    } while (0)

namespace tabvault {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

void to_json(nlohmann::json& j, const MigrationResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"fromVersion", result.from_version},
        {"toVersion", result.to_version},
        {"stepsExecuted", result.steps_executed},
        {"errors", result.errors},
        {"warnings", result.warnings},
        {"executionTime", result.execution_time_ms},
    };
    if (result.backup_created) {
        j["backupCreated"] = *result.backup_created;
    }
}

void to_json(nlohmann::json& j, const VersionInfo& info) {
    j = nlohmann::json{
        {"current", info.current},
        {"latest", info.latest},
        {"isUpToDate", info.is_up_to_date},
        {"migrationRequired", info.migration_required},
        {"migrationSteps", info.migration_steps},
    };
}

MigrationManager::MigrationManager(MigrationConfig config, const SchemaRegistry& registry,
                                   IntegrityValidator* validator, CollectionsReader reader, ClockFn clock)
    : config_(std::move(config)),
      registry_(registry),
      validator_(validator),
      reader_(std::move(reader)),
      clock_(clock ? std::move(clock) : ClockFn(systemNowMs)),
      log_level_(log::levelFromString(config_.log_level)) {
    registerBuiltInSteps();
}

void MigrationManager::registerBuiltInSteps() {
    const SchemaRegistry& registry = registry_;

    MigrationStep initial;
    initial.version = 1;
    initial.description = "Create initial schema with all containers and indexes";
    initial.execute = [&registry](SchemaUpgrade& upgrade) -> storage::Status {
        for (const auto& container : registry.containersAtVersion(1)) {
            if (!upgrade.hasContainer(container.name)) {
                RETURN_IF_ERROR(upgrade.createContainer(container));
                continue;
            }
            for (const auto& index : container.indexes) {
                if (!upgrade.hasIndex(container.name, index.name)) {
                    RETURN_IF_ERROR(upgrade.createIndex(container.name, index));
                }
            }
        }
        return {};
    };
    initial.rollback = [&registry](SchemaUpgrade& upgrade) -> storage::Status {
        for (const auto& container : registry.containersAtVersion(1)) {
            if (upgrade.hasContainer(container.name)) {
                RETURN_IF_ERROR(upgrade.deleteContainer(container.name));
            }
        }
        return {};
    };
    initial.validate = [&registry](const RecordStore& store) -> storage::Status {
        for (const auto& container : registry.containersAtVersion(1)) {
            if (!store.hasContainer(container.name)) {
                return TABVAULT_ERROR(storage::ErrorCode::MIGRATION_VALIDATION_FAILED,
                                      "Container missing after migration: " + container.name);
            }
        }
        return {};
    };
    registerStep(std::move(initial));
}

void MigrationManager::registerStep(MigrationStep step) {
    int version = step.version;
    steps_[version] = std::move(step);
}

storage::Result<std::vector<MigrationStep>> MigrationManager::getMigrationSteps(int from_version,
                                                                                int to_version) const {
    std::vector<MigrationStep> steps;
    for (int version = from_version + 1; version <= to_version; ++version) {
        auto it = steps_.find(version);
        if (it == steps_.end()) {
            return storage::StorageError::migrationStepNotFound(version).withLocation(__FILE__, __LINE__, __FUNCTION__);
        }
        steps.push_back(it->second);
    }
    return steps;
}

std::vector<MigrationStepInfo> MigrationManager::getAvailableMigrations() const {
    std::vector<MigrationStepInfo> infos;
    for (const auto& [version, step] : steps_) {
        infos.push_back(MigrationStepInfo{version, step.description, static_cast<bool>(step.rollback),
                                          static_cast<bool>(step.validate)});
    }
    return infos;
}

MigrationResult MigrationManager::performMigration(RecordStore& store, int old_version, int new_version) {
    const auto started = std::chrono::steady_clock::now();

    MigrationResult result;
    result.from_version = old_version;
    result.to_version = new_version;

    if (new_version < old_version) {
        result.errors.push_back("Downgrade from " + std::to_string(old_version) + " to " +
                                std::to_string(new_version) + " is not supported");
        result.execution_time_ms = elapsedMs(started);
        return result;
    }
    if (old_version == new_version) {
        MIGRATION_LOG(INFO, "[MigrationManager] Schema already at version {}", new_version);
        result.success = true;
        result.execution_time_ms = elapsedMs(started);
        return result;
    }

    auto steps_result = getMigrationSteps(old_version, new_version);
    if (!steps_result.isOk()) {
        result.errors.push_back(steps_result.error().toString());
        result.execution_time_ms = elapsedMs(started);
        return result;
    }
    const std::vector<MigrationStep>& steps = steps_result.value();
    MIGRATION_LOG(INFO, "[MigrationManager] Migrating from version {} to {} ({} steps)", old_version, new_version, steps.size());

    if (config_.enable_backups && old_version > 0 && validator_ && reader_) {
        auto collections = reader_(store);
        storage::Result<BackupManifest> backup = collections.isOk()
            ? validator_->createBackup(collections.value(),
                                       "Pre-migration backup (v" + std::to_string(old_version) + " to v" +
                                           std::to_string(new_version) + ")")
            : storage::Result<BackupManifest>(collections.error());
        if (backup.isOk()) {
            result.backup_created = backup.value().id;
        } else if (backup.error().code == storage::ErrorCode::BACKUPS_DISABLED) {
            result.warnings.push_back("Pre-migration backup skipped: backups are disabled");
        } else {
            result.errors.push_back("Pre-migration backup failed: " + backup.error().toString());
            result.execution_time_ms = elapsedMs(started);
            return result;
        }
    }

    auto upgrade = store.beginUpgrade(new_version);
    if (!upgrade.isOk()) {
        result.errors.push_back(upgrade.error().toString());
        result.execution_time_ms = elapsedMs(started);
        return result;
    }

    result = executeSteps(store, *upgrade.value(), steps, std::move(result));
    result.execution_time_ms = elapsedMs(started);
    if (result.success) {
        MIGRATION_LOG(INFO, "[MigrationManager] Migration to version {} completed in {} ms", new_version,
                 result.execution_time_ms);
    } else {
        MIGRATION_LOG(ERROR, "[MigrationManager] Migration to version {} failed with {} errors", new_version,
                  result.errors.size());
    }
    return result;
}

MigrationResult MigrationManager::executeSteps(RecordStore& store, SchemaUpgrade& upgrade,
                                               const std::vector<MigrationStep>& steps, MigrationResult result) {
    std::vector<const MigrationStep*> applied;
    for (const auto& step : steps) {
        MIGRATION_LOG(INFO, "[MigrationManager] Step v{}: {}", step.version, step.description);
        auto status = attemptStep(step, upgrade);
        if (status.isOk()) {
            applied.push_back(&step);
            ++result.steps_executed;
            continue;
        }

        result.errors.push_back("Step v" + std::to_string(step.version) + " failed: " + status.error().toString());
        if (config_.rollback_on_failure) {
            std::vector<const MigrationStep*> chain{&step};
            chain.insert(chain.end(), applied.rbegin(), applied.rend());
            rollbackSteps(chain, upgrade, result.errors);
            upgrade.abort();
        } else {
            // Keep what completed; the failing step's partial changes land with it
            int landed = applied.empty() ? upgrade.oldVersion() : applied.back()->version;
            auto retarget = upgrade.setTargetVersion(landed);
            auto commit = retarget.isOk() ? upgrade.commit() : retarget;
            if (!commit.isOk()) {
                result.errors.push_back("Commit of completed steps failed: " + commit.error().toString());
                upgrade.abort();
            } else if (landed > upgrade.oldVersion()) {
                auto stamp = stampMetadataVersion(store, landed);
                if (!stamp.isOk()) result.errors.push_back(stamp.error().toString());
            }
        }
        return result;
    }

    auto commit = upgrade.commit();
    if (!commit.isOk()) {
        result.errors.push_back("Schema commit failed: " + commit.error().toString());
        return result;
    }

    validateStructure(store, result.to_version, steps, result.errors);
    if (config_.validate_after_migration) {
        sweepReferences(store, result.warnings);
    }
    auto stamp = stampMetadataVersion(store, result.to_version);
    if (!stamp.isOk()) {
        result.errors.push_back(stamp.error().toString());
    }
    result.success = result.errors.empty();
    return result;
}

storage::Status MigrationManager::attemptStep(const MigrationStep& step, SchemaUpgrade& upgrade) const {
    const int attempts = 1 + std::max(0, config_.max_retries);
    storage::Status last = TABVAULT_ERROR(storage::ErrorCode::MIGRATION_FAILED, "Step has no execute function");
    if (!step.execute) {
        return last;
    }
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            last = step.execute(upgrade);
        } catch (const storage::StorageError& e) {
            last = e;
        } catch (const std::exception& e) {
            last = TABVAULT_ERROR(storage::ErrorCode::MIGRATION_FAILED, "Step threw an exception").withDetails(e.what());
        }
        if (last.isOk()) {
            return last;
        }
        MIGRATION_LOG(WARN, "[MigrationManager] Step v{} attempt {}/{} failed: {}", step.version, attempt, attempts,
                 last.error().toString());
    }
    return last;
}

void MigrationManager::rollbackSteps(const std::vector<const MigrationStep*>& chain, SchemaUpgrade& upgrade,
                                     std::vector<std::string>& errors) const {
    for (const MigrationStep* step : chain) {
        if (!step->rollback) {
            MIGRATION_LOG(WARN, "[MigrationManager] Step v{} has no rollback", step->version);
            continue;
        }
        storage::Status status;
        try {
            status = step->rollback(upgrade);
        } catch (const storage::StorageError& e) {
            status = e;
        } catch (const std::exception& e) {
            status = TABVAULT_ERROR(storage::ErrorCode::ROLLBACK_FAILED, "Rollback threw an exception")
                .withDetails(e.what());
        }
        if (status.isOk()) {
            MIGRATION_LOG(INFO, "[MigrationManager] Rolled back step v{}", step->version);
        } else {
            errors.push_back("Rollback of step v" + std::to_string(step->version) +
                             " failed: " + status.error().toString());
        }
    }
}

void MigrationManager::validateStructure(const RecordStore& store, int version, const std::vector<MigrationStep>& steps,
                                         std::vector<std::string>& errors) const {
    for (const auto& container : registry_.containersAtVersion(version)) {
        if (!store.hasContainer(container.name)) {
            errors.push_back("Missing container after migration: " + container.name);
            continue;
        }
        for (const auto& index : container.indexes) {
            if (!store.hasIndex(container.name, index.name)) {
                errors.push_back("Missing index after migration: " + container.name + "." + index.name);
            }
        }
    }
    for (const auto& step : steps) {
        if (!step.validate) continue;
        storage::Status status;
        try {
            status = step.validate(store);
        } catch (const storage::StorageError& e) {
            status = e;
        } catch (const std::exception& e) {
            status = TABVAULT_ERROR(storage::ErrorCode::MIGRATION_VALIDATION_FAILED, "Validation threw an exception")
                .withDetails(e.what());
        }
        if (!status.isOk()) {
            errors.push_back("Validation of step v" + std::to_string(step.version) +
                             " failed: " + status.error().toString());
        }
    }
}

void MigrationManager::sweepReferences(RecordStore& store, std::vector<std::string>& warnings) const {
    if (!validator_ || !reader_) {
        return;
    }
    auto collections = reader_(store);
    if (!collections.isOk()) {
        warnings.push_back("Referential sweep skipped: " + collections.error().toString());
        return;
    }
    const RecordCollections& data = collections.value();
    ValidationResult sweep = validator_->validateRelationships(data.sessions, data.tabs, data.navigation_events);
    for (const auto& error : sweep.errors) {
        warnings.push_back(error.message);
    }
    for (const auto& warning : sweep.warnings) {
        warnings.push_back(warning.message);
    }
}

storage::Status MigrationManager::stampMetadataVersion(RecordStore& store, int version) const {
    if (!store.hasContainer(containers::METADATA)) {
        return {};
    }
    auto txn = store.begin({containers::METADATA}, TransactionMode::READ_WRITE);
    std::vector<nlohmann::json> documents;
    ASSIGN_OR_RETURN(documents, txn->getAll(containers::METADATA));

    const Timestamp now = clock_();
    DatabaseMetadata meta;
    meta.created_at = now;
    if (!documents.empty()) {
        meta = documents.back().get<DatabaseMetadata>();
    }
    for (const auto& document : documents) {
        int stored_version = document.value("version", 0);
        if (stored_version != version) {
            RETURN_IF_ERROR(txn->remove(containers::METADATA, Key{int64_t{stored_version}}));
        }
    }
    meta.version = version;
    meta.last_modified = now;
    RETURN_IF_ERROR(txn->put(containers::METADATA, nlohmann::json(meta)));
    RETURN_IF_ERROR(txn->commit());
    MIGRATION_LOG(INFO, "[MigrationManager] Metadata stamped with schema version {}", version);
    return {};
}

storage::Result<VersionInfo> MigrationManager::getVersionInfo(const std::string& data_dir) const {
    VersionInfo info;
    ASSIGN_OR_RETURN(info.current, RecordStore::readPersistedVersion(data_dir));
    info.latest = registry_.latestVersion();
    info.is_up_to_date = info.current >= info.latest;
    info.migration_required = info.current < info.latest;
    if (info.migration_required) {
        std::vector<MigrationStep> steps;
        ASSIGN_OR_RETURN(steps, getMigrationSteps(info.current, info.latest));
        for (const auto& step : steps) {
            info.migration_steps.push_back(step.description);
        }
    }
    return info;
}

storage::Result<bool> MigrationManager::isMigrationNeeded(const std::string& data_dir) const {
    return getVersionInfo(data_dir).map([](const VersionInfo& info) { return info.migration_required; });
}

} // namespace tabvault
