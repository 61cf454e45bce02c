//src/test/storage_engine.test.cpp
#include "gtest/gtest.h"
#include "tabvault/storage_engine.h"
#include "test_fixtures.h"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace tabvault;
using testing_support::makeBoundary;
using testing_support::makeEvent;
using testing_support::makeSession;
using testing_support::makeTab;

class StorageEngineTest : public ::testing::Test {
protected:
    std::string test_dir_;
    testing_support::ManualClock clock_;
    SchemaRegistry registry_;
    SessionDataSerializer serializer_{SerializerConfig{}, makeDefaultChecksum(), clock_.fn()};
    IntegrityValidator validator_{ValidatorConfig{}, "", makeDefaultChecksum(), clock_.fn()};
    std::unique_ptr<MigrationManager> migration_;
    std::unique_ptr<StorageEngine> engine_;

    void SetUp() override {
        test_dir_ = testing_support::uniqueTestDir("storage_engine");
        testing_support::removeTestDir(test_dir_);
        MigrationConfig migration_config;
        migration_config.log_level = "warn";
        const SessionDataSerializer* serializer = &serializer_;
        migration_ = std::make_unique<MigrationManager>(
            migration_config, registry_, &validator_,
            [serializer](RecordStore& store) { return readCollections(store, *serializer); }, clock_.fn());
        engine_ = makeEngine(defaultConfig());
    }

    void TearDown() override {
        engine_.reset();
        testing_support::removeTestDir(test_dir_);
    }

    static StorageConfig defaultConfig() {
        StorageConfig config;
        config.run_startup_maintenance = false;
        return config;
    }

    std::unique_ptr<StorageEngine> makeEngine(const StorageConfig& config) {
        return std::make_unique<StorageEngine>(test_dir_, config, registry_, serializer_, validator_, *migration_,
                                               clock_.fn());
    }

    // Session s1 with tabs 1 and 2, three events and one boundary
    void populate() {
        Session session = makeSession("s1", "work", clock_.now());
        session.window_ids = {1};
        session.tabs.push_back(makeTab(1, "https://example.com/a", 1, clock_.now()));
        session.tabs.push_back(makeTab(2, "https://docs.example.org/b", 1, clock_.now()));
        ASSERT_TRUE(engine_->createSession(session).isOk());
        for (const auto& tab : session.tabs) {
            ASSERT_TRUE(engine_->createTab(tab, "s1").isOk());
        }
        auto events = engine_->createNavigationEvents({makeEvent(1, "https://example.com/a1", clock_.now() + 1),
                                                       makeEvent(1, "https://example.com/a2", clock_.now() + 2),
                                                       makeEvent(2, "https://docs.example.org/b1", clock_.now() + 3)},
                                                      "s1");
        ASSERT_TRUE(events.isOk()) << events.error().toString();
        ASSERT_TRUE(engine_->createBoundary(makeBoundary("b1", "s1", clock_.now())).isOk());
    }
};

TEST_F(StorageEngineTest, InitializeIsIdempotent) {
    ASSERT_TRUE(engine_->initialize().isOk());
    ASSERT_TRUE(engine_->initialize().isOk());
    EXPECT_TRUE(engine_->isInitialized());

    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().version, registry_.latestVersion());
    EXPECT_EQ(meta.value().total_sessions, 0);
}

TEST_F(StorageEngineTest, OperationsInitializeOnFirstUse) {
    EXPECT_FALSE(engine_->isInitialized());
    auto session = engine_->getSession("missing");
    ASSERT_TRUE(session.isOk()) << session.error().toString();
    EXPECT_FALSE(session.value().has_value());
    EXPECT_TRUE(engine_->isInitialized());
}

TEST_F(StorageEngineTest, CreateAndReadEveryRecordKind) {
    populate();

    auto session = engine_->getSession("s1");
    ASSERT_TRUE(session.isOk());
    ASSERT_TRUE(session.value().has_value());
    EXPECT_EQ(session.value()->session.tabs.size(), 2u);
    EXPECT_TRUE(session.value()->is_valid);

    auto tab = engine_->getTab(2);
    ASSERT_TRUE(tab.isOk());
    ASSERT_TRUE(tab.value().has_value());
    EXPECT_EQ(tab.value()->session_id, "s1");
    EXPECT_EQ(tab.value()->domain, "docs.example.org");

    auto event = engine_->getNavigationEvent(1, clock_.now() + 2);
    ASSERT_TRUE(event.isOk());
    ASSERT_TRUE(event.value().has_value());
    EXPECT_EQ(event.value()->event.url, "https://example.com/a2");

    auto boundary = engine_->getBoundary("b1");
    ASSERT_TRUE(boundary.isOk());
    EXPECT_TRUE(boundary.value().has_value());
}

TEST_F(StorageEngineTest, CountersFollowCreatesAndDeletes) {
    populate();
    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_sessions, 1);
    EXPECT_EQ(meta.value().total_tabs, 2);
    EXPECT_EQ(meta.value().total_navigation_events, 3);
    EXPECT_EQ(meta.value().total_boundaries, 1);

    // Rewriting an existing key does not count twice
    ASSERT_TRUE(engine_->createTab(makeTab(1, "https://example.com/again", 1, clock_.now()), "s1").isOk());
    ASSERT_TRUE(engine_->deleteNavigationEvent(1, clock_.now() + 1).isOk());

    meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_tabs, 2);
    EXPECT_EQ(meta.value().total_navigation_events, 2);
}

TEST_F(StorageEngineTest, DeletingASessionCascades) {
    populate();
    ASSERT_TRUE(engine_->deleteSession("s1").isOk());

    TabQuery tabs;
    tabs.session_ids = {"s1"};
    auto tab_results = engine_->queryTabs(tabs);
    ASSERT_TRUE(tab_results.isOk());
    EXPECT_TRUE(tab_results.value().empty());

    NavigationEventQuery events;
    events.session_ids = {"s1"};
    auto event_results = engine_->queryNavigationEvents(events);
    ASSERT_TRUE(event_results.isOk());
    EXPECT_TRUE(event_results.value().empty());

    BoundaryQuery boundaries;
    boundaries.session_ids = {"s1"};
    auto boundary_results = engine_->queryBoundaries(boundaries);
    ASSERT_TRUE(boundary_results.isOk());
    EXPECT_TRUE(boundary_results.value().empty());

    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_sessions, 0);
    EXPECT_EQ(meta.value().total_tabs, 0);
    EXPECT_EQ(meta.value().total_navigation_events, 0);
    EXPECT_EQ(meta.value().total_boundaries, 0);

    auto again = engine_->deleteSession("s1");
    ASSERT_FALSE(again.isOk());
    EXPECT_EQ(again.error().code, storage::ErrorCode::KEY_NOT_FOUND);
}

TEST_F(StorageEngineTest, DeletingATabRemovesItsEvents) {
    populate();
    ASSERT_TRUE(engine_->deleteTab(1).isOk());

    NavigationEventQuery query;
    query.tab_ids = {1};
    auto events = engine_->queryNavigationEvents(query);
    ASSERT_TRUE(events.isOk());
    EXPECT_TRUE(events.value().empty());

    query.tab_ids = {2};
    events = engine_->queryNavigationEvents(query);
    ASSERT_TRUE(events.isOk());
    EXPECT_EQ(events.value().size(), 1u);
}

TEST_F(StorageEngineTest, UpdatesOfMissingRecordsFail) {
    ASSERT_TRUE(engine_->initialize().isOk());

    SessionPatch session_patch;
    session_patch.tag = "other";
    auto session = engine_->updateSession("ghost", session_patch);
    ASSERT_FALSE(session.isOk());
    EXPECT_EQ(session.error().code, storage::ErrorCode::KEY_NOT_FOUND);

    TabPatch tab_patch;
    tab_patch.title = "other";
    auto tab = engine_->updateTab(99, tab_patch);
    ASSERT_FALSE(tab.isOk());
    EXPECT_EQ(tab.error().code, storage::ErrorCode::KEY_NOT_FOUND);

    auto boundary = engine_->updateBoundary("ghost", BoundaryPatch{});
    ASSERT_FALSE(boundary.isOk());
    EXPECT_EQ(boundary.error().code, storage::ErrorCode::KEY_NOT_FOUND);
}

TEST_F(StorageEngineTest, UpdatesBumpTheVersion) {
    populate();
    clock_.advance(5000);

    SessionPatch session_patch;
    session_patch.tag = "personal";
    auto session = engine_->updateSession("s1", session_patch);
    ASSERT_TRUE(session.isOk());
    EXPECT_EQ(session.value().version, kInitialRecordVersion + 1);
    EXPECT_EQ(session.value().session.tag, "personal");
    EXPECT_EQ(session.value().session.updated_at, clock_.now());

    TabPatch tab_patch;
    tab_patch.title = "Renamed";
    tab_patch.is_active = true;
    auto tab = engine_->updateTab(1, tab_patch);
    ASSERT_TRUE(tab.isOk());
    EXPECT_EQ(tab.value().version, kInitialRecordVersion + 1);
    EXPECT_EQ(tab.value().tab.last_accessed, clock_.now());
    EXPECT_TRUE(tab.value().is_active);

    auto reread = engine_->getTab(1);
    ASSERT_TRUE(reread.isOk());
    ASSERT_TRUE(reread.value().has_value());
    EXPECT_EQ(reread.value()->tab.title, "Renamed");
    EXPECT_EQ(reread.value()->checksum, serializer_.checksumOf(reread.value()->tab));
}

TEST_F(StorageEngineTest, DateRangeQueriesStayWithinBoundsAndLimit) {
    const Timestamp base = clock_.now();
    for (int i = 0; i < 10; ++i) {
        Session session = makeSession("s" + std::to_string(i), i % 2 == 0 ? "even" : "odd", base + i * 1000);
        ASSERT_TRUE(engine_->createSession(session).isOk());
    }

    SessionQuery query;
    query.date_range = DateRange{base + 2000, base + 7000};
    QueryOptions options;
    options.limit = 4;
    auto results = engine_->querySessions(query, options);
    ASSERT_TRUE(results.isOk());
    ASSERT_EQ(results.value().size(), 4u);
    for (const auto& stored : results.value()) {
        EXPECT_TRUE(query.date_range->contains(stored.session.created_at));
    }
    // Newest first by default
    EXPECT_EQ(results.value().front().session.id, "s7");

    options.order = SortOrder::ASCENDING;
    options.offset = 1;
    results = engine_->querySessions(query, options);
    ASSERT_TRUE(results.isOk());
    ASSERT_FALSE(results.value().empty());
    EXPECT_EQ(results.value().front().session.id, "s3");

    options.limit = 0;
    results = engine_->querySessions(query, options);
    ASSERT_TRUE(results.isOk());
    EXPECT_TRUE(results.value().empty());
}

TEST_F(StorageEngineTest, SessionFiltersCombine) {
    Session work = makeSession("w", "work", clock_.now());
    work.metadata.purpose = "Quarterly Planning";
    work.tabs.push_back(makeTab(1, "https://calendar.example.com", 1, clock_.now()));
    ASSERT_TRUE(engine_->createSession(work).isOk());

    Session home = makeSession("h", "home", clock_.now() + 1);
    home.tabs.push_back(makeTab(2, "https://recipes.test", 1, clock_.now()));
    ASSERT_TRUE(engine_->createSession(home).isOk());

    SessionQuery by_domain;
    by_domain.domains = {"example"};
    auto results = engine_->querySessions(by_domain);
    ASSERT_TRUE(results.isOk());
    ASSERT_EQ(results.value().size(), 1u);
    EXPECT_EQ(results.value()[0].session.id, "w");

    SessionQuery by_text;
    by_text.search_text = "planning";
    results = engine_->querySessions(by_text);
    ASSERT_TRUE(results.isOk());
    ASSERT_EQ(results.value().size(), 1u);
    EXPECT_EQ(results.value()[0].session.id, "w");

    SessionQuery by_tag;
    by_tag.tags = {"home"};
    results = engine_->querySessions(by_tag);
    ASSERT_TRUE(results.isOk());
    ASSERT_EQ(results.value().size(), 1u);
    EXPECT_EQ(results.value()[0].session.id, "h");
}

TEST_F(StorageEngineTest, BatchedEventsShareOneBatchId) {
    StorageConfig config = defaultConfig();
    config.batch_size = 2;
    engine_ = makeEngine(config);

    std::vector<NavigationEvent> events;
    for (int i = 0; i < 5; ++i) {
        events.push_back(makeEvent(3, "https://example.com/" + std::to_string(i), clock_.now() + i));
    }
    auto created = engine_->createNavigationEvents(events, "s1");
    ASSERT_TRUE(created.isOk());
    ASSERT_EQ(created.value().size(), 5u);

    std::set<std::string> batch_ids;
    for (const auto& stored : created.value()) {
        ASSERT_TRUE(stored.batch_id.has_value());
        batch_ids.insert(*stored.batch_id);
    }
    ASSERT_EQ(batch_ids.size(), 1u);
    EXPECT_EQ(batch_ids.begin()->rfind("batch_" + std::to_string(clock_.now()) + "_", 0), 0u);

    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_navigation_events, 5);
}

TEST_F(StorageEngineTest, RecordsSurviveShutdown) {
    populate();
    ASSERT_TRUE(engine_->shutdown().isOk());
    EXPECT_FALSE(engine_->isInitialized());

    engine_ = makeEngine(defaultConfig());
    ASSERT_TRUE(engine_->initialize().isOk());
    auto session = engine_->getSession("s1");
    ASSERT_TRUE(session.isOk());
    ASSERT_TRUE(session.value().has_value());
    EXPECT_EQ(session.value()->session.tag, "work");

    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_tabs, 2);
}

TEST_F(StorageEngineTest, TabWithUnknownSessionIsStoredAndFlagged) {
    ASSERT_TRUE(engine_->createSession(makeSession("s1", "work", clock_.now())).isOk());
    ASSERT_TRUE(engine_->createTab(makeTab(2, "https://example.com", 1, clock_.now()), "nonexistent").isOk());

    auto check = engine_->runIntegrityCheck();
    ASSERT_TRUE(check.isOk());
    EXPECT_FALSE(check.value().is_valid);
    ASSERT_EQ(check.value().errors.size(), 1u);
    EXPECT_EQ(check.value().errors[0].type, ValidationErrorType::MISSING_REFERENCE);
    EXPECT_EQ(check.value().errors[0].entity_id, "2");

    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_FALSE(meta.value().integrity_check.is_valid);
    EXPECT_EQ(meta.value().integrity_check.errors.size(), 1u);
    EXPECT_EQ(meta.value().integrity_check.last_check, clock_.now());
}

TEST_F(StorageEngineTest, CleanupRemovesSessionsPastMaxAge) {
    StorageConfig config = defaultConfig();
    config.max_session_age_ms = kMillisPerDay;
    engine_ = makeEngine(config);

    ASSERT_TRUE(engine_->createSession(makeSession("old", "work", clock_.now() - 2 * kMillisPerDay)).isOk());
    ASSERT_TRUE(engine_->createTab(makeTab(1, "https://example.com", 1, clock_.now()), "old").isOk());
    ASSERT_TRUE(engine_->createSession(makeSession("fresh", "work", clock_.now())).isOk());

    auto cleaned = engine_->cleanupOldData();
    ASSERT_TRUE(cleaned.isOk());
    EXPECT_EQ(cleaned.value(), 1u);

    auto old = engine_->getSession("old");
    ASSERT_TRUE(old.isOk());
    EXPECT_FALSE(old.value().has_value());
    auto tab = engine_->getTab(1);
    ASSERT_TRUE(tab.isOk());
    EXPECT_FALSE(tab.value().has_value());
    auto fresh = engine_->getSession("fresh");
    ASSERT_TRUE(fresh.isOk());
    EXPECT_TRUE(fresh.value().has_value());
}

TEST_F(StorageEngineTest, StorageStatsReportCountsAndExtremes) {
    ASSERT_TRUE(engine_->createSession(makeSession("a", "work", clock_.now() - 500)).isOk());
    ASSERT_TRUE(engine_->createSession(makeSession("b", "work", clock_.now())).isOk());
    ASSERT_TRUE(engine_->updateStorageStats().isOk());

    auto stats = engine_->getStorageStats();
    ASSERT_TRUE(stats.isOk());
    EXPECT_EQ(stats.value().sessions, 2);
    EXPECT_EQ(stats.value().oldest_record, clock_.now() - 500);
    EXPECT_EQ(stats.value().newest_record, clock_.now());
    EXPECT_GT(stats.value().storage_size, 0);
}

TEST_F(StorageEngineTest, CorrectorReassignsEventsAndRepairsWindows) {
    Session session = makeSession("s1", "work", clock_.now());
    session.tabs.push_back(makeTab(4, "https://example.com", 3, clock_.now()));
    ASSERT_TRUE(engine_->createSession(session).isOk());
    ASSERT_TRUE(engine_->createTab(session.tabs[0], "s1").isOk());
    ASSERT_TRUE(engine_->createNavigationEvent(makeEvent(4, "https://example.com/x", clock_.now()), "stale").isOk());

    ASSERT_TRUE(engine_->reassignNavigationEvent(navigationEventEntityId(4, clock_.now())).isOk());
    auto event = engine_->getNavigationEvent(4, clock_.now());
    ASSERT_TRUE(event.isOk());
    ASSERT_TRUE(event.value().has_value());
    EXPECT_EQ(event.value()->session_id, "s1");

    ValidationError violation;
    violation.type = ValidationErrorType::SCHEMA_VIOLATION;
    violation.entity_type = EntityType::SESSION;
    violation.entity_id = "s1";
    ASSERT_TRUE(engine_->repairSchemaViolation(violation).isOk());
    auto repaired = engine_->getSession("s1");
    ASSERT_TRUE(repaired.isOk());
    ASSERT_TRUE(repaired.value().has_value());
    EXPECT_EQ(repaired.value()->session.window_ids, (std::vector<WindowId>{3}));
    EXPECT_TRUE(repaired.value()->is_valid);

    violation.entity_type = EntityType::BOUNDARY;
    auto unsupported = engine_->repairSchemaViolation(violation);
    ASSERT_FALSE(unsupported.isOk());
    EXPECT_EQ(unsupported.error().code, storage::ErrorCode::NOT_IMPLEMENTED);
}

TEST_F(StorageEngineTest, IngestSkipsExistingKeysUnlessOverwriting) {
    populate();
    auto exported = engine_->exportCollections();
    ASSERT_TRUE(exported.isOk());
    EXPECT_EQ(exported.value().totalItems(), 7u);

    auto skipped = engine_->ingestCollections(exported.value(), false);
    ASSERT_TRUE(skipped.isOk());
    EXPECT_EQ(skipped.value().written, 0u);
    EXPECT_EQ(skipped.value().skipped, 7u);

    ASSERT_TRUE(engine_->clearAllData().isOk());
    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_sessions, 0);

    auto written = engine_->ingestCollections(exported.value(), true);
    ASSERT_TRUE(written.isOk());
    EXPECT_EQ(written.value().written, 7u);
    meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_tabs, 2);
    EXPECT_EQ(meta.value().total_navigation_events, 3);
}

TEST_F(StorageEngineTest, ConcurrentInitializeMigratesOnce) {
    engine_.reset();
    auto sweeps = std::make_shared<std::atomic<int>>(0);
    MigrationConfig migration_config;
    migration_config.log_level = "warn";
    migration_config.validate_after_migration = true;
    const SessionDataSerializer* serializer = &serializer_;
    MigrationManager counting(
        migration_config, registry_, &validator_,
        [serializer, sweeps](RecordStore& store) {
            sweeps->fetch_add(1);
            return readCollections(store, *serializer);
        },
        clock_.fn());
    StorageEngine engine(test_dir_, defaultConfig(), registry_, serializer_, validator_, counting, clock_.fn());

    constexpr int kThreads = 8;
    std::atomic<bool> go{false};
    std::vector<storage::Status> statuses(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            statuses[i] = engine.initialize();
        });
    }
    go = true;
    for (auto& thread : threads) thread.join();

    for (const auto& status : statuses) {
        EXPECT_TRUE(status.isOk()) << status.error().toString();
    }
    EXPECT_TRUE(engine.isInitialized());
    EXPECT_EQ(sweeps->load(), 1);

    auto meta = engine.getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().version, registry_.latestVersion());
    EXPECT_TRUE(engine.shutdown().isOk());
}

TEST_F(StorageEngineTest, EmptyIdsAreRejectedWithoutWriting) {
    populate();

    auto session = engine_->createSession(makeSession("", "work", clock_.now()));
    ASSERT_FALSE(session.isOk());
    EXPECT_EQ(session.error().code, storage::ErrorCode::SCHEMA_VIOLATION);

    auto boundary = engine_->createBoundary(makeBoundary("", "s1", clock_.now()));
    ASSERT_FALSE(boundary.isOk());
    EXPECT_EQ(boundary.error().code, storage::ErrorCode::SCHEMA_VIOLATION);

    auto missing = engine_->getSession("");
    ASSERT_TRUE(missing.isOk());
    EXPECT_FALSE(missing.value().has_value());
    auto missing_boundary = engine_->getBoundary("");
    ASSERT_TRUE(missing_boundary.isOk());
    EXPECT_FALSE(missing_boundary.value().has_value());

    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_sessions, 1);
    EXPECT_EQ(meta.value().total_boundaries, 1);
    ASSERT_TRUE(engine_->updateStorageStats().isOk());
    auto stats = engine_->getStorageStats();
    ASSERT_TRUE(stats.isOk());
    EXPECT_EQ(stats.value().sessions, 1);
    EXPECT_EQ(stats.value().boundaries, 1);
}

TEST_F(StorageEngineTest, QueriesStopAtTheScanCap) {
    StorageConfig config = defaultConfig();
    config.batch_size = 20000;
    engine_ = makeEngine(config);

    const size_t total = StorageEngine::kMaxScannedRecords + 5;
    RecordCollections collections;
    collections.sessions.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        // The five oldest sessions are the only "late" ones
        const std::string tag = i < 5 ? "late" : "bulk";
        collections.sessions.push_back(serializer_.serializeSession(
            makeSession("s" + std::to_string(i), tag, clock_.now() + static_cast<Timestamp>(i))));
    }
    auto ingested = engine_->ingestCollections(collections, false);
    ASSERT_TRUE(ingested.isOk()) << ingested.error().toString();
    ASSERT_EQ(ingested.value().written, total);

    QueryOptions options;
    options.limit = total;
    auto everything = engine_->querySessions(SessionQuery{}, options);
    ASSERT_TRUE(everything.isOk());
    EXPECT_EQ(everything.value().size(), StorageEngine::kMaxScannedRecords);
    EXPECT_EQ(everything.value().front().session.id, "s" + std::to_string(total - 1));

    // Newest first, so the late sessions sit past the cap
    SessionQuery late;
    late.tags = {"late", "other"};
    auto capped = engine_->querySessions(late, options);
    ASSERT_TRUE(capped.isOk());
    EXPECT_TRUE(capped.value().empty());

    // An index range that starts at them still finds them
    late.tags = {"late"};
    auto indexed = engine_->querySessions(late, options);
    ASSERT_TRUE(indexed.isOk());
    EXPECT_EQ(indexed.value().size(), 5u);
}

TEST_F(StorageEngineTest, TabAndEventQueriesFollowTheirIndex) {
    Session session = makeSession("s1", "work", clock_.now());
    ASSERT_TRUE(engine_->createSession(session).isOk());
    for (TabId id : {5, 2, 9, 7}) {
        const WindowId window = id == 7 ? 2 : 1;
        ASSERT_TRUE(engine_->createTab(makeTab(id, "https://example.com/" + std::to_string(id), window, clock_.now()),
                                       "s1").isOk());
    }

    TabQuery by_window;
    by_window.window_ids = {1};
    QueryOptions ascending;
    ascending.order = SortOrder::ASCENDING;
    auto tabs = engine_->queryTabs(by_window, ascending);
    ASSERT_TRUE(tabs.isOk());
    std::vector<TabId> ids;
    for (const auto& stored : tabs.value()) ids.push_back(stored.tab.id);
    EXPECT_EQ(ids, (std::vector<TabId>{2, 5, 9}));

    tabs = engine_->queryTabs(by_window);
    ASSERT_TRUE(tabs.isOk());
    ids.clear();
    for (const auto& stored : tabs.value()) ids.push_back(stored.tab.id);
    EXPECT_EQ(ids, (std::vector<TabId>{9, 5, 2}));

    auto events = engine_->createNavigationEvents({makeEvent(5, "https://example.com/5a", clock_.now() + 30),
                                                   makeEvent(2, "https://example.com/2a", clock_.now() + 10),
                                                   makeEvent(5, "https://example.com/5b", clock_.now() + 20),
                                                   makeEvent(5, "https://example.com/5c", clock_.now() + 40)},
                                                  "s1");
    ASSERT_TRUE(events.isOk());

    NavigationEventQuery by_tab;
    by_tab.tab_ids = {5};
    auto newest_first = engine_->queryNavigationEvents(by_tab);
    ASSERT_TRUE(newest_first.isOk());
    std::vector<Timestamp> stamps;
    for (const auto& stored : newest_first.value()) stamps.push_back(stored.event.timestamp - clock_.now());
    EXPECT_EQ(stamps, (std::vector<Timestamp>{40, 30, 20}));

    QueryOptions second_only = ascending;
    second_only.offset = 1;
    second_only.limit = 1;
    auto second = engine_->queryNavigationEvents(by_tab, second_only);
    ASSERT_TRUE(second.isOk());
    ASSERT_EQ(second.value().size(), 1u);
    EXPECT_EQ(second.value()[0].event.url, "https://example.com/5a");
}

TEST_F(StorageEngineTest, ReplaceAllDataIsAllOrNothing) {
    populate();
    auto exported = engine_->exportCollections();
    ASSERT_TRUE(exported.isOk());

    RecordCollections replacement;
    replacement.sessions.push_back(serializer_.serializeSession(makeSession("fresh", "home", clock_.now())));
    replacement.boundaries.push_back(serializer_.serializeBoundary(makeBoundary("", "fresh", clock_.now())));

    auto rejected = engine_->replaceAllData(replacement);
    ASSERT_FALSE(rejected.isOk());
    EXPECT_EQ(rejected.error().code, storage::ErrorCode::SCHEMA_VIOLATION);

    auto untouched = engine_->exportCollections();
    ASSERT_TRUE(untouched.isOk());
    EXPECT_EQ(untouched.value().totalItems(), exported.value().totalItems());
    auto fresh = engine_->getSession("fresh");
    ASSERT_TRUE(fresh.isOk());
    EXPECT_FALSE(fresh.value().has_value());
    auto meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_tabs, 2);
    EXPECT_EQ(meta.value().total_navigation_events, 3);

    replacement.boundaries.clear();
    replacement.boundaries.push_back(serializer_.serializeBoundary(makeBoundary("b9", "fresh", clock_.now())));
    auto replaced = engine_->replaceAllData(replacement);
    ASSERT_TRUE(replaced.isOk()) << replaced.error().toString();
    EXPECT_EQ(replaced.value().written, 2u);

    auto old_session = engine_->getSession("s1");
    ASSERT_TRUE(old_session.isOk());
    EXPECT_FALSE(old_session.value().has_value());
    fresh = engine_->getSession("fresh");
    ASSERT_TRUE(fresh.isOk());
    EXPECT_TRUE(fresh.value().has_value());

    meta = engine_->getMetadata();
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta.value().total_sessions, 1);
    EXPECT_EQ(meta.value().total_tabs, 0);
    EXPECT_EQ(meta.value().total_navigation_events, 0);
    EXPECT_EQ(meta.value().total_boundaries, 1);
}
