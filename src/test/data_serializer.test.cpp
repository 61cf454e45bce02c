//src/test/data_serializer.test.cpp
#include "gtest/gtest.h"
#include "tabvault/data_serializer.h"
#include "tabvault/url_utils.h"
#include "test_fixtures.h"

using namespace tabvault;
using testing_support::ManualClock;
using testing_support::makeSession;
using testing_support::makeTab;

class DataSerializerTest : public ::testing::Test {
protected:
    ManualClock clock_;
    SessionDataSerializer serializer_{SerializerConfig{}, makeDefaultChecksum(), clock_.fn()};

    Session largeSession(size_t tab_count) {
        Session session = makeSession("s-large", "research", clock_.now());
        session.window_ids = {1};
        for (size_t i = 0; i < tab_count; ++i) {
            Tab tab = makeTab(static_cast<TabId>(i + 1),
                              "https://docs.example.com/articles/" + std::to_string(i), 1, clock_.now());
            tab.title = "Notes on distributed storage engines, chapter " + std::to_string(i);
            session.tabs.push_back(tab);
        }
        return session;
    }
};

TEST_F(DataSerializerTest, EnvelopeIsDerivedFromTheSession) {
    Session session = makeSession("s1", "work", clock_.now());
    session.window_ids = {1};
    session.tabs.push_back(makeTab(1, "https://Example.com/a", 1, clock_.now()));
    session.tabs.push_back(makeTab(2, "https://news.site.org/b", 1, clock_.now()));
    session.tabs.push_back(makeTab(3, "https://example.com/c", 1, clock_.now()));

    StoredSession stored = serializer_.serializeSession(session);
    EXPECT_EQ(stored.version, kInitialRecordVersion);
    EXPECT_EQ(stored.last_modified, clock_.now());
    EXPECT_EQ(stored.total_tab_count, 3);
    EXPECT_EQ(stored.domains, (std::vector<std::string>{"example.com", "news.site.org"}));
    EXPECT_TRUE(stored.is_valid);
    EXPECT_EQ(stored.checksum, Crc32Checksum().digestJson(semanticFields(stored.session)));
}

TEST_F(DataSerializerTest, OptimizationTruncatesLongFieldsAndDropsStaleFormData) {
    Session session = makeSession("s1", "work", clock_.now());
    session.window_ids = {1};

    Tab long_tab = makeTab(1, "https://example.com/" + std::string(700, 'p'), 1, clock_.now());
    long_tab.title = std::string(300, 't');
    long_tab.form_data = std::map<std::string, std::string>{{"q", "fresh"}};
    session.tabs.push_back(long_tab);

    Tab stale_tab = makeTab(2, "https://example.com/form", 1, clock_.now() - 2 * kMillisPerHour);
    stale_tab.form_data = std::map<std::string, std::string>{{"q", "stale"}};
    session.tabs.push_back(stale_tab);

    StoredSession stored = serializer_.serializeSession(session);
    const Tab& optimized = stored.session.tabs[0];
    EXPECT_LT(optimized.url.size(), long_tab.url.size());
    EXPECT_EQ(optimized.url.rfind("https://example.com", 0), 0u);
    EXPECT_EQ(optimized.url.substr(optimized.url.size() - 3), "...");
    EXPECT_EQ(optimized.title.size(), 203u);
    EXPECT_TRUE(optimized.form_data.has_value());
    EXPECT_FALSE(stored.session.tabs[1].form_data.has_value());
}

TEST_F(DataSerializerTest, LargeSessionIsCompressedAndDecodesBack) {
    Session session = largeSession(60);
    EncodedSession encoded = serializer_.encodeSession(session);

    EXPECT_TRUE(encoded.stored.compressed);
    EXPECT_TRUE(encoded.document.contains("payload"));
    EXPECT_FALSE(encoded.document.contains("tabs"));
    EXPECT_EQ(encoded.document.at("id"), "s-large");
    EXPECT_EQ(encoded.document.at("domains"), json::array({"docs.example.com"}));

    auto decoded = serializer_.decodeSession(encoded.document);
    ASSERT_TRUE(decoded.isOk()) << decoded.error().toString();
    EXPECT_TRUE(decoded.value().is_valid);
    ASSERT_EQ(decoded.value().session.tabs.size(), 60u);
    EXPECT_EQ(decoded.value().session.tabs[42].url, "https://docs.example.com/articles/42");
    EXPECT_EQ(decoded.value().checksum, encoded.stored.checksum);
}

TEST_F(DataSerializerTest, SmallSessionStaysInline) {
    Session session = makeSession("s1", "work", clock_.now());
    session.tabs.push_back(makeTab(1, "https://example.com", 1, clock_.now()));

    EncodedSession encoded = serializer_.encodeSession(session);
    EXPECT_FALSE(encoded.stored.compressed);
    ASSERT_TRUE(encoded.document.contains("tabs"));
    EXPECT_EQ(encoded.document.at("size"), encoded.stored.size);
}

TEST_F(DataSerializerTest, TamperedSessionDecodesAsInvalid) {
    Session session = makeSession("s1", "work", clock_.now());
    session.tabs.push_back(makeTab(1, "https://example.com", 1, clock_.now()));
    EncodedSession encoded = serializer_.encodeSession(session);

    json tampered = encoded.document;
    tampered["tabs"][0]["title"] = "changed behind our back";
    auto decoded = serializer_.decodeSession(tampered);
    ASSERT_TRUE(decoded.isOk());
    EXPECT_FALSE(decoded.value().is_valid);
}

TEST_F(DataSerializerTest, MalformedDocumentIsRejected) {
    auto decoded = serializer_.decodeSession(json::array({1, 2}));
    ASSERT_FALSE(decoded.isOk());
    EXPECT_EQ(decoded.error().code, storage::ErrorCode::INVALID_DATA_FORMAT);
}

TEST_F(DataSerializerTest, BatchDecodeSkipsBadDocuments) {
    std::vector<Session> sessions{makeSession("a", "work", clock_.now()), makeSession("b", "home", clock_.now())};
    std::vector<StoredSession> stored = serializer_.serializeSessions(sessions);
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[1].session.id, "b");

    std::vector<json> documents{serializer_.encodeSession(sessions[0]).document, json::array({1}),
                                serializer_.encodeSession(sessions[1]).document};
    std::vector<StoredSession> decoded = serializer_.decodeSessions(documents);
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded[0].session.id, "a");
    EXPECT_EQ(decoded[1].session.tag, "home");
}

TEST_F(DataSerializerTest, CompressionStatsShrinkRepetitiveSessions) {
    CompressionStats stats = serializer_.getCompressionStats(largeSession(200));
    EXPECT_GT(stats.original_size, 0u);
    EXPECT_LT(stats.compressed_size, stats.original_size);
    EXPECT_LT(stats.ratio, 1.0);
    EXPECT_GE(stats.time_ms, 0.0);
}

TEST_F(DataSerializerTest, TabDomainFallsBackToUnknown) {
    StoredTab good = serializer_.serializeTab(makeTab(1, "https://WWW.Example.com/x", 1, clock_.now()), "s1");
    EXPECT_EQ(good.domain, "www.example.com");
    EXPECT_EQ(good.session_id, "s1");
    EXPECT_EQ(good.checksum, serializer_.checksumOf(good.tab));

    StoredTab bad = serializer_.serializeTab(makeTab(2, "not a url", 1, clock_.now()), "s1");
    EXPECT_EQ(bad.domain, "unknown");
}

TEST_F(DataSerializerTest, BoundaryCountsInvolvedTabsAndWindows) {
    SessionBoundary boundary = testing_support::makeBoundary("b1", "s1", clock_.now(), BoundaryReason::IDLE_TIMEOUT);
    boundary.metadata.tabs_involved = std::vector<TabId>{1, 2, 3};
    boundary.metadata.windows_involved = std::vector<WindowId>{7};

    StoredSessionBoundary stored = serializer_.serializeBoundary(boundary);
    EXPECT_EQ(stored.tab_count, 3);
    EXPECT_EQ(stored.window_count, 1);

    auto decoded = serializer_.decodeBoundary(serializer_.toDocument(stored));
    ASSERT_TRUE(decoded.isOk());
    EXPECT_EQ(decoded.value().boundary.reason, BoundaryReason::IDLE_TIMEOUT);
}

TEST_F(DataSerializerTest, NavigationEventCarriesBatchId) {
    NavigationEvent event = testing_support::makeEvent(5, "https://example.com/next", clock_.now());
    StoredNavigationEvent stored = serializer_.serializeNavigationEvent(event, "s1", std::string("batch_1"));
    EXPECT_EQ(stored.domain, "example.com");
    ASSERT_TRUE(stored.batch_id.has_value());
    EXPECT_EQ(*stored.batch_id, "batch_1");
}

TEST_F(DataSerializerTest, Sha256ChecksumIsSelectable) {
    SerializerConfig config;
    config.checksum_algorithm = "sha256";
    SessionDataSerializer serializer(config, nullptr, clock_.fn());
    EXPECT_EQ(serializer.checksumAlgorithm().name(), "sha256");

    StoredTab stored = serializer.serializeTab(makeTab(1, "https://example.com", 1, clock_.now()), "s1");
    EXPECT_EQ(stored.checksum.size(), 64u);
    EXPECT_EQ(serializer.calculateSecureHash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(UrlUtilsTest, ExtractDomainAndTruncate) {
    EXPECT_EQ(url_utils::extractDomain("https://user@Sub.Example.COM:8080/path").value_or(""), "sub.example.com");
    EXPECT_FALSE(url_utils::extractDomain("mailto:someone").has_value());
    EXPECT_EQ(url_utils::truncateText("abcdef", 3), "abc...");
    EXPECT_EQ(url_utils::truncateText("abc", 3), "abc");
    EXPECT_EQ(url_utils::truncateUrl("https://example.com/short"), "https://example.com/short");
}
