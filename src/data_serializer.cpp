#include "tabvault/data_serializer.h"
#include "tabvault/compression_utils.h"
#include "tabvault/debug_utils.h"
#include "tabvault/storage_error/error_utils.h"
#include "tabvault/url_utils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <set>

namespace tabvault {

namespace {

constexpr size_t kMaxUrlLength = 500;
constexpr size_t kKeptPathLength = 200;
constexpr size_t kMaxTitleLength = 200;
constexpr size_t kMaxNotesLength = 1000;
constexpr size_t kMaxHostTokenDigits = 6;
// A compressed body is kept only when it is at most this fraction of the original
constexpr double kMaxCompressedRatio = 0.9;

// Body fields of a session document; everything else stays top-level for indexing
constexpr const char* kBodyFields[] = {"tabs", "windowIds", "metadata", "hosts"};

/**
 * Replaces hostnames that occur in more than one tab URL by "~<n>" and returns the
 * host table. Only URLs whose authority is exactly the lower-case host are rewritten,
 * and nothing is rewritten when an authority already starts with '~'.
 */
std::vector<std::string> tokenizeHosts(json& tabs) {
    std::map<std::string, size_t> occurrences;
    std::vector<std::string> first_seen;
    for (const auto& tab : tabs) {
        auto parsed = url_utils::parseUrl(tab.value("url", std::string()));
        if (!parsed || !parsed->has_authority) continue;
        if (!parsed->authority.empty() && parsed->authority.front() == '~') {
            return {};
        }
        if (parsed->host.empty() || parsed->authority != parsed->host) continue;
        if (occurrences[parsed->host]++ == 0) {
            first_seen.push_back(parsed->host);
        }
    }

    std::vector<std::string> hosts;
    std::map<std::string, size_t> token_of;
    for (const auto& host : first_seen) {
        if (occurrences[host] > 1) {
            token_of[host] = hosts.size();
            hosts.push_back(host);
        }
    }
    if (hosts.empty()) {
        return hosts;
    }

    for (auto& tab : tabs) {
        std::string url = tab.value("url", std::string());
        auto parsed = url_utils::parseUrl(url);
        if (!parsed || !parsed->has_authority || parsed->authority != parsed->host) continue;
        auto it = token_of.find(parsed->host);
        if (it == token_of.end()) continue;
        size_t sep = url.find("://");
        tab["url"] = url.substr(0, sep + 3) + "~" + std::to_string(it->second) + parsed->rest;
    }
    return hosts;
}

void restoreHosts(json& tabs, const std::vector<std::string>& hosts) {
    for (auto& tab : tabs) {
        auto it = tab.find("url");
        if (it == tab.end() || !it->is_string()) continue;
        std::string url = it->get<std::string>();
        size_t sep = url.find("://~");
        if (sep == std::string::npos || sep != url.find(':')) continue;
        size_t start = sep + 4;
        size_t end = url.find_first_of("/?#", start);
        if (end == std::string::npos) end = url.size();
        std::string digits = url.substr(start, end - start);
        if (digits.empty() || digits.size() > kMaxHostTokenDigits ||
            !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        size_t index = static_cast<size_t>(std::stoul(digits));
        if (index >= hosts.size()) continue;
        *it = url.substr(0, sep + 3) + hosts[index] + url.substr(end);
    }
}

std::string domainOrUnknown(const std::string& url) {
    return url_utils::extractDomain(url).value_or("unknown");
}

} // namespace

SessionDataSerializer::SessionDataSerializer(SerializerConfig config,
                                             std::shared_ptr<const ChecksumAlgorithm> checksum,
                                             ClockFn clock)
    : config_(std::move(config)), checksum_(std::move(checksum)), clock_(std::move(clock)) {
    if (!checksum_) {
        checksum_ = makeChecksum(config_.checksum_algorithm);
        if (!checksum_) {
            LOG_WARN("[Serializer] Unknown checksum algorithm '{}', falling back to crc32", config_.checksum_algorithm);
            checksum_ = makeDefaultChecksum();
        }
    }
    if (!clock_) {
        clock_ = systemNowMs;
    }
}

// --- Sessions ---

Session SessionDataSerializer::optimizeSession(const Session& session, Timestamp now) const {
    Session optimized = session;
    const Timestamp stale_before = now - kMillisPerHour;
    for (auto& tab : optimized.tabs) {
        tab.url = url_utils::truncateUrl(tab.url, kMaxUrlLength, kKeptPathLength);
        tab.title = url_utils::truncateText(tab.title, kMaxTitleLength);
        if (tab.form_data && tab.created_at <= stale_before) {
            tab.form_data.reset();
        }
    }
    if (optimized.metadata.notes) {
        optimized.metadata.notes = url_utils::truncateText(*optimized.metadata.notes, kMaxNotesLength);
    }
    return optimized;
}

std::vector<std::string> SessionDataSerializer::deriveDomains(const Session& session) {
    std::set<std::string> domains;
    for (const auto& tab : session.tabs) {
        if (auto domain = url_utils::extractDomain(tab.url)) {
            domains.insert(*domain);
        }
    }
    return std::vector<std::string>(domains.begin(), domains.end());
}

void SessionDataSerializer::finishEnvelope(StoredSession& stored, Timestamp now) const {
    stored.last_modified = now;
    stored.domains = deriveDomains(stored.session);
    stored.total_tab_count = static_cast<int64_t>(stored.session.tabs.size());
    stored.checksum = checksumOf(stored.session);
    stored.is_valid = true;
}

EncodedSession SessionDataSerializer::encodeSession(const Session& session) const {
    const Timestamp now = clock_();
    EncodedSession encoded;
    encoded.stored.session = config_.enable_optimization ? optimizeSession(session, now) : session;
    encoded.stored.version = kInitialRecordVersion;
    finishEnvelope(encoded.stored, now);
    encoded.document = toDocument(encoded.stored);
    return encoded;
}

EncodedSession SessionDataSerializer::reencodeSession(const StoredSession& previous, const Session& updated) const {
    const Timestamp now = clock_();
    EncodedSession encoded;
    encoded.stored.session = config_.enable_optimization ? optimizeSession(updated, now) : updated;
    encoded.stored.version = previous.version + 1;
    encoded.stored.total_navigation_events = previous.total_navigation_events;
    finishEnvelope(encoded.stored, now);
    encoded.document = toDocument(encoded.stored);
    return encoded;
}

json SessionDataSerializer::toDocument(StoredSession& stored) const {
    json document = stored;
    json body = json::object();
    body["tabs"] = std::move(document["tabs"]);
    body["windowIds"] = std::move(document["windowIds"]);
    body["metadata"] = std::move(document["metadata"]);
    if (config_.enable_optimization) {
        std::vector<std::string> hosts = tokenizeHosts(body["tabs"]);
        if (!hosts.empty()) {
            body["hosts"] = std::move(hosts);
        }
    }

    std::vector<uint8_t> encoded_body = json::to_cbor(body);
    stored.compressed = false;
    stored.size = static_cast<int64_t>(encoded_body.size());

    if (config_.enable_compression && config_.compression_type != CompressionType::NONE &&
        encoded_body.size() > config_.compression_threshold) {
        try {
            std::vector<uint8_t> packed = CompressionManager::compress(
                encoded_body.data(), encoded_body.size(), config_.compression_type, config_.compression_level);
            if (static_cast<double>(packed.size()) <= kMaxCompressedRatio * static_cast<double>(encoded_body.size())) {
                stored.compressed = true;
                stored.size = static_cast<int64_t>(packed.size());
                for (const char* field : kBodyFields) {
                    document.erase(field);
                }
                document["payload"] = json::binary(std::move(packed));
                document["payloadSize"] = encoded_body.size();
                document["codec"] = compressionTypeToString(config_.compression_type);
            }
        } catch (const std::runtime_error& e) {
            LOG_WARN("[Serializer] Compression of session {} failed, storing uncompressed: {}",
                     stored.session.id, e.what());
        }
    }

    if (!stored.compressed) {
        for (auto& item : body.items()) {
            document[item.key()] = std::move(item.value());
        }
    }
    document["size"] = stored.size;
    document["compressed"] = stored.compressed;
    return document;
}

storage::Result<StoredSession> SessionDataSerializer::decodeSession(const json& document) const {
    if (!document.is_object()) {
        return TABVAULT_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Session document is not an object");
    }
    json expanded = document;
    StoredSession stored;
    try {
        if (expanded.value("compressed", false) && expanded.contains("payload")) {
            const auto& packed = expanded["payload"].get_binary();
            size_t original_size = expanded.value("payloadSize", static_cast<size_t>(0));
            CompressionType codec = compressionTypeFromString(expanded.value("codec", std::string("zstd")));
            std::vector<uint8_t> raw = CompressionManager::decompress(packed.data(), packed.size(), original_size, codec);
            json body = json::from_cbor(raw);
            for (auto& item : body.items()) {
                expanded[item.key()] = std::move(item.value());
            }
            expanded.erase("payload");
            expanded.erase("payloadSize");
            expanded.erase("codec");
        }
        if (expanded.contains("hosts")) {
            auto hosts = expanded["hosts"].get<std::vector<std::string>>();
            if (expanded.contains("tabs") && expanded["tabs"].is_array()) {
                restoreHosts(expanded["tabs"], hosts);
            }
            expanded.erase("hosts");
        }
        stored = expanded.get<StoredSession>();
    } catch (const json::exception& e) {
        return TABVAULT_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Malformed session document")
            .withDetails(e.what());
    } catch (const std::runtime_error& e) {
        return TABVAULT_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Cannot decompress session payload")
            .withDetails(e.what());
    }

    if (config_.preserve_metadata) {
        std::string actual = checksumOf(stored.session);
        if (actual != stored.checksum) {
            LOG_WARN("[Serializer] Checksum mismatch for session {} (stored {}, computed {})",
                     stored.session.id, stored.checksum, actual);
            stored.is_valid = false;
        }
    }
    return stored;
}

Session SessionDataSerializer::deserializeSession(const StoredSession& stored) const {
    return stored.session;
}

// --- Tabs, events, boundaries ---

StoredTab SessionDataSerializer::serializeTab(const Tab& tab, const std::string& session_id) const {
    StoredTab stored;
    stored.tab = tab;
    stored.session_id = session_id;
    stored.domain = domainOrUnknown(tab.url);
    stored.version = kInitialRecordVersion;
    stored.last_modified = clock_();
    stored.checksum = checksumOf(tab);
    return stored;
}

StoredNavigationEvent SessionDataSerializer::serializeNavigationEvent(const NavigationEvent& event,
                                                                      const std::string& session_id,
                                                                      const std::optional<std::string>& batch_id) const {
    StoredNavigationEvent stored;
    stored.event = event;
    stored.session_id = session_id;
    stored.domain = domainOrUnknown(event.url);
    stored.version = kInitialRecordVersion;
    stored.batch_id = batch_id;
    stored.checksum = checksumOf(event);
    return stored;
}

StoredSessionBoundary SessionDataSerializer::serializeBoundary(const SessionBoundary& boundary) const {
    StoredSessionBoundary stored;
    stored.boundary = boundary;
    stored.tab_count = boundary.metadata.tabs_involved
        ? static_cast<int64_t>(boundary.metadata.tabs_involved->size()) : 0;
    stored.window_count = boundary.metadata.windows_involved
        ? static_cast<int64_t>(boundary.metadata.windows_involved->size()) : 0;
    stored.version = kInitialRecordVersion;
    stored.checksum = checksumOf(boundary);
    return stored;
}

namespace {

template<typename Stored, typename Semantic>
storage::Result<Stored> decodePlain(const json& document, const char* kind, bool verify,
                                    const SessionDataSerializer& serializer,
                                    Semantic (*semantic)(const Stored&),
                                    std::string (*entity_id)(const Stored&)) {
    Stored stored;
    try {
        stored = document.get<Stored>();
    } catch (const json::exception& e) {
        return TABVAULT_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, std::string("Malformed ") + kind + " document")
            .withDetails(e.what());
    }
    if (verify) {
        std::string actual = serializer.checksumOf(semantic(stored));
        if (actual != stored.checksum) {
            LOG_WARN("[Serializer] Checksum mismatch for {} {} (stored {}, computed {})",
                     kind, entity_id(stored), stored.checksum, actual);
        }
    }
    return stored;
}

const Tab& tabOf(const StoredTab& stored) { return stored.tab; }
std::string tabId(const StoredTab& stored) { return std::to_string(stored.tab.id); }
const NavigationEvent& eventOf(const StoredNavigationEvent& stored) { return stored.event; }
std::string eventId(const StoredNavigationEvent& stored) {
    return navigationEventEntityId(stored.event.tab_id, stored.event.timestamp);
}
const SessionBoundary& boundaryOf(const StoredSessionBoundary& stored) { return stored.boundary; }
std::string boundaryId(const StoredSessionBoundary& stored) { return stored.boundary.id; }

} // namespace

storage::Result<StoredTab> SessionDataSerializer::decodeTab(const json& document) const {
    return decodePlain<StoredTab, const Tab&>(document, "tab", config_.preserve_metadata, *this, &tabOf, &tabId);
}

storage::Result<StoredNavigationEvent> SessionDataSerializer::decodeNavigationEvent(const json& document) const {
    return decodePlain<StoredNavigationEvent, const NavigationEvent&>(
        document, "navigation event", config_.preserve_metadata, *this, &eventOf, &eventId);
}

storage::Result<StoredSessionBoundary> SessionDataSerializer::decodeBoundary(const json& document) const {
    return decodePlain<StoredSessionBoundary, const SessionBoundary&>(
        document, "boundary", config_.preserve_metadata, *this, &boundaryOf, &boundaryId);
}

Tab SessionDataSerializer::deserializeTab(const StoredTab& stored) const {
    return stored.tab;
}

NavigationEvent SessionDataSerializer::deserializeNavigationEvent(const StoredNavigationEvent& stored) const {
    return stored.event;
}

SessionBoundary SessionDataSerializer::deserializeBoundary(const StoredSessionBoundary& stored) const {
    return stored.boundary;
}

// --- Batches ---

std::vector<StoredSession> SessionDataSerializer::serializeSessions(const std::vector<Session>& sessions) const {
    std::vector<StoredSession> out;
    out.reserve(sessions.size());
    for (const auto& session : sessions) {
        try {
            out.push_back(serializeSession(session));
        } catch (const std::exception& e) {
            LOG_ERROR("[Serializer] Skipping session {} in batch: {}", session.id, e.what());
        }
    }
    return out;
}

std::vector<StoredSession> SessionDataSerializer::decodeSessions(const std::vector<json>& documents) const {
    std::vector<StoredSession> out;
    out.reserve(documents.size());
    for (const auto& document : documents) {
        auto decoded = decodeSession(document);
        if (!decoded.isOk()) {
            LOG_ERROR("[Serializer] Skipping undecodable session document: {}", decoded.error().toString());
            continue;
        }
        out.push_back(std::move(decoded).value());
    }
    return out;
}

// --- Checksums ---

std::string SessionDataSerializer::checksumOf(const Session& session) const {
    return checksum_->digestJson(semanticFields(session));
}

std::string SessionDataSerializer::checksumOf(const Tab& tab) const {
    return checksum_->digestJson(semanticFields(tab));
}

std::string SessionDataSerializer::checksumOf(const NavigationEvent& event) const {
    return checksum_->digestJson(semanticFields(event));
}

std::string SessionDataSerializer::checksumOf(const SessionBoundary& boundary) const {
    return checksum_->digestJson(semanticFields(boundary));
}

CompressionStats SessionDataSerializer::getCompressionStats(const Session& session) const {
    Session subject = config_.enable_optimization ? optimizeSession(session, clock_()) : session;
    json body = {{"tabs", subject.tabs}, {"windowIds", subject.window_ids}, {"metadata", subject.metadata}};
    std::vector<uint8_t> raw = json::to_cbor(body);

    CompressionStats stats;
    stats.original_size = raw.size();
    stats.compressed_size = raw.size();
    auto start = std::chrono::steady_clock::now();
    try {
        CompressionType type = config_.compression_type == CompressionType::NONE ? CompressionType::ZSTD
                                                                                  : config_.compression_type;
        stats.compressed_size = CompressionManager::compress(raw.data(), raw.size(), type,
                                                             config_.compression_level).size();
    } catch (const std::runtime_error& e) {
        LOG_WARN("[Serializer] Compression stats unavailable for session {}: {}", session.id, e.what());
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    stats.time_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    stats.ratio = raw.empty() ? 1.0 : static_cast<double>(stats.compressed_size) / static_cast<double>(raw.size());
    return stats;
}

std::string SessionDataSerializer::calculateSecureHash(const std::string& data) const {
    return Sha256Checksum().digest(data);
}

} // namespace tabvault
