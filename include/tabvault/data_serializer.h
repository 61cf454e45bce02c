// @include/tabvault/data_serializer.h
#pragma once

#include "checksum.h"
#include "config.h"
#include "record_codec.h"
#include "storage_error/result.h"
#include "types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabvault {

struct CompressionStats {
    size_t original_size = 0;
    size_t compressed_size = 0;
    double ratio = 1.0;       // compressed / original
    double time_ms = 0.0;
};

// A stored session together with the document persisted for it
struct EncodedSession {
    StoredSession stored;
    json document;
};

/**
 * @brief Maps domain records to stored records and persisted documents, and back.
 *
 * Sessions are the only record kind with a variable-size body; their tabs,
 * window ids and metadata may be host-tokenized and compressed in the persisted
 * document. The other kinds persist as their plain JSON form.
 */
class SessionDataSerializer {
public:
    explicit SessionDataSerializer(SerializerConfig config = {},
                                   std::shared_ptr<const ChecksumAlgorithm> checksum = nullptr,
                                   ClockFn clock = systemNowMs);

    // --- Domain -> stored ---
    EncodedSession encodeSession(const Session& session) const;
    // Re-encodes a patched session, carrying the envelope of the previous revision
    EncodedSession reencodeSession(const StoredSession& previous, const Session& updated) const;
    StoredSession serializeSession(const Session& session) const { return encodeSession(session).stored; }

    StoredTab serializeTab(const Tab& tab, const std::string& session_id) const;
    StoredNavigationEvent serializeNavigationEvent(const NavigationEvent& event, const std::string& session_id,
                                                   const std::optional<std::string>& batch_id = std::nullopt) const;
    StoredSessionBoundary serializeBoundary(const SessionBoundary& boundary) const;

    // --- Stored -> persisted document ---
    json toDocument(const StoredTab& stored) const { return json(stored); }
    json toDocument(const StoredNavigationEvent& stored) const { return json(stored); }
    json toDocument(const StoredSessionBoundary& stored) const { return json(stored); }
    // Recomputes the session encoding (size and compressed flag are restamped)
    json toDocument(StoredSession& stored) const;

    // --- Persisted document -> stored (checksum drift is logged, never thrown) ---
    storage::Result<StoredSession> decodeSession(const json& document) const;
    storage::Result<StoredTab> decodeTab(const json& document) const;
    storage::Result<StoredNavigationEvent> decodeNavigationEvent(const json& document) const;
    storage::Result<StoredSessionBoundary> decodeBoundary(const json& document) const;

    // --- Stored -> domain ---
    Session deserializeSession(const StoredSession& stored) const;
    Tab deserializeTab(const StoredTab& stored) const;
    NavigationEvent deserializeNavigationEvent(const StoredNavigationEvent& stored) const;
    SessionBoundary deserializeBoundary(const StoredSessionBoundary& stored) const;

    // Batch variants skip records that fail and log them
    std::vector<StoredSession> serializeSessions(const std::vector<Session>& sessions) const;
    std::vector<StoredSession> decodeSessions(const std::vector<json>& documents) const;

    // --- Checksums over semantic fields ---
    std::string checksumOf(const Session& session) const;
    std::string checksumOf(const Tab& tab) const;
    std::string checksumOf(const NavigationEvent& event) const;
    std::string checksumOf(const SessionBoundary& boundary) const;

    // Recomputes a stored record's checksum in place (used by repairs)
    void restampChecksum(StoredSession& stored) const { stored.checksum = checksumOf(stored.session); stored.is_valid = true; }
    void restampChecksum(StoredTab& stored) const { stored.checksum = checksumOf(stored.tab); }
    void restampChecksum(StoredNavigationEvent& stored) const { stored.checksum = checksumOf(stored.event); }
    void restampChecksum(StoredSessionBoundary& stored) const { stored.checksum = checksumOf(stored.boundary); }

    CompressionStats getCompressionStats(const Session& session) const;

    // SHA-256 hex digest regardless of the configured record checksum
    std::string calculateSecureHash(const std::string& data) const;

    const SerializerConfig& config() const { return config_; }
    const ChecksumAlgorithm& checksumAlgorithm() const { return *checksum_; }
    std::shared_ptr<const ChecksumAlgorithm> sharedChecksum() const { return checksum_; }

private:
    Session optimizeSession(const Session& session, Timestamp now) const;
    static std::vector<std::string> deriveDomains(const Session& session);
    void finishEnvelope(StoredSession& stored, Timestamp now) const;

    SerializerConfig config_;
    std::shared_ptr<const ChecksumAlgorithm> checksum_;
    ClockFn clock_;
};

} // namespace tabvault
