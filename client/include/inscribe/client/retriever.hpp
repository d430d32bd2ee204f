/**
 * Inscribe - Retrieval and reconstruction of a stored payload.
 *
 * FetchMetadata -> (wait while not finalized) -> AcquireChunks ->
 * Reassemble -> VerifyDigest -> Decode. Chunk order always comes from the
 * index inside each chunk instruction, never from arrival order.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "inscribe/client/chunk_source.hpp"
#include "inscribe/client/config.hpp"
#include "inscribe/client/payload_cache.hpp"
#include "inscribe/codec.hpp"
#include "inscribe/protocol.hpp"

namespace inscribe::client
{

    struct RetrievalResult
    {
        Bytes data;
        std::size_t encoded_size{};
        std::uint32_t declared_chunks{};
        std::size_t observed_chunks{};
        protocol::SessionMetadata metadata;
        std::vector<std::string> warnings;
        std::string source;
        bool digest_verified{};
        bool from_cache{};
        std::size_t metadata_attempts{};
    };

    struct SessionProgress
    {
        protocol::SessionMetadata metadata;
        bool finalized{};
        std::optional<std::size_t> chunks_observed;
    };

    struct Reassembly
    {
        Bytes stream;
        std::size_t observed_chunks{};
        std::vector<std::string> warnings;
    };

    // Sorts by index, keeps the first chunk seen for a duplicated index and
    // reports gaps or a count that differs from the declared one.
    Reassembly reassemble(std::vector<codec::Chunk> chunks, std::uint32_t declared_chunks);

    class Retriever
    {
    public:
        Retriever(MetadataSource &metadata, ChunkSource &primary, RetrievalSettings settings);

        // Used when the primary source is unreachable.
        void set_fallback(ChunkSource *fallback) noexcept { fallback_ = fallback; }
        void set_cache(PayloadCache *cache) noexcept { cache_ = cache; }

        RetrievalResult retrieve(const std::string &session_handle);

        // Metadata and, when a history source is configured, the number of
        // chunks already on the ledger. Never reconstructs.
        SessionProgress status(const std::string &session_handle);

    private:
        protocol::SessionMetadata wait_for_finalized(const std::string &session_handle, std::size_t &attempts);
        AcquiredChunks acquire(const std::string &session_handle, const protocol::SessionMetadata &metadata,
                               std::string &source_name, std::vector<std::string> &warnings);

        MetadataSource &metadata_;
        ChunkSource &primary_;
        ChunkSource *fallback_{nullptr};
        PayloadCache *cache_{nullptr};
        RetrievalSettings settings_;
    };

} // namespace inscribe::client
