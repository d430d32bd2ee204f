#include "inscribe/client/retriever.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

#include "inscribe/crypto.hpp"
#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    namespace
    {

        void warn(std::vector<std::string> &warnings, std::string message)
        {
            spdlog::warn("{}", message);
            warnings.push_back(std::move(message));
        }

    } // namespace

    Reassembly reassemble(std::vector<codec::Chunk> chunks, std::uint32_t declared_chunks)
    {
        Reassembly result;
        std::stable_sort(chunks.begin(), chunks.end(), [](const codec::Chunk &a, const codec::Chunk &b)
                         { return a.index < b.index; });

        std::size_t duplicates = 0;
        std::vector<std::uint32_t> gaps;
        std::optional<std::uint32_t> previous;
        for (auto &chunk : chunks)
        {
            if (previous && chunk.index == *previous)
            {
                ++duplicates;
                continue;
            }
            const std::uint32_t expected = previous ? *previous + 1 : 0;
            for (auto missing = expected; missing < chunk.index; ++missing)
            {
                gaps.push_back(missing);
            }
            result.stream.insert(result.stream.end(), chunk.data.begin(), chunk.data.end());
            ++result.observed_chunks;
            previous = chunk.index;
        }

        if (duplicates > 0)
        {
            warn(result.warnings, std::to_string(duplicates) + " duplicate chunk(s) ignored");
        }
        if (!gaps.empty())
        {
            warn(result.warnings, std::to_string(gaps.size()) + " chunk index gap(s), first missing index " +
                                      std::to_string(gaps.front()));
        }
        if (result.observed_chunks != declared_chunks)
        {
            warn(result.warnings, "Chunk count mismatch: session declares " + std::to_string(declared_chunks) +
                                      ", found " + std::to_string(result.observed_chunks));
        }
        return result;
    }

    Retriever::Retriever(MetadataSource &metadata, ChunkSource &primary, RetrievalSettings settings)
        : metadata_(metadata), primary_(primary), settings_(settings)
    {
    }

    protocol::SessionMetadata Retriever::wait_for_finalized(const std::string &session_handle, std::size_t &attempts)
    {
        const auto total_attempts = settings_.max_retries + 1;
        std::string last_problem;
        ErrorCode last_code = ErrorCode::SessionNotFinalized;
        for (attempts = 1; attempts <= total_attempts; ++attempts)
        {
            try
            {
                auto metadata = metadata_.fetch(session_handle);
                if (metadata.status == layout::SessionStatus::Finalized)
                {
                    return metadata;
                }
                last_code = ErrorCode::SessionNotFinalized;
                last_problem = "session is not finalized";
            }
            catch (const InscribeError &ex)
            {
                if (ex.code() != ErrorCode::TransportError)
                {
                    throw;
                }
                last_code = ErrorCode::TransportError;
                last_problem = ex.what();
            }

            if (attempts < total_attempts)
            {
                spdlog::info("Session {} not ready ({}), retrying in {} ms ({}/{})", session_handle, last_problem,
                             settings_.retry_delay.count(), attempts, settings_.max_retries);
                std::this_thread::sleep_for(settings_.retry_delay);
            }
        }
        attempts = total_attempts;
        throw InscribeError(last_code, "Session " + session_handle + " unavailable after " +
                                           std::to_string(total_attempts) + " attempt(s): " + last_problem);
    }

    AcquiredChunks Retriever::acquire(const std::string &session_handle, const protocol::SessionMetadata &metadata,
                                      std::string &source_name, std::vector<std::string> &warnings)
    {
        try
        {
            source_name = std::string(primary_.name());
            return primary_.acquire(session_handle, metadata);
        }
        catch (const InscribeError &ex)
        {
            const bool recoverable = ex.code() == ErrorCode::TransportError || ex.code() == ErrorCode::Unsupported;
            if (!fallback_ || !recoverable)
            {
                throw;
            }
            warn(warnings, std::string(primary_.name()) + " failed, falling back to " + std::string(fallback_->name()) +
                               ": " + ex.what());
        }
        source_name = std::string(fallback_->name());
        return fallback_->acquire(session_handle, metadata);
    }

    RetrievalResult Retriever::retrieve(const std::string &session_handle)
    {
        RetrievalResult result;
        result.metadata = wait_for_finalized(session_handle, result.metadata_attempts);
        result.declared_chunks = result.metadata.total_chunks;

        if (cache_)
        {
            if (auto cached = cache_->get(session_handle))
            {
                spdlog::debug("Serving {} from cache", session_handle);
                result.data = std::move(*cached);
                result.from_cache = true;
                result.source = "cache";
                result.digest_verified = true;
                return result;
            }
        }

        auto acquired = acquire(session_handle, result.metadata, result.source, result.warnings);
        Bytes stream;
        if (acquired.assembled)
        {
            stream = std::move(*acquired.assembled);
            result.observed_chunks = result.declared_chunks;
        }
        else
        {
            auto reassembly = reassemble(std::move(acquired.chunks), result.declared_chunks);
            stream = std::move(reassembly.stream);
            result.observed_chunks = reassembly.observed_chunks;
            result.warnings.insert(result.warnings.end(), reassembly.warnings.begin(), reassembly.warnings.end());
        }
        if (stream.empty())
        {
            throw InscribeError(ErrorCode::ChunkCountMismatch, "No chunk data found for session " + session_handle);
        }
        result.encoded_size = stream.size();

        if (!result.metadata.content_digest.empty())
        {
            const auto actual = crypto::to_hex(crypto::sha256(stream));
            result.digest_verified = actual == result.metadata.content_digest;
            if (!result.digest_verified)
            {
                const auto message = "Digest mismatch for session " + session_handle + ": expected " +
                                     result.metadata.content_digest + ", computed " + actual;
                if (settings_.strict_digest)
                {
                    throw InscribeError(ErrorCode::DigestMismatch, message);
                }
                warn(result.warnings, message);
            }
        }
        else
        {
            warn(result.warnings, "Session " + session_handle + " carries no digest, integrity not verified");
        }

        auto decoded = codec::decode(stream, codec::DecodeOptions{.legacy_detection = settings_.legacy_detection});
        result.data = std::move(decoded.data);
        if (cache_ && result.digest_verified)
        {
            cache_->put(session_handle, result.data);
        }
        spdlog::info("Reconstructed {} byte(s) from {} chunk(s) of session {} via {}", result.data.size(),
                     result.observed_chunks, session_handle, result.source);
        return result;
    }

    SessionProgress Retriever::status(const std::string &session_handle)
    {
        SessionProgress progress;
        progress.metadata = metadata_.fetch(session_handle);
        progress.finalized = progress.metadata.status == layout::SessionStatus::Finalized;

        ChunkSource *history = nullptr;
        if (primary_.yields_chunks())
        {
            history = &primary_;
        }
        else if (fallback_ && fallback_->yields_chunks())
        {
            history = fallback_;
        }
        if (history)
        {
            auto acquired = history->acquire(session_handle, progress.metadata);
            std::vector<std::uint32_t> indices;
            for (const auto &chunk : acquired.chunks)
            {
                indices.push_back(chunk.index);
            }
            std::sort(indices.begin(), indices.end());
            indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
            progress.chunks_observed = indices.size();
        }
        return progress;
    }

} // namespace inscribe::client
