/**
 * Inscribe - Where a retrieval gets its metadata and chunk bytes from.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "inscribe/client/ledger.hpp"
#include "inscribe/client/session_service.hpp"
#include "inscribe/codec.hpp"
#include "inscribe/protocol.hpp"

namespace inscribe::client
{

    class MetadataSource
    {
    public:
        virtual ~MetadataSource() = default;

        // Throws InscribeError(SessionNotFound) or (TransportError).
        virtual protocol::SessionMetadata fetch(const std::string &session_handle) = 0;
    };

    class ServiceMetadataSource : public MetadataSource
    {
    public:
        explicit ServiceMetadataSource(SessionService &service);

        protocol::SessionMetadata fetch(const std::string &session_handle) override;

    private:
        SessionService &service_;
    };

    // Reads and decodes the session account directly.
    class LedgerMetadataSource : public MetadataSource
    {
    public:
        explicit LedgerMetadataSource(LedgerClient &ledger);

        protocol::SessionMetadata fetch(const std::string &session_handle) override;

    private:
        LedgerClient &ledger_;
    };

    struct AcquiredChunks
    {
        std::vector<codec::Chunk> chunks;
        // Set when the source returns the already concatenated stream.
        std::optional<Bytes> assembled;
    };

    class ChunkSource
    {
    public:
        virtual ~ChunkSource() = default;

        virtual std::string_view name() const = 0;

        // True when acquire() yields individual indexed chunks.
        virtual bool yields_chunks() const noexcept { return false; }

        virtual AcquiredChunks acquire(const std::string &session_handle, const protocol::SessionMetadata &metadata) = 0;
    };

    class ServiceDownloadSource : public ChunkSource
    {
    public:
        explicit ServiceDownloadSource(SessionService &service);

        std::string_view name() const override { return "service-download"; }
        AcquiredChunks acquire(const std::string &session_handle, const protocol::SessionMetadata &metadata) override;

    private:
        SessionService &service_;
    };

    // Scans the session account's transaction history for chunk instructions
    // of the storage program. Chunks come back in history order.
    class HistoryScanSource : public ChunkSource
    {
    public:
        HistoryScanSource(LedgerClient &ledger, const PublicKey &program_id);

        std::string_view name() const override { return "history-scan"; }
        bool yields_chunks() const noexcept override { return true; }
        AcquiredChunks acquire(const std::string &session_handle, const protocol::SessionMetadata &metadata) override;

    private:
        LedgerClient &ledger_;
        PublicKey program_id_;
    };

} // namespace inscribe::client
