#include "inscribe/client/chunk_source.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "inscribe/address.hpp"
#include "inscribe/crypto.hpp"
#include "inscribe/error_codes.hpp"
#include "inscribe/layout.hpp"

namespace inscribe::client
{

    ServiceMetadataSource::ServiceMetadataSource(SessionService &service) : service_(service)
    {
    }

    protocol::SessionMetadata ServiceMetadataSource::fetch(const std::string &session_handle)
    {
        return service_.session_metadata(session_handle);
    }

    LedgerMetadataSource::LedgerMetadataSource(LedgerClient &ledger) : ledger_(ledger)
    {
    }

    protocol::SessionMetadata LedgerMetadataSource::fetch(const std::string &session_handle)
    {
        const auto data = ledger_.account_info(address::parse_public_key(session_handle));
        if (!data)
        {
            throw InscribeError(ErrorCode::SessionNotFound, "Session account " + session_handle + " does not exist");
        }
        const auto account = layout::decode_session_account(*data);

        protocol::SessionMetadata metadata;
        metadata.owner = address::to_base58(account.owner);
        metadata.session_id = crypto::to_hex(account.session_id);
        metadata.total_chunks = account.total_chunks;
        metadata.status = account.status;
        metadata.content_digest = crypto::to_hex(account.digest);
        return metadata;
    }

    ServiceDownloadSource::ServiceDownloadSource(SessionService &service) : service_(service)
    {
    }

    AcquiredChunks ServiceDownloadSource::acquire(const std::string &session_handle, const protocol::SessionMetadata &)
    {
        AcquiredChunks acquired;
        acquired.assembled = service_.download(session_handle);
        return acquired;
    }

    HistoryScanSource::HistoryScanSource(LedgerClient &ledger, const PublicKey &program_id)
        : ledger_(ledger), program_id_(program_id)
    {
    }

    AcquiredChunks HistoryScanSource::acquire(const std::string &session_handle, const protocol::SessionMetadata &metadata)
    {
        std::optional<SessionId> expected_id;
        if (metadata.session_id.size() == kSessionIdSize * 2)
        {
            try
            {
                const auto bytes = crypto::from_hex(metadata.session_id);
                SessionId id{};
                std::copy(bytes.begin(), bytes.end(), id.begin());
                expected_id = id;
            }
            catch (const InscribeError &)
            {
                spdlog::debug("Session id {} is not hex, scanning without id filter", metadata.session_id);
            }
        }

        AcquiredChunks acquired;
        const auto history = ledger_.transaction_history(address::parse_public_key(session_handle));
        for (const auto &transaction : history)
        {
            for (const auto &data : wire::instruction_data_for_program(transaction.message, program_id_))
            {
                auto instruction = layout::parse_chunk_instruction(data);
                if (!instruction)
                {
                    continue;
                }
                if (expected_id && instruction->session_id != *expected_id)
                {
                    continue;
                }
                acquired.chunks.push_back(codec::Chunk{instruction->chunk_index, std::move(instruction->data)});
            }
        }
        spdlog::info("History scan of {} found {} chunk instruction(s) in {} transaction(s)", session_handle,
                     acquired.chunks.size(), history.size());
        return acquired;
    }

} // namespace inscribe::client
