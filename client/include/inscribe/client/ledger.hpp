/**
 * Inscribe - Ledger access used by the upload and retrieval pipelines.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "inscribe/protocol.hpp"
#include "inscribe/types.hpp"
#include "inscribe/wire.hpp"

namespace inscribe::client
{

    struct SignatureStatus
    {
        protocol::Commitment commitment{protocol::Commitment::Processed};
        std::optional<std::string> error;
    };

    struct SimulationResult
    {
        bool ok{};
        std::optional<std::string> error;
        std::vector<std::string> logs;
    };

    struct HistoricalTransaction
    {
        std::string signature;
        wire::Message message;
    };

    // Network failures surface as InscribeError(TransportError); a node that
    // rejects a submission raises InscribeError(ChunkDispatchFailed) with the
    // node's message text.
    class LedgerClient
    {
    public:
        virtual ~LedgerClient() = default;

        // Most signatures a node answers in one status query.
        static constexpr std::size_t kStatusQueryLimit = 256;

        virtual wire::Blockhash latest_blockhash() = 0;

        // Returns the base58 signature the ledger will track the transaction by.
        virtual std::string submit_transaction(const Bytes &signed_transaction) = 0;

        virtual SimulationResult simulate_transaction(const Bytes &signed_transaction) = 0;

        // One batched query; nullopt where the ledger has not seen the signature.
        virtual std::vector<std::optional<SignatureStatus>> signature_statuses(const std::vector<std::string> &signatures) = 0;

        virtual std::optional<Bytes> account_info(const PublicKey &address) = 0;

        virtual std::vector<HistoricalTransaction> transaction_history(const PublicKey &address) = 0;
    };

} // namespace inscribe::client
