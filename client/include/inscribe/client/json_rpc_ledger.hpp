#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "inscribe/client/http_client.hpp"
#include "inscribe/client/ledger.hpp"

namespace inscribe::client
{

    // LedgerClient speaking the node's JSON-RPC 2.0 interface over HTTP.
    class JsonRpcLedgerClient : public LedgerClient
    {
    public:
        JsonRpcLedgerClient(HttpClient &http, std::string endpoint,
                            protocol::Commitment commitment = protocol::Commitment::Confirmed);

        wire::Blockhash latest_blockhash() override;
        std::string submit_transaction(const Bytes &signed_transaction) override;
        SimulationResult simulate_transaction(const Bytes &signed_transaction) override;
        std::vector<std::optional<SignatureStatus>> signature_statuses(const std::vector<std::string> &signatures) override;
        std::optional<Bytes> account_info(const PublicKey &address) override;
        std::vector<HistoricalTransaction> transaction_history(const PublicKey &address) override;

        static constexpr std::size_t kHistoryPageSize = 1000;

    private:
        nlohmann::json call(const std::string &method, nlohmann::json params);

        HttpClient &http_;
        std::string endpoint_;
        protocol::Commitment commitment_;
        std::atomic<std::uint64_t> next_id_{1};
    };

} // namespace inscribe::client
