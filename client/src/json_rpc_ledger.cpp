#include "inscribe/client/json_rpc_ledger.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "inscribe/address.hpp"
#include "inscribe/encoding/base58.hpp"
#include "inscribe/encoding/base64.hpp"
#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    namespace
    {

        Bytes decode_account_data(const nlohmann::json &data)
        {
            // [payload, "base64"]
            if (!data.is_array() || data.empty() || !data.front().is_string())
            {
                throw InscribeError(ErrorCode::InvalidPayload, "Unexpected account data encoding");
            }
            auto bytes = encoding::decode_base64(data.front().get<std::string>());
            if (!bytes)
            {
                throw InscribeError(ErrorCode::InvalidPayload, "Account data is not valid base64");
            }
            return std::move(*bytes);
        }

        std::string describe_error(const nlohmann::json &error)
        {
            return error.is_string() ? error.get<std::string>() : error.dump();
        }

    } // namespace

    JsonRpcLedgerClient::JsonRpcLedgerClient(HttpClient &http, std::string endpoint, protocol::Commitment commitment)
        : http_(http), endpoint_(std::move(endpoint)), commitment_(commitment)
    {
    }

    nlohmann::json JsonRpcLedgerClient::call(const std::string &method, nlohmann::json params)
    {
        const nlohmann::json request = {
            {"jsonrpc", "2.0"},
            {"id", next_id_.fetch_add(1)},
            {"method", method},
            {"params", std::move(params)},
        };
        const auto response = http_.post_json(endpoint_, request.dump());
        if (!response.ok())
        {
            throw InscribeError(ErrorCode::TransportError,
                                method + " returned HTTP " + std::to_string(response.status));
        }

        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(response.body);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw InscribeError(ErrorCode::TransportError, method + " returned malformed JSON: " + ex.what());
        }
        if (auto it = json.find("error"); it != json.end() && !it->is_null())
        {
            const auto message = it->value("message", std::string{"unknown error"});
            std::string detail;
            if (auto data = it->find("data"); data != it->end() && !data->is_null())
            {
                detail = " " + data->dump();
            }
            throw InscribeError(method == "sendTransaction" ? ErrorCode::ChunkDispatchFailed : ErrorCode::TransportError,
                                method + " failed: " + message + detail);
        }
        return json.value("result", nlohmann::json{});
    }

    wire::Blockhash JsonRpcLedgerClient::latest_blockhash()
    {
        const auto result = call("getLatestBlockhash", nlohmann::json::array({{{"commitment", std::string(to_string(commitment_))}}}));
        const auto text = result.at("value").at("blockhash").get<std::string>();
        return address::parse_public_key(text);
    }

    std::string JsonRpcLedgerClient::submit_transaction(const Bytes &signed_transaction)
    {
        const auto result = call("sendTransaction",
                                 nlohmann::json::array({encoding::encode_base64(signed_transaction),
                                                        {{"encoding", "base64"},
                                                         {"preflightCommitment", std::string(to_string(commitment_))}}}));
        if (!result.is_string())
        {
            throw InscribeError(ErrorCode::ChunkDispatchFailed, "sendTransaction returned no signature");
        }
        return result.get<std::string>();
    }

    SimulationResult JsonRpcLedgerClient::simulate_transaction(const Bytes &signed_transaction)
    {
        const auto result = call("simulateTransaction",
                                 nlohmann::json::array({encoding::encode_base64(signed_transaction),
                                                        {{"encoding", "base64"},
                                                         {"commitment", std::string(to_string(commitment_))},
                                                         {"replaceRecentBlockhash", true},
                                                         {"sigVerify", false}}}));
        SimulationResult simulation;
        const auto &value = result.at("value");
        if (auto logs = value.find("logs"); logs != value.end() && logs->is_array())
        {
            simulation.logs = logs->get<std::vector<std::string>>();
        }
        if (auto err = value.find("err"); err != value.end() && !err->is_null())
        {
            simulation.error = describe_error(*err);
        }
        simulation.ok = !simulation.error.has_value();
        return simulation;
    }

    std::vector<std::optional<SignatureStatus>> JsonRpcLedgerClient::signature_statuses(
        const std::vector<std::string> &signatures)
    {
        std::vector<std::optional<SignatureStatus>> statuses;
        statuses.reserve(signatures.size());
        // The node caps one query at kStatusQueryLimit signatures.
        for (std::size_t offset = 0; offset < signatures.size(); offset += kStatusQueryLimit)
        {
            const auto end = std::min(signatures.size(), offset + kStatusQueryLimit);
            const std::vector<std::string> slice(signatures.begin() + static_cast<std::ptrdiff_t>(offset),
                                                 signatures.begin() + static_cast<std::ptrdiff_t>(end));
            const auto result = call("getSignatureStatuses",
                                     nlohmann::json::array({slice, {{"searchTransactionHistory", true}}}));
            const auto &values = result.at("value");
            for (std::size_t i = 0; i < slice.size(); ++i)
            {
                if (i >= values.size() || values[i].is_null())
                {
                    statuses.emplace_back(std::nullopt);
                    continue;
                }
                const auto &entry = values[i];
                SignatureStatus status;
                if (auto level = entry.find("confirmationStatus"); level != entry.end() && level->is_string())
                {
                    status.commitment = protocol::commitment_from_string(level->get<std::string>())
                                            .value_or(protocol::Commitment::Processed);
                }
                if (auto err = entry.find("err"); err != entry.end() && !err->is_null())
                {
                    status.error = describe_error(*err);
                }
                statuses.emplace_back(std::move(status));
            }
        }
        return statuses;
    }

    std::optional<Bytes> JsonRpcLedgerClient::account_info(const PublicKey &address)
    {
        const auto result = call("getAccountInfo",
                                 nlohmann::json::array({address::to_base58(address),
                                                        {{"encoding", "base64"}, {"commitment", std::string(to_string(commitment_))}}}));
        const auto &value = result.at("value");
        if (value.is_null())
        {
            return std::nullopt;
        }
        return decode_account_data(value.at("data"));
    }

    std::vector<HistoricalTransaction> JsonRpcLedgerClient::transaction_history(const PublicKey &address)
    {
        std::vector<std::string> signatures;
        std::optional<std::string> before;
        while (true)
        {
            nlohmann::json options = {{"limit", kHistoryPageSize}, {"commitment", std::string(to_string(commitment_))}};
            if (before)
            {
                options["before"] = *before;
            }
            const auto page = call("getSignaturesForAddress",
                                   nlohmann::json::array({address::to_base58(address), options}));
            for (const auto &entry : page)
            {
                if (auto err = entry.find("err"); err != entry.end() && !err->is_null())
                {
                    continue;
                }
                signatures.push_back(entry.at("signature").get<std::string>());
            }
            if (page.size() < kHistoryPageSize)
            {
                break;
            }
            before = page.back().at("signature").get<std::string>();
        }
        spdlog::debug("History for {} lists {} successful transaction(s)", address::to_base58(address), signatures.size());

        std::vector<HistoricalTransaction> history;
        history.reserve(signatures.size());
        for (const auto &signature : signatures)
        {
            const auto result = call("getTransaction",
                                     nlohmann::json::array({signature,
                                                            {{"encoding", "base64"},
                                                             {"commitment", std::string(to_string(commitment_))},
                                                             {"maxSupportedTransactionVersion", 0}}}));
            if (result.is_null())
            {
                continue;
            }
            const auto raw = decode_account_data(result.at("transaction"));
            try
            {
                history.push_back(HistoricalTransaction{signature, wire::parse_transaction(raw).message});
            }
            catch (const InscribeError &ex)
            {
                spdlog::debug("Skipping transaction {}: {}", signature, ex.what());
            }
        }
        return history;
    }

} // namespace inscribe::client
