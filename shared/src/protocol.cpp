#include "inscribe/protocol.hpp"

#include <array>

#include "inscribe/error_codes.hpp"

namespace inscribe::protocol
{

    namespace
    {

        struct StrategyMapping
        {
            DispatchStrategy strategy;
            std::string_view label;
        };

        constexpr std::array<StrategyMapping, 3> kStrategyMappings{{
            {DispatchStrategy::BatchedParallel, "batched"},
            {DispatchStrategy::Sequential, "sequential"},
            {DispatchStrategy::FireAndForget, "fire-and-forget"},
        }};

        struct CommitmentMapping
        {
            Commitment commitment;
            std::string_view label;
        };

        constexpr std::array<CommitmentMapping, 3> kCommitmentMappings{{
            {Commitment::Processed, "processed"},
            {Commitment::Confirmed, "confirmed"},
            {Commitment::Finalized, "finalized"},
        }};

        layout::SessionStatus parse_status(const std::string &value)
        {
            // The service reports an open session as "pending".
            if (value == "pending")
            {
                return layout::SessionStatus::Active;
            }
            if (auto status = layout::session_status_from_string(value))
            {
                return *status;
            }
            throw InscribeError(ErrorCode::InvalidPayload, "Unknown session status: " + value);
        }

    } // namespace

    std::string_view to_string(DispatchStrategy strategy) noexcept
    {
        for (const auto &mapping : kStrategyMappings)
        {
            if (mapping.strategy == strategy)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<DispatchStrategy> dispatch_strategy_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStrategyMappings)
        {
            if (mapping.label == value)
            {
                return mapping.strategy;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(Commitment commitment) noexcept
    {
        for (const auto &mapping : kCommitmentMappings)
        {
            if (mapping.commitment == commitment)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<Commitment> commitment_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommitmentMappings)
        {
            if (mapping.label == value)
            {
                return mapping.commitment;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const SessionRequest &request)
    {
        json = {
            {"pubkey", request.owner},
            {"chunks", request.chunks},
            {"chunkSize", request.chunk_size},
            {"method", request.method},
            {"totalChunks", request.total_chunks},
            {"contentDigest", request.content_digest},
        };
    }

    void from_json(const nlohmann::json &json, SessionRequest &request)
    {
        request.owner = json.at("pubkey").get<std::string>();
        request.chunks = json.value("chunks", std::vector<std::string>{});
        request.chunk_size = json.value("chunkSize", 0ULL);
        request.method = json.value("method", static_cast<std::uint8_t>(0));
        request.total_chunks = json.value("totalChunks", 0U);
        request.content_digest = json.value("contentDigest", std::string{});
    }

    void to_json(nlohmann::json &json, const SessionResponse &response)
    {
        json = {
            {"sessionId", response.session_id},
            {"createSessionTransaction", response.create_session_tx},
            {"chunkTransactions", response.chunk_txs},
            {"finalizeTransaction", response.finalize_tx},
            {"merkleRoot", response.content_digest},
            {"totalChunks", response.total_chunks},
            {"uploadType", response.upload_type},
        };
        if (response.session_handle)
        {
            json["sessionPubkey"] = *response.session_handle;
        }
        if (response.init_storage_tx)
        {
            json["initStorageTransaction"] = *response.init_storage_tx;
        }
    }

    void from_json(const nlohmann::json &json, SessionResponse &response)
    {
        response.session_id = json.at("sessionId").get<std::string>();
        response.create_session_tx = json.at("createSessionTransaction").get<std::string>();
        response.chunk_txs = json.at("chunkTransactions").get<std::vector<std::string>>();
        response.finalize_tx = json.at("finalizeTransaction").get<std::string>();
        response.content_digest = json.value("merkleRoot", std::string{});
        response.total_chunks = json.value("totalChunks", 0U);
        response.upload_type = json.value("uploadType", std::string{});
        if (auto it = json.find("sessionPubkey"); it != json.end() && it->is_string())
        {
            response.session_handle = it->get<std::string>();
        }
        else
        {
            response.session_handle.reset();
        }
        if (auto it = json.find("initStorageTransaction"); it != json.end() && it->is_string())
        {
            response.init_storage_tx = it->get<std::string>();
        }
        else
        {
            response.init_storage_tx.reset();
        }
    }

    void to_json(nlohmann::json &json, const SessionMetadata &metadata)
    {
        json = {
            {"owner", metadata.owner},
            {"sessionId", metadata.session_id},
            {"totalChunks", metadata.total_chunks},
            {"status", metadata.status == layout::SessionStatus::Finalized ? "finalized" : "pending"},
            {"merkleRoot", metadata.content_digest},
        };
        if (metadata.storage_account)
        {
            json["storageAccount"] = *metadata.storage_account;
        }
    }

    void from_json(const nlohmann::json &json, SessionMetadata &metadata)
    {
        metadata.owner = json.value("owner", std::string{});
        metadata.session_id = json.value("sessionId", std::string{});
        metadata.total_chunks = json.at("totalChunks").get<std::uint32_t>();
        metadata.status = parse_status(json.value("status", std::string{"pending"}));
        metadata.content_digest = json.value("merkleRoot", std::string{});
        if (auto it = json.find("storageAccount"); it != json.end() && it->is_string())
        {
            metadata.storage_account = it->get<std::string>();
        }
        else
        {
            metadata.storage_account.reset();
        }
    }

} // namespace inscribe::protocol
