/**
 * Inscribe - Session service schema, ledger commitment levels and dispatch
 * strategy names, with their JSON serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "inscribe/layout.hpp"

namespace inscribe::protocol
{

    enum class DispatchStrategy : std::uint8_t
    {
        BatchedParallel,
        Sequential,
        FireAndForget
    };

    std::string_view to_string(DispatchStrategy strategy) noexcept;
    std::optional<DispatchStrategy> dispatch_strategy_from_string(std::string_view value) noexcept;

    enum class Commitment : std::uint8_t
    {
        Processed = 0,
        Confirmed = 1,
        Finalized = 2
    };

    std::string_view to_string(Commitment commitment) noexcept;
    std::optional<Commitment> commitment_from_string(std::string_view value) noexcept;

    constexpr bool meets(Commitment actual, Commitment required) noexcept
    {
        return static_cast<std::uint8_t>(actual) >= static_cast<std::uint8_t>(required);
    }

    // Body of POST /api/v2/inscribe/pinocchio.
    struct SessionRequest
    {
        std::string owner;
        std::vector<std::string> chunks; // base64
        std::uint64_t chunk_size{};
        std::uint8_t method{};
        std::uint32_t total_chunks{};
        std::string content_digest; // hex
    };

    void to_json(nlohmann::json &json, const SessionRequest &request);
    void from_json(const nlohmann::json &json, SessionRequest &request);

    // Transactions are base64 serialized and treated as opaque templates.
    struct SessionResponse
    {
        std::string session_id;
        std::optional<std::string> session_handle;
        std::string create_session_tx;
        std::optional<std::string> init_storage_tx;
        std::vector<std::string> chunk_txs;
        std::string finalize_tx;
        std::string content_digest;
        std::uint32_t total_chunks{};
        std::string upload_type;
    };

    void to_json(nlohmann::json &json, const SessionResponse &response);
    void from_json(const nlohmann::json &json, SessionResponse &response);

    struct SessionMetadata
    {
        std::string owner;
        std::string session_id;
        std::uint32_t total_chunks{};
        layout::SessionStatus status{layout::SessionStatus::Active};
        std::string content_digest;
        std::optional<std::string> storage_account;
    };

    void to_json(nlohmann::json &json, const SessionMetadata &metadata);
    void from_json(const nlohmann::json &json, SessionMetadata &metadata);

} // namespace inscribe::protocol
