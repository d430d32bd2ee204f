/**
 * Inscribe - Upload orchestration.
 *
 * encode -> plan session -> initialize storage -> create session ->
 * dispatch and confirm in bounded rounds -> finalize -> publish to index.
 * A call either returns a finalized session or throws; partial progress is
 * left in last_dispatch_log() for diagnostics.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "inscribe/client/config.hpp"
#include "inscribe/client/dispatch_log.hpp"
#include "inscribe/client/ledger.hpp"
#include "inscribe/client/session_backend.hpp"
#include "inscribe/client/session_index.hpp"
#include "inscribe/client/signer.hpp"
#include "inscribe/codec.hpp"

namespace inscribe::client
{

    struct StorageResult
    {
        std::string session_handle;
        SessionId session_id{};
        std::uint32_t chunk_count{};
        // Confirmed chunk signatures in index order, then the finalize signature.
        std::vector<std::string> signatures;
        // Every chunk submission, failed ones included.
        std::vector<DispatchRecord> attempts;
        std::optional<std::string> init_storage_signature;
        std::string create_signature;
        std::string finalize_signature;
        Digest digest{};
        bool compressed{};
        codec::EncodingMethod method{codec::EncodingMethod::Raw};
        std::size_t original_size{};
        std::size_t encoded_size{};
        std::size_t rounds{};
        std::size_t batches_dispatched{};
        std::uint64_t estimated_fee_lamports{};
        std::chrono::milliseconds duration{};
    };

    void to_json(nlohmann::json &json, const StorageResult &result);

    class Uploader
    {
    public:
        Uploader(LedgerClient &ledger, const Signer &signer, SessionBackend &backend, UploadSettings settings);

        void set_index(SessionIndex *index) noexcept { index_ = index; }

        StorageResult upload(ByteView payload, const codec::EncodeOptions &options,
                             const std::optional<std::string> &logical_id = std::nullopt);

        const DispatchLog &last_dispatch_log() const noexcept { return log_; }

    private:
        LedgerClient &ledger_;
        const Signer &signer_;
        SessionBackend &backend_;
        UploadSettings settings_;
        SessionIndex *index_{nullptr};
        DispatchLog log_;
    };

} // namespace inscribe::client
