#include "inscribe/client/uploader.hpp"

#include <spdlog/spdlog.h>

#include "inscribe/client/confirmation_tracker.hpp"
#include "inscribe/client/finalizer.hpp"
#include "inscribe/client/session_manager.hpp"
#include "inscribe/client/transaction_dispatcher.hpp"
#include "inscribe/crypto.hpp"
#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    void to_json(nlohmann::json &json, const StorageResult &result)
    {
        json = {
            {"session", result.session_handle},
            {"sessionId", crypto::to_hex(result.session_id)},
            {"chunks", result.chunk_count},
            {"signatures", result.signatures},
            {"attempts", result.attempts},
            {"createSignature", result.create_signature},
            {"finalizeSignature", result.finalize_signature},
            {"digest", crypto::to_hex(result.digest)},
            {"compressed", result.compressed},
            {"method", std::string(codec::to_string(result.method))},
            {"originalSize", result.original_size},
            {"encodedSize", result.encoded_size},
            {"rounds", result.rounds},
            {"batches", result.batches_dispatched},
            {"estimatedFeeLamports", result.estimated_fee_lamports},
            {"durationMs", result.duration.count()},
        };
        if (result.init_storage_signature)
        {
            json["initStorageSignature"] = *result.init_storage_signature;
        }
    }

    Uploader::Uploader(LedgerClient &ledger, const Signer &signer, SessionBackend &backend, UploadSettings settings)
        : ledger_(ledger), signer_(signer), backend_(backend), settings_(settings)
    {
    }

    StorageResult Uploader::upload(ByteView payload, const codec::EncodeOptions &options,
                                   const std::optional<std::string> &logical_id)
    {
        const auto started = std::chrono::steady_clock::now();
        log_ = DispatchLog{};

        const auto encoded = codec::encode(payload, options);
        spdlog::info("Encoded {} byte(s) into {} byte(s), {} chunk(s), method {}", encoded.original_size,
                     encoded.encoded_size, encoded.chunks.size(), codec::to_string(encoded.method));

        const auto plan = backend_.plan(encoded, signer_.public_key());
        if (plan.chunks.size() != encoded.chunks.size() || plan.session.total_chunks != encoded.chunks.size())
        {
            throw InscribeError(ErrorCode::SessionCreationFailed, "Session plan does not cover every chunk");
        }
        const auto &handle = plan.session.handle;

        ConfirmationTracker tracker(ledger_, settings_.confirmation);
        TransactionDispatcher dispatcher(ledger_, signer_, tracker, settings_.dispatch);
        SessionManager sessions(ledger_, signer_, tracker, settings_.session);

        StorageResult result;
        result.init_storage_signature = sessions.ensure_storage_initialized(plan);
        result.create_signature = sessions.create_session(plan);

        auto pending = log_.unconfirmed(plan.session.total_chunks);
        const auto max_rounds = 1 + settings_.confirmation.retry_rounds;
        std::size_t round = 0;
        while (!pending.empty() && round < max_rounds)
        {
            ++round;
            if (round > 1)
            {
                spdlog::warn("Retrying {} unconfirmed chunk(s) for {} (round {}/{})", pending.size(), handle, round,
                             max_rounds);
            }
            dispatcher.dispatch(plan.chunks, pending, static_cast<std::uint32_t>(round), log_);
            pending = log_.unconfirmed(plan.session.total_chunks);
        }
        if (!pending.empty())
        {
            throw UploadFailedError(handle, pending);
        }

        Finalizer finalizer(ledger_, signer_, tracker, settings_.finalize);
        result.finalize_signature = finalizer.finalize(plan, log_);

        if (logical_id && index_)
        {
            index_->publish(*logical_id, handle);
        }

        result.session_handle = handle;
        result.session_id = plan.session.session_id;
        result.chunk_count = plan.session.total_chunks;
        result.signatures = log_.confirmed_signatures(plan.session.total_chunks);
        result.signatures.push_back(result.finalize_signature);
        result.attempts = log_.records();
        result.digest = encoded.digest;
        result.compressed = encoded.compressed;
        result.method = encoded.method;
        result.original_size = encoded.original_size;
        result.encoded_size = encoded.encoded_size;
        result.rounds = round;
        result.batches_dispatched = dispatcher.batches_dispatched();

        const auto transactions = result.attempts.size() + 1 + (result.init_storage_signature ? 1 : 0) +
                                  finalizer.attempts_made();
        result.estimated_fee_lamports = static_cast<std::uint64_t>(transactions) * settings_.lamports_per_transaction;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

        spdlog::info("Stored {} chunk(s) in session {} after {} round(s) in {} ms", result.chunk_count, handle, round,
                     result.duration.count());
        return result;
    }

} // namespace inscribe::client
