#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "inscribe/client/config.hpp"
#include "inscribe/client/confirmation_tracker.hpp"
#include "inscribe/client/dispatch_log.hpp"
#include "inscribe/client/ledger.hpp"
#include "inscribe/client/signer.hpp"
#include "inscribe/wire.hpp"

namespace inscribe::client
{

    struct DispatchSummary
    {
        std::size_t batches{};
        std::size_t submitted{};
        std::size_t rejected{};
        std::size_t confirmed{};
    };

    // Signs and submits chunk transactions, then hands the signatures to the
    // tracker. Batched and sequential strategies confirm each batch before the
    // next is sent; fire-and-forget sends windows of up to
    // LedgerClient::kStatusQueryLimit without staggering and confirms each
    // window in one pass.
    class TransactionDispatcher
    {
    public:
        TransactionDispatcher(LedgerClient &ledger, const Signer &signer, ConfirmationTracker &tracker,
                              DispatchSettings settings);

        // Every submission is appended to the log and resolved before return.
        DispatchSummary dispatch(const std::vector<wire::Message> &chunk_messages, const std::vector<std::uint32_t> &indices,
                                 std::uint32_t attempt, DispatchLog &log);

        std::size_t batches_dispatched() const noexcept { return batches_dispatched_; }

    private:
        struct Submission
        {
            std::uint32_t chunk_index{};
            std::string signature;
            std::optional<std::string> error;
        };

        std::vector<Submission> submit_batch(const std::vector<wire::Message> &chunk_messages,
                                             const std::vector<std::uint32_t> &batch, std::chrono::milliseconds stagger);
        Submission submit_one(const wire::Message &message, std::uint32_t chunk_index, const wire::Blockhash &blockhash) const;
        void confirm_into(std::vector<Submission> &submissions, std::uint32_t attempt, DispatchLog &log,
                          DispatchSummary &summary);

        LedgerClient &ledger_;
        const Signer &signer_;
        ConfirmationTracker &tracker_;
        DispatchSettings settings_;
        std::size_t batches_dispatched_{0};
    };

} // namespace inscribe::client
