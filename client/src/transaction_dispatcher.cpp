#include "inscribe/client/transaction_dispatcher.hpp"

#include <algorithm>
#include <thread>

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    TransactionDispatcher::TransactionDispatcher(LedgerClient &ledger, const Signer &signer, ConfirmationTracker &tracker,
                                                 DispatchSettings settings)
        : ledger_(ledger), signer_(signer), tracker_(tracker), settings_(settings)
    {
        if (settings_.batch_size == 0)
        {
            throw InscribeError(ErrorCode::InvalidInput, "Dispatch batch size must be positive");
        }
        if (settings_.batch_size > LedgerClient::kStatusQueryLimit)
        {
            throw InscribeError(ErrorCode::InvalidInput, "Dispatch batch size " + std::to_string(settings_.batch_size) +
                                                             " exceeds " + std::to_string(LedgerClient::kStatusQueryLimit));
        }
    }

    DispatchSummary TransactionDispatcher::dispatch(const std::vector<wire::Message> &chunk_messages,
                                                    const std::vector<std::uint32_t> &indices, std::uint32_t attempt,
                                                    DispatchLog &log)
    {
        for (const auto index : indices)
        {
            if (index >= chunk_messages.size())
            {
                throw InscribeError(ErrorCode::InvalidInput, "Chunk index " + std::to_string(index) + " has no transaction");
            }
        }

        DispatchSummary summary;
        switch (settings_.strategy)
        {
        case protocol::DispatchStrategy::BatchedParallel:
        {
            for (std::size_t offset = 0; offset < indices.size(); offset += settings_.batch_size)
            {
                const auto end = std::min(indices.size(), offset + settings_.batch_size);
                const std::vector<std::uint32_t> batch(indices.begin() + static_cast<std::ptrdiff_t>(offset),
                                                       indices.begin() + static_cast<std::ptrdiff_t>(end));
                auto submissions = submit_batch(chunk_messages, batch, settings_.stagger);
                ++summary.batches;
                confirm_into(submissions, attempt, log, summary);
            }
            break;
        }
        case protocol::DispatchStrategy::Sequential:
        {
            for (std::size_t i = 0; i < indices.size(); ++i)
            {
                if (i > 0)
                {
                    std::this_thread::sleep_for(settings_.sequential_delay);
                }
                auto submissions = submit_batch(chunk_messages, {indices[i]}, std::chrono::milliseconds(0));
                ++summary.batches;
                confirm_into(submissions, attempt, log, summary);
            }
            break;
        }
        case protocol::DispatchStrategy::FireAndForget:
        {
            // Windows keep each confirmation pass within one status query.
            for (std::size_t offset = 0; offset < indices.size(); offset += LedgerClient::kStatusQueryLimit)
            {
                const auto end = std::min(indices.size(), offset + LedgerClient::kStatusQueryLimit);
                const std::vector<std::uint32_t> window(indices.begin() + static_cast<std::ptrdiff_t>(offset),
                                                        indices.begin() + static_cast<std::ptrdiff_t>(end));
                auto submissions = submit_batch(chunk_messages, window, std::chrono::milliseconds(0));
                ++summary.batches;
                confirm_into(submissions, attempt, log, summary);
            }
            break;
        }
        }

        batches_dispatched_ += summary.batches;
        spdlog::info("Attempt {}: {} chunk(s) in {} batch(es) via {}, {} confirmed, {} rejected", attempt, indices.size(),
                     summary.batches, to_string(settings_.strategy), summary.confirmed, summary.rejected);
        return summary;
    }

    std::vector<TransactionDispatcher::Submission> TransactionDispatcher::submit_batch(
        const std::vector<wire::Message> &chunk_messages, const std::vector<std::uint32_t> &batch,
        std::chrono::milliseconds stagger)
    {
        std::vector<Submission> submissions(batch.size());

        // One reference blockhash per batch.
        wire::Blockhash blockhash{};
        try
        {
            blockhash = ledger_.latest_blockhash();
        }
        catch (const InscribeError &ex)
        {
            spdlog::warn("Could not fetch a blockhash for {} chunk(s): {}", batch.size(), ex.what());
            for (std::size_t i = 0; i < batch.size(); ++i)
            {
                submissions[i] = Submission{batch[i], {}, std::string("blockhash unavailable: ") + ex.what()};
            }
            return submissions;
        }

        if (settings_.strategy != protocol::DispatchStrategy::BatchedParallel || batch.size() == 1)
        {
            for (std::size_t i = 0; i < batch.size(); ++i)
            {
                submissions[i] = submit_one(chunk_messages[batch[i]], batch[i], blockhash);
            }
            return submissions;
        }

        asio::thread_pool pool(batch.size());
        for (std::size_t slot = 0; slot < batch.size(); ++slot)
        {
            asio::post(pool, [this, &submissions, &chunk_messages, &batch, &blockhash, slot, stagger]()
                       {
                           // Staggered starts keep submissions in rough index order.
                           std::this_thread::sleep_for(stagger * static_cast<long>(slot));
                           submissions[slot] = submit_one(chunk_messages[batch[slot]], batch[slot], blockhash);
                       });
        }
        pool.join();
        return submissions;
    }

    TransactionDispatcher::Submission TransactionDispatcher::submit_one(const wire::Message &message,
                                                                        std::uint32_t chunk_index,
                                                                        const wire::Blockhash &blockhash) const
    {
        Submission submission{chunk_index, {}, std::nullopt};
        try
        {
            submission.signature = ledger_.submit_transaction(sign_and_serialize(message, blockhash, signer_));
        }
        catch (const InscribeError &ex)
        {
            submission.error = ex.what();
        }
        catch (const std::exception &ex)
        {
            submission.error = std::string("unexpected submission failure: ") + ex.what();
        }
        return submission;
    }

    void TransactionDispatcher::confirm_into(std::vector<Submission> &submissions, std::uint32_t attempt, DispatchLog &log,
                                             DispatchSummary &summary)
    {
        std::vector<std::pair<std::size_t, std::string>> outstanding;
        for (auto &submission : submissions)
        {
            if (submission.error)
            {
                spdlog::warn("Chunk {} rejected on attempt {}: {}", submission.chunk_index, attempt, *submission.error);
                log.add_failure(submission.chunk_index, attempt, *submission.error);
                ++summary.rejected;
                continue;
            }
            ++summary.submitted;
            outstanding.emplace_back(log.add(submission.chunk_index, submission.signature, attempt), submission.signature);
        }
        if (outstanding.empty())
        {
            return;
        }

        std::vector<std::string> signatures;
        signatures.reserve(outstanding.size());
        for (const auto &[record_id, signature] : outstanding)
        {
            signatures.push_back(signature);
        }
        const auto report = tracker_.confirm(signatures);
        for (const auto &[record_id, signature] : outstanding)
        {
            if (report.is_confirmed(signature))
            {
                log.resolve(record_id, DispatchOutcome::Confirmed);
                ++summary.confirmed;
                continue;
            }
            std::optional<std::string> error;
            if (auto it = report.errors.find(signature); it != report.errors.end())
            {
                error = it->second;
            }
            log.resolve(record_id, DispatchOutcome::Failed, error);
        }
    }

} // namespace inscribe::client
