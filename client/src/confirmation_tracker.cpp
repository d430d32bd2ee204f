#include "inscribe/client/confirmation_tracker.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    namespace
    {
        enum class TrackState
        {
            Pending,
            Confirmed,
            Failed
        };
    } // namespace

    bool ConfirmationReport::is_confirmed(const std::string &signature) const
    {
        return std::find(confirmed.begin(), confirmed.end(), signature) != confirmed.end();
    }

    ConfirmationTracker::ConfirmationTracker(LedgerClient &ledger, ConfirmationSettings settings)
        : ledger_(ledger), settings_(settings)
    {
    }

    std::size_t ConfirmationTracker::max_polls() const noexcept
    {
        if (settings_.poll_interval.count() <= 0)
        {
            return 1;
        }
        return std::max<std::size_t>(1, static_cast<std::size_t>(settings_.max_wait / settings_.poll_interval));
    }

    ConfirmationReport ConfirmationTracker::confirm(const std::vector<std::string> &signatures)
    {
        ConfirmationReport report;
        std::map<std::string, TrackState> states;
        for (const auto &signature : signatures)
        {
            states.emplace(signature, TrackState::Pending);
        }

        // The first poll always runs; later ones only while time remains.
        const auto deadline = std::chrono::steady_clock::now() + settings_.max_wait;
        const auto polls = max_polls();
        for (std::size_t poll = 0; poll < polls; ++poll)
        {
            if (poll > 0 && std::chrono::steady_clock::now() >= deadline)
            {
                break;
            }

            std::vector<std::string> pending;
            for (const auto &[signature, state] : states)
            {
                if (state == TrackState::Pending)
                {
                    pending.push_back(signature);
                }
            }
            if (pending.empty())
            {
                break;
            }

            ++report.polls;
            ++status_queries_;
            std::vector<std::optional<SignatureStatus>> statuses;
            try
            {
                statuses = ledger_.signature_statuses(pending);
            }
            catch (const InscribeError &ex)
            {
                if (ex.code() != ErrorCode::TransportError)
                {
                    throw;
                }
                spdlog::warn("Status poll {} failed: {}", poll + 1, ex.what());
            }

            bool still_pending = false;
            for (std::size_t i = 0; i < pending.size(); ++i)
            {
                const auto &signature = pending[i];
                if (i >= statuses.size() || !statuses[i])
                {
                    still_pending = true;
                    continue;
                }
                const auto &status = *statuses[i];
                if (status.error)
                {
                    states[signature] = TrackState::Failed;
                    report.errors[signature] = *status.error;
                }
                else if (protocol::meets(status.commitment, settings_.commitment))
                {
                    states[signature] = TrackState::Confirmed;
                }
                else
                {
                    still_pending = true;
                }
            }

            if (still_pending && poll + 1 < polls)
            {
                const auto remaining = deadline - std::chrono::steady_clock::now();
                if (remaining <= std::chrono::steady_clock::duration::zero())
                {
                    break;
                }
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(settings_.poll_interval, remaining));
            }
        }

        for (const auto &signature : signatures)
        {
            auto &state = states[signature];
            if (state == TrackState::Pending)
            {
                state = TrackState::Failed;
                report.timed_out = true;
                report.errors.emplace(signature, "not confirmed within " + std::to_string(settings_.max_wait.count()) + " ms");
            }
            if (state == TrackState::Confirmed)
            {
                report.confirmed.push_back(signature);
            }
            else
            {
                report.failed.push_back(signature);
            }
        }

        spdlog::debug("Confirmed {}/{} signature(s) in {} poll(s)", report.confirmed.size(), signatures.size(), report.polls);
        return report;
    }

} // namespace inscribe::client
