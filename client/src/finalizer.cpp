#include "inscribe/client/finalizer.hpp"

#include <algorithm>
#include <optional>
#include <thread>

#include <spdlog/spdlog.h>

#include "inscribe/error_codes.hpp"
#include "inscribe/layout.hpp"

namespace inscribe::client
{

    Finalizer::Finalizer(LedgerClient &ledger, const Signer &signer, ConfirmationTracker &tracker,
                         FinalizeSettings settings)
        : ledger_(ledger), signer_(signer), tracker_(tracker), settings_(settings)
    {
    }

    std::string Finalizer::finalize(const SessionPlan &plan, const DispatchLog &log)
    {
        const auto &handle = plan.session.handle;
        const auto missing = log.unconfirmed(plan.session.total_chunks);
        if (!missing.empty())
        {
            throw FinalizationFailedError(handle, std::to_string(missing.size()) + " chunk(s) have no confirmed dispatch");
        }

        const auto attempts = std::max<std::size_t>(1, settings_.attempts);
        std::string last_error = "no attempt made";
        std::optional<std::string> submitted;
        for (std::size_t attempt = 1; attempt <= attempts; ++attempt)
        {
            ++attempts_made_;
            try
            {
                const auto signature =
                    ledger_.submit_transaction(sign_and_serialize(plan.finalize, ledger_.latest_blockhash(), signer_));
                submitted = signature;
                const auto report = tracker_.confirm({signature});
                if (report.is_confirmed(signature))
                {
                    spdlog::info("Session {} finalized: {}", handle, signature);
                    return signature;
                }
                const auto it = report.errors.find(signature);
                last_error = it != report.errors.end() ? it->second : "not confirmed";
            }
            catch (const InscribeError &ex)
            {
                last_error = ex.what();
            }

            spdlog::warn("Finalize attempt {}/{} for {} failed: {}", attempt, attempts, handle, last_error);
            // An unconfirmed earlier attempt may still have landed.
            if (submitted && session_finalized(plan.session))
            {
                spdlog::info("Session {} is finalized on the ledger, keeping {}", handle, *submitted);
                return *submitted;
            }
            if (attempt < attempts)
            {
                std::this_thread::sleep_for(settings_.retry_delay);
            }
        }
        throw FinalizationFailedError(handle, last_error);
    }

    bool Finalizer::session_finalized(const SessionDescriptor &session)
    {
        try
        {
            const auto data = ledger_.account_info(session.address);
            return data && layout::decode_session_account(*data).status == layout::SessionStatus::Finalized;
        }
        catch (const InscribeError &ex)
        {
            spdlog::warn("Could not read session account {}: {}", session.handle, ex.what());
            return false;
        }
    }

} // namespace inscribe::client
