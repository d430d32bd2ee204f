#pragma once

#include <string>

#include "inscribe/client/config.hpp"
#include "inscribe/client/confirmation_tracker.hpp"
#include "inscribe/client/dispatch_log.hpp"
#include "inscribe/client/ledger.hpp"
#include "inscribe/client/session_backend.hpp"
#include "inscribe/client/signer.hpp"

namespace inscribe::client
{

    class Finalizer
    {
    public:
        Finalizer(LedgerClient &ledger, const Signer &signer, ConfirmationTracker &tracker, FinalizeSettings settings);

        // Requires a confirmed record for every chunk. A failed attempt is
        // followed by a read of the session account, so a finalize that
        // landed unconfirmed still counts. Throws FinalizationFailedError
        // when the session could not be closed.
        std::string finalize(const SessionPlan &plan, const DispatchLog &log);

        std::size_t attempts_made() const noexcept { return attempts_made_; }

    private:
        bool session_finalized(const SessionDescriptor &session);

        LedgerClient &ledger_;
        const Signer &signer_;
        ConfirmationTracker &tracker_;
        FinalizeSettings settings_;
        std::size_t attempts_made_{0};
    };

} // namespace inscribe::client
