#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "inscribe/client/config.hpp"
#include "inscribe/client/confirmation_tracker.hpp"
#include "inscribe/client/ledger.hpp"
#include "inscribe/client/session_backend.hpp"
#include "inscribe/client/signer.hpp"
#include "inscribe/layout.hpp"

namespace inscribe::client
{

    class SessionManager
    {
    public:
        SessionManager(LedgerClient &ledger, const Signer &signer, ConfirmationTracker &tracker, SessionSettings settings);

        // Returns the initialization signature, or nullopt when the plan needs
        // none or the owner's storage already exists. Any other failure throws
        // InscribeError(SessionCreationFailed).
        std::optional<std::string> ensure_storage_initialized(const SessionPlan &plan);

        // Submits and confirms the create transaction, then waits until the
        // session account is readable with the declared chunk count and digest.
        // A confirmation timeout defers to the account read; a ledger error
        // fails immediately.
        std::string create_session(const SessionPlan &plan);

        layout::SessionAccount wait_for_session(const SessionDescriptor &session);

        static bool is_already_initialized(std::string_view error);

    private:
        std::string submit(const wire::Message &message, const std::string &what);
        std::string submit_and_confirm(const wire::Message &message, const std::string &what);

        LedgerClient &ledger_;
        const Signer &signer_;
        ConfirmationTracker &tracker_;
        SessionSettings settings_;
    };

} // namespace inscribe::client
