#include "inscribe/client/session_manager.hpp"

#include <algorithm>
#include <array>
#include <thread>

#include <spdlog/spdlog.h>

#include "inscribe/crypto.hpp"
#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    namespace
    {
        // Custom program error 0 is the program's "account already initialized".
        constexpr std::array<std::string_view, 5> kAlreadyInitializedMarkers{{
            "custom program error: 0x0",
            "\"Custom\":0",
            "Custom(0)",
            "already in use",
            "already exists",
        }};
    } // namespace

    SessionManager::SessionManager(LedgerClient &ledger, const Signer &signer, ConfirmationTracker &tracker,
                                   SessionSettings settings)
        : ledger_(ledger), signer_(signer), tracker_(tracker), settings_(settings)
    {
    }

    bool SessionManager::is_already_initialized(std::string_view error)
    {
        for (const auto marker : kAlreadyInitializedMarkers)
        {
            if (error.find(marker) != std::string_view::npos)
            {
                return true;
            }
        }
        return false;
    }

    std::optional<std::string> SessionManager::ensure_storage_initialized(const SessionPlan &plan)
    {
        if (!plan.init_storage)
        {
            return std::nullopt;
        }

        wire::Blockhash blockhash{};
        try
        {
            blockhash = ledger_.latest_blockhash();
            const auto simulation = ledger_.simulate_transaction(sign_and_serialize(*plan.init_storage, blockhash, signer_));
            if (!simulation.ok)
            {
                const auto &error = *simulation.error;
                if (is_already_initialized(error))
                {
                    spdlog::info("Storage account already initialized, continuing");
                    return std::nullopt;
                }
                throw InscribeError(ErrorCode::SessionCreationFailed, "Storage initialization would fail: " + error);
            }
        }
        catch (const InscribeError &ex)
        {
            if (ex.code() == ErrorCode::SessionCreationFailed)
            {
                throw;
            }
            if (is_already_initialized(ex.what()))
            {
                spdlog::info("Storage account already initialized, continuing");
                return std::nullopt;
            }
            throw InscribeError(ErrorCode::SessionCreationFailed, std::string("Storage initialization failed: ") + ex.what());
        }

        try
        {
            auto signature = submit_and_confirm(*plan.init_storage, "storage initialization");
            spdlog::info("Storage account initialized: {}", signature);
            return signature;
        }
        catch (const InscribeError &ex)
        {
            if (is_already_initialized(ex.what()))
            {
                spdlog::info("Storage account already initialized, continuing");
                return std::nullopt;
            }
            throw;
        }
    }

    std::string SessionManager::create_session(const SessionPlan &plan)
    {
        const auto signature = submit(plan.create_session, "session creation");
        const auto report = tracker_.confirm({signature});
        if (!report.is_confirmed(signature))
        {
            const auto it = report.errors.find(signature);
            const auto reason = it != report.errors.end() ? it->second : std::string("unknown status");
            if (!report.timed_out)
            {
                throw InscribeError(ErrorCode::SessionCreationFailed, "session creation failed: " + reason);
            }
            // The transaction may have landed without its status showing up;
            // the account read below decides.
            spdlog::warn("Session creation {} not confirmed ({}), checking account {}", signature, reason,
                         plan.session.handle);
        }
        wait_for_session(plan.session);
        spdlog::info("Session {} created: {}", plan.session.handle, signature);
        return signature;
    }

    layout::SessionAccount SessionManager::wait_for_session(const SessionDescriptor &session)
    {
        const auto checks = std::max<std::size_t>(1, settings_.account_checks);
        for (std::size_t check = 0; check < checks; ++check)
        {
            std::optional<Bytes> data;
            try
            {
                data = ledger_.account_info(session.address);
            }
            catch (const InscribeError &ex)
            {
                if (ex.code() != ErrorCode::TransportError)
                {
                    throw;
                }
                spdlog::warn("Reading session account failed: {}", ex.what());
            }

            if (data)
            {
                const auto account = layout::decode_session_account(*data);
                if (account.total_chunks != session.total_chunks || account.digest != session.digest)
                {
                    throw InscribeError(ErrorCode::SessionCreationFailed,
                                        "Session account " + session.handle + " declares " +
                                            std::to_string(account.total_chunks) + " chunk(s) and digest " +
                                            crypto::to_hex(account.digest) + ", expected " +
                                            std::to_string(session.total_chunks) + " and " +
                                            crypto::to_hex(session.digest));
                }
                return account;
            }
            if (check + 1 < checks)
            {
                std::this_thread::sleep_for(settings_.account_check_interval);
            }
        }
        throw InscribeError(ErrorCode::SessionCreationFailed,
                            "Session account " + session.handle + " did not appear after " + std::to_string(checks) +
                                " read(s)");
    }

    std::string SessionManager::submit(const wire::Message &message, const std::string &what)
    {
        try
        {
            return ledger_.submit_transaction(sign_and_serialize(message, ledger_.latest_blockhash(), signer_));
        }
        catch (const InscribeError &ex)
        {
            throw InscribeError(ErrorCode::SessionCreationFailed, what + " rejected: " + ex.what());
        }
    }

    std::string SessionManager::submit_and_confirm(const wire::Message &message, const std::string &what)
    {
        const auto signature = submit(message, what);
        const auto report = tracker_.confirm({signature});
        if (!report.is_confirmed(signature))
        {
            const auto it = report.errors.find(signature);
            throw InscribeError(ErrorCode::SessionCreationFailed,
                                what + " not confirmed: " + (it != report.errors.end() ? it->second : "unknown status"));
        }
        return signature;
    }

} // namespace inscribe::client
