/**
 * Inscribe - Batched confirmation of outstanding signatures.
 *
 * Each poll sends one status query for everything still pending. A
 * signature moves out of pending exactly once: to confirmed when it reaches
 * the configured commitment, to failed when the ledger reports an error or
 * the wait budget runs out. The budget is wall-clock time, so slow status
 * queries shorten the number of polls; max_polls() is only an upper bound.
 */
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "inscribe/client/config.hpp"
#include "inscribe/client/ledger.hpp"

namespace inscribe::client
{

    struct ConfirmationReport
    {
        std::vector<std::string> confirmed;
        std::vector<std::string> failed;
        std::map<std::string, std::string> errors;
        std::size_t polls{};
        bool timed_out{};

        bool is_confirmed(const std::string &signature) const;
    };

    class ConfirmationTracker
    {
    public:
        ConfirmationTracker(LedgerClient &ledger, ConfirmationSettings settings);

        ConfirmationReport confirm(const std::vector<std::string> &signatures);

        std::size_t max_polls() const noexcept;
        std::size_t status_queries() const noexcept { return status_queries_; }

    private:
        LedgerClient &ledger_;
        ConfirmationSettings settings_;
        std::size_t status_queries_{0};
    };

} // namespace inscribe::client
