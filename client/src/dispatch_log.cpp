#include "inscribe/client/dispatch_log.hpp"

#include <algorithm>
#include <array>

#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    namespace
    {
        struct OutcomeMapping
        {
            DispatchOutcome outcome;
            std::string_view label;
        };

        constexpr std::array<OutcomeMapping, 3> kOutcomeMappings{{
            {DispatchOutcome::Pending, "pending"},
            {DispatchOutcome::Confirmed, "confirmed"},
            {DispatchOutcome::Failed, "failed"},
        }};
    } // namespace

    std::string_view to_string(DispatchOutcome outcome) noexcept
    {
        for (const auto &mapping : kOutcomeMappings)
        {
            if (mapping.outcome == outcome)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    void to_json(nlohmann::json &json, const DispatchRecord &record)
    {
        json = {
            {"chunk", record.chunk_index},
            {"signature", record.signature},
            {"attempt", record.attempt},
            {"outcome", std::string(to_string(record.outcome))},
        };
        if (record.error)
        {
            json["error"] = *record.error;
        }
    }

    std::size_t DispatchLog::add(std::uint32_t chunk_index, std::string signature, std::uint32_t attempt)
    {
        records_.push_back(DispatchRecord{chunk_index, std::move(signature), attempt, DispatchOutcome::Pending, std::nullopt});
        return records_.size() - 1;
    }

    std::size_t DispatchLog::add_failure(std::uint32_t chunk_index, std::uint32_t attempt, std::string error)
    {
        records_.push_back(DispatchRecord{chunk_index, {}, attempt, DispatchOutcome::Failed, std::move(error)});
        return records_.size() - 1;
    }

    void DispatchLog::resolve(std::size_t record_id, DispatchOutcome outcome, std::optional<std::string> error)
    {
        if (record_id >= records_.size())
        {
            throw InscribeError(ErrorCode::InternalError, "Unknown dispatch record " + std::to_string(record_id));
        }
        auto &record = records_[record_id];
        if (record.outcome == DispatchOutcome::Confirmed)
        {
            return;
        }
        record.outcome = outcome;
        record.error = std::move(error);
    }

    std::optional<std::string> DispatchLog::confirmed_signature(std::uint32_t chunk_index) const
    {
        for (const auto &record : records_)
        {
            if (record.chunk_index == chunk_index && record.outcome == DispatchOutcome::Confirmed)
            {
                return record.signature;
            }
        }
        return std::nullopt;
    }

    bool DispatchLog::all_confirmed(std::uint32_t total_chunks) const
    {
        return unconfirmed(total_chunks).empty();
    }

    std::vector<std::uint32_t> DispatchLog::unconfirmed(std::uint32_t total_chunks) const
    {
        std::vector<bool> confirmed(total_chunks, false);
        for (const auto &record : records_)
        {
            if (record.outcome == DispatchOutcome::Confirmed && record.chunk_index < total_chunks)
            {
                confirmed[record.chunk_index] = true;
            }
        }
        std::vector<std::uint32_t> missing;
        for (std::uint32_t index = 0; index < total_chunks; ++index)
        {
            if (!confirmed[index])
            {
                missing.push_back(index);
            }
        }
        return missing;
    }

    std::vector<std::string> DispatchLog::confirmed_signatures(std::uint32_t total_chunks) const
    {
        std::vector<std::string> signatures;
        signatures.reserve(total_chunks);
        for (std::uint32_t index = 0; index < total_chunks; ++index)
        {
            if (auto signature = confirmed_signature(index))
            {
                signatures.push_back(std::move(*signature));
            }
        }
        return signatures;
    }

    std::size_t DispatchLog::count(DispatchOutcome outcome) const
    {
        return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(), [outcome](const DispatchRecord &record)
                                                      { return record.outcome == outcome; }));
    }

} // namespace inscribe::client
