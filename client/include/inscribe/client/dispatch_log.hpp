#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace inscribe::client
{

    enum class DispatchOutcome : std::uint8_t
    {
        Pending,
        Confirmed,
        Failed
    };

    std::string_view to_string(DispatchOutcome outcome) noexcept;

    struct DispatchRecord
    {
        std::uint32_t chunk_index{};
        std::string signature; // empty when the submission itself was rejected
        std::uint32_t attempt{};
        DispatchOutcome outcome{DispatchOutcome::Pending};
        std::optional<std::string> error;
    };

    void to_json(nlohmann::json &json, const DispatchRecord &record);

    // Submission history of one upload. Owned by that upload and only touched
    // from its coordinating thread.
    class DispatchLog
    {
    public:
        std::size_t add(std::uint32_t chunk_index, std::string signature, std::uint32_t attempt);
        std::size_t add_failure(std::uint32_t chunk_index, std::uint32_t attempt, std::string error);

        // Confirmed records never change outcome again.
        void resolve(std::size_t record_id, DispatchOutcome outcome, std::optional<std::string> error = std::nullopt);

        const std::vector<DispatchRecord> &records() const noexcept { return records_; }

        std::optional<std::string> confirmed_signature(std::uint32_t chunk_index) const;
        bool all_confirmed(std::uint32_t total_chunks) const;
        std::vector<std::uint32_t> unconfirmed(std::uint32_t total_chunks) const;

        // Index order; chunks without a confirmed record are skipped.
        std::vector<std::string> confirmed_signatures(std::uint32_t total_chunks) const;

        std::size_t count(DispatchOutcome outcome) const;

    private:
        std::vector<DispatchRecord> records_;
    };

} // namespace inscribe::client
