#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "inscribe/address.hpp"
#include "inscribe/codec.hpp"
#include "inscribe/protocol.hpp"

namespace inscribe::client
{

    struct DispatchSettings
    {
        protocol::DispatchStrategy strategy{protocol::DispatchStrategy::BatchedParallel};
        std::size_t batch_size{5};
        std::chrono::milliseconds stagger{100};
        std::chrono::milliseconds sequential_delay{250};
    };

    struct ConfirmationSettings
    {
        std::chrono::milliseconds max_wait{30000};
        std::chrono::milliseconds poll_interval{1000};
        std::size_t retry_rounds{2};
        protocol::Commitment commitment{protocol::Commitment::Confirmed};
    };

    struct SessionSettings
    {
        std::size_t account_checks{10};
        std::chrono::milliseconds account_check_interval{1000};
    };

    struct FinalizeSettings
    {
        std::size_t attempts{3};
        std::chrono::milliseconds retry_delay{2000};
    };

    struct UploadSettings
    {
        DispatchSettings dispatch{};
        ConfirmationSettings confirmation{};
        SessionSettings session{};
        FinalizeSettings finalize{};
        std::uint64_t lamports_per_transaction{5000};
    };

    struct RetrievalSettings
    {
        std::size_t max_retries{5};
        std::chrono::milliseconds retry_delay{3000};
        bool strict_digest{true};
        bool legacy_detection{false};
    };

    struct CacheSettings
    {
        std::size_t max_entries{64};
        std::size_t max_bytes{64 * 1024 * 1024};
    };

    enum class CommandKind : std::uint8_t
    {
        Upload,
        Download,
        Status
    };

    struct ClientConfig
    {
        CommandKind command{CommandKind::Upload};
        std::filesystem::path input_path;
        std::string session_handle;
        std::filesystem::path output_path;
        std::optional<std::string> logical_id;

        std::string rpc_url{"http://127.0.0.1:8899"};
        std::string service_url{"http://127.0.0.1:8080"};
        std::string program_id{address::kDefaultProgramId};
        std::optional<std::filesystem::path> keypair_path;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> index_path;
        bool direct{false};
        bool use_history{false};
        bool verbose{false};

        codec::EncodeOptions encode{};
        UploadSettings upload{};
        RetrievalSettings retrieval{};
        CacheSettings cache{};
    };

    std::string usage();

    // Loads --config first when present; every other flag overrides the file.
    ClientConfig parse_arguments(int argc, char *argv[]);

    void apply_config_file(ClientConfig &config, const std::filesystem::path &path);

} // namespace inscribe::client
