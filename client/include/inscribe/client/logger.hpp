#pragma once

#include <filesystem>
#include <optional>

namespace inscribe::client
{

    // Console plus optional file sink, installed as the default spdlog logger.
    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose);

} // namespace inscribe::client
