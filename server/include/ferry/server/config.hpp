#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ferry::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8000};
        std::filesystem::path root{"received"};
        // Zero waits on a stalled peer indefinitely.
        std::chrono::seconds io_timeout{0};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

    // Overlays the keys present in a JSON file onto `config`. Unknown keys are
    // ignored; malformed files throw std::runtime_error.
    void apply_config_file(ServerConfig &config, const std::filesystem::path &path);

} // namespace ferry::server
