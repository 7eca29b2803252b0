#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::client
{

    struct Endpoint
    {
        std::string host;
        std::uint16_t port{};
    };

    struct ClientConfig
    {
        Endpoint target{{}, 8000};
        // SOCKS5 proxy, a local Tor daemon by default. Empty means direct TCP.
        std::optional<Endpoint> proxy{Endpoint{"127.0.0.1", 9050}};
        std::vector<std::string> inputs;
        bool force_stdin{false};
        std::string stdin_name{"data.bin"};
        std::chrono::seconds io_timeout{0};
        std::optional<std::filesystem::path> log_path;
        bool show_help{false};
    };

    // Accepts "host" or "host:port".
    Endpoint parse_endpoint(const std::string &text, std::uint16_t default_port);

    ClientConfig parse_arguments(int argc, char *argv[]);

    void apply_config_file(ClientConfig &config, const std::filesystem::path &path);

    std::string usage(const std::string &program_name);

} // namespace ferry::client
