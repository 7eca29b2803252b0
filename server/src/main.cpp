#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ferry/server/server.hpp"
#include "ferry/tcp_stream.hpp"
#include "ferry/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "Ferry receiver " << ferry::version() << "\n"
                  << "Usage: " << program_name
                  << " [--root <DIR>] [--port <PORT>] [--address <ADDRESS>] [--io-timeout <seconds>] "
                     "[--log <FILE>] [--log-level <LEVEL>] [--config <FILE>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::filesystem::path> find_config_argument(int argc, char *argv[])
    {
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(argv[i + 1]);
            }
        }
        return std::nullopt;
    }

} // namespace

int main(int argc, char *argv[])
{
    using ferry::server::Server;
    using ferry::server::ServerConfig;

    ServerConfig config;

    try
    {
        if (const auto config_path = find_config_argument(argc, argv))
        {
            ferry::server::apply_config_file(config, *config_path);
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }

            const auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            if (arg == "--port")
            {
                config.port = ferry::parse_port(*value);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--io-timeout")
            {
                config.io_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--log-level")
            {
                config.log_level = *value;
            }
            else if (arg == "--config")
            {
                // Applied before the other options so they can override it.
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting Ferry receiver {} on {}:{}", ferry::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
