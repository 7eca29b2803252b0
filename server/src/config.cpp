#include "ferry/server/config.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "ferry/tcp_stream.hpp"

namespace ferry::server
{

    void apply_config_file(ServerConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw std::runtime_error("Config file " + path.string() + " must contain a JSON object");
        }

        try
        {
            config.address = json.value("address", config.address);
            if (json.contains("port"))
            {
                config.port = checked_port(json.at("port").get<std::int64_t>());
            }
            if (json.contains("root"))
            {
                config.root = std::filesystem::path(json.at("root").get<std::string>());
            }
            if (json.contains("io_timeout"))
            {
                config.io_timeout = std::chrono::seconds(json.at("io_timeout").get<std::int64_t>());
            }
            if (json.contains("log_file"))
            {
                config.log_file = std::filesystem::path(json.at("log_file").get<std::string>());
            }
            config.log_level = json.value("log_level", config.log_level);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid value in config file " + path.string() + ": " + ex.what());
        }
    }

} // namespace ferry::server
