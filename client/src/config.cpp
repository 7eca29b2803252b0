#include "ferry/client/config.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "ferry/tcp_stream.hpp"

namespace ferry::client
{

    Endpoint parse_endpoint(const std::string &text, std::uint16_t default_port)
    {
        Endpoint endpoint{text, default_port};
        const auto colon_pos = text.rfind(':');
        if (colon_pos != std::string::npos && text.find(':') == colon_pos)
        {
            endpoint.host = text.substr(0, colon_pos);
            endpoint.port = parse_port(text.substr(colon_pos + 1));
        }
        if (endpoint.host.empty())
        {
            throw std::runtime_error("Expected endpoint format host[:port], got '" + text + "'");
        }
        return endpoint;
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;

        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                apply_config_file(config, std::filesystem::path(argv[i + 1]));
            }
        }

        std::optional<std::string> target;
        std::optional<std::string> port_override;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            const auto next_value = [&](const char *what) -> std::string
            {
                if (index >= argc)
                {
                    throw std::runtime_error(arg + " requires " + what);
                }
                return argv[index++];
            };

            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else if (arg == "--port")
            {
                port_override = next_value("a port number");
            }
            else if (arg == "--proxy")
            {
                config.proxy = parse_endpoint(next_value("a host:port"), 9050);
            }
            else if (arg == "--direct")
            {
                config.proxy.reset();
            }
            else if (arg == "--stdin")
            {
                config.force_stdin = true;
            }
            else if (arg == "--name")
            {
                config.stdin_name = next_value("a file name");
            }
            else if (arg == "--io-timeout")
            {
                config.io_timeout = std::chrono::seconds(std::stoll(next_value("a value in seconds")));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(next_value("a file path"));
            }
            else if (arg == "--config")
            {
                (void)next_value("a file path");
            }
            else if (arg.size() > 1 && arg.front() == '-' && arg != "-")
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (!target)
            {
                target = arg;
            }
            else
            {
                config.inputs.push_back(arg);
            }
        }

        if (config.show_help)
        {
            return config;
        }
        if (!target)
        {
            throw std::runtime_error("Missing target address");
        }
        config.target = parse_endpoint(*target, config.target.port);
        if (port_override)
        {
            config.target.port = parse_port(*port_override);
        }
        if (config.stdin_name.empty())
        {
            throw std::runtime_error("--name must not be empty");
        }
        return config;
    }

    void apply_config_file(ClientConfig &config, const std::filesystem::path &path)
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
            if (json.contains("port"))
            {
                config.target.port = checked_port(json.at("port").get<std::int64_t>());
            }
            if (json.contains("proxy"))
            {
                const auto &proxy = json.at("proxy");
                if (proxy.is_null() || (proxy.is_string() && proxy.get<std::string>().empty()))
                {
                    config.proxy.reset();
                }
                else
                {
                    config.proxy = parse_endpoint(proxy.get<std::string>(), 9050);
                }
            }
            if (json.contains("io_timeout"))
            {
                config.io_timeout = std::chrono::seconds(json.at("io_timeout").get<std::int64_t>());
            }
            if (json.contains("log_file"))
            {
                config.log_path = std::filesystem::path(json.at("log_file").get<std::string>());
            }
            config.stdin_name = json.value("stdin_name", config.stdin_name);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid value in config file " + path.string() + ": " + ex.what());
        }
    }

    std::string usage(const std::string &program_name)
    {
        return "Usage:\n"
               "  Send files or directories:\n"
               "    " + program_name + " [options] <host[:port]> file1.txt file2.jpg '*.png' directory/\n"
               "  Send piped input:\n"
               "    cat data | " + program_name + " [options] <host[:port]> [--name <file name>]\n"
               "Options:\n"
               "  --port <PORT>          receiver port (default 8000)\n"
               "  --proxy <HOST:PORT>    SOCKS5 proxy (default 127.0.0.1:9050)\n"
               "  --direct               connect without a proxy\n"
               "  --stdin                read the payload from standard input\n"
               "  --name <NAME>          name declared for standard input (default data.bin)\n"
               "  --io-timeout <SECONDS> abort when the peer stalls (default 0, never)\n"
               "  --log <FILE>           write a diagnostic log\n"
               "  --config <FILE>        JSON configuration file\n";
    }

} // namespace ferry::client
