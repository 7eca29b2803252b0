#include "ferry/client/session.hpp"

#include <unistd.h>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "ferry/client/inputs.hpp"
#include "ferry/client/socks5.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/filesystem.hpp"
#include "ferry/progress.hpp"

namespace ferry::client
{

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)) {}

    int ClientSession::run()
    {
        const auto start_time = std::chrono::steady_clock::now();
        const bool from_stdin = stdin_mode();
        try
        {
            std::vector<std::filesystem::path> items;
            if (!from_stdin)
            {
                if (config_.inputs.empty())
                {
                    throw std::runtime_error("Please specify files or directories to send");
                }
                items = expand_inputs(config_.inputs);
                std::cout << "Found " << items.size() << " item(s) to send" << std::endl;
            }

            auto stream = connect();
            ConsoleProgressSink progress(std::cout);
            LocalFilesystem filesystem;
            const TransferOptions options{
                .cancellation = &cancellation_,
                .io_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.io_timeout),
            };
            Sender sender(*stream, filesystem, progress, options);

            if (from_stdin)
            {
                std::cout << "Reading from stdin..." << std::endl;
                sender.send_stream(std::cin, config_.stdin_name);
            }
            else
            {
                sender.send_all(items);
            }
            stream->close();

            print_summary(sender.summary(), std::chrono::steady_clock::now() - start_time);
        }
        catch (const TransferError &ex)
        {
            std::cerr << (from_stdin ? "Error sending from stdin: " : "Error sending files: ") << ex.what()
                      << std::endl;
            logger_.log("error", to_string(ex.code()), ": ", ex.what());
            return 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Error: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    bool ClientSession::stdin_mode() const
    {
        if (config_.force_stdin)
        {
            return true;
        }
        return config_.inputs.empty() && ::isatty(STDIN_FILENO) == 0;
    }

    std::unique_ptr<TcpStream> ClientSession::connect()
    {
        const TransferOptions options{
            .cancellation = &cancellation_,
            .io_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.io_timeout),
        };
        if (config_.proxy)
        {
            logger_.log("info", "dialing ", config_.target.host, ':', config_.target.port, " via SOCKS5 proxy ",
                        config_.proxy->host, ':', config_.proxy->port);
            return Socks5Dialer(*config_.proxy).dial(config_.target, options.next_operation());
        }
        logger_.log("info", "dialing ", config_.target.host, ':', config_.target.port, " directly");
        return TcpStream::connect(config_.target.host, config_.target.port, options.next_operation());
    }

    void ClientSession::print_summary(const SendSummary &summary, std::chrono::steady_clock::duration elapsed) const
    {
        std::cout << "\nAll items transferred successfully in " << format_duration(elapsed) << " (" << summary.files
                  << " files, " << summary.directories << " directories, "
                  << format_bytes(static_cast<double>(summary.bytes)) << ")" << std::endl;
    }

} // namespace ferry::client
