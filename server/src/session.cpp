#include "ferry/server/session.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"
#include "ferry/progress.hpp"

namespace ferry::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services, std::uint64_t id)
        : stream_(std::move(socket)),
          services_(std::move(services)),
          id_(id),
          remote_endpoint_(stream_.remote_endpoint()) {}

    Session::~Session()
    {
        stream_.close();
    }

    void Session::run()
    {
        spdlog::info("Client connected from {} (session {})", remote_endpoint_, id_);

        LogProgressSink progress(remote_endpoint_);
        TransferOptions options{
            .cancellation = &cancellation_,
            .io_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(services_.io_timeout),
        };
        Receiver receiver(stream_, services_.filesystem, services_.root, progress, options);

        try
        {
            summary_ = receiver.run();
            spdlog::info("Connection from {} closed: {} files, {} directories, {}", remote_endpoint_, summary_->files,
                         summary_->directories, format_bytes(static_cast<double>(summary_->bytes)));
        }
        catch (const TransferError &ex)
        {
            spdlog::error("Error receiving from {}: {} [{}]", remote_endpoint_, ex.what(), to_string(ex.code()));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Error receiving from {}: {}", remote_endpoint_, ex.what());
        }

        stream_.close();
    }

    void Session::cancel() noexcept
    {
        cancellation_.cancel();
    }

} // namespace ferry::server
