#pragma once

#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "ferry/cancellation.hpp"
#include "ferry/filesystem.hpp"
#include "ferry/receiver.hpp"
#include "ferry/tcp_stream.hpp"

namespace ferry::server
{

    struct ServerServices
    {
        const LocalFilesystem &filesystem;
        std::filesystem::path root;
        std::chrono::seconds io_timeout;
    };

    // One accepted connection. Runs the receiver to completion on its own
    // thread and shares nothing with other sessions except the receive root.
    class Session
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services, std::uint64_t id);
        ~Session();

        void run();

        void cancel() noexcept;

        std::uint64_t id() const noexcept { return id_; }
        const std::string &remote_endpoint() const noexcept { return remote_endpoint_; }

        // Result of the last run(); empty while running or after a failure.
        const std::optional<ReceiveSummary> &summary() const noexcept { return summary_; }

    private:
        TcpStream stream_;
        ServerServices services_;
        std::uint64_t id_;
        std::string remote_endpoint_;
        CancellationToken cancellation_;
        std::optional<ReceiveSummary> summary_;
    };

} // namespace ferry::server
