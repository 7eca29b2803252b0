#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstddef>
#include <cstdint>

#include "ferry/filesystem.hpp"
#include "ferry/server/config.hpp"
#include "ferry/server/session_manager.hpp"

namespace ferry::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        // Accepts until stop() or a termination signal, then cancels and joins
        // every running session.
        void run();

        void stop();

        std::uint16_t port() const;
        std::size_t active_sessions() { return session_manager_.active_count(); }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal(int signal);

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        LocalFilesystem filesystem_;
        SessionManager session_manager_;
        std::uint64_t next_session_id_{1};
    };

} // namespace ferry::server
