#include "ferry/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/server/session.hpp"

namespace ferry::server
{

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(1),
          acceptor_(io_context_),
          signals_(io_context_)
    {
        filesystem_.make_directories(config_.root);

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{}, files will be saved to {}", config_.address, port(), config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
        if (!ec) {
            handle_signal(signal);
        } });
    }

    void Server::run()
    {
        accept_next();
        io_context_.run();

        session_manager_.cancel_all();
        session_manager_.join_all();
        spdlog::info("Server stopped");
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   {
                       std::error_code ec;
                       acceptor_.close(ec);
                       signals_.cancel(ec);
                       io_context_.stop();
                   });
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            try
            {
                ServerServices services{filesystem_, config_.root, config_.io_timeout};
                auto session = std::make_shared<Session>(std::move(socket), services, next_session_id_++);
                const std::weak_ptr<Session> weak_session = session;
                session_manager_.launch(
                    session->id(), [session]
                    { session->run(); },
                    [weak_session]
                    {
                        if (auto live = weak_session.lock())
                        {
                            live->cancel();
                        }
                    });
                spdlog::debug("Accepted connection {} from {}", session->id(), session->remote_endpoint());
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Failed to start session: {}", ex.what());
            }
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal(int signal)
    {
        spdlog::info("Signal {} received, shutting down", signal);
        std::error_code ec;
        acceptor_.close(ec);
        session_manager_.cancel_all();
        io_context_.stop();
    }

} // namespace ferry::server
