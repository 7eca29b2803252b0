#include "ferry/tcp_stream.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include "ferry/error_codes.hpp"

namespace ferry
{

    namespace
    {
        constexpr auto kPollSlice = std::chrono::milliseconds(50);

        // getaddrinfo cannot be interrupted and Asio joins its resolver thread
        // when the owning io_context goes away, so lookups run on a thread of
        // their own that is abandoned once the stop condition fires.
        asio::ip::tcp::resolver::results_type resolve(const std::string &host, std::uint16_t port,
                                                      const StopCondition &stop)
        {
            stop.throw_if_stopped();
            auto promise = std::make_shared<std::promise<asio::ip::tcp::resolver::results_type>>();
            auto lookup = promise->get_future();
            std::thread([promise, host, port]
                        {
                            asio::io_context context;
                            asio::ip::tcp::resolver resolver(context);
                            std::error_code ec;
                            auto endpoints = resolver.resolve(host, std::to_string(port), ec);
                            if (ec)
                            {
                                promise->set_exception(std::make_exception_ptr(
                                    TransferError(ErrorCode::IoError, "cannot resolve " + host + ": " + ec.message())));
                                return;
                            }
                            promise->set_value(std::move(endpoints));
                        })
                .detach();

            for (;;)
            {
                stop.throw_if_stopped();
                const auto slice =
                    std::min<std::chrono::steady_clock::duration>(kPollSlice, stop.deadline().remaining());
                if (lookup.wait_for(slice) == std::future_status::ready)
                {
                    return lookup.get();
                }
            }
        }
    } // namespace

    std::uint16_t parse_port(const std::string &text)
    {
        if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos)
        {
            throw std::runtime_error("Invalid port: " + text);
        }
        return checked_port(std::stoll(text));
    }

    std::uint16_t checked_port(std::int64_t value)
    {
        if (value < 1 || value > 65535)
        {
            throw std::runtime_error("Invalid port: " + std::to_string(value));
        }
        return static_cast<std::uint16_t>(value);
    }

    TcpStream::TcpStream(UnconnectedTag /*tag*/) : socket_(io_context_) {}

    TcpStream::TcpStream(asio::ip::tcp::socket socket) : socket_(io_context_)
    {
        const auto protocol = socket.local_endpoint().protocol();
        socket_.assign(protocol, socket.release());
    }

    TcpStream::~TcpStream()
    {
        close();
    }

    std::unique_ptr<TcpStream> TcpStream::connect(const std::string &host, std::uint16_t port,
                                                  const StopCondition &stop)
    {
        const auto endpoints = resolve(host, port, stop);
        auto stream = std::make_unique<TcpStream>(UnconnectedTag{});

        std::error_code result;
        bool done = false;
        asio::async_connect(stream->socket_, endpoints,
                            [&](const std::error_code &ec, const asio::ip::tcp::endpoint & /*endpoint*/)
                            {
                                result = ec;
                                done = true;
                            });
        stream->wait(stop, done);
        if (result)
        {
            throw TransferError(ErrorCode::IoError,
                                "failed to connect to " + host + ":" + std::to_string(port) + ": " + result.message());
        }
        return stream;
    }

    std::size_t TcpStream::read_some(std::span<std::uint8_t> buffer, const StopCondition &stop)
    {
        stop.throw_if_stopped();
        std::error_code result;
        std::size_t transferred = 0;
        bool done = false;
        socket_.async_read_some(asio::buffer(buffer.data(), buffer.size()),
                                [&](const std::error_code &ec, std::size_t bytes)
                                {
                                    result = ec;
                                    transferred = bytes;
                                    done = true;
                                });
        wait(stop, done);
        if (result == asio::error::eof)
        {
            return 0;
        }
        if (result)
        {
            throw TransferError(ErrorCode::IoError, "read failed: " + result.message());
        }
        return transferred;
    }

    void TcpStream::write_all(std::span<const std::uint8_t> data, const StopCondition &stop)
    {
        stop.throw_if_stopped();
        std::error_code result;
        bool done = false;
        asio::async_write(socket_, asio::buffer(data.data(), data.size()),
                          [&](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              result = ec;
                              done = true;
                          });
        wait(stop, done);
        if (result)
        {
            throw TransferError(ErrorCode::IoError, "write failed: " + result.message());
        }
    }

    void TcpStream::close()
    {
        std::error_code ec;
        if (socket_.is_open())
        {
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);
        }
    }

    std::string TcpStream::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    void TcpStream::wait(const StopCondition &stop, const bool &done)
    {
        while (!done)
        {
            if (stop.stopped())
            {
                // Abort the pending operation and let its handler run before
                // reporting; the stream is unusable afterwards.
                std::error_code ignored;
                socket_.close(ignored);
                io_context_.restart();
                io_context_.run();
                stop.throw_if_stopped();
            }
            const auto slice = std::min<std::chrono::steady_clock::duration>(kPollSlice, stop.deadline().remaining());
            io_context_.restart();
            io_context_.run_for(slice);
        }
    }

} // namespace ferry
