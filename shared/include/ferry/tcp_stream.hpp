/**
 * Ferry - TCP implementation of DuplexStream on standalone Asio.
 *
 * Every operation runs asynchronously on a private io_context in short slices
 * so that cancellation tokens and deadlines are honoured while blocked.
 */
#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include "ferry/stream.hpp"

namespace ferry
{

    // Validates a decimal TCP port in 1-65535; throws std::runtime_error otherwise.
    std::uint16_t parse_port(const std::string &text);
    std::uint16_t checked_port(std::int64_t value);

    class TcpStream : public DuplexStream
    {
        struct UnconnectedTag
        {
            explicit UnconnectedTag() = default;
        };

    public:
        // Adopts a connected socket owned by another io_context.
        explicit TcpStream(asio::ip::tcp::socket socket);
        // Used by connect(); the socket is opened there.
        explicit TcpStream(UnconnectedTag tag);
        ~TcpStream() override;

        TcpStream(const TcpStream &) = delete;
        TcpStream &operator=(const TcpStream &) = delete;

        static std::unique_ptr<TcpStream> connect(const std::string &host, std::uint16_t port,
                                                  const StopCondition &stop = {});

        std::size_t read_some(std::span<std::uint8_t> buffer, const StopCondition &stop) override;
        void write_all(std::span<const std::uint8_t> data, const StopCondition &stop) override;
        void close() override;

        std::string remote_endpoint() const;

    private:
        void wait(const StopCondition &stop, const bool &done);

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
    };

} // namespace ferry
