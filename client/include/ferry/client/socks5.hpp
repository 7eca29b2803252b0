#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/client/config.hpp"
#include "ferry/stream.hpp"
#include "ferry/tcp_stream.hpp"

namespace ferry::client
{

    // RFC 1928 CONNECT without authentication. The target is always sent as a
    // domain name so hidden-service addresses are resolved by the proxy.
    std::vector<std::uint8_t> encode_socks5_greeting();

    std::vector<std::uint8_t> encode_socks5_connect(const std::string &host, std::uint16_t port);

    std::string_view socks5_reply_message(std::uint8_t code) noexcept;

    // Runs the handshake on an already connected proxy stream. Throws
    // TransferError(IoError) when the proxy refuses.
    void socks5_handshake(DuplexStream &stream, const std::string &host, std::uint16_t port, const StopCondition &stop);

    class Socks5Dialer
    {
    public:
        explicit Socks5Dialer(Endpoint proxy);

        std::unique_ptr<TcpStream> dial(const Endpoint &target, const StopCondition &stop) const;

    private:
        Endpoint proxy_;
    };

} // namespace ferry::client
