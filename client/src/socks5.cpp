#include "ferry/client/socks5.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"

namespace ferry::client
{

    namespace
    {
        constexpr std::uint8_t kVersion = 0x05;
        constexpr std::uint8_t kMethodNoAuth = 0x00;
        constexpr std::uint8_t kCommandConnect = 0x01;
        constexpr std::uint8_t kAddressIpv4 = 0x01;
        constexpr std::uint8_t kAddressDomain = 0x03;
        constexpr std::uint8_t kAddressIpv6 = 0x04;

        void read_reply_bytes(DuplexStream &stream, std::span<std::uint8_t> buffer, const StopCondition &stop)
        {
            if (read_full(stream, buffer, stop) != buffer.size())
            {
                throw TransferError(ErrorCode::IoError, "SOCKS5 proxy closed the connection during the handshake");
            }
        }
    } // namespace

    std::vector<std::uint8_t> encode_socks5_greeting()
    {
        return {kVersion, 0x01, kMethodNoAuth};
    }

    std::vector<std::uint8_t> encode_socks5_connect(const std::string &host, std::uint16_t port)
    {
        if (host.empty() || host.size() > 255)
        {
            throw std::invalid_argument("SOCKS5 host name must be 1-255 bytes");
        }
        std::vector<std::uint8_t> request{kVersion, kCommandConnect, 0x00, kAddressDomain,
                                          static_cast<std::uint8_t>(host.size())};
        request.insert(request.end(), host.begin(), host.end());
        request.push_back(static_cast<std::uint8_t>((port >> 8) & 0xFF));
        request.push_back(static_cast<std::uint8_t>(port & 0xFF));
        return request;
    }

    std::string_view socks5_reply_message(std::uint8_t code) noexcept
    {
        switch (code)
        {
        case 0x00:
            return "succeeded";
        case 0x01:
            return "general SOCKS server failure";
        case 0x02:
            return "connection not allowed by ruleset";
        case 0x03:
            return "network unreachable";
        case 0x04:
            return "host unreachable";
        case 0x05:
            return "connection refused";
        case 0x06:
            return "TTL expired";
        case 0x07:
            return "command not supported";
        case 0x08:
            return "address type not supported";
        default:
            return "unknown error";
        }
    }

    void socks5_handshake(DuplexStream &stream, const std::string &host, std::uint16_t port, const StopCondition &stop)
    {
        stream.write_all(encode_socks5_greeting(), stop);

        std::array<std::uint8_t, 2> method{};
        read_reply_bytes(stream, method, stop);
        if (method[0] != kVersion)
        {
            throw TransferError(ErrorCode::IoError, "proxy is not a SOCKS5 server");
        }
        if (method[1] != kMethodNoAuth)
        {
            throw TransferError(ErrorCode::IoError, "SOCKS5 proxy requires an unsupported authentication method");
        }

        stream.write_all(encode_socks5_connect(host, port), stop);

        std::array<std::uint8_t, 4> reply{};
        read_reply_bytes(stream, reply, stop);
        if (reply[0] != kVersion)
        {
            throw TransferError(ErrorCode::IoError, "malformed SOCKS5 reply");
        }
        if (reply[1] != 0x00)
        {
            throw TransferError(ErrorCode::IoError, "SOCKS5 connect to " + host + ":" + std::to_string(port) +
                                                        " failed: " + std::string(socks5_reply_message(reply[1])));
        }

        std::size_t address_length = 0;
        switch (reply[3])
        {
        case kAddressIpv4:
            address_length = 4;
            break;
        case kAddressIpv6:
            address_length = 16;
            break;
        case kAddressDomain:
        {
            std::array<std::uint8_t, 1> length{};
            read_reply_bytes(stream, length, stop);
            address_length = length[0];
            break;
        }
        default:
            throw TransferError(ErrorCode::IoError, "SOCKS5 reply has unknown address type");
        }

        // Bound address and port are not used.
        std::vector<std::uint8_t> bound(address_length + 2);
        read_reply_bytes(stream, bound, stop);
    }

    Socks5Dialer::Socks5Dialer(Endpoint proxy) : proxy_(std::move(proxy)) {}

    std::unique_ptr<TcpStream> Socks5Dialer::dial(const Endpoint &target, const StopCondition &stop) const
    {
        std::unique_ptr<TcpStream> stream;
        try
        {
            stream = TcpStream::connect(proxy_.host, proxy_.port, stop);
        }
        catch (const TransferError &ex)
        {
            throw TransferError(ex.code(), std::string("can't connect to SOCKS5 proxy: ") + ex.what());
        }
        spdlog::debug("connected to SOCKS5 proxy {}:{}", proxy_.host, proxy_.port);
        socks5_handshake(*stream, target.host, target.port, stop);
        return stream;
    }

} // namespace ferry::client
