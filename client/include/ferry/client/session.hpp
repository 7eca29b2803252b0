#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

#include "ferry/cancellation.hpp"
#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/sender.hpp"
#include "ferry/tcp_stream.hpp"

namespace ferry::client
{

    // One outbound connection: resolves the inputs, dials the receiver
    // (through the SOCKS5 proxy unless direct) and sends everything in order.
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        int run();

    private:
        bool stdin_mode() const;
        std::unique_ptr<TcpStream> connect();
        void print_summary(const SendSummary &summary, std::chrono::steady_clock::duration elapsed) const;

        ClientConfig config_;
        Logger logger_;
        CancellationToken cancellation_;
    };

} // namespace ferry::client
