#include "ferry/content.hpp"

#include <algorithm>
#include <array>
#include <vector>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"
#include "ferry/wire.hpp"

namespace ferry::wire
{

    std::uint64_t send_content(DuplexStream &stream, ReadableFile &source, const std::string &name,
                               std::uint64_t declared, ProgressCounter &progress, const TransferOptions &options,
                               crypto::ContentDigest &digest)
    {
        std::vector<std::uint8_t> buffer(kChunkSize);
        std::uint64_t sent = 0;
        while (sent < declared)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(kChunkSize, declared - sent));
            const auto count = source.read(std::span<std::uint8_t>(buffer.data(), want));
            if (count == 0)
            {
                throw TransferError(ErrorCode::IoError, name + " shrank during transfer: read " + std::to_string(sent) +
                                                            " of " + std::to_string(declared) + " declared bytes");
            }
            const std::span<const std::uint8_t> chunk(buffer.data(), count);
            stream.write_all(chunk, options.next_operation());
            digest.update(chunk);
            sent += count;
            progress.advance(count);
        }

        std::array<std::uint8_t, 1> probe{};
        if (source.read(probe) != 0)
        {
            spdlog::warn("{} grew during transfer; sent the declared {} bytes only", name, declared);
        }
        return sent;
    }

    std::uint64_t receive_content(DuplexStream &stream, WritableFile &sink, const std::string &name, std::uint64_t size,
                                  ProgressCounter &progress, const TransferOptions &options,
                                  crypto::ContentDigest &digest)
    {
        std::vector<std::uint8_t> buffer(kChunkSize);
        std::uint64_t received = 0;
        while (received < size)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(kChunkSize, size - received));
            const auto count = stream.read_some(std::span<std::uint8_t>(buffer.data(), want), options.next_operation());
            if (count == 0)
            {
                throw TransferError(ErrorCode::IoError, "stream ended after " + std::to_string(received) + " of " +
                                                            std::to_string(size) + " bytes of " + name);
            }
            const std::span<const std::uint8_t> chunk(buffer.data(), count);
            sink.write(chunk);
            digest.update(chunk);
            received += count;
            progress.advance(count);
        }
        return received;
    }

} // namespace ferry::wire
