/**
 * Ferry - Item descriptor frames exchanged ahead of every transferred entry.
 *
 * Frame layout, all integers big-endian:
 *   u32 name length | name bytes | i64 size | u8 directory flag
 * A file frame is followed by exactly `size` raw content bytes.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ferry/stream.hpp"

namespace ferry::wire
{

    inline constexpr std::size_t kMaxNameLength = 255;
    inline constexpr std::size_t kChunkSize = 32 * 1024;

    struct ItemDescriptor
    {
        std::string name;
        std::int64_t size{};
        bool is_directory{};

        bool operator==(const ItemDescriptor &) const = default;
    };

    std::vector<std::uint8_t> encode_descriptor_bytes(const ItemDescriptor &descriptor);

    void encode_descriptor(DuplexStream &stream, const ItemDescriptor &descriptor, const StopCondition &stop = {});

    // Returns std::nullopt when the stream ends cleanly before the first byte of
    // a frame. Oversized names and bad flags raise ErrorCode::ProtocolError,
    // truncated frames raise ErrorCode::IoError.
    std::optional<ItemDescriptor> decode_descriptor(DuplexStream &stream, const StopCondition &stop = {});

} // namespace ferry::wire
