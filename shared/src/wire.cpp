#include "ferry/wire.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>

#include "ferry/error_codes.hpp"

namespace ferry::wire
{

    namespace
    {
        constexpr std::size_t kLengthFieldSize = sizeof(std::uint32_t);
        constexpr std::size_t kTrailerSize = sizeof(std::int64_t) + 1;

        std::uint32_t read_u32_be(std::span<const std::uint8_t, 4> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t, 4> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        std::int64_t read_i64_be(std::span<const std::uint8_t, 8> buffer)
        {
            std::uint64_t value = 0;
            for (const auto byte : buffer)
            {
                value = (value << 8) | static_cast<std::uint64_t>(byte);
            }
            return static_cast<std::int64_t>(value);
        }

        void write_i64_be(std::int64_t value, std::span<std::uint8_t, 8> buffer)
        {
            auto bits = static_cast<std::uint64_t>(value);
            for (std::size_t i = buffer.size(); i > 0; --i)
            {
                buffer[i - 1] = static_cast<std::uint8_t>(bits & 0xFF);
                bits >>= 8;
            }
        }

        void read_exactly(DuplexStream &stream, std::span<std::uint8_t> buffer, const StopCondition &stop,
                          const char *what)
        {
            const auto count = read_full(stream, buffer, stop);
            if (count != buffer.size())
            {
                throw TransferError(ErrorCode::IoError,
                                    std::string("file info read: stream ended inside ") + what);
            }
        }

    } // namespace

    std::vector<std::uint8_t> encode_descriptor_bytes(const ItemDescriptor &descriptor)
    {
        if (descriptor.name.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("item name too large to frame");
        }
        const auto name_length = descriptor.name.size();
        std::vector<std::uint8_t> frame(kLengthFieldSize + name_length + kTrailerSize);
        const std::span<std::uint8_t> out(frame);

        write_u32_be(static_cast<std::uint32_t>(name_length), out.first<kLengthFieldSize>());
        std::copy(descriptor.name.begin(), descriptor.name.end(),
                  frame.begin() + static_cast<std::ptrdiff_t>(kLengthFieldSize));
        write_i64_be(descriptor.size, out.subspan(kLengthFieldSize + name_length).first<8>());
        frame.back() = descriptor.is_directory ? 1 : 0;
        return frame;
    }

    void encode_descriptor(DuplexStream &stream, const ItemDescriptor &descriptor, const StopCondition &stop)
    {
        const auto frame = encode_descriptor_bytes(descriptor);
        stream.write_all(frame, stop);
    }

    std::optional<ItemDescriptor> decode_descriptor(DuplexStream &stream, const StopCondition &stop)
    {
        std::array<std::uint8_t, kLengthFieldSize> length_field{};
        const auto header_read = read_full(stream, length_field, stop);
        if (header_read == 0)
        {
            return std::nullopt;
        }
        if (header_read != length_field.size())
        {
            throw TransferError(ErrorCode::IoError, "file info read: stream ended inside name length");
        }

        const auto name_length = read_u32_be(length_field);
        if (name_length > kMaxNameLength)
        {
            throw TransferError(ErrorCode::ProtocolError,
                                "filename too long: " + std::to_string(name_length) + " bytes");
        }

        ItemDescriptor descriptor;
        std::vector<std::uint8_t> name(name_length);
        read_exactly(stream, name, stop, "name");
        descriptor.name.assign(name.begin(), name.end());

        std::array<std::uint8_t, kTrailerSize> trailer{};
        read_exactly(stream, trailer, stop, "size and flag");
        descriptor.size = read_i64_be(std::span<const std::uint8_t>(trailer).first<8>());

        const auto flag = trailer.back();
        if (flag > 1)
        {
            throw TransferError(ErrorCode::ProtocolError,
                                "invalid directory flag " + std::to_string(flag) + " for " + descriptor.name);
        }
        descriptor.is_directory = flag == 1;
        return descriptor;
    }

} // namespace ferry::wire
