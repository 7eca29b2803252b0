/**
 * Ferry - Duplex byte stream abstraction consumed by the transfer core.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

#include "ferry/cancellation.hpp"

namespace ferry
{

    class DuplexStream
    {
    public:
        virtual ~DuplexStream() = default;

        // Reads at least one byte unless the peer closed the stream, in which
        // case 0 is returned. Failures throw TransferError.
        virtual std::size_t read_some(std::span<std::uint8_t> buffer, const StopCondition &stop) = 0;

        virtual void write_all(std::span<const std::uint8_t> data, const StopCondition &stop) = 0;

        virtual void close() = 0;
    };

    // Fills the buffer unless the stream ends first; returns the byte count read.
    std::size_t read_full(DuplexStream &stream, std::span<std::uint8_t> buffer, const StopCondition &stop);

    struct TransferOptions
    {
        const CancellationToken *cancellation{nullptr};
        // Zero disables the per-operation deadline.
        std::chrono::milliseconds io_timeout{0};

        StopCondition next_operation() const;
    };

} // namespace ferry
