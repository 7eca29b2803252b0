#include "ferry/stream.hpp"

namespace ferry
{

    std::size_t read_full(DuplexStream &stream, std::span<std::uint8_t> buffer, const StopCondition &stop)
    {
        std::size_t filled = 0;
        while (filled < buffer.size())
        {
            const auto count = stream.read_some(buffer.subspan(filled), stop);
            if (count == 0)
            {
                break;
            }
            filled += count;
        }
        return filled;
    }

    StopCondition TransferOptions::next_operation() const
    {
        if (io_timeout.count() <= 0)
        {
            return StopCondition(cancellation, Deadline{});
        }
        return StopCondition(cancellation, Deadline::after(io_timeout));
    }

} // namespace ferry
