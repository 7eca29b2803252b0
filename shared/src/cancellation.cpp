#include "ferry/cancellation.hpp"

#include <algorithm>

#include "ferry/error_codes.hpp"

namespace ferry
{

    Deadline Deadline::after(Clock::duration timeout)
    {
        return Deadline(Clock::now() + timeout);
    }

    bool Deadline::expired() const noexcept
    {
        return at_.has_value() && Clock::now() >= *at_;
    }

    Deadline::Clock::duration Deadline::remaining() const noexcept
    {
        if (!at_)
        {
            return Clock::duration::max();
        }
        return std::max(*at_ - Clock::now(), Clock::duration::zero());
    }

    StopCondition::StopCondition(const CancellationToken *token, Deadline deadline)
        : token_(token), deadline_(deadline) {}

    bool StopCondition::cancelled() const noexcept
    {
        return token_ != nullptr && token_->cancelled();
    }

    bool StopCondition::expired() const noexcept
    {
        return deadline_.expired();
    }

    void StopCondition::throw_if_stopped() const
    {
        if (cancelled())
        {
            throw TransferError(ErrorCode::Cancelled, "operation cancelled");
        }
        if (expired())
        {
            throw TransferError(ErrorCode::Timeout, "operation timed out");
        }
    }

} // namespace ferry
