/**
 * Ferry - Cancellation tokens and deadlines for blocking stream operations.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace ferry
{

    class CancellationToken
    {
    public:
        void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

        bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> cancelled_{false};
    };

    class Deadline
    {
    public:
        using Clock = std::chrono::steady_clock;

        Deadline() = default;

        static Deadline after(Clock::duration timeout);

        bool unbounded() const noexcept { return !at_.has_value(); }
        bool expired() const noexcept;
        Clock::duration remaining() const noexcept;

    private:
        explicit Deadline(Clock::time_point at) : at_(at) {}

        std::optional<Clock::time_point> at_;
    };

    // Checked before and during every blocking stream operation. A default
    // constructed condition never stops.
    class StopCondition
    {
    public:
        StopCondition() = default;
        StopCondition(const CancellationToken *token, Deadline deadline);

        bool cancelled() const noexcept;
        bool expired() const noexcept;
        bool stopped() const noexcept { return cancelled() || expired(); }

        const Deadline &deadline() const noexcept { return deadline_; }

        // Throws TransferError with ErrorCode::Cancelled or ErrorCode::Timeout.
        void throw_if_stopped() const;

    private:
        const CancellationToken *token_{nullptr};
        Deadline deadline_{};
    };

} // namespace ferry
