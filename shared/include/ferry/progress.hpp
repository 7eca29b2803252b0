/**
 * Ferry - Per-item progress accounting and the sinks that render it.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace ferry
{

    struct ProgressObservation
    {
        std::string label;
        std::uint64_t current{};
        std::optional<std::uint64_t> total;
        std::chrono::steady_clock::duration elapsed{};
        bool final{};

        // Empty when the total is unknown. A zero-byte total reports 100.
        std::optional<double> percent() const;
        double bytes_per_second() const;
    };

    class ProgressSink
    {
    public:
        virtual ~ProgressSink() = default;

        virtual void observe(const ProgressObservation &observation) = 0;
    };

    class NullProgressSink : public ProgressSink
    {
    public:
        void observe(const ProgressObservation & /*observation*/) override {}
    };

    // Single-line terminal rendering, redrawn at most every 100ms.
    class ConsoleProgressSink : public ProgressSink
    {
    public:
        explicit ConsoleProgressSink(std::ostream &out);

        void observe(const ProgressObservation &observation) override;

    private:
        std::ostream &out_;
        std::mutex mutex_;
        std::chrono::steady_clock::time_point last_draw_{};
    };

    // Logs every quarter of a known total and the completion of each item.
    class LogProgressSink : public ProgressSink
    {
    public:
        explicit LogProgressSink(std::string context);

        void observe(const ProgressObservation &observation) override;

    private:
        std::string context_;
        int last_quarter_{0};
    };

    // Tracks one item. A fresh counter is created for every file or stream
    // transferred; it is never shared between items.
    class ProgressCounter
    {
    public:
        ProgressCounter(std::string label, std::optional<std::uint64_t> total, ProgressSink &sink);

        void advance(std::uint64_t bytes);

        // Emits the closing observation with current == total.
        void finish();

        std::uint64_t current() const noexcept { return current_; }
        const std::optional<std::uint64_t> &total() const noexcept { return total_; }

    private:
        void emit(bool final);

        std::string label_;
        std::optional<std::uint64_t> total_;
        std::uint64_t current_{0};
        std::uint64_t last_reported_{0};
        std::chrono::steady_clock::time_point start_time_;
        ProgressSink &sink_;
    };

    std::string format_bytes(double bytes);

    std::string format_duration(std::chrono::steady_clock::duration duration);

} // namespace ferry
