#include "ferry/progress.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <spdlog/spdlog.h>

namespace ferry
{

    namespace
    {
        constexpr auto kRedrawInterval = std::chrono::milliseconds(100);
    } // namespace

    std::optional<double> ProgressObservation::percent() const
    {
        if (!total)
        {
            return std::nullopt;
        }
        if (*total == 0)
        {
            return 100.0;
        }
        const auto clamped = std::min(current, *total);
        return static_cast<double>(clamped) / static_cast<double>(*total) * 100.0;
    }

    double ProgressObservation::bytes_per_second() const
    {
        const auto seconds = std::chrono::duration<double>(elapsed).count();
        if (seconds <= 0.0)
        {
            return 0.0;
        }
        return static_cast<double>(current) / seconds;
    }

    ConsoleProgressSink::ConsoleProgressSink(std::ostream &out) : out_(out) {}

    void ConsoleProgressSink::observe(const ProgressObservation &observation)
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        if (observation.final)
        {
            out_ << '\r' << observation.label << ": " << format_bytes(static_cast<double>(observation.current))
                 << " transferred in " << format_duration(observation.elapsed)
                 << spdlog::fmt_lib::format(" ({:.1f} MB/s)", observation.bytes_per_second() / 1024.0 / 1024.0)
                 << "        " << std::endl;
            last_draw_ = {};
            return;
        }

        if (now - last_draw_ < kRedrawInterval)
        {
            return;
        }

        const auto speed = format_bytes(observation.bytes_per_second()) + "/s";
        if (const auto percent = observation.percent())
        {
            out_ << '\r' << observation.label << ": " << format_bytes(static_cast<double>(observation.current)) << '/'
                 << format_bytes(static_cast<double>(*observation.total))
                 << spdlog::fmt_lib::format(" ({:.1f}%)", *percent) << " | Speed: " << speed << std::flush;
        }
        else
        {
            out_ << '\r' << observation.label << ": " << format_bytes(static_cast<double>(observation.current))
                 << " | Speed: " << speed << std::flush;
        }
        last_draw_ = now;
    }

    LogProgressSink::LogProgressSink(std::string context) : context_(std::move(context)) {}

    void LogProgressSink::observe(const ProgressObservation &observation)
    {
        if (observation.final)
        {
            spdlog::info("{} {} complete: {} in {} ({}/s)", context_, observation.label,
                         format_bytes(static_cast<double>(observation.current)), format_duration(observation.elapsed),
                         format_bytes(observation.bytes_per_second()));
            last_quarter_ = 0;
            return;
        }
        const auto percent = observation.percent();
        if (!percent)
        {
            return;
        }
        const auto quarter = static_cast<int>(*percent / 25.0);
        if (quarter > last_quarter_ && quarter < 4)
        {
            last_quarter_ = quarter;
            spdlog::debug("{} {} {:.0f}% ({}/{})", context_, observation.label, *percent,
                          format_bytes(static_cast<double>(observation.current)),
                          format_bytes(static_cast<double>(*observation.total)));
        }
    }

    ProgressCounter::ProgressCounter(std::string label, std::optional<std::uint64_t> total, ProgressSink &sink)
        : label_(std::move(label)),
          total_(total),
          start_time_(std::chrono::steady_clock::now()),
          sink_(sink) {}

    void ProgressCounter::advance(std::uint64_t bytes)
    {
        current_ += bytes;
        emit(false);
    }

    void ProgressCounter::finish()
    {
        if (total_)
        {
            current_ = *total_;
        }
        emit(true);
    }

    void ProgressCounter::emit(bool final)
    {
        auto value = total_ ? std::min(current_, *total_) : current_;
        last_reported_ = std::max(last_reported_, value);

        ProgressObservation observation;
        observation.label = label_;
        observation.current = last_reported_;
        observation.total = total_;
        observation.elapsed = std::chrono::steady_clock::now() - start_time_;
        observation.final = final;
        sink_.observe(observation);
    }

    std::string format_bytes(double bytes)
    {
        static constexpr std::array<const char *, 5> kUnits{"B", "KB", "MB", "GB", "TB"};
        std::size_t unit = 0;
        while (bytes >= 1024.0 && unit < kUnits.size() - 1)
        {
            bytes /= 1024.0;
            ++unit;
        }
        return spdlog::fmt_lib::format("{:.1f} {}", bytes, kUnits[unit]);
    }

    std::string format_duration(std::chrono::steady_clock::duration duration)
    {
        const auto total_seconds = std::chrono::round<std::chrono::seconds>(duration).count();
        const auto hours = total_seconds / 3600;
        const auto minutes = (total_seconds % 3600) / 60;
        const auto seconds = total_seconds % 60;
        if (hours > 0)
        {
            return spdlog::fmt_lib::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
        }
        return spdlog::fmt_lib::format("{:02}:{:02}", minutes, seconds);
    }

} // namespace ferry
