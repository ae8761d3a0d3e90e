#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <compare>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace almanac {

/**
 * Timestamp - a point in time, stored as milliseconds since the Unix epoch
 * so it maps directly onto SQLite INTEGER columns.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * ISO 8601, UTC, millisecond precision: 2024-03-01T09:30:00.000Z
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(to_time_point());
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        auto ms = ((millis_ % 1000) + 1000) % 1000;
        oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
        return oss.str();
    }

    /**
     * Compact UTC form used in file names: 20240301T093000Z
     */
    [[nodiscard]] std::string to_compact_string() const {
        auto time_t = Clock::to_time_t(to_time_point());
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(millis_ - d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * Source of "now" for stamping, TTLs and retention ages. The store never
 * reads the system clock directly so tests can drive time.
 */
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override { return Timestamp::now(); }
};

/**
 * Clock that only moves when told to.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp(1'700'000'000'000)) : now_(start) {}

    [[nodiscard]] Timestamp now() const override { return now_; }

    void set(Timestamp t) { now_ = t; }
    void advance(Timestamp::Duration d) { now_ = now_ + d; }

private:
    Timestamp now_;
};

/**
 * Monotonic elapsed-time measurement for metrics.
 */
class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] double elapsed_ms() const {
        auto d = std::chrono::steady_clock::now() - start_;
        return std::chrono::duration<double, std::milli>(d).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace almanac
