#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>

namespace marginalia {

/**
 * CivilTime - Broken-down UTC calendar time.
 */
struct CivilTime {
    int year{1970};
    int month{1};   // 1..12
    int day{1};     // 1..31
    int hour{0};
    int minute{0};
    int second{0};
    int millisecond{0};

    bool operator==(const CivilTime&) const = default;
};

/**
 * Timestamp - Represents a point in time.
 *
 * Stored as milliseconds since the Unix epoch. Annotation timestamps travel
 * as ISO 8601 strings; the storage layer parses them and the core only
 * compares and formats instants.
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

    /**
     * UTC calendar breakdown.
     */
    [[nodiscard]] CivilTime to_civil() const;

    /**
     * Format as ISO 8601 string, e.g. "2024-01-05T10:00:00.000Z".
     */
    [[nodiscard]] std::string to_iso_string() const;

    /**
     * Date portion only, "YYYY-MM-DD".
     */
    [[nodiscard]] std::string to_iso_date() const;

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

} // namespace marginalia
