#pragma once
/**
 * @file time.h
 * @brief Julian date time value used to evaluate time-varying properties
 */

#include "geoclamp/core/types.h"

namespace geoclamp::core {

/// J2000 epoch as a Julian day number
constexpr Real J2000_EPOCH = 2451545.0;

/**
 * @brief Julian date split into whole day number and seconds of day
 *
 * Keeping the day and the seconds apart preserves sub-millisecond
 * resolution that a single double loses at Julian day magnitudes.
 * The seconds component is kept in [0, 86400).
 */
struct JulianDate {
    Int32 day_number{0};
    Real seconds_of_day{0.0};

    constexpr JulianDate() noexcept = default;
    JulianDate(Int32 day, Real seconds) noexcept;

    /**
     * @brief Create from a fractional Julian day
     */
    static JulianDate from_total_days(Real total_days) noexcept;

    /**
     * @brief Create from a calendar date (UTC)
     *
     * Algorithm from "Astronomical Algorithms" by Jean Meeus.
     */
    static JulianDate from_calendar(int year, int month, int day,
                                    int hour, int minute, Real second) noexcept;

    /**
     * @brief Create from seconds since the J2000 epoch
     */
    static JulianDate from_j2000_seconds(Real seconds) noexcept;

    /// Fractional Julian day
    Real total_days() const noexcept;

    /// Seconds since the J2000 epoch
    Real j2000_seconds() const noexcept;

    /// Return this date advanced by the given number of seconds
    JulianDate add_seconds(Real seconds) const noexcept;

    /// Seconds from this date to another
    Real seconds_until(const JulianDate& other) const noexcept;

    bool operator==(const JulianDate& other) const noexcept {
        return day_number == other.day_number && seconds_of_day == other.seconds_of_day;
    }
    bool operator!=(const JulianDate& other) const noexcept { return !(*this == other); }
    bool operator<(const JulianDate& other) const noexcept {
        return day_number < other.day_number ||
               (day_number == other.day_number && seconds_of_day < other.seconds_of_day);
    }
};

} // namespace geoclamp::core
