/**
 * @file time.cpp
 * @brief Julian date implementation
 */

#include "geoclamp/core/time.h"
#include <cmath>

namespace geoclamp::core {

JulianDate::JulianDate(Int32 day, Real seconds) noexcept
    : day_number(day), seconds_of_day(seconds)
{
    // Normalize seconds into [0, 86400)
    Real whole_days = std::floor(seconds_of_day / constants::SECONDS_PER_DAY);
    day_number += static_cast<Int32>(whole_days);
    seconds_of_day -= whole_days * constants::SECONDS_PER_DAY;
}

JulianDate JulianDate::from_total_days(Real total_days) noexcept
{
    Real whole = std::floor(total_days);
    return JulianDate(static_cast<Int32>(whole),
                      (total_days - whole) * constants::SECONDS_PER_DAY);
}

JulianDate JulianDate::from_calendar(int year, int month, int day,
                                     int hour, int minute, Real second) noexcept
{
    int a = (14 - month) / 12;
    int y = year + 4800 - a;
    int m = month + 12 * a - 3;

    // Julian Day Number (noon-based)
    int jdn = day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;

    // Julian days start at noon
    Real seconds = (static_cast<Real>(hour) - 12.0) * 3600.0 +
                   static_cast<Real>(minute) * 60.0 + second;

    return JulianDate(jdn, seconds);
}

JulianDate JulianDate::from_j2000_seconds(Real seconds) noexcept
{
    return JulianDate(static_cast<Int32>(J2000_EPOCH), 0.0).add_seconds(seconds);
}

Real JulianDate::total_days() const noexcept
{
    return static_cast<Real>(day_number) + seconds_of_day / constants::SECONDS_PER_DAY;
}

Real JulianDate::j2000_seconds() const noexcept
{
    return (static_cast<Real>(day_number) - J2000_EPOCH) * constants::SECONDS_PER_DAY +
           seconds_of_day;
}

JulianDate JulianDate::add_seconds(Real seconds) const noexcept
{
    return JulianDate(day_number, seconds_of_day + seconds);
}

Real JulianDate::seconds_until(const JulianDate& other) const noexcept
{
    return static_cast<Real>(other.day_number - day_number) * constants::SECONDS_PER_DAY +
           (other.seconds_of_day - seconds_of_day);
}

} // namespace geoclamp::core
