#pragma once

#include <chrono>
#include <cstddef>

namespace ANYLOG {
    // A year-less timestamp resolving further than this into the future belongs to the previous year.
    constexpr std::chrono::days    YEAR_ROLLBACK_TOLERANCE {3};
    // A date-less timestamp resolving further than this into the future belongs to the previous day.
    constexpr std::chrono::minutes TIME_OF_DAY_TOLERANCE   {60};
    // Nanosecond resolution.
    constexpr std::size_t          MAX_FRACTION_DIGITS     {9};
    // Offsets must stay strictly inside +/- 24h.
    constexpr unsigned             MAX_OFFSET_HOURS        {23};
} // namespace ANYLOG
