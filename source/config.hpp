// -*- fil-column: 120; indent-tabs-mode: nil -*-
#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include "anylog_constants.hpp"
#include "anylog_types.hpp"

struct ParserConfig {
    // Applied to timestamps written without a zone.
    AnylogTypes::UtcOffset fallback_offset {std::chrono::minutes {0}};
    std::chrono::days year_rollback_tolerance {ANYLOG::YEAR_ROLLBACK_TOLERANCE};
    std::chrono::minutes time_of_day_tolerance {ANYLOG::TIME_OF_DAY_TOLERANCE};
};

/**
 * Parse a UTC offset given by a user
 *
 * Accepts "Z", "UTC", "+HH", "+HH:MM" and "+HHMM" (or '-' in place of '+'). Hours must be below 24.
 *
 * @returns the offset, or an empty optional if `text` isn't one of the forms above.
 */
auto parse_utc_offset(std::string_view text) -> std::optional<AnylogTypes::UtcOffset>;

/**
 * Parse an absolute reference time given by a user
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS[.f](Z|+HH:MM|+HHMM)"; the zone is mandatory so the result never depends on the machine.
 *
 * @returns the instant, or an empty optional if `text` isn't in that form or names an impossible date.
 */
auto parse_reference_time(std::string_view text) -> std::optional<AnylogTypes::timestamp>;
