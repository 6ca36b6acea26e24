#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include "anylog_constants.hpp"
#include "anylog_types.hpp"

/// TimestampNormalizer - turn the fields a grammar read into an absolute, zone-aware instant
///
/// Assumptions:
///
/// 1.  A timestamp without a zone was written in the caller-supplied fallback offset. The ambient time zone of the
///     machine is never consulted.
///
/// 2.  A timestamp without a year was written in the year of the reference time, as seen in the effective offset,
///     unless that places it more than the year rollback tolerance after the reference time. Then it was written in
///     the previous year ("Dec 31" read early on Jan 2).
///
/// 3.  A timestamp without a date was written on the reference day, unless that places it more than the time of day
///     tolerance after the reference time. Then it was written the day before.
///
/// 4.  A missing fraction is exactly zero.
///
class TimestampNormalizer
{
  public:
    using timestamp = AnylogTypes::timestamp;

    // The fields can't form a real date or clock time, e.g. "Feb 29" in an inferred non-leap year.
    struct invalid_calendar_date : std::runtime_error {
        explicit invalid_calendar_date(const std::string& description)
            : std::runtime_error(description) {}
    };

    TimestampNormalizer() = default;

    TimestampNormalizer(std::chrono::days year_rollback_tolerance, std::chrono::minutes time_of_day_tolerance);

    /**
     * Resolve raw fields against a reference time
     *
     * @param[in] raw fields read by a grammar
     * @param[in] reference_now the "current" time used to fill in a missing year or date
     * @param[in] fallback_offset applied when `raw` carries no offset; ignored otherwise
     *
     * @returns the absolute instant together with the offset it was expressed in.
     *
     * @throws invalid_calendar_date if the fields, once the year is known, don't form a valid date and time.
     */
    auto resolve(const AnylogTypes::RawTimestamp& raw, timestamp reference_now,
                 AnylogTypes::UtcOffset fallback_offset) const -> AnylogTypes::ResolvedTimestamp;

    // True if every present field is within its range and the day exists in its month. Feb 29 passes when the year
    // is unknown, since only resolve() can tell.
    static auto fields_in_range(const AnylogTypes::RawTimestamp& raw) -> bool;

    // "YYYY-MM-DDTHH:MM:SS[.fffffffff]+HH:MM" in the timestamp's own offset, trailing zero fraction digits dropped.
    static auto format_iso8601(const AnylogTypes::ResolvedTimestamp& ts) -> std::string;

    auto year_rollback_tolerance() const {
        return m_year_rollback_tolerance;
    }

    auto time_of_day_tolerance() const {
        return m_time_of_day_tolerance;
    }

  private:
    std::chrono::days m_year_rollback_tolerance {ANYLOG::YEAR_ROLLBACK_TOLERANCE};
    std::chrono::minutes m_time_of_day_tolerance {ANYLOG::TIME_OF_DAY_TOLERANCE};
};
