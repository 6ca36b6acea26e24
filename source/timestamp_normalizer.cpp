#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <tuple>

#include "timestamp_normalizer.hpp"
#include "logging.hpp"

namespace sc = std::chrono;

using RawTimestamp = AnylogTypes::RawTimestamp;
using ResolvedTimestamp = AnylogTypes::ResolvedTimestamp;
using UtcOffset = AnylogTypes::UtcOffset;

namespace {
    // Any leap year will do; it lets "Feb 29" through when the year isn't known yet.
    constexpr int LEAP_YEAR_STAND_IN {2000};

    auto clock_offset(const RawTimestamp& raw) -> sc::nanoseconds {
        return sc::hours {raw.hour} + sc::minutes {raw.minute} + sc::seconds {raw.second}
            + raw.fraction.value_or(sc::nanoseconds {0});
    }

    auto describe(const RawTimestamp& raw, sc::year year) -> std::string {
        std::ostringstream out;
        out << std::setfill('0') << std::setw(4) << static_cast<int>(year) << '-'
            << std::setw(2) << (raw.date ? raw.date->month : 0u) << '-'
            << std::setw(2) << (raw.date ? raw.date->day : 0u) << ' '
            << std::setw(2) << raw.hour << ':' << std::setw(2) << raw.minute << ':' << std::setw(2) << raw.second;
        return out.str();
    }

    // True if month/day/clock in `year` falls after `latest`, a wall clock reading expressed as if it were UTC. The
    // date itself needn't exist in `year`: Feb 29 of a common year still sorts after Feb 28.
    auto ahead_of(sc::month month, sc::day day, sc::nanoseconds clock, AnylogTypes::timestamp latest, sc::year year)
        -> bool {
        const auto latest_day = sc::floor<sc::days>(latest);
        const sc::year_month_day latest_ymd {latest_day};
        if (latest_ymd.year() != year) {
            return latest_ymd.year() < year;
        }
        const sc::nanoseconds latest_clock {latest - latest_day};
        return std::tuple {month, day, clock} > std::tuple {latest_ymd.month(), latest_ymd.day(), latest_clock};
    }

    auto to_instant(sc::sys_days day, sc::nanoseconds clock, UtcOffset offset) -> AnylogTypes::timestamp {
        return sc::time_point_cast<AnylogTypes::timestamp::duration>(day + clock - offset.val());
    }
} // namespace

TimestampNormalizer::TimestampNormalizer(sc::days year_rollback_tolerance, sc::minutes time_of_day_tolerance)
    : m_year_rollback_tolerance {year_rollback_tolerance}
    , m_time_of_day_tolerance {time_of_day_tolerance}
{
}

auto TimestampNormalizer::resolve(const RawTimestamp& raw, timestamp reference_now, UtcOffset fallback_offset) const
    -> ResolvedTimestamp
{
    const auto offset = raw.offset.value_or(fallback_offset);
    const auto local_today = sc::floor<sc::days>(reference_now + offset.val());
    const sc::year_month_day today {local_today};
    const auto year = raw.year ? sc::year {*raw.year} : today.year();

    if (raw.hour > 23 || raw.minute > 59 || raw.second > 59) {
        BLT(error) << "Impossible clock time in " << describe(raw, year);
        throw invalid_calendar_date {"Impossible clock time: " + describe(raw, year)};
    }
    const auto clock = clock_offset(raw);

    if (!raw.date) {
        auto instant = to_instant(local_today, clock, offset);
        if (instant > reference_now + m_time_of_day_tolerance) {
            BLT(debug) << "Time of day " << describe(raw, year) << " is ahead of the reference time. Using the day before.";
            instant = to_instant(local_today - sc::days {1}, clock, offset);
        }
        return ResolvedTimestamp {.instant = instant, .offset = offset};
    }

    const sc::month month {raw.date->month};
    const sc::day day {raw.date->day};
    auto chosen_year = year;
    if (!raw.year && ahead_of(month, day, clock, reference_now + offset.val() + m_year_rollback_tolerance, year)) {
        chosen_year = year - sc::years {1};
        BLT(debug) << "Year-less date " << describe(raw, year) << " is ahead of the reference time. Using "
                   << static_cast<int>(chosen_year) << ".";
    }

    const sc::year_month_day ymd {chosen_year, month, day};
    if (!ymd.ok()) {
        BLT(error) << "Impossible calendar date " << describe(raw, chosen_year);
        throw invalid_calendar_date {"Impossible calendar date: " + describe(raw, chosen_year)};
    }
    const auto instant = to_instant(sc::sys_days {ymd}, clock, offset);
    return ResolvedTimestamp {.instant = instant, .offset = offset};
}

auto TimestampNormalizer::fields_in_range(const RawTimestamp& raw) -> bool {
    if (raw.hour > 23 || raw.minute > 59 || raw.second > 59) {
        return false;
    }
    if (raw.fraction && (*raw.fraction < sc::nanoseconds {0} || *raw.fraction >= sc::seconds {1})) {
        return false;
    }
    if (raw.offset && sc::abs(raw.offset->val()) >= sc::hours {24}) {
        return false;
    }
    if (raw.year && !sc::year {*raw.year}.ok()) {
        return false;
    }
    if (raw.date) {
        const auto year = sc::year {raw.year.value_or(LEAP_YEAR_STAND_IN)};
        if (!sc::year_month_day {year, sc::month {raw.date->month}, sc::day {raw.date->day}}.ok()) {
            return false;
        }
    }
    return true;
}

auto TimestampNormalizer::format_iso8601(const ResolvedTimestamp& ts) -> std::string {
    const auto local = ts.local_time();
    const auto local_day = sc::floor<sc::days>(local);
    const sc::year_month_day ymd {local_day};
    const sc::hh_mm_ss clock {sc::duration_cast<sc::nanoseconds>(local - local_day)};

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << clock.hours().count() << ':'
        << std::setw(2) << clock.minutes().count() << ':'
        << std::setw(2) << clock.seconds().count();

    if (auto ns = clock.subseconds().count(); ns != 0) {
        std::ostringstream frac;
        frac << std::setfill('0') << std::setw(static_cast<int>(ANYLOG::MAX_FRACTION_DIGITS)) << ns;
        auto digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        out << '.' << digits;
    }

    auto minutes = ts.offset.val().count();
    out << (minutes < 0 ? '-' : '+');
    minutes = minutes < 0 ? -minutes : minutes;
    out << std::setw(2) << minutes / 60 << ':' << std::setw(2) << minutes % 60;
    return out.str();
}
