// -*- fil-column: 120; indent-tabs-mode: nil -*-
#include <limits>
#include <type_traits>

#include "grammars.hpp"
#include "line_cursor.hpp"
#include "logging.hpp"
#include "timestamp_normalizer.hpp"

using sv = std::string_view;
using RawTimestamp = AnylogTypes::RawTimestamp;
using UtcOffset = AnylogTypes::UtcOffset;

namespace Grammars {

namespace {
    constexpr sv SEPARATORS {" \t"};
    constexpr std::size_t UNBOUNDED {std::numeric_limits<std::size_t>::max()};

    // "Mon " is optional wherever a weekday may lead. Leaves the cursor untouched if it's not all there.
    auto skip_weekday(LineCursor& cur) -> void {
        const auto start = cur.pos();
        if (!cur.read_weekday_abbrev() || !cur.accept(' ')) {
            cur.rewind(start);
        }
    }

    // HH:MM:SS with two digit minutes and seconds. Hours take between `min_hour_digits` and two digits.
    auto read_clock(LineCursor& cur, RawTimestamp& raw, std::size_t min_hour_digits = 2) -> bool {
        auto hour = cur.read_digits(min_hour_digits, 2);
        if (!hour || !cur.accept(':')) {
            return false;
        }
        auto minute = cur.read_digits(2, 2);
        if (!minute || !cur.accept(':')) {
            return false;
        }
        auto second = cur.read_digits(2, 2);
        if (!second) {
            return false;
        }
        raw.hour = *hour;
        raw.minute = *minute;
        raw.second = *second;
        return true;
    }

    // "Nov 21 00:30:05[.f] 2017", the part of a ctime(3) timestamp after the weekday.
    auto read_month_day_clock_year(LineCursor& cur, RawTimestamp& raw) -> bool {
        auto month = cur.read_month_abbrev();
        if (!month || !cur.spaces(1, UNBOUNDED)) {
            return false;
        }
        auto day = cur.read_digits(1, 2);
        if (!day || !cur.accept(' ') || !read_clock(cur, raw)) {
            return false;
        }
        raw.fraction = cur.read_fraction();
        if (!cur.accept(' ')) {
            return false;
        }
        auto year = cur.read_digits(4, 4);
        if (!year) {
            return false;
        }
        raw.year = static_cast<int>(*year);
        raw.date = AnylogTypes::MonthDay {.month = *month, .day = *day};
        return true;
    }

    // YYYY-MM-DD(T| )HH:MM:SS with an optional '.' or ',' fraction.
    auto read_iso_date_time(LineCursor& cur, RawTimestamp& raw) -> bool {
        auto year = cur.read_digits(4, 4);
        if (!year || !cur.accept('-')) {
            return false;
        }
        auto month = cur.read_digits(2, 2);
        if (!month || !cur.accept('-')) {
            return false;
        }
        auto day = cur.read_digits(2, 2);
        if (!day || !cur.accept_any("T ")) {
            return false;
        }
        raw.year = static_cast<int>(*year);
        raw.date = AnylogTypes::MonthDay {.month = *month, .day = *day};
        if (!read_clock(cur, raw)) {
            return false;
        }
        raw.fraction = cur.read_fraction(".,");
        return true;
    }

    // Close the bracket if one was opened, take the separator and check the fields.
    auto finish(LineCursor& cur, bool bracketed, const RawTimestamp& raw, sv grammar) -> std::optional<GrammarMatch> {
        if (bracketed && !cur.accept(']')) {
            BLT_GRAMMAR(trace, grammar) << "Opening bracket without closing bracket.";
            return {};
        }
        const auto timestamp_length = cur.pos();
        if (!cur.accept_any(SEPARATORS)) {
            BLT_GRAMMAR(trace, grammar) << "No separator after timestamp at pos " << timestamp_length << ".";
            return {};
        }
        if (!TimestampNormalizer::fields_in_range(raw)) {
            BLT_GRAMMAR(trace, grammar) << "Shape matched but the field values are out of range.";
            return {};
        }
        return GrammarMatch {.raw = raw, .timestamp_length = timestamp_length, .consumed_length = cur.pos()};
    }
} // namespace

auto Ctime::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    const bool bracketed = cur.accept('[');
    // Without the weekday this reads like syslog followed by a number, and syslog gets first pick.
    if (!cur.read_weekday_abbrev() || !cur.accept(' ') || !read_month_day_clock_year(cur, raw)) {
        return {};
    }
    return finish(cur, bracketed, raw, NAME);
}

auto CtimeNoWeekday::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    const bool bracketed = cur.accept('[');
    skip_weekday(cur);
    if (!read_month_day_clock_year(cur, raw)) {
        return {};
    }
    return finish(cur, bracketed, raw, NAME);
}

auto Syslog::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    const bool bracketed = cur.accept('[');
    skip_weekday(cur);

    auto month = cur.read_month_abbrev();
    if (!month) {
        return {};
    }
    auto padding = cur.spaces(1, 2);
    if (!padding) {
        return {};
    }
    // Only a single digit day is space padded: "Jun  1".
    auto day = *padding == 2 ? cur.read_digits(1, 1) : cur.read_digits(1, 2);
    if (!day || !cur.accept(' ') || !read_clock(cur, raw)) {
        return {};
    }
    raw.fraction = cur.read_fraction();
    raw.date = AnylogTypes::MonthDay {.month = *month, .day = *day};
    return finish(cur, bracketed, raw, NAME);
}

auto Iso8601Offset::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    const bool bracketed = cur.accept('[');
    if (!read_iso_date_time(cur, raw)) {
        return {};
    }

    // The zone is either attached to the time or one space away from it.
    auto offset = cur.read_utc_offset(LineCursor::OffsetStyle::ISO8601);
    if (!offset && cur.accept(' ')) {
        offset = cur.read_utc_offset(LineCursor::OffsetStyle::ISO8601);
    }
    if (!offset) {
        return {};
    }
    raw.offset = UtcOffset {*offset};
    // Some tools follow the zone with a colon: "+0200: message"
    cur.accept(':');
    return finish(cur, bracketed, raw, NAME);
}

auto CommonLog::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    const bool bracketed = cur.accept('[');

    auto day = cur.read_digits(1, 2);
    if (!day || !cur.accept('/')) {
        return {};
    }
    auto month = cur.read_month_abbrev();
    if (!month || !cur.accept('/')) {
        return {};
    }
    auto year = cur.read_digits(4, 4);
    if (!year || !cur.accept(':') || !read_clock(cur, raw) || !cur.accept(' ')) {
        return {};
    }
    auto offset = cur.read_utc_offset(LineCursor::OffsetStyle::COMPACT);
    if (!offset) {
        return {};
    }
    raw.year = static_cast<int>(*year);
    raw.date = AnylogTypes::MonthDay {.month = *month, .day = *day};
    raw.offset = UtcOffset {*offset};
    return finish(cur, bracketed, raw, NAME);
}

auto Iso8601Local::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    const bool bracketed = cur.accept('[');
    if (!read_iso_date_time(cur, raw)) {
        return {};
    }
    return finish(cur, bracketed, raw, NAME);
}

auto MonthDayYear::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    const bool bracketed = cur.accept('[');
    skip_weekday(cur);

    auto month = cur.read_month_abbrev();
    if (!month || !cur.spaces(1, UNBOUNDED)) {
        return {};
    }
    auto day = cur.read_digits(1, 2);
    if (!day) {
        return {};
    }
    cur.accept(',');
    if (!cur.accept(' ')) {
        return {};
    }
    auto year = cur.read_digits(4, 4);
    if (!year || !cur.accept(' ') || !read_clock(cur, raw)) {
        return {};
    }
    raw.fraction = cur.read_fraction();
    raw.year = static_cast<int>(*year);
    raw.date = AnylogTypes::MonthDay {.month = *month, .day = *day};
    return finish(cur, bracketed, raw, NAME);
}

auto Ue4::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    if (!cur.accept('[')) {
        return {};
    }

    auto year = cur.read_digits(4, 4);
    if (!year || !cur.accept('.')) {
        return {};
    }
    auto month = cur.read_digits(1, 2);
    if (!month || !cur.accept('.')) {
        return {};
    }
    auto day = cur.read_digits(1, 2);
    if (!day || !cur.accept('-')) {
        return {};
    }
    auto hour = cur.read_digits(1, 2);
    if (!hour || !cur.accept('.')) {
        return {};
    }
    auto minute = cur.read_digits(1, 2);
    if (!minute || !cur.accept('.')) {
        return {};
    }
    auto second = cur.read_digits(1, 2);
    if (!second) {
        return {};
    }
    // Milliseconds in practice, but read as a decimal fraction so any width works.
    auto fraction = cur.read_fraction(":");
    if (!fraction || !cur.accept(']')) {
        return {};
    }

    // Frame counter, right aligned behind at least one space: "[  0]"
    if (!cur.accept('[') || !cur.spaces(1, UNBOUNDED)) {
        return {};
    }
    if (!cur.read_digits(1, UNBOUNDED) || !cur.accept(']')) {
        return {};
    }

    raw.year = static_cast<int>(*year);
    raw.date = AnylogTypes::MonthDay {.month = *month, .day = *day};
    raw.hour = *hour;
    raw.minute = *minute;
    raw.second = *second;
    raw.fraction = *fraction;
    raw.offset = UtcOffset {std::chrono::minutes {0}};
    if (!TimestampNormalizer::fields_in_range(raw)) {
        BLT_GRAMMAR(trace, NAME) << "Shape matched but the field values are out of range.";
        return {};
    }
    return GrammarMatch {.raw = raw, .timestamp_length = cur.pos(), .consumed_length = cur.pos()};
}

auto TimeOfDay::try_parse(sv line) const -> std::optional<GrammarMatch> {
    LineCursor cur {line};
    RawTimestamp raw;
    const bool bracketed = cur.accept('[');
    if (!read_clock(cur, raw, 1)) {
        return {};
    }
    raw.fraction = cur.read_fraction();
    return finish(cur, bracketed, raw, NAME);
}

auto name_of(const Grammar& grammar) -> sv {
    return std::visit([] (const auto& g) { return std::decay_t<decltype(g)>::NAME; }, grammar);
}

auto try_parse(const Grammar& grammar, sv line) -> std::optional<GrammarMatch> {
    return std::visit([line] (const auto& g) { return g.try_parse(line); }, grammar);
}

} // namespace Grammars
