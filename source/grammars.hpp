// -*- fil-column: 120; indent-tabs-mode: nil -*-
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>

#include "anylog_types.hpp"

/// Grammars - one recognizer per timestamp convention
///
/// Every grammar is anchored at the start of the line and either returns the fields it read together with the length
/// of the timestamp text and of timestamp text plus separator, or an empty optional. An empty optional is the normal
/// answer for a line in some other convention; it is never an error.
///
/// Shape rules shared by all grammars except Ue4:
///
/// 1.  The timestamp may be wrapped in "[...]", but only if both brackets are present.
///
/// 2.  Exactly one space or tab follows the timestamp. It belongs to neither the timestamp nor the message.
///
/// 3.  Field values that can't form a calendar date or a clock time (month 13, hour 24, Apr 31) are no match.
///
namespace Grammars {
    struct GrammarMatch {
        AnylogTypes::RawTimestamp raw;
        // Length of the timestamp text, brackets and trailing ':' included.
        std::size_t timestamp_length {};
        // timestamp_length plus the separator; the message starts here.
        std::size_t consumed_length {};
    };

    // "Tue Nov 21 00:30:05 2017" as printed by ctime(3) and Apache's error log. The weekday is required.
    struct Ctime {
        static constexpr std::string_view NAME {"ctime"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    // "[Nov 21 00:30:05 2017]", ctime with the weekday left out. Mostly reached when brackets keep syslog from
    // claiming the line.
    struct CtimeNoWeekday {
        static constexpr std::string_view NAME {"ctime_no_weekday"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    // "Nov 20 21:56:01" or "Jun  1 12:00:00", weekday optional. No year, no zone.
    struct Syslog {
        static constexpr std::string_view NAME {"syslog"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    // "2015-05-13 17:39:16 +0200:", "2024-03-01T08:15:30.250Z"
    struct Iso8601Offset {
        static constexpr std::string_view NAME {"iso8601_offset"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    // "10/Oct/2000:13:55:36 -0700", the web server common log format.
    struct CommonLog {
        static constexpr std::string_view NAME {"common_log"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    // "2024-01-01 12:00:00,123" without a zone.
    struct Iso8601Local {
        static constexpr std::string_view NAME {"iso8601_local"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    // "Jan 03, 2016 22:29:55", weekday and comma optional.
    struct MonthDayYear {
        static constexpr std::string_view NAME {"month_day_year"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    // "[2018.10.29-16.56.37:542][  0]" as written by Unreal Engine 4. UTC, and the message follows immediately.
    struct Ue4 {
        static constexpr std::string_view NAME {"ue4"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    // "22:07:10", time of day only.
    struct TimeOfDay {
        static constexpr std::string_view NAME {"time_of_day"};
        auto try_parse(std::string_view line) const -> std::optional<GrammarMatch>;
    };

    using Grammar = std::variant<Ctime, Syslog, CtimeNoWeekday, Iso8601Offset, CommonLog, Iso8601Local, MonthDayYear, Ue4,
                                 TimeOfDay>;

    auto name_of(const Grammar& grammar) -> std::string_view;

    auto try_parse(const Grammar& grammar, std::string_view line) -> std::optional<GrammarMatch>;
} // namespace Grammars
