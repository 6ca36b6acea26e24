// -*- fil-column: 120; indent-tabs-mode: nil -*-
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall"
#include <gtest/gtest.h>
#pragma GCC diagnostic pop

#include "anylog_types.hpp"
#include "grammar_catalog.hpp"
#include "grammars.hpp"
#include "line_cursor.hpp"
#include "line_matcher.hpp"

using namespace std::literals::string_view_literals;
namespace sc = std::chrono;

namespace {
    struct Sample {
        std::string_view line;
        std::string_view grammar;
        std::string_view message;
    };

    // One line per grammar, most of them as real tools write them.
    const std::vector<Sample> samples {
        {"Tue Nov 21 00:30:05 2017 More stuff here", "ctime", "More stuff here"},
        {"Mon Oct  5 11:40:10 2015\t[INFO] PDApp.ExternalGateway - NativePlatformHandler destructed", "ctime",
         "[INFO] PDApp.ExternalGateway - NativePlatformHandler destructed"},
        {"[Sun Feb 25 06:11:12.043123448 2018] [:notice] [pid 1:tid 2] process manager initialized (pid 1)", "ctime",
         "[:notice] [pid 1:tid 2] process manager initialized (pid 1)"},
        {"Jun  1 12:00:00 host app[123]: boot ok", "syslog", "host app[123]: boot ok"},
        {"Jun 15 12:00:00 1999 packets dropped", "syslog", "1999 packets dropped"},
        {"Nov 20 21:56:01 herzog com.apple.xpc.launchd[1] (com.apple.preference.displays.MirrorDisplays): Service only"
         " ran for 0 seconds.", "syslog",
         "herzog com.apple.xpc.launchd[1] (com.apple.preference.displays.MirrorDisplays): Service only ran for 0"
         " seconds."},
        {"Mon Nov 20 00:31:19.005 <kernel> en0: Received EAPOL packet (length = 161)", "syslog",
         "<kernel> en0: Received EAPOL packet (length = 161)"},
        {"[Jun 15 12:00:00 1999] packets dropped", "ctime_no_weekday", "packets dropped"},
        {"2015-05-13 17:39:16 +0200: Repaired 'Library/Printers/Canon/IJScanner/Resources/Parameters/CNQ9601'",
         "iso8601_offset", "Repaired 'Library/Printers/Canon/IJScanner/Resources/Parameters/CNQ9601'"},
        {"[2024-03-01T08:15:30.250Z] request served", "iso8601_offset", "request served"},
        {"[10/Oct/2000:13:55:36 -0700] \"GET /apache_pb.gif HTTP/1.0\" 200 2326", "common_log",
         "\"GET /apache_pb.gif HTTP/1.0\" 200 2326"},
        {"2024-01-01 12:00:00,123 INFO root: hello", "iso8601_local", "INFO root: hello"},
        {"Jan 03, 2016 22:29:55 [0x70000073b000] DEBUG - Responding HTTP/1.1 200", "month_day_year",
         "[0x70000073b000] DEBUG - Responding HTTP/1.1 200"},
        {"[2018.10.29-16.56.37:542][  0]LogInit: Selected Device Profile: [WindowsNoEditor]", "ue4",
         "LogInit: Selected Device Profile: [WindowsNoEditor]"},
        {"22:07:10 server  | detected binary path: /Users/mitsuhiko/.virtualenvs/sentry/bin/uwsgi", "time_of_day",
         "server  | detected binary path: /Users/mitsuhiko/.virtualenvs/sentry/bin/uwsgi"},
    };
} // namespace

TEST(LineCursor, Accept) {
    LineCursor cur {"abc"};
    EXPECT_TRUE(cur.accept('a'));
    EXPECT_EQ(cur.pos(), 1);
    EXPECT_FALSE(cur.accept('c'));
    EXPECT_EQ(cur.pos(), 1);

    auto c = cur.accept_any("xb");
    ASSERT_TRUE(c);
    EXPECT_EQ(*c, 'b');
    EXPECT_FALSE(cur.accept_any("xy"));
    EXPECT_EQ(cur.rest(), "c"sv);
    EXPECT_FALSE(cur.at_end());
    EXPECT_TRUE(cur.accept('c'));
    EXPECT_TRUE(cur.at_end());
    EXPECT_FALSE(cur.accept('c'));
    EXPECT_FALSE(cur.accept_any("abc"));
}

TEST(LineCursor, Spaces) {
    LineCursor cur {"   x"};
    auto n = cur.spaces(1, 2);
    ASSERT_TRUE(n);
    EXPECT_EQ(*n, 2);
    EXPECT_EQ(cur.pos(), 2);

    EXPECT_FALSE(cur.spaces(2, 5));
    EXPECT_EQ(cur.pos(), 2);

    n = cur.spaces(0, 5);
    ASSERT_TRUE(n);
    EXPECT_EQ(*n, 1);

    n = cur.spaces(0, 5);
    ASSERT_TRUE(n);
    EXPECT_EQ(*n, 0);
    EXPECT_EQ(cur.rest(), "x"sv);

    // Tabs aren't spaces.
    LineCursor tab {"\tx"};
    EXPECT_FALSE(tab.spaces(1, 1));
}

TEST(LineCursor, ReadDigits) {
    LineCursor cur {"12345"};
    auto v = cur.read_digits(2, 2);
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, 12);
    EXPECT_EQ(cur.pos(), 2);

    EXPECT_FALSE(cur.read_digits(4, 4));
    EXPECT_EQ(cur.pos(), 2);

    v = cur.read_digits(1, 9);
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, 345);
    EXPECT_TRUE(cur.at_end());
    EXPECT_FALSE(cur.read_digits(1, 2));

    LineCursor alpha {"x1"};
    EXPECT_FALSE(alpha.read_digits(1, 2));
    EXPECT_EQ(alpha.pos(), 0);

    // Leading zeros are just digits.
    LineCursor padded {"05:"};
    v = padded.read_digits(2, 2);
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, 5);
    EXPECT_EQ(padded.rest(), ":"sv);
}

TEST(LineCursor, Names) {
    LineCursor cur {"Oct 5"};
    auto month = cur.read_month_abbrev();
    ASSERT_TRUE(month);
    EXPECT_EQ(*month, 10);
    EXPECT_EQ(cur.pos(), 3);

    LineCursor dec {"Dec"};
    month = dec.read_month_abbrev();
    ASSERT_TRUE(month);
    EXPECT_EQ(*month, 12);

    LineCursor lower {"oct"};
    EXPECT_FALSE(lower.read_month_abbrev());
    EXPECT_EQ(lower.pos(), 0);

    LineCursor shorty {"Ju"};
    EXPECT_FALSE(shorty.read_month_abbrev());

    LineCursor sun {"Sun Feb"};
    auto weekday = sun.read_weekday_abbrev();
    ASSERT_TRUE(weekday);
    EXPECT_EQ(*weekday, 7);
    EXPECT_FALSE(sun.read_month_abbrev());
    EXPECT_TRUE(sun.accept(' '));
    month = sun.read_month_abbrev();
    ASSERT_TRUE(month);
    EXPECT_EQ(*month, 2);
}

TEST(LineCursor, ReadFraction) {
    LineCursor half {".5 "};
    auto f = half.read_fraction();
    ASSERT_TRUE(f);
    EXPECT_EQ(*f, sc::milliseconds {500});
    EXPECT_EQ(half.rest(), " "sv);

    LineCursor dangling {". "};
    EXPECT_FALSE(dangling.read_fraction());
    EXPECT_EQ(dangling.pos(), 0);

    LineCursor comma {",123"};
    EXPECT_FALSE(comma.read_fraction());
    f = comma.read_fraction(".,");
    ASSERT_TRUE(f);
    EXPECT_EQ(*f, sc::milliseconds {123});

    LineCursor nanos {".043123448"};
    f = nanos.read_fraction();
    ASSERT_TRUE(f);
    EXPECT_EQ(*f, sc::nanoseconds {43123448});

    // Past nanoseconds the digits are consumed and dropped.
    LineCursor too_fine {".1234567891 x"};
    f = too_fine.read_fraction();
    ASSERT_TRUE(f);
    EXPECT_EQ(*f, sc::nanoseconds {123456789});
    EXPECT_EQ(too_fine.rest(), " x"sv);
}

TEST(LineCursor, ReadUtcOffset) {
    using Style = LineCursor::OffsetStyle;

    auto iso = [] (std::string_view text) {
        LineCursor cur {text};
        return cur.read_utc_offset(Style::ISO8601);
    };
    auto compact = [] (std::string_view text) {
        LineCursor cur {text};
        return cur.read_utc_offset(Style::COMPACT);
    };

    EXPECT_EQ(iso("Z"), sc::minutes {0});
    EXPECT_EQ(iso("+0200"), sc::minutes {120});
    EXPECT_EQ(iso("+02:00"), sc::minutes {120});
    EXPECT_EQ(iso("-05:30"), sc::minutes {-330});
    EXPECT_EQ(iso("+2359"), sc::minutes {23 * 60 + 59});
    EXPECT_FALSE(iso("+2400"));
    EXPECT_FALSE(iso("+0260"));
    EXPECT_FALSE(iso("+02:"));
    EXPECT_FALSE(iso("+2"));
    EXPECT_FALSE(iso("0200"));

    EXPECT_EQ(compact("-0700"), sc::minutes {-420});
    EXPECT_FALSE(compact("Z"));
    EXPECT_FALSE(compact("+02:00"));

    // A failed offset consumes nothing.
    LineCursor cur {"+02:x"};
    EXPECT_FALSE(cur.read_utc_offset(Style::ISO8601));
    EXPECT_EQ(cur.pos(), 0);

    // The colon is left alone when it doesn't introduce minutes.
    LineCursor trailing {"+0200: msg"};
    EXPECT_EQ(trailing.read_utc_offset(Style::ISO8601), sc::minutes {120});
    EXPECT_EQ(trailing.rest(), ": msg"sv);
}

TEST(Grammars, Ctime) {
    auto m = Grammars::Ctime {}.try_parse("Tue Nov 21 00:30:05 2017 More stuff here");
    ASSERT_TRUE(m);
    ASSERT_TRUE(m->raw.year);
    EXPECT_EQ(*m->raw.year, 2017);
    ASSERT_TRUE(m->raw.date);
    EXPECT_EQ(m->raw.date->month, 11);
    EXPECT_EQ(m->raw.date->day, 21);
    EXPECT_EQ(m->raw.hour, 0);
    EXPECT_EQ(m->raw.minute, 30);
    EXPECT_EQ(m->raw.second, 5);
    EXPECT_FALSE(m->raw.fraction);
    EXPECT_FALSE(m->raw.offset);
    EXPECT_EQ(m->timestamp_length, 24);
    EXPECT_EQ(m->consumed_length, 25);

    // No year means it's not ctime.
    EXPECT_FALSE(Grammars::Ctime {}.try_parse("Nov 21 00:30:05 host x"));
    // Nor does a missing weekday; the number belongs to a syslog message.
    EXPECT_FALSE(Grammars::Ctime {}.try_parse("Jun 15 12:00:00 1999 packets dropped"));
    // Brackets must balance.
    EXPECT_FALSE(Grammars::Ctime {}.try_parse("[Tue Nov 21 00:30:05 2017 More stuff here"));
    EXPECT_FALSE(Grammars::Ctime {}.try_parse("Tue Nov 21 00:30:05 2017] More stuff here"));
    // Feb 29 in a known non-leap year.
    EXPECT_FALSE(Grammars::Ctime {}.try_parse("Wed Feb 29 10:00:00 2023 msg"));
    EXPECT_TRUE(Grammars::Ctime {}.try_parse("Thu Feb 29 10:00:00 2024 msg"));
}

TEST(Grammars, CtimeNoWeekday) {
    auto m = Grammars::CtimeNoWeekday {}.try_parse("[Jun 15 12:00:00 1999] packets dropped");
    ASSERT_TRUE(m);
    EXPECT_EQ(*m->raw.year, 1999);
    EXPECT_EQ(m->raw.date->month, 6);
    EXPECT_EQ(m->raw.date->day, 15);
    EXPECT_EQ(m->timestamp_length, 22);

    // The weekday is still allowed.
    EXPECT_TRUE(Grammars::CtimeNoWeekday {}.try_parse("Tue Nov 21 00:30:05 2017 More stuff here"));
    EXPECT_FALSE(Grammars::CtimeNoWeekday {}.try_parse("Jun 15 12:00:00 host"));
}

TEST(Grammars, Syslog) {
    auto m = Grammars::Syslog {}.try_parse("Jun  1 12:00:00 host app[123]: boot ok");
    ASSERT_TRUE(m);
    EXPECT_FALSE(m->raw.year);
    ASSERT_TRUE(m->raw.date);
    EXPECT_EQ(m->raw.date->month, 6);
    EXPECT_EQ(m->raw.date->day, 1);
    EXPECT_EQ(m->raw.hour, 12);
    EXPECT_FALSE(m->raw.offset);
    EXPECT_EQ(m->timestamp_length, 15);
    EXPECT_EQ(m->consumed_length, 16);

    m = Grammars::Syslog {}.try_parse("Mon Nov 20 00:31:19.005 <kernel> en0");
    ASSERT_TRUE(m);
    ASSERT_TRUE(m->raw.fraction);
    EXPECT_EQ(*m->raw.fraction, sc::milliseconds {5});

    // Digits finer than a nanosecond don't cost the timestamp.
    m = Grammars::Syslog {}.try_parse("Mon Nov 20 00:31:19.0051234567 <kernel> x");
    ASSERT_TRUE(m);
    ASSERT_TRUE(m->raw.fraction);
    EXPECT_EQ(*m->raw.fraction, sc::nanoseconds {5123456});
    EXPECT_EQ(m->timestamp_length, 30);

    // Only a single digit day may be padded.
    EXPECT_FALSE(Grammars::Syslog {}.try_parse("Jun  12 12:00:00 host"));
    EXPECT_FALSE(Grammars::Syslog {}.try_parse("Jun   1 12:00:00 host"));
    // A separator is required.
    EXPECT_FALSE(Grammars::Syslog {}.try_parse("Jun  1 12:00:00"));
    EXPECT_FALSE(Grammars::Syslog {}.try_parse("Jun  1 12:00:00|host"));
    // Year-less Feb 29 is left to the normalizer.
    EXPECT_TRUE(Grammars::Syslog {}.try_parse("Feb 29 10:00:00 host"));
    EXPECT_FALSE(Grammars::Syslog {}.try_parse("Feb 30 10:00:00 host"));
    EXPECT_FALSE(Grammars::Syslog {}.try_parse("Jun  1 24:00:00 host"));
    EXPECT_FALSE(Grammars::Syslog {}.try_parse("Jun  1 12:60:00 host"));
}

TEST(Grammars, Iso8601Offset) {
    auto m = Grammars::Iso8601Offset {}.try_parse("2015-05-13 17:39:16 +0200: Repaired");
    ASSERT_TRUE(m);
    ASSERT_TRUE(m->raw.offset);
    EXPECT_EQ(m->raw.offset->val(), sc::minutes {120});
    EXPECT_EQ(m->timestamp_length, 26);
    EXPECT_EQ(m->consumed_length, 27);

    m = Grammars::Iso8601Offset {}.try_parse("2024-03-01T08:15:30.250-03:30 x");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->raw.offset->val(), sc::minutes {-210});
    ASSERT_TRUE(m->raw.fraction);
    EXPECT_EQ(*m->raw.fraction, sc::milliseconds {250});

    EXPECT_FALSE(Grammars::Iso8601Offset {}.try_parse("2024-03-01 08:15:30 x"));
    EXPECT_FALSE(Grammars::Iso8601Offset {}.try_parse("2024-03-01 08:15:30 Zebra crossing"));
    EXPECT_FALSE(Grammars::Iso8601Offset {}.try_parse("2024-13-01T08:15:30Z x"));
}

TEST(Grammars, CommonLog) {
    auto m = Grammars::CommonLog {}.try_parse("[10/Oct/2000:13:55:36 -0700] \"GET / HTTP/1.0\"");
    ASSERT_TRUE(m);
    ASSERT_TRUE(m->raw.year);
    EXPECT_EQ(*m->raw.year, 2000);
    EXPECT_EQ(m->raw.date->month, 10);
    EXPECT_EQ(m->raw.date->day, 10);
    EXPECT_EQ(m->raw.offset->val(), sc::minutes {-420});
    EXPECT_EQ(m->timestamp_length, 28);

    EXPECT_FALSE(Grammars::CommonLog {}.try_parse("[10/Oct/2000:13:55:36] x"));
    EXPECT_FALSE(Grammars::CommonLog {}.try_parse("[10/Oct/2000:13:55:36 -07:00] x"));
}

TEST(Grammars, Ue4) {
    std::string_view line {"[2018.10.29-16.56.37:542][  0]LogInit: Selected Device Profile"};
    auto m = Grammars::Ue4 {}.try_parse(line);
    ASSERT_TRUE(m);
    EXPECT_EQ(*m->raw.year, 2018);
    EXPECT_EQ(m->raw.date->month, 10);
    EXPECT_EQ(m->raw.date->day, 29);
    EXPECT_EQ(m->raw.hour, 16);
    EXPECT_EQ(m->raw.minute, 56);
    EXPECT_EQ(m->raw.second, 37);
    EXPECT_EQ(*m->raw.fraction, sc::milliseconds {542});
    EXPECT_EQ(m->raw.offset->val(), sc::minutes {0});
    // No separator: the message follows the frame counter directly.
    EXPECT_EQ(m->timestamp_length, m->consumed_length);
    EXPECT_EQ(line.substr(m->consumed_length), "LogInit: Selected Device Profile"sv);

    EXPECT_FALSE(Grammars::Ue4 {}.try_parse("[2018.10.29-16.56.37:542]LogInit"));
    EXPECT_FALSE(Grammars::Ue4 {}.try_parse("[2018.10.29-16.56.37:542][0]LogInit"));
    EXPECT_FALSE(Grammars::Ue4 {}.try_parse("[2018.10.29-16.56.37][  0]LogInit"));

    // The sub-second field is read as a fraction of any width.
    m = Grammars::Ue4 {}.try_parse("[2018.10.29-16.56.37:5421][ 12]LogInit");
    ASSERT_TRUE(m);
    EXPECT_EQ(*m->raw.fraction, sc::microseconds {542100});
    m = Grammars::Ue4 {}.try_parse("[2018.10.29-16.56.37:5][ 12]LogInit");
    ASSERT_TRUE(m);
    EXPECT_EQ(*m->raw.fraction, sc::milliseconds {500});
}

TEST(Grammars, TimeOfDay) {
    auto m = Grammars::TimeOfDay {}.try_parse("7:05:00 worker ready");
    ASSERT_TRUE(m);
    EXPECT_FALSE(m->raw.date);
    EXPECT_FALSE(m->raw.year);
    EXPECT_EQ(m->raw.hour, 7);
    EXPECT_EQ(m->raw.minute, 5);

    EXPECT_FALSE(Grammars::TimeOfDay {}.try_parse("25:00:00 nope"));
    EXPECT_FALSE(Grammars::TimeOfDay {}.try_parse("12:00 nope"));
}

TEST(Grammars, NameAndDispatch) {
    Grammars::Grammar g {Grammars::CommonLog {}};
    EXPECT_EQ(Grammars::name_of(g), "common_log"sv);
    EXPECT_TRUE(Grammars::try_parse(g, "[10/Oct/2000:13:55:36 -0700] x"));
    EXPECT_FALSE(Grammars::try_parse(g, "Jun  1 12:00:00 host"));
}

TEST(GrammarCatalog, Standard) {
    const auto& catalog = GrammarCatalog::standard();
    EXPECT_EQ(&catalog, &GrammarCatalog::standard());
    ASSERT_EQ(catalog.size(), 9);
    EXPECT_EQ(catalog.rank_of("ctime"), 0);
    EXPECT_EQ(catalog.rank_of("syslog"), 1);
    EXPECT_EQ(catalog.rank_of("ctime_no_weekday"), 2);
    EXPECT_EQ(catalog.rank_of("iso8601_offset"), 3);
    EXPECT_EQ(catalog.rank_of("common_log"), 4);
    EXPECT_EQ(catalog.rank_of("iso8601_local"), 5);
    EXPECT_EQ(catalog.rank_of("month_day_year"), 6);
    EXPECT_EQ(catalog.rank_of("ue4"), 7);
    EXPECT_EQ(catalog.rank_of("time_of_day"), 8);
    EXPECT_FALSE(catalog.rank_of("rfc3164"));
}

TEST(GrammarCatalog, DuplicateNames) {
    EXPECT_THROW(GrammarCatalog({Grammars::Syslog {}, Grammars::Ctime {}, Grammars::Syslog {}}), std::logic_error);
}

TEST(LineMatcher, Samples) {
    for (const auto& sample : samples) {
        auto m = match_line(sample.line);
        ASSERT_TRUE(m) << sample.line;
        EXPECT_EQ(m->grammar, sample.grammar) << sample.line;
        EXPECT_EQ(m->message, sample.message) << sample.line;
    }
}

TEST(LineMatcher, NoTimestamp) {
    EXPECT_FALSE(match_line("no timestamp here at all"));
    EXPECT_FALSE(match_line(""));
    EXPECT_FALSE(match_line("[]"));
    // Every grammar rejects month 13, so nothing is left to claim the line.
    EXPECT_FALSE(match_line("2024-13-01 10:00:00 msg"));
}

TEST(LineMatcher, HigherRankedGrammarsDontMatch) {
    const auto& catalog = GrammarCatalog::standard();
    for (const auto& sample : samples) {
        auto rank = catalog.rank_of(sample.grammar);
        ASSERT_TRUE(rank) << sample.grammar;
        for (std::size_t r = 0; r < *rank; ++r) {
            EXPECT_FALSE(Grammars::try_parse(catalog.grammars()[r], sample.line))
                << Grammars::name_of(catalog.grammars()[r]) << " claims " << sample.line;
        }
    }
}

TEST(LineMatcher, RoundTrip) {
    for (const auto& sample : samples) {
        auto m = match_line(sample.line);
        ASSERT_TRUE(m) << sample.line;
        EXPECT_EQ(std::string(m->timestamp_text) + std::string(m->separator) + std::string(m->message),
                  std::string(sample.line));
    }
    auto m = match_line("Mon Oct  5 11:40:10 2015\t[INFO] x");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->timestamp_text, "Mon Oct  5 11:40:10 2015"sv);
    EXPECT_EQ(m->separator, "\t"sv);
}

TEST(LineMatcher, MessageIsNotTrimmed) {
    auto m = match_line("Jun  1 12:00:00   indented  ");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->message, "  indented  "sv);

    m = match_line("Jun  1 12:00:00 ");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->message, ""sv);
}

TEST(LineMatcher, FallsThroughOnImpossibleDate) {
    // ctime rejects Feb 29 2023; syslog takes the year-less part and leaves the year in the message.
    auto m = match_line("Wed Feb 29 10:00:00 2023 msg");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->grammar, "syslog"sv);
    EXPECT_EQ(m->message, "2023 msg"sv);
}

TEST(LineMatcher, OrderDecidesAmbiguousLines) {
    // Without ctime ahead of it, syslog claims a ctime line and the year stays in the message.
    const GrammarCatalog syslog_only {{Grammars::Syslog {}}};
    auto m = match_line("Tue Nov 21 00:30:05 2017 More stuff here", syslog_only);
    ASSERT_TRUE(m);
    EXPECT_EQ(m->grammar, "syslog"sv);
    EXPECT_EQ(m->message, "2017 More stuff here"sv);

    m = match_line("Tue Nov 21 00:30:05 2017 More stuff here");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->grammar, "ctime"sv);
    EXPECT_EQ(m->message, "More stuff here"sv);
}

TEST(LineMatcher, YearLikeMessageStaysInSyslogMessage) {
    auto m = match_line("Jun 15 12:00:00 1999 packets dropped");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->grammar, "syslog"sv);
    EXPECT_FALSE(m->raw.year);
    EXPECT_EQ(m->timestamp_text, "Jun 15 12:00:00"sv);
    EXPECT_EQ(m->message, "1999 packets dropped"sv);

    // Brackets keep syslog out, so the year is read.
    m = match_line("[Jun 15 12:00:00 1999] packets dropped");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->grammar, "ctime_no_weekday"sv);
    ASSERT_TRUE(m->raw.year);
    EXPECT_EQ(*m->raw.year, 1999);
    EXPECT_EQ(m->message, "packets dropped"sv);
}

TEST(LineMatcher, LongFractionKeepsTimestamp) {
    auto m = match_line("Mon Nov 20 00:31:19.0051234567 <kernel> x");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->grammar, "syslog"sv);
    EXPECT_EQ(m->timestamp_text, "Mon Nov 20 00:31:19.0051234567"sv);
    EXPECT_EQ(m->message, "<kernel> x"sv);
}

TEST(LineMatcher, Deterministic) {
    for (const auto& sample : samples) {
        auto first = match_line(sample.line);
        auto second = match_line(sample.line);
        ASSERT_TRUE(first);
        ASSERT_TRUE(second);
        EXPECT_EQ(first->grammar, second->grammar);
        EXPECT_EQ(first->timestamp_text, second->timestamp_text);
        EXPECT_EQ(first->message, second->message);
    }
}
