// -*- fil-column: 120; indent-tabs-mode: nil -*-
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall"
#include <gflags/gflags.h>
#pragma GCC diagnostic pop

#include "config.hpp"
#include "line_matcher.hpp"
#include "log_line_parser.hpp"
#include "logging.hpp"
#include "timestamp_normalizer.hpp"

DEFINE_string(fallback_offset,     "Z",   "UTC offset for timestamps written without a zone: Z, +HH, +HH:MM or +HHMM");
DEFINE_string(reference_now,       "",    "Pin the reference time as YYYY-MM-DDTHH:MM:SS+HH:MM instead of reading the"
                                          " system clock");
DEFINE_string(log_level,           "",    "Log level (trace, debug, info, warning, error, fatal); defaults to $BL_LEVEL");
DEFINE_int32(year_rollback_days,   3,     "Days a year-less timestamp may lie in the future before it is attributed to"
                                          " the previous year");
DEFINE_int32(time_of_day_minutes,  60,    "Minutes a date-less timestamp may lie in the future before it is attributed"
                                          " to the previous day");
DEFINE_bool(show_grammar,          false, "Prefix each output line with the name of the grammar that matched");

namespace {
    // Print "<timestamp or '-'>\t<message>" for every line of `in`.
    auto parse_stream(std::istream& in, std::string_view source_name, const LogLineParser& parser,
                      const std::optional<AnylogTypes::timestamp>& reference_now) -> void {
        std::string line;
        int line_num = 0;
        while (std::getline(in, line)) {
            line_num += 1;
            std::string_view linev {line};
            if (linev.ends_with('\r')) {
                linev.remove_suffix(1);
            }

            if (FLAGS_show_grammar) {
                auto match = match_line(linev);
                std::cout << (match ? match->grammar : std::string_view {"-"}) << '\t';
            }

            try {
                auto record = reference_now
                    ? parser.parse_with(linev, *reference_now, parser.config().fallback_offset)
                    : parser.parse(linev);
                std::cout << (record.ts ? TimestampNormalizer::format_iso8601(*record.ts) : std::string {"-"})
                          << '\t' << record.message << '\n';
            } catch (const TimestampNormalizer::invalid_calendar_date& e) {
                BLT(error) << source_name << ":" << line_num << ": " << e.what();
                std::cout << "-\t" << linev << '\n';
            }
        }
    }
} // namespace

auto main(int argc, char* argv[]) -> int {
    gflags::SetUsageMessage("Split log lines into an ISO-8601 timestamp and the message that follows it");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (!set_log_filter(FLAGS_log_level.empty() ? std::nullopt : std::optional<std::string_view> {FLAGS_log_level})) {
        std::cerr << "Unknown log level " << std::quoted(FLAGS_log_level) << "\n";
        return EXIT_FAILURE;
    }

    ParserConfig config;
    auto fallback = parse_utc_offset(FLAGS_fallback_offset);
    if (!fallback) {
        std::cerr << "Invalid --fallback_offset " << std::quoted(FLAGS_fallback_offset) << "\n";
        return EXIT_FAILURE;
    }
    config.fallback_offset = *fallback;

    if (FLAGS_year_rollback_days < 0) {
        std::cerr << "--year_rollback_days must not be negative\n";
        return EXIT_FAILURE;
    }
    config.year_rollback_tolerance = std::chrono::days {FLAGS_year_rollback_days};

    if (FLAGS_time_of_day_minutes < 0) {
        std::cerr << "--time_of_day_minutes must not be negative\n";
        return EXIT_FAILURE;
    }
    config.time_of_day_tolerance = std::chrono::minutes {FLAGS_time_of_day_minutes};

    std::optional<AnylogTypes::timestamp> reference_now;
    if (!FLAGS_reference_now.empty()) {
        reference_now = parse_reference_time(FLAGS_reference_now);
        if (!reference_now) {
            std::cerr << "Invalid --reference_now " << std::quoted(FLAGS_reference_now) << "\n";
            return EXIT_FAILURE;
        }
    }

    const LogLineParser parser {config};

    if (argc < 2) {
        BLT(info) << "No files given. Reading stdin.";
        parse_stream(std::cin, "<stdin>", parser, reference_now);
        return EXIT_SUCCESS;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string path {argv[i]};
        std::ifstream log_in {path};
        if (log_in.fail()) {
            BLT(error) << "Failed to open " << std::quoted(path) << " for reading. Skipping.";
            continue;
        }
        BLT(info) << "Parsing " << std::quoted(path);
        parse_stream(log_in, path, parser, reference_now);
    }
    return EXIT_SUCCESS;
}
