// -*- fil-column: 120; indent-tabs-mode: nil -*-
#include <chrono>
#include <iomanip>

#include "log_line_parser.hpp"
#include "line_matcher.hpp"
#include "logging.hpp"

using sv = std::string_view;

LogLineParser::LogLineParser(ParserConfig config, const GrammarCatalog& catalog)
    : m_config(config)
    , m_catalog(catalog)
    , m_normalizer(config.year_rollback_tolerance, config.time_of_day_tolerance)
{
}

auto LogLineParser::parse(sv line) const -> AnylogTypes::LogRecord {
    return parse_with(line, std::chrono::system_clock::now(), m_config.fallback_offset);
}

auto LogLineParser::parse_with(sv line, AnylogTypes::timestamp reference_now,
                               AnylogTypes::UtcOffset fallback_offset) const -> AnylogTypes::LogRecord {
    auto match = match_line(line, m_catalog);
    if (!match) {
        return AnylogTypes::LogRecord {.ts = std::nullopt, .message = line};
    }

    auto resolved = m_normalizer.resolve(match->raw, reference_now, fallback_offset);
    BLT(trace) << "Grammar " << match->grammar << " resolved " << std::quoted(match->timestamp_text) << " to "
               << TimestampNormalizer::format_iso8601(resolved);
    return AnylogTypes::LogRecord {.ts = resolved, .message = match->message};
}
