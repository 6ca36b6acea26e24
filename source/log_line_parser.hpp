// -*- fil-column: 120; indent-tabs-mode: nil -*-
#pragma once

#include <string_view>

#include "anylog_types.hpp"
#include "config.hpp"
#include "grammar_catalog.hpp"
#include "timestamp_normalizer.hpp"

// Split log lines into a resolved timestamp and the message that follows it.
class LogLineParser {
public:
    // The catalog must outlive the parser. The standard one always does.
    explicit LogLineParser(ParserConfig config = ParserConfig {},
                           const GrammarCatalog& catalog = GrammarCatalog::standard());

    // Resolve against the system clock and the configured fallback offset.
    auto parse(std::string_view line) const -> AnylogTypes::LogRecord;

    /**
     * Resolve against an explicit reference time and fallback offset
     *
     * Reads no clock and no environment, so the result depends on the arguments alone.
     *
     * @returns the record; its timestamp is empty if no grammar recognized one, and its message then is the whole line.
     *
     * @throws TimestampNormalizer::invalid_calendar_date if a grammar matched fields that can't form a real date
     *     once the year is known.
     */
    auto parse_with(std::string_view line, AnylogTypes::timestamp reference_now,
                    AnylogTypes::UtcOffset fallback_offset) const -> AnylogTypes::LogRecord;

    auto config() const -> const ParserConfig& {
        return m_config;
    }

private:
    ParserConfig m_config;
    const GrammarCatalog& m_catalog;
    TimestampNormalizer m_normalizer;
};
