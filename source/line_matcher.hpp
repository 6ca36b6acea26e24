// -*- fil-column: 120; indent-tabs-mode: nil -*-
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "anylog_types.hpp"
#include "grammar_catalog.hpp"

// The first grammar that recognized a line, and how it carved the line up. All views point into the matched line, and
// timestamp_text + separator + message reproduces it exactly.
struct LineMatch {
    AnylogTypes::RawTimestamp raw;
    std::string_view grammar;
    std::string_view timestamp_text;
    std::string_view separator;
    std::string_view message;
};

/**
 * Find the timestamp at the start of a line
 *
 * Tries every grammar of `catalog` in priority order and stops at the first that recognizes the line. Holds no state
 * between calls, so the same line and catalog always give the same answer.
 *
 * @param[in] line one log line without its trailing newline
 * @param[in] catalog grammars to try
 *
 * @returns the winning match, or an empty optional if no grammar recognized a timestamp. The latter is an ordinary
 *     outcome: the whole line is then message.
 */
auto match_line(std::string_view line, const GrammarCatalog& catalog = GrammarCatalog::standard())
    -> std::optional<LineMatch>;
