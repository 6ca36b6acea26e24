// -*- fil-column: 120; indent-tabs-mode: nil -*-
#include <iomanip>

#include "line_matcher.hpp"
#include "logging.hpp"

auto match_line(std::string_view line, const GrammarCatalog& catalog) -> std::optional<LineMatch> {
    for (const auto& grammar : catalog) {
        auto match = Grammars::try_parse(grammar, line);
        if (!match) {
            continue;
        }
        auto name = Grammars::name_of(grammar);
        BLT_GRAMMAR(trace, name) << "Matched " << match->timestamp_length << " chars of " << std::quoted(line);
        return LineMatch {
            .raw = match->raw,
            .grammar = name,
            .timestamp_text = line.substr(0, match->timestamp_length),
            .separator = line.substr(match->timestamp_length, match->consumed_length - match->timestamp_length),
            .message = line.substr(match->consumed_length),
        };
    }
    BLT(trace) << "No grammar recognized a timestamp in " << std::quoted(line);
    return {};
}
