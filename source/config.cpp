// -*- fil-column: 120; indent-tabs-mode: nil -*-
#include <iomanip>
#include <string>

#include "config.hpp"
#include "grammars.hpp"
#include "line_cursor.hpp"
#include "logging.hpp"
#include "timestamp_normalizer.hpp"

using sv = std::string_view;
using UtcOffset = AnylogTypes::UtcOffset;

auto parse_utc_offset(sv text) -> std::optional<UtcOffset> {
    if (text == "Z" || text == "UTC") {
        return UtcOffset {std::chrono::minutes {0}};
    }

    LineCursor cur {text};
    auto offset = cur.read_utc_offset(LineCursor::OffsetStyle::ISO8601);
    if (!offset) {
        // Bare hours: "+02"
        cur.rewind(0);
        auto sign = cur.accept_any("+-");
        auto hours = sign ? cur.read_digits(2, 2) : std::nullopt;
        if (hours && *hours <= ANYLOG::MAX_OFFSET_HOURS) {
            offset = std::chrono::hours {*sign == '-' ? -static_cast<int>(*hours) : static_cast<int>(*hours)};
        }
    }
    if (!offset || !cur.at_end()) {
        BLT(warning) << "Not a UTC offset: " << std::quoted(text);
        return {};
    }
    return UtcOffset {*offset};
}

auto parse_reference_time(sv text) -> std::optional<AnylogTypes::timestamp> {
    // Same shape as an ISO-8601 log timestamp with an explicit zone. The grammar wants a separator after the
    // timestamp, so lend it one.
    const std::string line = std::string(text) + " ";
    auto match = Grammars::Iso8601Offset {}.try_parse(line);
    if (!match || match->consumed_length != line.size() || line[match->timestamp_length - 1] == ':') {
        BLT(warning) << "Not an ISO-8601 time with a zone: " << std::quoted(text);
        return {};
    }
    // Year and zone are both present, so neither the reference time nor the fallback is consulted.
    const TimestampNormalizer normalizer;
    return normalizer.resolve(match->raw, AnylogTypes::timestamp {}, UtcOffset {std::chrono::minutes {0}}).instant;
}
