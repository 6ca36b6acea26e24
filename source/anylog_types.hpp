// -*- fil-column: 120; indent-tabs-mode: nil -*-
#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include "wrapper.hpp"

namespace AnylogTypes {
    using timestamp = std::chrono::time_point<std::chrono::system_clock>;

    // Whole minutes east of UTC.
    WRAPPER(UtcOffset, std::chrono::minutes);

    struct MonthDay {
        unsigned month {};
        unsigned day {};
        auto operator==(const MonthDay& other) const -> bool = default;
    };

    // Fields exactly as a grammar read them, before year/date/zone inference.
    struct RawTimestamp {
        // Absent for conventions that omit the year, e.g. syslog.
        std::optional<int> year;
        // Absent for time-of-day-only conventions.
        std::optional<MonthDay> date;
        unsigned hour {};
        unsigned minute {};
        unsigned second {};
        std::optional<std::chrono::nanoseconds> fraction;
        // Absent when the convention implies an unspecified local zone.
        std::optional<UtcOffset> offset;
    };

    struct ResolvedTimestamp {
        timestamp instant;
        UtcOffset offset {std::chrono::minutes {0}};

        // Wall clock reading in `offset`, expressed as if it were UTC.
        auto local_time() const {
            return instant + offset.val();
        }

        auto operator==(const ResolvedTimestamp& other) const -> bool = default;
    };

    struct LogRecord {
        // Empty when no grammar recognized a timestamp; never a fabricated epoch.
        std::optional<ResolvedTimestamp> ts;
        // View into the parsed line, so the line must outlive the record.
        std::string_view message;
    };
} // namespace AnylogTypes
