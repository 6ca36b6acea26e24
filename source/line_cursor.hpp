// -*- fil-column: 120; indent-tabs-mode: nil -*-
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

/**
 * Forward-only scanner over one log line
 *
 * Every grammar walks its own cursor from the start of the line. Each `accept`/`read` method either consumes the
 * construct it's named after and reports success, or consumes nothing and reports failure, so callers can chain
 * attempts without restoring the position themselves. The cursor never looks past the end of the view.
 */
class LineCursor {
public:
    enum class OffsetStyle {
        // "Z", "+HH:MM" or "+HHMM"
        ISO8601,
        // "+HHMM" only, as written by web servers
        COMPACT
    };

    explicit LineCursor(std::string_view line)
        : m_line(line) {
    }

    auto pos() const -> std::size_t {
        return m_pos;
    }

    auto at_end() const -> bool {
        return m_pos >= m_line.size();
    }

    // Return to a position previously obtained from pos().
    auto rewind(std::size_t pos) -> void {
        m_pos = pos < m_line.size() ? pos : m_line.size();
    }

    auto rest() const -> std::string_view {
        return m_line.substr(m_pos);
    }

    /**
     * Consume one specific character
     *
     * @returns true if the next character was `c` and has been consumed.
     */
    auto accept(char c) -> bool;

    /**
     * Consume one character out of a set
     *
     * @returns the consumed character, or an empty optional if the next character isn't in `chars`.
     */
    auto accept_any(std::string_view chars) -> std::optional<char>;

    /**
     * Consume a run of spaces (' ' only, not tabs)
     *
     * Consumes at most `max_len` spaces. Fails without consuming anything if fewer than `min_len` are present.
     *
     * @returns the number of spaces consumed.
     */
    auto spaces(std::size_t min_len, std::size_t max_len) -> std::optional<std::size_t>;

    /**
     * Read an unsigned decimal integer of bounded width
     *
     * Consumes at most `max_len` digits, which must not exceed 9 so the value always fits. Fails without consuming
     * anything if fewer than `min_len` digits are present. Any further digits are left for the caller to trip over.
     */
    auto read_digits(std::size_t min_len, std::size_t max_len) -> std::optional<unsigned>;

    // Read an English three letter month abbreviation ("Jan" ... "Dec"), returning the month number 1-12.
    auto read_month_abbrev() -> std::optional<unsigned>;

    // Read an English three letter weekday abbreviation ("Mon" ... "Sun"), returning 1 (Monday) to 7 (Sunday).
    auto read_weekday_abbrev() -> std::optional<unsigned>;

    /**
     * Read a sub-second fraction
     *
     * The fraction is one of `separators` followed by one or more digits, read as a decimal fraction of a second.
     * All the digits are consumed, but only the first 9 count. A separator that isn't followed by a digit isn't
     * consumed.
     *
     * @returns the fraction at nanosecond resolution, or an empty optional if no fraction is present.
     */
    auto read_fraction(std::string_view separators = ".") -> std::optional<std::chrono::nanoseconds>;

    /**
     * Read a UTC offset
     *
     * Hours must be below 24 and minutes below 60.
     *
     * @returns the offset in minutes east of UTC, or an empty optional if no well formed offset is present.
     */
    auto read_utc_offset(OffsetStyle style) -> std::optional<std::chrono::minutes>;

private:
    std::string_view m_line;
    std::size_t m_pos {0};
};
