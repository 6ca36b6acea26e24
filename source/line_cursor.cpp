// -*- fil-column: 120; indent-tabs-mode: nil -*-
#include <array>
#include <string_view>

#include "line_cursor.hpp"
#include "anylog_constants.hpp"

using sv = std::string_view;

namespace {
    constexpr std::array<sv, 12> MONTH_ABBREVS {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };
    constexpr std::array<sv, 7> WEEKDAY_ABBREVS {
        "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"
    };
    constexpr std::size_t ABBREV_LEN {3};
    constexpr unsigned dec_radix {10};

    auto is_digit(char c) -> bool {
        return c >= '0' && c <= '9';
    }

    template<std::size_t N>
    auto index_of_abbrev(const std::array<sv, N>& names, sv candidate) -> std::optional<unsigned> {
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (names[i] == candidate) {
                return static_cast<unsigned>(i + 1);
            }
        }
        return {};
    }
} // namespace

auto LineCursor::accept(char c) -> bool {
    if (at_end() || m_line[m_pos] != c) {
        return false;
    }
    ++m_pos;
    return true;
}

auto LineCursor::accept_any(sv chars) -> std::optional<char> {
    if (at_end() || chars.find(m_line[m_pos]) == sv::npos) {
        return {};
    }
    return m_line[m_pos++];
}

auto LineCursor::spaces(std::size_t min_len, std::size_t max_len) -> std::optional<std::size_t> {
    std::size_t count {0};
    while (count < max_len && m_pos + count < m_line.size() && m_line[m_pos + count] == ' ') {
        ++count;
    }
    if (count < min_len) {
        return {};
    }
    m_pos += count;
    return count;
}

auto LineCursor::read_digits(std::size_t min_len, std::size_t max_len) -> std::optional<unsigned> {
    if (max_len > ANYLOG::MAX_FRACTION_DIGITS) {
        max_len = ANYLOG::MAX_FRACTION_DIGITS;
    }
    unsigned value {0};
    std::size_t count {0};
    while (count < max_len && m_pos + count < m_line.size() && is_digit(m_line[m_pos + count])) {
        value = value * dec_radix + static_cast<unsigned>(m_line[m_pos + count] - '0');
        ++count;
    }
    if (count == 0 || count < min_len) {
        return {};
    }
    m_pos += count;
    return value;
}

auto LineCursor::read_month_abbrev() -> std::optional<unsigned> {
    auto month = index_of_abbrev(MONTH_ABBREVS, m_line.substr(m_pos, ABBREV_LEN));
    if (month) {
        m_pos += ABBREV_LEN;
    }
    return month;
}

auto LineCursor::read_weekday_abbrev() -> std::optional<unsigned> {
    auto weekday = index_of_abbrev(WEEKDAY_ABBREVS, m_line.substr(m_pos, ABBREV_LEN));
    if (weekday) {
        m_pos += ABBREV_LEN;
    }
    return weekday;
}

auto LineCursor::read_fraction(sv separators) -> std::optional<std::chrono::nanoseconds> {
    const auto start = m_pos;
    if (!accept_any(separators)) {
        return {};
    }
    const auto digits_start = m_pos;
    auto value = read_digits(1, ANYLOG::MAX_FRACTION_DIGITS);
    if (!value) {
        rewind(start);
        return {};
    }
    // Scale to nanoseconds: "5" is 500000000ns, "123456789" is 123456789ns.
    auto ns = static_cast<std::chrono::nanoseconds::rep>(*value);
    for (auto digits = m_pos - digits_start; digits < ANYLOG::MAX_FRACTION_DIGITS; ++digits) {
        ns *= dec_radix;
    }
    // Finer digits are truncated.
    while (!at_end() && is_digit(m_line[m_pos])) {
        ++m_pos;
    }
    return std::chrono::nanoseconds {ns};
}

auto LineCursor::read_utc_offset(OffsetStyle style) -> std::optional<std::chrono::minutes> {
    const auto start = m_pos;
    if (style == OffsetStyle::ISO8601 && accept('Z')) {
        return std::chrono::minutes {0};
    }
    auto sign = accept_any("+-");
    if (!sign) {
        return {};
    }
    auto hours = read_digits(2, 2);
    if (hours && style == OffsetStyle::ISO8601) {
        // The colon only counts if minutes follow it.
        const auto colon_pos = m_pos;
        if (accept(':') && !(m_pos < m_line.size() && is_digit(m_line[m_pos]))) {
            rewind(colon_pos);
        }
    }
    auto minutes = hours ? read_digits(2, 2) : std::nullopt;
    if (!hours || !minutes || *hours > ANYLOG::MAX_OFFSET_HOURS || *minutes > 59) {
        rewind(start);
        return {};
    }
    auto offset = std::chrono::hours {*hours} + std::chrono::minutes {*minutes};
    return *sign == '-' ? -offset : offset;
}
