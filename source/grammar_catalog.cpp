// -*- fil-column: 120; indent-tabs-mode: nil -*-
#include <iomanip>
#include <set>
#include <stdexcept>
#include <string>

#include "grammar_catalog.hpp"
#include "logging.hpp"

GrammarCatalog::GrammarCatalog(std::vector<Grammars::Grammar> grammars)
    : m_grammars(std::move(grammars))
{
    std::set<std::string_view> names;
    for (const auto& grammar : m_grammars) {
        auto name = Grammars::name_of(grammar);
        if (!names.insert(name).second) {
            BLT(fatal) << "GrammarCatalog: grammar " << std::quoted(name) << " is listed more than once.";
            throw std::logic_error("GrammarCatalog: duplicate grammar " + std::string(name));
        }
    }
}

auto GrammarCatalog::standard() -> const GrammarCatalog& {
    // Order matters:
    // - ctime before syslog, or syslog claims "Tue Nov 21 00:30:05 2017" and leaves the year in the message. ctime
    //   insists on the weekday, so "Jun 15 12:00:00 1999 packets dropped" stays syslog.
    // - ctime_no_weekday after syslog, for the same reason.
    // - iso8601_offset before iso8601_local, or the zone ends up in the message.
    // - time_of_day last; it's the loosest.
    static const GrammarCatalog catalog {{
        Grammars::Ctime {},
        Grammars::Syslog {},
        Grammars::CtimeNoWeekday {},
        Grammars::Iso8601Offset {},
        Grammars::CommonLog {},
        Grammars::Iso8601Local {},
        Grammars::MonthDayYear {},
        Grammars::Ue4 {},
        Grammars::TimeOfDay {},
    }};
    return catalog;
}

auto GrammarCatalog::rank_of(std::string_view name) const -> std::optional<std::size_t> {
    for (std::size_t rank = 0; rank < m_grammars.size(); ++rank) {
        if (Grammars::name_of(m_grammars[rank]) == name) {
            return rank;
        }
    }
    return {};
}
