// -*- fil-column: 120; indent-tabs-mode: nil -*-
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "grammars.hpp"

// An ordered, read-only list of grammars, most specific first. The order is the only thing that settles which of two
// structurally compatible grammars claims a line, so it is curated by hand and never reordered at runtime.
class GrammarCatalog {
public:
    using const_iterator = std::vector<Grammars::Grammar>::const_iterator;

    // Grammar names must be unique; throws std::logic_error otherwise.
    explicit GrammarCatalog(std::vector<Grammars::Grammar> grammars);

    // The built-in catalog. Built on first use and shared, read-only, for the life of the process.
    static auto standard() -> const GrammarCatalog&;

    auto grammars() const -> const std::vector<Grammars::Grammar>& {
        return m_grammars;
    }

    auto size() const {
        return m_grammars.size();
    }

    auto begin() const -> const_iterator {
        return m_grammars.cbegin();
    }

    auto end() const -> const_iterator {
        return m_grammars.cend();
    }

    // Priority rank (0 is tried first) of the grammar with the given name.
    auto rank_of(std::string_view name) const -> std::optional<std::size_t>;

private:
    std::vector<Grammars::Grammar> m_grammars;
};
