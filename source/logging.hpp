#pragma once

#include <optional>
#include <string_view>

#include <boost/log/trivial.hpp>

#define BLT(lev) BOOST_LOG_TRIVIAL(lev)
#define BLT_GRAMMAR(lev, grammar) BOOST_LOG_TRIVIAL(lev) << "Grammar " << grammar << ": "

// Map a level name ("trace" ... "fatal") onto a Boost.Log severity. Empty optional for unknown names.
auto severity_from_name(std::string_view name) -> std::optional<boost::log::trivial::severity_level>;

// Set the global severity filter. An explicit level wins; otherwise the BL_LEVEL environment variable is used. Returns
// false if the name that was consulted isn't a known level, in which case the filter is left alone.
auto set_log_filter(std::optional<std::string_view> level = std::nullopt) -> bool;
