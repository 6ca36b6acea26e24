#include <cstdlib>
#include <iomanip>
#include <map>
#include <string>

#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include "logging.hpp"

auto severity_from_name(std::string_view name) -> std::optional<boost::log::trivial::severity_level> {
    static const std::map<std::string, boost::log::trivial::severity_level, std::less<>> sevs {
        {"trace",   boost::log::trivial::trace},
        {"debug",   boost::log::trivial::debug},
        {"info",    boost::log::trivial::info},
        {"warning", boost::log::trivial::warning},
        {"error",   boost::log::trivial::error},
        {"fatal",   boost::log::trivial::fatal},
    };
    if (auto levit = sevs.find(name); levit != sevs.end()) {
        return levit->second;
    }
    return {};
}

auto set_log_filter(std::optional<std::string_view> level) -> bool {
    if (!level) {
        if (const char* bl_level = std::getenv("BL_LEVEL")) {
            level = bl_level;
        } else {
            return true;
        }
    }

    auto lev = severity_from_name(*level);
    if (!lev) {
        BLT(warning) << "Unknown log level " << std::quoted(*level) << ". Leaving the log filter unchanged.";
        return false;
    }
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= *lev
    );
    return true;
}
