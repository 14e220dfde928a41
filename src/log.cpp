// =============================================================================
// log.cpp - Boost.Log sink and filter setup
// =============================================================================

#include "cpmm/log.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/log/expressions/predicates/channel_severity_filter.hpp>
#include <boost/log/keywords/auto_flush.hpp>
#include <boost/log/keywords/file_name.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/keywords/open_mode.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

#include <array>
#include <ios>
#include <iostream>

namespace cpmm::util {

namespace {

constexpr std::array<const char*, 4> CHANNELS = {
    "General",
    "AMM",
    "Ledger",
    "Config",
};

constexpr const char* LOG_FORMAT = "%TimeStamp% [%ThreadID%] %Channel%:%Severity% %Message%";

} // anonymous namespace

std::ostream& operator<<(std::ostream& stream, Severity sev) {
    static constexpr std::array<const char*, 6> labels = {
        "TRC",
        "DBG",
        "NFO",
        "WRN",
        "ERR",
        "FTL",
    };
    return stream << labels.at(static_cast<size_t>(sev));
}

std::optional<Severity> severity_from_string(std::string_view level) {
    std::string s{level};
    if (boost::iequals(s, "trace")) return Severity::TRC;
    if (boost::iequals(s, "debug")) return Severity::DBG;
    if (boost::iequals(s, "info")) return Severity::NFO;
    if (boost::iequals(s, "warning") || boost::iequals(s, "warn")) return Severity::WRN;
    if (boost::iequals(s, "error")) return Severity::ERR;
    if (boost::iequals(s, "fatal")) return Severity::FTL;
    return std::nullopt;
}

void LogService::init(const LogConfig& config) {
    namespace keywords = boost::log::keywords;

    auto core = boost::log::core::get();
    core->remove_all_sinks();

    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<Severity, char>("Severity");

    if (config.console) {
        boost::log::add_console_log(std::clog, keywords::format = LOG_FORMAT);
    }

    if (config.file) {
        boost::log::add_file_log(
            keywords::file_name = *config.file,
            keywords::auto_flush = true,
            keywords::format = LOG_FORMAT,
            keywords::open_mode = std::ios_base::app
        );
    }

    auto min_severity = boost::log::expressions::channel_severity_filter(log_channel, log_severity);
    for (const auto* channel : CHANNELS) {
        min_severity[channel] = config.level;
    }
    core->set_filter(min_severity);

    Logger general{"General"};
    LOG(general.info()) << "Log level = " << config.level;
}

} // namespace cpmm::util
