#pragma once

#include <string_view>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

namespace zkvote {

using LogLevel = boost::log::trivial::severity_level;
using Logger = boost::log::sources::severity_logger_mt<LogLevel>;

// Installs the console sink once and sets the minimum severity.
void InitLogging(LogLevel min_level = boost::log::trivial::info);
LogLevel ParseLogLevel(std::string_view name);

}  // namespace zkvote

// Usage: ZKVOTE_LOG(lg, debug) << "message";
#define ZKVOTE_LOG(logger, sev) BOOST_LOG_SEV((logger), ::boost::log::trivial::sev)
