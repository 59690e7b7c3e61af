#include "zkvote/common/logging.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace zkvote {

void InitLogging(LogLevel min_level) {
  static std::once_flag sink_once;
  std::call_once(sink_once, []() {
    namespace expr = boost::log::expressions;
    boost::log::add_console_log(
        std::clog,
        boost::log::keywords::format =
            (expr::stream << "[" << boost::log::trivial::severity << "] " << expr::smessage),
        boost::log::keywords::auto_flush = true);
    boost::log::add_common_attributes();
  });
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

LogLevel ParseLogLevel(std::string_view name) {
  if (name == "trace") {
    return boost::log::trivial::trace;
  }
  if (name == "debug") {
    return boost::log::trivial::debug;
  }
  if (name == "info") {
    return boost::log::trivial::info;
  }
  if (name == "warning") {
    return boost::log::trivial::warning;
  }
  if (name == "error") {
    return boost::log::trivial::error;
  }
  if (name == "fatal") {
    return boost::log::trivial::fatal;
  }
  throw std::invalid_argument("unknown log level: " + std::string(name));
}

}  // namespace zkvote
