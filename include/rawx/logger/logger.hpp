#ifndef RAWX_LOGGER_HPP
#define RAWX_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

namespace rawx::logger {

using severity_level = boost::log::trivial::severity_level;

// Logger handed to the request pipelines
using RequestLogger = boost::log::sources::severity_logger_mt<severity_level>;

// Sets up the console sink, plus a rotating file sink when log_file is not empty
void init_logging(const std::string& log_file = "",
                  severity_level min_level = severity_level::info);

// Changes the global severity filter
void set_log_level(severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_severity(const std::string& name, severity_level& level);

} // namespace rawx::logger

// Convenience macros for logging through an injected logger
#define RAWX_LOG_TRACE(lg) BOOST_LOG_SEV(lg, boost::log::trivial::trace)
#define RAWX_LOG_DEBUG(lg) BOOST_LOG_SEV(lg, boost::log::trivial::debug)
#define RAWX_LOG_INFO(lg) BOOST_LOG_SEV(lg, boost::log::trivial::info)
#define RAWX_LOG_WARN(lg) BOOST_LOG_SEV(lg, boost::log::trivial::warning)
#define RAWX_LOG_ERROR(lg) BOOST_LOG_SEV(lg, boost::log::trivial::error)

#endif // RAWX_LOGGER_HPP
