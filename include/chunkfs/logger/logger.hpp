#ifndef CHUNKFS_LOGGER_HPP
#define CHUNKFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace logging {

// Routes all BOOST_LOG_TRIVIAL records to a rotating text file.
// Records below min_level are dropped.
void init_logging(const std::string& log_file = "chunkfs.log",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info);

// Changes the minimum severity without touching the installed sinks
void set_log_level(boost::log::trivial::severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_log_level(const std::string& name, boost::log::trivial::severity_level& level);

} // namespace logging
} // namespace chunkfs

#endif // CHUNKFS_LOGGER_HPP
