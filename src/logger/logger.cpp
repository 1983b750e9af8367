#include "chunkfs/logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/named_scope.hpp>
#include <filesystem>
#include <iostream>

namespace chunkfs {
namespace logging {

void init_logging(const std::string& log_file, boost::log::trivial::severity_level min_level) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks so repeated initialization does not duplicate records
    logging::core::get()->remove_all_sinks();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);

    logging::add_common_attributes();
    logging::core::get()->add_global_attribute("Scope", logging::attributes::named_scope());

    logging::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::format = (
        expr::stream
          << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
          << " [" << logging::trivial::severity << "]"
          << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
          << " " << expr::smessage
      ),
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true
    );

    set_log_level(min_level);
    logging::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging system initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

bool parse_log_level(const std::string& name, boost::log::trivial::severity_level& level) {
  return boost::log::trivial::from_string(name.c_str(), name.size(), level);
}

} // namespace logging
} // namespace chunkfs
