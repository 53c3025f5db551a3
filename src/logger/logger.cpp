#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace magenc::logger {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

severity_level parse_severity(const std::string& name) {
    severity_level level;
    if (!logging::trivial::from_string(name.c_str(), name.size(), level)) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

void init_logging(const LogOptions& options) {
    try {
        // Clear any existing sinks
        logging::core::get()->remove_all_sinks();
        logging::add_common_attributes();

        const auto format = (
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << logging::trivial::severity << "]"
                << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
                << " " << expr::smessage
        );

        if (options.console) {
            logging::add_console_log(
                std::clog,
                keywords::format = format,
                keywords::auto_flush = true
            );
        }

        if (!options.log_file.empty()) {
            logging::add_file_log(
                keywords::file_name = options.log_file,
                keywords::format = format,
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
                keywords::auto_flush = true
            );
        }

        logging::core::get()->set_filter(logging::trivial::severity >= options.min_level);
        logging::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(debug) << "Logger: Initialized at level " << options.min_level
                                 << (options.log_file.empty() ? "" : ", file " + options.log_file);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace magenc::logger
