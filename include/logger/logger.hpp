#ifndef MAGENC_LOGGER_HPP
#define MAGENC_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace magenc::logger {

using severity_level = boost::log::trivial::severity_level;

struct LogOptions {
    severity_level min_level{boost::log::trivial::info};
    // Rotating text file sink in addition to the console when set
    std::string log_file;
    bool console{true};
};

// Accepts trace, debug, info, warning, error and fatal. Throws
// std::invalid_argument for anything else.
severity_level parse_severity(const std::string& name);

// Replaces every installed sink with the configured ones
void init_logging(const LogOptions& options = LogOptions());

} // namespace magenc::logger

#endif // MAGENC_LOGGER_HPP
