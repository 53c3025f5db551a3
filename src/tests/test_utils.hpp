#ifndef MAGENC_TEST_UTILS_HPP
#define MAGENC_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

// Console sink for the test binary; only warnings and above by default
inline void init_test_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);

    boost::log::add_common_attributes();
}

// Fresh directory under the system temp path
inline std::filesystem::path make_temp_dir(const std::string& prefix) {
    static int counter = 0;
    const auto path = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count())
         + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path);
    return path;
}

#endif // MAGENC_TEST_UTILS_HPP
