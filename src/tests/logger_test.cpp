#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace magenc::logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_dir = make_temp_dir("logger_test");
        log_path = (log_dir / "magenc.log").string();
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        // Back to the test binary's own sink
        init_test_logging();
        std::filesystem::remove_all(log_dir);
    }

    std::string read_log() const {
        boost::log::core::get()->flush();
        std::ifstream file(log_path, std::ios::binary);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    std::filesystem::path log_dir;
    std::string log_path;
};

TEST_F(LoggerTest, ParseSeverity) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("debug"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("verbose"), std::invalid_argument);
    EXPECT_THROW(parse_severity(""), std::invalid_argument);
}

TEST_F(LoggerTest, FileSinkReceivesMessages) {
    LogOptions options;
    options.min_level = boost::log::trivial::debug;
    options.log_file = log_path;
    options.console = false;
    init_logging(options);

    BOOST_LOG_TRIVIAL(info) << "Store: logger test message";
    BOOST_LOG_TRIVIAL(debug) << "Store: debug line";

    const std::string content = read_log();
    EXPECT_NE(content.find("Store: logger test message"), std::string::npos);
    EXPECT_NE(content.find("[info]"), std::string::npos);
    EXPECT_NE(content.find("Store: debug line"), std::string::npos);
    EXPECT_NE(content.find("[Thread "), std::string::npos);
}

TEST_F(LoggerTest, FilterDropsLowerSeverities) {
    LogOptions options;
    options.min_level = boost::log::trivial::warning;
    options.log_file = log_path;
    options.console = false;
    init_logging(options);

    BOOST_LOG_TRIVIAL(info) << "Fetcher: filtered out";
    BOOST_LOG_TRIVIAL(error) << "Fetcher: kept";

    const std::string content = read_log();
    EXPECT_EQ(content.find("filtered out"), std::string::npos);
    EXPECT_NE(content.find("Fetcher: kept"), std::string::npos);
}

TEST_F(LoggerTest, ReinitializingAppendsToExistingFile) {
    LogOptions options;
    options.log_file = log_path;
    options.console = false;

    init_logging(options);
    BOOST_LOG_TRIVIAL(warning) << "first run";
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();

    init_logging(options);
    BOOST_LOG_TRIVIAL(warning) << "second run";

    const std::string content = read_log();
    EXPECT_NE(content.find("first run"), std::string::npos);
    EXPECT_NE(content.find("second run"), std::string::npos);
}
