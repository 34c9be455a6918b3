#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace crystal::logger;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = make_test_directory("logger_test");
        log_file = log_dir / "crystal.log";
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();

        if (std::filesystem::exists(log_dir)) {
            std::filesystem::remove_all(log_dir);
        }
    }

    void init(severity_level level) {
        LogOptions options;
        options.min_level = level;
        options.log_file = log_file.string();
        options.console = false;
        init_logging(options);
    }

    std::string log_content() {
        boost::log::core::get()->flush();
        std::ifstream file(log_file, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return "";
        }
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }
};

TEST_F(LoggerTest, BasicLogging) {
    init(boost::log::trivial::trace);

    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    std::string content = log_content();
    EXPECT_NE(content.find("Test info message"), std::string::npos);
    EXPECT_NE(content.find("Test error message"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, SeverityFilter) {
    init(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Filtered debug message";
    BOOST_LOG_TRIVIAL(warning) << "Visible warning message";

    std::string content = log_content();
    EXPECT_EQ(content.find("Filtered debug message"), std::string::npos);
    EXPECT_NE(content.find("Visible warning message"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentLogging) {
    init(boost::log::trivial::trace);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 10; ++i) {
                BOOST_LOG_TRIVIAL(info) << "Thread " << t << " message " << i;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::string content = log_content();
    for (int t = 0; t < 4; ++t) {
        EXPECT_NE(content.find("Thread " + std::to_string(t) + " message 9"), std::string::npos);
    }
}

TEST(ParseSeverityTest, KnownAndUnknownNames) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("DEBUG"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("Info"), boost::log::trivial::info);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("warn"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("error"), boost::log::trivial::error);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_FALSE(parse_severity("verbose").has_value());
    EXPECT_FALSE(parse_severity("").has_value());
}
