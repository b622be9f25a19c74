#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include "../src/physics/aerodynamics/aerodynamics.hpp"
#include "../src/physics/utils.hpp"
#include <atomic>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace std_atmosphere;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::drop(logging::kLoggerName);
    }

    void TearDown() override {
        spdlog::drop(logging::kLoggerName);
    }

    std::shared_ptr<spdlog::logger> makeCaptureLogger() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_stream_);
        return std::make_shared<spdlog::logger>(logging::kLoggerName, sink);
    }

    std::ostringstream log_stream_;
};

// Test level names
TEST_F(LoggingTest, ParseKnownLevels) {
    EXPECT_EQ(logging::parse_level("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("off"), spdlog::level::off);
}

TEST_F(LoggingTest, UnknownLevelThrowsAndKeepsCurrentLevel) {
    spdlog::register_logger(makeCaptureLogger());
    logging::set_level(spdlog::level::warn);

    EXPECT_THROW(logging::parse_level("warnings"), std::invalid_argument);
    EXPECT_THROW(logging::set_level(std::string("verbose")), std::invalid_argument);
    EXPECT_EQ(logging::get_logger()->level(), spdlog::level::warn);

    // Diagnostics still reach the sink
    aerodynamics::sutherland_viscosity(6000.0);
    EXPECT_NE(log_stream_.str().find("too large"), std::string::npos);
}

TEST_F(LoggingTest, SetLevelByName) {
    spdlog::register_logger(makeCaptureLogger());
    logging::set_level(std::string("off"));
    EXPECT_EQ(logging::get_logger()->level(), spdlog::level::off);
    logging::set_level(std::string("debug"));
    EXPECT_EQ(logging::get_logger()->level(), spdlog::level::debug);
}

// Test logger lookup
TEST_F(LoggingTest, CallerRegisteredLoggerIsUsed) {
    auto logger = makeCaptureLogger();
    spdlog::register_logger(logger);
    EXPECT_EQ(logging::get_logger(), logger);
}

TEST_F(LoggingTest, DefaultLoggerCreatedOnce) {
    auto first = logging::get_logger();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->name(), logging::kLoggerName);
    EXPECT_EQ(logging::get_logger(), first);
}

TEST_F(LoggingTest, ConcurrentRegistrationDoesNotEscapeDiagnostics) {
    for (int round = 0; round < 200; ++round) {
        spdlog::drop(logging::kLoggerName);
        std::atomic<bool> diagnostic_threw(false);

        std::thread caller([this]() {
            try {
                spdlog::register_logger(makeCaptureLogger());
            } catch (const spdlog::spdlog_ex&) {
                // The library created its logger first
            }
        });
        std::thread library([&diagnostic_threw]() {
            try {
                aerodynamics::sutherland_viscosity(500.0);
                logging::get_logger();
            } catch (const std::exception&) {
                diagnostic_threw = true;
            }
        });
        caller.join();
        library.join();

        EXPECT_FALSE(diagnostic_threw) << "round " << round;
        EXPECT_NE(spdlog::get(logging::kLoggerName), nullptr);
    }
}
