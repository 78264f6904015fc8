#include "core/Logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

using trackdl::core::Logger;
using trackdl::core::LogLevel;

TEST(LoggerTest, ParseLevelIgnoresCaseAndWhitespace) {
    EXPECT_EQ(Logger::parseLevel(" DEBUG "), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parseLevel("\terror\n"), LogLevel::Error);
    EXPECT_EQ(Logger::parseLevel("OFF"), LogLevel::Off);
    EXPECT_EQ(Logger::parseLevel("verbose"), LogLevel::Info);
    EXPECT_EQ(Logger::parseLevel(""), LogLevel::Info);
}

TEST(LoggerTest, RepeatedInitFailureReusesConsoleFallback) {
    namespace fs = std::filesystem;
    const fs::path blocker = fs::temp_directory_path() / "trackdl-logger-blocker";
    fs::remove_all(blocker);
    std::ofstream(blocker) << "not a directory";

    // A log directory below a regular file cannot be created
    const std::string logDir = (blocker / "logs").string();
    EXPECT_NO_THROW(Logger::instance().initialize(LogLevel::Error, logDir));
    EXPECT_NO_THROW(Logger::instance().initialize(LogLevel::Error, logDir));
    EXPECT_NE(spdlog::get("trackdl_fallback"), nullptr);
    EXPECT_NO_THROW(LOG_ERROR("logging after fallback"));

    Logger::instance().initialize(LogLevel::Off);
    fs::remove_all(blocker);
}
