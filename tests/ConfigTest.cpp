#include "core/Config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using trackdl::core::Config;
namespace fs = std::filesystem;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clearEnvironment();
        Config::instance().setDefaults();
        m_dir = fs::temp_directory_path() /
                (std::string("trackdl-config-") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(m_dir);
    }

    void TearDown() override {
        clearEnvironment();
        Config::instance().setDefaults();
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    static void clearEnvironment() {
        unsetenv("DOWNLOAD_FOLDER");
        unsetenv("CONCURRENT_DOWNLOADS");
        unsetenv("STREAM_URL_TEMPLATE");
        unsetenv("LOG_LEVEL");
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        fs::path path = m_dir / name;
        std::ofstream(path) << content;
        return path;
    }

    fs::path m_dir;
};

} // namespace

TEST_F(ConfigTest, DefaultsCoverDownloadAndLoggingKeys) {
    auto& config = Config::instance();

    EXPECT_EQ(config.get<int>("downloads.concurrentDownloads"), 4);
    EXPECT_EQ(config.get<int>("downloads.queueCapacity"), 1000);
    EXPECT_EQ(config.get<std::string>("downloads.streamUrlTemplate", "unset"), "");
    EXPECT_EQ(config.get<std::string>("downloads.fileExtension"), "flac");
    EXPECT_EQ(config.get<std::string>("logging.level"), "info");
    EXPECT_NE(config.get<std::string>("downloads.folder").find("TrackDL"), std::string::npos);
}

TEST_F(ConfigTest, MissingKeysAndWrongTypesFallBackToDefault) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.has("downloads.nope"));
    EXPECT_EQ(config.get<int>("downloads.nope", 9), 9);
    EXPECT_EQ(config.get<int>("downloads.fileExtension", 3), 3);
}

TEST_F(ConfigTest, SetUsesDotNotation) {
    auto& config = Config::instance();
    config.set("downloads.concurrentDownloads", 8);
    config.set("ui.theme", std::string("dark"));

    EXPECT_EQ(config.get<int>("downloads.concurrentDownloads"), 8);
    EXPECT_TRUE(config.has("ui.theme"));
    EXPECT_EQ(config.getAll()["ui"]["theme"], "dark");
}

TEST_F(ConfigTest, LoadMergesFileOverDefaults) {
    auto path = writeFile("config.json",
        R"({"downloads": {"concurrentDownloads": 6, "streamUrlTemplate": "https://cdn.test/{id}"}})");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path.string()));

    EXPECT_EQ(config.get<int>("downloads.concurrentDownloads"), 6);
    EXPECT_EQ(config.get<std::string>("downloads.streamUrlTemplate"), "https://cdn.test/{id}");
    EXPECT_EQ(config.get<int>("downloads.queueCapacity"), 1000);
    EXPECT_EQ(config.get<std::string>("logging.level"), "info");
    EXPECT_EQ(config.getPath(), path.string());
}

TEST_F(ConfigTest, LoadRejectsMissingOrInvalidFile) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.load((m_dir / "absent.json").string()));
    EXPECT_FALSE(config.load(writeFile("bad.json", "{ not json").string()));
    EXPECT_EQ(config.get<int>("downloads.concurrentDownloads"), 4);
}

TEST_F(ConfigTest, SaveCreatesParentDirectories) {
    auto& config = Config::instance();
    config.set("downloads.concurrentDownloads", 2);

    fs::path path = m_dir / "nested" / "config.json";
    ASSERT_TRUE(config.save(path.string()));
    ASSERT_TRUE(fs::exists(path));

    config.setDefaults();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.get<int>("downloads.concurrentDownloads"), 2);
}

TEST_F(ConfigTest, EnvironmentOverridesLoadedValues) {
    setenv("DOWNLOAD_FOLDER", "/srv/music", 1);
    setenv("CONCURRENT_DOWNLOADS", "7", 1);
    setenv("STREAM_URL_TEMPLATE", "http://local/{id}", 1);
    setenv("LOG_LEVEL", "debug", 1);

    auto& config = Config::instance();
    config.applyEnvironment();

    EXPECT_EQ(config.get<std::string>("downloads.folder"), "/srv/music");
    EXPECT_EQ(config.get<int>("downloads.concurrentDownloads"), 7);
    EXPECT_EQ(config.get<std::string>("downloads.streamUrlTemplate"), "http://local/{id}");
    EXPECT_EQ(config.get<std::string>("logging.level"), "debug");
}

TEST_F(ConfigTest, InvalidWorkerCountFromEnvironmentIsIgnored) {
    auto& config = Config::instance();

    for (const char* value : {"0", "-3", "four", "5x"}) {
        setenv("CONCURRENT_DOWNLOADS", value, 1);
        config.applyEnvironment();
        EXPECT_EQ(config.get<int>("downloads.concurrentDownloads"), 4) << value;
    }
}
