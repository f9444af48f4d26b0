#include "logger/Logger.hpp"
#include "support/TestSupport.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using testsupport::TempDir;

namespace {
    std::vector<fs::path> logFiles(const fs::path &directory, const std::string &prefix) {
        std::vector<fs::path> files;
        for (const auto &entry: fs::directory_iterator(directory)) {
            const std::string name = entry.path().filename().string();
            if (entry.path().extension() == ".log" && name.rfind(prefix + "_", 0) == 0) {
                files.push_back(entry.path());
            }
        }
        return files;
    }

    void touch(const fs::path &path, fs::file_time_type when) {
        {
            std::ofstream out(path.string());
            out << "old\n";
        }
        fs::last_write_time(path, when);
    }
}

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::shutdown();
    }

    TempDir dir_;
};

TEST_F(LoggerTest, RotatesWhenFileIsFull) {
    Logger::Options options;
    options.directory = dir_.path().string();
    options.filePrefix = "rotation";
    options.maxFileBytes = 300;
    options.maxFiles = 100;
    Logger::init(options);
    const std::string first = Logger::currentLogPath();

    for (int i = 0; i < 10; ++i) {
        Logger::logInfo("[LoggerTest] line " + std::to_string(i) + " " + std::string(60, 'x'));
    }

    EXPECT_NE(Logger::currentLogPath(), first);
    auto files = logFiles(dir_.path(), "rotation");
    EXPECT_GE(files.size(), 3u);
    for (const auto &file: files) {
        EXPECT_LE(fs::file_size(file), 300u) << file;
    }
}

TEST_F(LoggerTest, InitPrunesOwnFilesOnly) {
    const auto now = fs::file_time_type::clock::now();
    for (int i = 0; i < 4; ++i) {
        touch(dir_.path() / ("service_20251015_10000" + std::to_string(i) + ".log"),
              now - std::chrono::minutes(60 - i));
    }
    touch(dir_.path() / "service_20251001_080000.log", now - std::chrono::hours(24 * 10));
    touch(dir_.path() / "other_20251001_080000.log", now - std::chrono::hours(24 * 10));

    Logger::Options options;
    options.directory = dir_.path().string();
    options.filePrefix = "service";
    options.maxFiles = 3;
    options.retentionDays = 7;
    Logger::init(options);

    auto files = logFiles(dir_.path(), "service");
    EXPECT_EQ(files.size(), 3u);
    EXPECT_TRUE(fs::exists(Logger::currentLogPath()));
    EXPECT_TRUE(fs::exists(dir_.path() / "service_20251015_100003.log"));
    EXPECT_TRUE(fs::exists(dir_.path() / "service_20251015_100002.log"));
    EXPECT_FALSE(fs::exists(dir_.path() / "service_20251015_100000.log"));
    EXPECT_FALSE(fs::exists(dir_.path() / "service_20251001_080000.log"));
    EXPECT_TRUE(fs::exists(dir_.path() / "other_20251001_080000.log"));
}

TEST_F(LoggerTest, ShutdownFallsBackToConsole) {
    Logger::init(dir_.path().string());
    const std::string path = Logger::currentLogPath();
    Logger::logInfo("[LoggerTest] before shutdown");
    Logger::shutdown();

    const auto size = fs::file_size(path);
    Logger::logInfo("[LoggerTest] after shutdown");
    EXPECT_EQ(fs::file_size(path), size);
}
