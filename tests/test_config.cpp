/**
 * @file test_config.cpp
 * @brief Unit tests for loading the json config
 */

#include <gtest/gtest.h>
#include <config.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace taxid;

// Helper to create a temporary config file
class TempConfigFile
{
public:
    explicit TempConfigFile(const std::string& content)
        : path_((std::filesystem::temp_directory_path() / "taxid_test_config.json").string())
    {
        std::ofstream file(path_);
        file << content;
    }

    ~TempConfigFile()
    {
        std::filesystem::remove(path_);
    }

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
};

TEST(ConfigTest, LoadsAllKeys) {
    TempConfigFile file{R"({"log_file_path": "/tmp/taxid_test.log", "console_log_enabled": true, "log_severity": "debug"})"};

    config::init(file.getPath());

    EXPECT_EQ(config::log_file_path, "/tmp/taxid_test.log");
    EXPECT_TRUE(config::console_log_enabled);
    EXPECT_EQ(config::log_severity, boost::log::trivial::debug);
}

TEST(ConfigTest, MissingFile) {
    EXPECT_THROW(config::init("/nonexistent/taxid_config.json"), std::invalid_argument);
}

TEST(ConfigTest, UnknownSeverity) {
    TempConfigFile file{R"({"log_file_path": "taxid.log", "console_log_enabled": false, "log_severity": "verbose"})"};

    EXPECT_THROW(config::init(file.getPath()), std::invalid_argument);
}

TEST(ConfigTest, MissingKey) {
    TempConfigFile file{R"({"log_file_path": "taxid.log"})"};

    // The exception type of a missing key differs between Boost.JSON versions
    EXPECT_THROW(config::init(file.getPath()), std::exception);
}

TEST(ConfigTest, MalformedJson) {
    TempConfigFile file{R"({"log_file_path": )"};

    EXPECT_THROW(config::init(file.getPath()), boost::system::system_error);
}
