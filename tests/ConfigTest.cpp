#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "utils/Config.hpp"
#include <fstream>

using namespace DryDock;
using DryDock::Testing::TempDir;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { Config::getInstance().resetDefaults(); }
    void TearDown() override { Config::getInstance().resetDefaults(); }

    void writeFile(const std::string& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    TempDir dir_;
};

TEST_F(ConfigTest, MissingFileIsCreatedWithDefaults) {
    Config& config = Config::getInstance();
    std::string path = dir_.file("nested/drydock/config.json");

    Error err = config.loadFromFile(path);
    ASSERT_TRUE(err.ok()) << err.describe();
    EXPECT_TRUE(std::filesystem::exists(path));

    EXPECT_EQ(config.getAppName(), "DryDock");
    EXPECT_EQ(config.getSyncIntervalSeconds(), 300);
    EXPECT_EQ(config.getHttpTimeoutSeconds(), 30);
    EXPECT_EQ(config.getMaxRedirects(), 10);
    EXPECT_EQ(config.getPoolMaxConnections(), 10);
    EXPECT_EQ(config.getPoolAcquireTimeoutMs(), 5000);
    EXPECT_EQ(config.getAssistantUrl(), "http://localhost:11434");
    EXPECT_EQ(config.getAssistantModel(), "gemma3");
    EXPECT_EQ(config.getAssistantTimeoutSeconds(), 60);
    EXPECT_EQ(config.getLogLevel(), "info");
    EXPECT_FALSE(config.getUserAgent().empty());
}

TEST_F(ConfigTest, SavedValuesRoundTrip) {
    Config& config = Config::getInstance();
    std::string path = dir_.file("config.json");

    config.setDatabasePath("/var/tmp/drydock.db");
    config.setSyncIntervalSeconds(120);
    config.setLogLevel("debug");
    ASSERT_TRUE(config.saveToFile(path).ok());

    config.resetDefaults();
    EXPECT_EQ(config.getSyncIntervalSeconds(), 300);

    Error err = config.loadFromFile(path);
    ASSERT_TRUE(err.ok()) << err.describe();
    EXPECT_EQ(config.getDatabasePath(), "/var/tmp/drydock.db");
    EXPECT_EQ(config.getSyncIntervalSeconds(), 120);
    EXPECT_EQ(config.getLogLevel(), "debug");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    Config& config = Config::getInstance();
    std::string path = dir_.file("config.json");
    writeFile(path, R"({"syncIntervalSeconds": 60, "assistantModel": "llama3", "maxRedirects": -1})");

    Error err = config.loadFromFile(path);
    ASSERT_TRUE(err.ok()) << err.describe();
    EXPECT_EQ(config.getSyncIntervalSeconds(), 60);
    EXPECT_EQ(config.getAssistantModel(), "llama3");
    EXPECT_EQ(config.getMaxRedirects(), 10);
    EXPECT_EQ(config.getHttpTimeoutSeconds(), 30);
}

TEST_F(ConfigTest, MalformedFileIsReported) {
    Config& config = Config::getInstance();
    std::string path = dir_.file("config.json");
    writeFile(path, "{ not json");

    Error err = config.loadFromFile(path);
    EXPECT_FALSE(err.ok());
    EXPECT_EQ(config.getSyncIntervalSeconds(), 300);

    writeFile(path, "[1, 2, 3]");
    EXPECT_FALSE(config.loadFromFile(path).ok());
}

TEST_F(ConfigTest, EmptyDatabasePathUsesDataDir) {
    Config& config = Config::getInstance();
    config.setDatabasePath("");
    std::string path = config.getDatabasePath();
    EXPECT_EQ(path, Config::defaultDatabasePath());
    const std::string suffix = "/DryDock/database.db";
    ASSERT_GE(path.size(), suffix.size());
    EXPECT_EQ(path.substr(path.size() - suffix.size()), suffix);
}

TEST_F(ConfigTest, IntervalMustBePositive) {
    Config& config = Config::getInstance();
    config.setSyncIntervalSeconds(0);
    EXPECT_EQ(config.getSyncIntervalSeconds(), 300);
    config.setSyncIntervalSeconds(45);
    EXPECT_EQ(config.getSyncIntervalSeconds(), 45);
}
