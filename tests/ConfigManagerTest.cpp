#include "application/config/ConfigManager.hpp"
#include "support/TestSupport.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

using core::config::ConfigManager;
using testsupport::TempDir;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("PRINT_SERVICE_HTTP_PORT");
        unsetenv("PRINT_SERVICE_STORE_DEFAULT_HOST");
        ConfigManager::getInstance().reset();
    }

    static void writeConfig(const std::string &path, const std::string &text) {
        std::ofstream out(path);
        out << text;
    }
};

TEST_F(ConfigManagerTest, Defaults) {
    auto &config = ConfigManager::getInstance();

    auto http = config.getHttpConfig();
    EXPECT_EQ(http.bindAddress, "127.0.0.1");
    EXPECT_EQ(http.port, 8105);

    auto delivery = config.getDeliveryConfig();
    EXPECT_EQ(delivery.timeoutMs, 5000);

    auto ticket = config.getTicketConfig();
    EXPECT_EQ(ticket.operatorName, "STE DHRAIFF SERVICES");
    EXPECT_DOUBLE_EQ(ticket.defaultStationFee, 0.15);
    EXPECT_EQ(ticket.characterTable, 2);
    EXPECT_EQ(ticket.feedLines, 4);

    auto store = config.getStoreConfig();
    EXPECT_EQ(store.defaultHost, "192.168.192.12");
    EXPECT_EQ(store.legacyHost, "192.168.192.168");
    EXPECT_EQ(store.printerId, "printer1");

    auto log = config.getLogConfig();
    EXPECT_EQ(log.directory, "logs");
    EXPECT_EQ(log.maxFileMb, 50);
    EXPECT_EQ(log.maxFiles, 10);
    EXPECT_EQ(log.retentionDays, 7);

    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, NestedFileIsFlattened) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    writeConfig(path, R"({
        "http": {"port": 9000, "bind": {"address": "0.0.0.0"}},
        "delivery": {"timeout": {"ms": 2500}},
        "ticket": {"operator": {"name": "LOUAGE SFAX"}, "station": {"fee": 0.2}},
        "store": {"path": "/var/lib/printers.json"}
    })");

    auto &config = ConfigManager::getInstance();
    config.loadFromFile(path);

    EXPECT_EQ(config.getHttpConfig().port, 9000);
    EXPECT_EQ(config.getHttpConfig().bindAddress, "0.0.0.0");
    EXPECT_EQ(config.getDeliveryConfig().timeoutMs, 2500);
    EXPECT_EQ(config.getTicketConfig().operatorName, "LOUAGE SFAX");
    EXPECT_DOUBLE_EQ(config.getTicketConfig().defaultStationFee, 0.2);
    EXPECT_EQ(config.getStoreConfig().path, "/var/lib/printers.json");
    EXPECT_EQ(config.getStoreConfig().defaultPort, 9100);
}

TEST_F(ConfigManagerTest, MissingFileKeepsDefaults) {
    TempDir dir;
    auto &config = ConfigManager::getInstance();
    config.loadFromFile(dir.file("absent.json"));
    EXPECT_EQ(config.getHttpConfig().port, 8105);
}

TEST_F(ConfigManagerTest, BrokenFileKeepsDefaults) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    writeConfig(path, "{ \"http\": ");

    auto &config = ConfigManager::getInstance();
    config.loadFromFile(path);
    EXPECT_EQ(config.getHttpConfig().port, 8105);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    writeConfig(path, R"({"http": {"port": 9000}})");
    setenv("PRINT_SERVICE_HTTP_PORT", "9200", 1);
    setenv("PRINT_SERVICE_STORE_DEFAULT_HOST", "10.0.0.20", 1);

    auto &config = ConfigManager::getInstance();
    config.loadFromFile(path);
    config.loadFromEnv();

    EXPECT_EQ(config.getHttpConfig().port, 9200);
    EXPECT_EQ(config.getStoreConfig().defaultHost, "10.0.0.20");
}

TEST_F(ConfigManagerTest, ReloadRereadsFile) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    writeConfig(path, R"({"http": {"port": 9000}})");

    auto &config = ConfigManager::getInstance();
    EXPECT_FALSE(config.reload());

    config.loadFromFile(path);
    writeConfig(path, R"({"http": {"port": 9001}})");
    EXPECT_TRUE(config.reload());
    EXPECT_EQ(config.getHttpConfig().port, 9001);
}

TEST_F(ConfigManagerTest, ValidationReportsBadValues) {
    TempDir dir;
    const std::string path = dir.file("config.json");
    writeConfig(path, R"({"http": {"port": 0}, "escpos": {"feed": {"lines": 99}}})");

    auto &config = ConfigManager::getInstance();
    config.loadFromFile(path);
    auto result = config.validate();

    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0], "http.port must be in [1, 65535]");
    EXPECT_EQ(result.errors[1], "escpos.feed.lines must be in [0, 32]");
}

TEST_F(ConfigManagerTest, MissingKeysFallBackToCallerDefault) {
    auto &config = ConfigManager::getInstance();
    EXPECT_EQ(config.get<int>("missing.key", 7), 7);
    EXPECT_EQ(config.get<std::string>("ticket.operator.name", ""), "STE DHRAIFF SERVICES");
    EXPECT_TRUE(config.get<bool>("missing.flag", true));
}
