#include "respkv/util/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace respkv::util::test {

class ConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("respkv_config_test_" +
                     std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigTest, DefaultValues) {
    Config config;
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 31337);
    EXPECT_EQ(config.max_connections, 64u);
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST_F(ConfigTest, LoadFile) {
    auto path = test_dir_ / "test.conf";
    {
        std::ofstream f(path);
        f << "host = \"0.0.0.0\"\n";
        f << "port = 8080\n";
        f << "max_connections = 8\n";
        f << "log_level = debug\n";
    }

    auto config = Config::load_file(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->host, "0.0.0.0");
    EXPECT_EQ(config->port, 8080);
    EXPECT_EQ(config->max_connections, 8u);
    EXPECT_EQ(config->log_level, LogLevel::Debug);
}

TEST_F(ConfigTest, LoadFileWithComments) {
    auto path = test_dir_ / "test.conf";
    {
        std::ofstream f(path);
        f << "# This is a comment\n";
        f << "port = 9000\n";
        f << "\n";
        f << "# Another comment\n";
        f << "host = \"localhost\"\n";
    }

    auto config = Config::load_file(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, 9000);
    EXPECT_EQ(config->host, "localhost");
}

TEST_F(ConfigTest, LoadFileNotFound) {
    auto config = Config::load_file("/nonexistent/path/config.conf");
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, LoadFileBadPortThrows) {
    auto path = test_dir_ / "bad.conf";
    {
        std::ofstream f(path);
        f << "port = 70000\n";
    }
    EXPECT_THROW(Config::load_file(path), std::invalid_argument);
}

TEST_F(ConfigTest, ParseArgs) {
    const char* argv[] = {"program", "-p", "8080", "-H", "0.0.0.0", "-l", "debug", "-m", "4"};
    int argc = 9;

    auto cli = Config::parse_args(argc, const_cast<char**>(argv));
    ASSERT_TRUE(cli.has_value());
    ASSERT_TRUE(cli->port.has_value());
    EXPECT_EQ(*cli->port, 8080);
    ASSERT_TRUE(cli->host.has_value());
    EXPECT_EQ(*cli->host, "0.0.0.0");
    ASSERT_TRUE(cli->log_level.has_value());
    EXPECT_EQ(*cli->log_level, LogLevel::Debug);
    ASSERT_TRUE(cli->max_connections.has_value());
    EXPECT_EQ(*cli->max_connections, 4u);
    EXPECT_FALSE(cli->config_path.has_value());
}

TEST_F(ConfigTest, ParseArgsLeavesUnsetFieldsEmpty) {
    const char* argv[] = {"program", "-p", "8080"};

    auto cli = Config::parse_args(3, const_cast<char**>(argv));
    ASSERT_TRUE(cli.has_value());
    EXPECT_TRUE(cli->port.has_value());
    EXPECT_FALSE(cli->host.has_value());
    EXPECT_FALSE(cli->max_connections.has_value());
    EXPECT_FALSE(cli->log_level.has_value());
}

TEST_F(ConfigTest, ParseArgsRecordsConfigPath) {
    const char* argv[] = {"program", "--config", "some.conf", "--port", "7000"};
    int argc = 5;

    auto cli = Config::parse_args(argc, const_cast<char**>(argv));
    ASSERT_TRUE(cli.has_value());
    ASSERT_TRUE(cli->config_path.has_value());
    EXPECT_EQ(*cli->config_path, std::filesystem::path("some.conf"));
    ASSERT_TRUE(cli->port.has_value());
    EXPECT_EQ(*cli->port, 7000);
}

TEST_F(ConfigTest, ParseArgsHelp) {
    const char* argv[] = {"program", "--help"};
    int argc = 2;

    auto cli = Config::parse_args(argc, const_cast<char**>(argv));
    EXPECT_FALSE(cli.has_value());
}

TEST_F(ConfigTest, ParseArgsRejectsUnknownOption) {
    const char* argv[] = {"program", "--bogus"};
    EXPECT_THROW((void)Config::parse_args(2, const_cast<char**>(argv)), std::invalid_argument);
}

TEST_F(ConfigTest, ParseArgsRejectsZeroConnections) {
    const char* argv[] = {"program", "--max-connections", "0"};
    EXPECT_THROW((void)Config::parse_args(3, const_cast<char**>(argv)), std::invalid_argument);
}

TEST_F(ConfigTest, MergeConfigs) {
    Config file_config;
    file_config.port = 8080;
    file_config.host = "0.0.0.0";
    file_config.max_connections = 10;

    ConfigOverrides cli;
    cli.port = 9000;  // CLI overrides file

    auto result = Config::merge(file_config, cli);

    EXPECT_EQ(result.port, 9000);       // CLI wins
    EXPECT_EQ(result.host, "0.0.0.0");  // file wins (not given on the CLI)
    EXPECT_EQ(result.max_connections, 10u);
    EXPECT_EQ(result.log_level, LogLevel::Info);
}

TEST_F(ConfigTest, MergeWithoutFileUsesDefaults) {
    ConfigOverrides cli;
    cli.host = "0.0.0.0";

    auto result = Config::merge(Config{}, cli);

    EXPECT_EQ(result.host, "0.0.0.0");
    EXPECT_EQ(result.port, 31337);
    EXPECT_EQ(result.max_connections, 64u);
    EXPECT_EQ(result.log_level, LogLevel::Info);
}

TEST_F(ConfigTest, CliFlagEqualToDefaultStillOverridesFile) {
    auto path = test_dir_ / "test.conf";
    {
        std::ofstream f(path);
        f << "port = 9000\n";
        f << "max_connections = 8\n";
        f << "log_level = debug\n";
    }
    const char* argv[] = {"program", "-c", path.c_str(), "-p", "31337", "-m", "64", "-l", "info"};

    auto cli = Config::parse_args(9, const_cast<char**>(argv));
    ASSERT_TRUE(cli.has_value());
    ASSERT_TRUE(cli->config_path.has_value());
    auto file_config = Config::load_file(*cli->config_path);
    ASSERT_TRUE(file_config.has_value());

    auto result = Config::merge(*file_config, *cli);

    EXPECT_EQ(result.port, 31337);
    EXPECT_EQ(result.max_connections, 64u);
    EXPECT_EQ(result.log_level, LogLevel::Info);
}

}  // namespace respkv::util::test
