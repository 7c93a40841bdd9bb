#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "gsim/app/console_logger.hpp"
#include "gsim/app/runner.hpp"
#include "gsim/foundation/error_code.hpp"

using namespace gsim::app;
using gsim::foundation::ErrorCode;

namespace kci = kcenon::common::interfaces;

// ═══════════════════════════════════════════════════════════════════════════
// parseArgs
// ═══════════════════════════════════════════════════════════════════════════

TEST(ParseArgsTest, NoArguments) {
    const char* argv[] = {"gsim_runner"};
    auto parsed = parseArgs(1, argv);
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_TRUE(parsed.value().configPath.empty());
    EXPECT_FALSE(parsed.value().ticks.has_value());
}

TEST(ParseArgsTest, ConfigAndTicks) {
    const char* argv[] = {"gsim_runner", "--config", "world.yaml", "--ticks", "600"};
    auto parsed = parseArgs(5, argv);
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_EQ(parsed.value().configPath, "world.yaml");
    ASSERT_TRUE(parsed.value().ticks.has_value());
    EXPECT_EQ(*parsed.value().ticks, 600u);
}

TEST(ParseArgsTest, RejectsBadInput) {
    const char* unknown[] = {"gsim_runner", "--verbose"};
    EXPECT_EQ(parseArgs(2, unknown).error().code(), ErrorCode::InvalidArgument);

    const char* missing[] = {"gsim_runner", "--ticks"};
    EXPECT_EQ(parseArgs(2, missing).error().code(), ErrorCode::InvalidArgument);

    const char* notNumber[] = {"gsim_runner", "--ticks", "12x"};
    auto bad = parseArgs(3, notNumber);
    ASSERT_TRUE(bad.hasError());
    EXPECT_NE(bad.error().message().find("12x"), std::string_view::npos);
}

// ═══════════════════════════════════════════════════════════════════════════
// loadConfig
// ═══════════════════════════════════════════════════════════════════════════

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("gsim_runner_") + info->name());
        std::filesystem::create_directories(tmpDir_);
        unsetenv("GSIM_CONFIG_PATH");
    }

    void TearDown() override {
        unsetenv("GSIM_CONFIG_PATH");
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& name, const std::string& content) {
        auto path = tmpDir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(LoadConfigTest, LoadsDefaultPath) {
    auto path = writeYaml("default.yaml", "simulation:\n  tick_rate: 30\n");
    gsim::foundation::ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path).hasValue());
    EXPECT_EQ(config.get<int>("simulation.tick_rate").value(), 30);
}

TEST_F(LoadConfigTest, EnvironmentOverridesDefault) {
    auto fallback = writeYaml("default.yaml", "simulation:\n  tick_rate: 30\n");
    auto chosen = writeYaml("override.yaml", "simulation:\n  tick_rate: 120\n");
    setenv("GSIM_CONFIG_PATH", chosen.c_str(), 1);

    gsim::foundation::ConfigManager config;
    ASSERT_TRUE(loadConfig(config, fallback).hasValue());
    EXPECT_EQ(config.get<int>("simulation.tick_rate").value(), 120);
}

TEST_F(LoadConfigTest, EmptyEnvironmentValueIgnored) {
    auto path = writeYaml("default.yaml", "simulation:\n  tick_rate: 30\n");
    setenv("GSIM_CONFIG_PATH", "", 1);

    gsim::foundation::ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path).hasValue());
}

TEST_F(LoadConfigTest, MissingFileFails) {
    gsim::foundation::ConfigManager config;
    auto result = loadConfig(config, tmpDir_ / "absent.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

// ═══════════════════════════════════════════════════════════════════════════
// SignalHandler
// ═══════════════════════════════════════════════════════════════════════════

TEST(SignalHandlerTest, RequestShutdownReleasesWait) {
    SignalHandler signals;
    EXPECT_FALSE(signals.shutdownRequested());
    SignalHandler::requestShutdown();
    EXPECT_TRUE(signals.shutdownRequested());
    signals.waitForShutdown();
}

// ═══════════════════════════════════════════════════════════════════════════
// ConsoleLogger
// ═══════════════════════════════════════════════════════════════════════════

TEST(ConsoleLoggerTest, WritesLevelAndMessage) {
    std::ostringstream out;
    ConsoleLogger logger(&out);
    ASSERT_TRUE(logger.log(kci::log_level::warning, "[Runtime] falling behind").is_ok());

    auto line = out.str();
    EXPECT_NE(line.find("Z WARNING [Runtime] falling behind\n"), std::string::npos);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], 'T');
}

TEST(ConsoleLoggerTest, FiltersBelowLevel) {
    std::ostringstream out;
    ConsoleLogger logger(&out);
    ASSERT_TRUE(logger.set_level(kci::log_level::error).is_ok());
    EXPECT_EQ(logger.get_level(), kci::log_level::error);
    EXPECT_FALSE(logger.is_enabled(kci::log_level::info));

    ASSERT_TRUE(logger.log(kci::log_level::info, "quiet").is_ok());
    ASSERT_TRUE(logger.log(kci::log_level::critical, "loud").is_ok());
    EXPECT_EQ(out.str().find("quiet"), std::string::npos);
    EXPECT_NE(out.str().find("CRITICAL loud"), std::string::npos);
}

TEST(ConsoleLoggerTest, InstallSetsDefaultLogger) {
    installConsoleLogger();
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<ConsoleLogger>(logger), nullptr);
    kci::GlobalLoggerRegistry::instance().clear();
}
