#pragma once

/// @file runner.hpp
/// @brief Entry-point utilities for gsim_runner.
///
/// Provides signal handling, configuration loading with environment
/// override, and command-line parsing.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>

#include "gsim/foundation/config_manager.hpp"
#include "gsim/foundation/game_result.hpp"

namespace gsim::app {

/// RAII signal handler for graceful shutdown.
///
/// Installs SIGINT and SIGTERM handlers on construction and restores
/// the default handlers on destruction. Only one instance should exist
/// at a time (typically in main()).
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block until SIGINT or SIGTERM is received.
    void waitForShutdown() const;

    /// Raise the flag without a signal (tests, embedding).
    static void requestShutdown() noexcept;

private:
    static void handler(int signal);
    static std::atomic<bool> shutdownFlag_;
};

/// Parsed command line of gsim_runner.
struct RunnerOptions {
    std::filesystem::path configPath;
    /// Run exactly this many ticks; absent means run until a signal.
    std::optional<uint64_t> ticks;
};

/// Parse `--config <path>` and `--ticks <n>`.
/// @return InvalidArgument for an unknown flag, a flag without a value
///         or a non-numeric tick count.
foundation::GameResult<RunnerOptions> parseArgs(int argc, const char* const argv[]);

/// Load configuration from @p defaultPath, or from GSIM_CONFIG_PATH when
/// that environment variable is set.
foundation::GameResult<void> loadConfig(foundation::ConfigManager& config,
                                        const std::filesystem::path& defaultPath);

}  // namespace gsim::app
