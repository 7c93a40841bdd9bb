/// @file runner.cpp
/// @brief Implementation of gsim_runner entry-point utilities.

#include "gsim/app/runner.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

namespace gsim::app {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
    // A second signal terminates immediately.
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- CLI argument parsing ----------------------------------------------------

GameResult<RunnerOptions> parseArgs(int argc, const char* const argv[]) {
    RunnerOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg != "--config" && arg != "--ticks") {
            return GameResult<RunnerOptions>::err(
                GameError(ErrorCode::InvalidArgument, "unknown option: " + std::string(arg)));
        }
        if (i + 1 >= argc) {
            return GameResult<RunnerOptions>::err(
                GameError(ErrorCode::InvalidArgument, std::string(arg) + " needs a value"));
        }
        std::string_view value(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--config") {
            options.configPath = std::filesystem::path(value);
            continue;
        }

        uint64_t ticks = 0;
        auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), ticks);
        if (ec != std::errc{} || end != value.data() + value.size()) {
            return GameResult<RunnerOptions>::err(GameError(
                ErrorCode::InvalidArgument, "--ticks expects a count, got '" + std::string(value) + "'"));
        }
        options.ticks = ticks;
    }
    return GameResult<RunnerOptions>::ok(std::move(options));
}

// -- Config loading ----------------------------------------------------------

GameResult<void> loadConfig(foundation::ConfigManager& config,
                            const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("GSIM_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

}  // namespace gsim::app
