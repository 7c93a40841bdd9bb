#pragma once

/// @file console_logger.hpp
/// @brief kcenon ILogger writing timestamped lines to a stream.

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>

namespace gsim::app {

/// `2026-01-02T03:04:05.678Z WARNING [Runtime] message` per line.
class ConsoleLogger final : public kcenon::common::interfaces::ILogger {
public:
    /// @param out Destination; std::clog when omitted.
    explicit ConsoleLogger(std::ostream* out = nullptr);

    kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        kcenon::common::interfaces::log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(kcenon::common::interfaces::log_level level) const override;
    kcenon::common::VoidResult set_level(kcenon::common::interfaces::log_level level) override;
    kcenon::common::interfaces::log_level get_level() const override;
    kcenon::common::VoidResult flush() override;

private:
    std::ostream* out_;
    std::mutex mutex_;
    std::atomic<kcenon::common::interfaces::log_level> minLevel_;
};

/// Register a ConsoleLogger as the registry's default logger.
void installConsoleLogger();

}  // namespace gsim::app
