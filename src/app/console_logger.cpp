/// @file console_logger.cpp
/// @brief ConsoleLogger implementation.

#include "gsim/app/console_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace gsim::app {

namespace kci = kcenon::common::interfaces;

namespace {

std::string_view levelTag(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO";
        case kci::log_level::warning:  return "WARNING";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRITICAL";
        case kci::log_level::off:      return "OFF";
    }
    return "UNKNOWN";
}

std::string utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << ms.count() << 'Z';
    return oss.str();
}

}  // namespace

ConsoleLogger::ConsoleLogger(std::ostream* out)
    : out_(out != nullptr ? out : &std::clog), minLevel_(kci::log_level::trace) {}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level, const std::string& message) {
    if (!is_enabled(level)) {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }
    auto line = utcTimestamp() + " " + std::string(levelTag(level)) + " " + message + "\n";
    std::lock_guard lock(mutex_);
    *out_ << line;
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level, std::string_view message,
                                              const kci::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(const kci::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool ConsoleLogger::is_enabled(kci::log_level level) const {
    return level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::set_level(kci::log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kci::log_level ConsoleLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    out_->flush();
    return kcenon::common::VoidResult::ok(std::monostate{});
}

void installConsoleLogger() {
    kci::GlobalLoggerRegistry::instance().set_default_logger(std::make_shared<ConsoleLogger>());
}

}  // namespace gsim::app
