#pragma once

/// @file log.h
/// Leveled diagnostic logging to stderr.

#include <iostream>
#include <mutex>
#include <string>

namespace gita {

enum class LogLevel { Debug, Info, Warn, Error };

/// Process-wide logger.  DEBUG lines are dropped unless verbose is on.
class Logger {
public:
    static Logger& instance();

    void set_verbose(bool v) { verbose_ = v; }
    bool verbose() const { return verbose_; }

    /// Redirect output (tests capture warnings this way).  Not owned.
    void set_stream(std::ostream* os) { os_ = os ? os : &std::cerr; }

    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;

    bool          verbose_ = false;
    std::ostream* os_      = &std::cerr;
    std::mutex    mutex_;
};

} // namespace gita

#define GITA_LOG_DEBUG(msg) ::gita::Logger::instance().log(::gita::LogLevel::Debug, msg)
#define GITA_LOG_INFO(msg)  ::gita::Logger::instance().log(::gita::LogLevel::Info, msg)
#define GITA_LOG_WARN(msg)  ::gita::Logger::instance().log(::gita::LogLevel::Warn, msg)
#define GITA_LOG_ERROR(msg) ::gita::Logger::instance().log(::gita::LogLevel::Error, msg)
