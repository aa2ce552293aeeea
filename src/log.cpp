#include "gita/log.h"

namespace gita {

namespace {
const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO"; // unreachable
}
} // anonymous namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level == LogLevel::Debug && !verbose_) return;

    std::lock_guard<std::mutex> lk(mutex_);
    *os_ << "[" << level_name(level) << "] " << message << "\n";
    os_->flush();
}

} // namespace gita
