#include "core/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mutex;

void write_line(LogLevel level, const char* label, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << label << "]";
    if (!tag.empty()) out << "[" << tag << "]";
    out << " " << msg << std::endl;
}
} // namespace

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void log_debug(const std::string& tag, const std::string& msg) { write_line(LogLevel::Debug, "DEBUG", tag, msg); }
void log_info(const std::string& tag, const std::string& msg) { write_line(LogLevel::Info, "INFO", tag, msg); }
void log_warn(const std::string& tag, const std::string& msg) { write_line(LogLevel::Warn, "WARN", tag, msg); }
void log_error(const std::string& tag, const std::string& msg) { write_line(LogLevel::Error, "ERROR", tag, msg); }

void log_info(const std::string& msg) { log_info(std::string(), msg); }
void log_error(const std::string& msg) { log_error(std::string(), msg); }
}
