#pragma once
#include <string>

namespace core {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Messages below the level are dropped. Default: Info.
void set_log_level(LogLevel level);
LogLevel log_level();

void log_debug(const std::string& tag, const std::string& msg);
void log_info(const std::string& tag, const std::string& msg);
void log_warn(const std::string& tag, const std::string& msg);
void log_error(const std::string& tag, const std::string& msg);

// Untagged forms kept for call sites that have no component tag.
void log_info(const std::string& msg);
void log_error(const std::string& msg);

}
