#ifndef LOG_HPP
#define LOG_HPP

#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

// Picks Debug when VOXSTREAM_DEBUG is set in the environment.
void init_log_level_from_env();

void log_debug(const std::string& tag, const std::string& msg);
void log_info(const std::string& tag, const std::string& msg);
void log_warn(const std::string& tag, const std::string& msg);
void log_error(const std::string& tag, const std::string& msg);

#endif
