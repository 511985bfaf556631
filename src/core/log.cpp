#include "core/log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_out_mutex;

bool enabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}

} // namespace

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void init_log_level_from_env() {
    if (std::getenv("VOXSTREAM_DEBUG") != nullptr) set_log_level(LogLevel::Debug);
}

void log_debug(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Debug)) return;
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << "[" << tag << "] [DEBUG] " << msg << std::endl;
}

void log_info(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Info)) return;
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << "[" << tag << "] " << msg << std::endl;
}

void log_warn(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Warn)) return;
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cerr << "[" << tag << "] [WARN] " << msg << std::endl;
}

void log_error(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cerr << "[" << tag << "] [ERROR] " << msg << std::endl;
}
