#include "log.hpp"
#include <platform/platform.hpp>
#include <cli/theme.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>

std::string portscope_log_path() {
    static std::string path = (platform::temp_dir() / "portscope_debug.log").string();
    return path;
}

void portscope_log(const std::string& msg) {
    std::ofstream out(portscope_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

StatusCallback default_log_sink() {
    return [](const std::string& msg) { portscope_log(msg); };
}

StatusCallback verbose_log_sink() {
    return [](const std::string& msg) {
        portscope_log(msg);
        std::cerr << theme::log(msg);
    };
}
