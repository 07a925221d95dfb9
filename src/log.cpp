// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "log.h"
#include "util.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace recscribe {

namespace {

LogLevel g_level = LogLevel::NONE;
FILE* g_file = nullptr;
bool g_stderr = false;
std::mutex g_mutex;

void write_line(FILE* out, const char* stamp, const char* level_str,
                const char* fmt, va_list args) {
    fprintf(out, "%s [%s] ", stamp, level_str);
    vfprintf(out, fmt, args);
    fprintf(out, "\n");
    fflush(out);
}

void write_log(const char* level_str, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_file && !g_stderr) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    if (g_file) {
        va_list copy;
        va_copy(copy, args);
        write_line(g_file, stamp, level_str, fmt, copy);
        va_end(copy);
    }
    if (g_stderr)
        write_line(stderr, stamp, level_str, fmt, args);
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug" || s == "DEBUG") return LogLevel::DEBUG;
    if (s == "info" || s == "INFO") return LogLevel::INFO;
    if (s == "warn" || s == "WARN") return LogLevel::WARN;
    if (s == "error" || s == "ERROR") return LogLevel::ERROR;
    return LogLevel::NONE;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "NONE";
    }
}

void log_init(LogLevel level, const fs::path& dir) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
    if (level == LogLevel::NONE) return;

    fs::path log_dir = dir.empty() ? (data_dir() / "logs") : dir;
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec) {
        fprintf(stderr, "recscribe: cannot create log directory %s: %s\n",
                log_dir.c_str(), ec.message().c_str());
        return;
    }

    // Daily log file
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    char datebuf[16];
    strftime(datebuf, sizeof(datebuf), "%Y-%m-%d", &tm);

    if (g_file) fclose(g_file);
    fs::path log_path = log_dir / ("recscribe-" + std::string(datebuf) + ".log");
    g_file = fopen(log_path.c_str(), "a");
}

void log_set_stderr(bool enabled) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_stderr = enabled;
}

void log_shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file) {
        fclose(g_file);
        g_file = nullptr;
    }
    g_stderr = false;
    g_level = LogLevel::NONE;
}

void log_debug(const char* fmt, ...) {
    if (g_level < LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    write_log("DEBUG", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    if (g_level < LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    write_log("INFO", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    if (g_level < LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    write_log("WARN", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    if (g_level < LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    write_log("ERROR", fmt, args);
    va_end(args);
}

} // namespace recscribe
