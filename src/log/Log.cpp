// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/log/Log.h"

#include <cctype>
#include <cstring>
#include <ctime>
#include <sys/syscall.h>
#include <unistd.h>

namespace pathspider {

std::mutex Logger::mtx_{};
std::atomic<int> Logger::level_{static_cast<int>(LogLevel::INFO)};
LogMode Logger::mode_ = LogMode::Console;
FILE* Logger::file_ = nullptr;

namespace {

std::string lowered(std::string text) {
    for (auto& ch : text) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return text;
}

const char* level_color(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "\033[37m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
    }
    return "\033[0m";
}

} // namespace

LogLevel parse_log_level(const std::string& text) {
    const auto lvl = lowered(text);
    if (lvl == "trace") return LogLevel::TRACE;
    if (lvl == "debug") return LogLevel::DEBUG;
    if (lvl == "warn" || lvl == "warning") return LogLevel::WARN;
    if (lvl == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

LogMode parse_log_mode(const std::string& text) {
    const auto mode = lowered(text);
    if (mode == "console") return LogMode::Console;
    if (mode == "file") return LogMode::File;
    return LogMode::Silent;
}

void Logger::init(const LoggerConfig& cfg) {
    std::lock_guard<std::mutex> lk(mtx_);

    level_.store(static_cast<int>(cfg.level), std::memory_order_relaxed);
    mode_ = cfg.mode;

    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    if (mode_ == LogMode::File) {
        file_ = std::fopen(cfg.file_path.c_str(), "a");
        if (!file_) {
            // Cannot open the log file: keep logging, just on stderr.
            mode_ = LogMode::Console;
        }
    }
}

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void Logger::log(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) < level_.load(std::memory_order_relaxed)) {
        return;
    }

    va_list ap;
    va_start(ap, fmt);
    vlog(lvl, fmt, ap);
    va_end(ap);
}

/**
 * Render one line: "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] (tid) message".
 */
void Logger::vlog(LogLevel lvl, const char* fmt, va_list ap) {
    if (mode_ == LogMode::Silent) {
        return;
    }

    timespec now_ts{};
    ::clock_gettime(CLOCK_REALTIME, &now_ts);
    std::tm tm{};
    localtime_r(&now_ts.tv_sec, &tm);

    char ts[40];
    const std::size_t n = std::strftime(ts, sizeof(ts), "%F %T", &tm);
    std::snprintf(ts + n, sizeof(ts) - n, ".%03ld", now_ts.tv_nsec / 1000000L);

    const long tid = static_cast<long>(::syscall(SYS_gettid));

    std::lock_guard<std::mutex> lk(mtx_);

    FILE* out = (mode_ == LogMode::File && file_) ? file_ : stderr;
    const char* color = (mode_ == LogMode::Console) ? level_color(lvl) : "";
    const char* reset = (mode_ == LogMode::Console) ? "\033[0m" : "";

    std::fprintf(out, "%s %s[%s]%s (%ld) ", ts, color, level_str(lvl), reset, tid);
    std::vfprintf(out, fmt, ap);

    const std::size_t len = std::strlen(fmt);
    if (len == 0 || fmt[len - 1] != '\n') {
        std::fputc('\n', out);
    }
    std::fflush(out);
}

} // namespace pathspider
