// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <mutex>
#include <thread>
#include <unistd.h>

#define COLOR_YELLOW "\033[1;33m"
#define COLOR_RED    "\033[1;31m"
#define COLOR_RESET  "\033[0m"

namespace {
    std::mutex          g_mu;          // guards writer startup/shutdown
    int                 g_pipe_wr = -1;
    std::thread         g_writer;
    std::atomic<int>    g_level{static_cast<int>(LogLevel::Info)};
    std::mutex          g_err_mu;      // keeps stderr lines whole
}


// Desc: logger loop to read from pipe and append to log file
// In: int pipe_read_fd, const std::string& path
// Out: void (returns when the write end is closed)
void logger_loop(int pipe_read_fd, const std::string& path) {
    char buf[1024];
    // [Main loop of logger thread]
    while (true) {
        ssize_t len = read(pipe_read_fd, buf, sizeof(buf) - 1);
        if (len == 0) break;
        if (len < 0) {
            if (errno == EINTR) continue;
            break;
        }
        buf[len] = '\0';
        FILE* f = fopen(path.c_str(), "a");
        if (f) {
            fwrite(buf, 1, static_cast<size_t>(len), f);
            fclose(f);
        }
    }
    close(pipe_read_fd);
}

bool log_init(const std::string& path, LogLevel min_level) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level.store(static_cast<int>(min_level));
    if (g_pipe_wr != -1) return true;

    int fds[2];
    if (pipe(fds) == -1) {
        std::cerr << "[Logger] pipe failed: " << std::strerror(errno) << "\n";
        return false;
    }
    g_pipe_wr = fds[1];
    g_writer = std::thread(logger_loop, fds[0], path);

    // the writer must be joined before static destruction
    static bool at_exit_registered = false;
    if (!at_exit_registered) {
        std::atexit([]{ log_shutdown(); });
        at_exit_registered = true;
    }
    return true;
}

void log_shutdown() {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_pipe_wr == -1) return;
    close(g_pipe_wr);
    g_pipe_wr = -1;
    if (g_writer.joinable()) g_writer.join();
}

void log_set_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug") { out = LogLevel::Debug; return true; }
    if (s == "info")  { out = LogLevel::Info;  return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
    if (s == "error") { out = LogLevel::Error; return true; }
    return false;
}


// Desc: format one line and hand it to stderr and/or the writer pipe
// In: LogLevel level, const std::string& tag, const std::string& msg
// Out: void
void log_line(LogLevel level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed)) return;

    time_t now = ::time(nullptr);
    struct tm tmv{};
    localtime_r(&now, &tmv);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);

    std::string line = "[" + std::string(ts) + "] [" + to_string(level) + "] [" + tag + "] " + msg + "\n";

    if (level >= LogLevel::Warn) {
        std::lock_guard<std::mutex> lk(g_err_mu);
        std::cerr << (level == LogLevel::Error ? COLOR_RED : COLOR_YELLOW)
                  << line.substr(0, line.size() - 1) << COLOR_RESET << std::endl;
    }

    std::lock_guard<std::mutex> lk(g_mu);
    if (g_pipe_wr == -1) {
        if (level < LogLevel::Warn) {
            std::lock_guard<std::mutex> elk(g_err_mu);
            std::cerr << line;
        }
        return;
    }
    // writes <= PIPE_BUF are atomic; longer lines may interleave with others
    ssize_t _wr = ::write(g_pipe_wr, line.data(), line.size());
    (void)_wr;
}
