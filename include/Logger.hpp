// === include/Logger.hpp ===
#pragma once
#include <string>

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Start the background file writer. Lines are handed to it through a pipe so
// callers never block on file I/O. Safe to call once; later calls are ignored.
bool log_init(const std::string& path, LogLevel min_level = LogLevel::Info);

// Drain the pipe and join the writer.
void log_shutdown();

void log_set_level(LogLevel level);
LogLevel log_level();

// "[timestamp] [LEVEL] [tag] msg". Warn/Error also go to stderr.
void log_line(LogLevel level, const std::string& tag, const std::string& msg);

// Writer side: read from pipe_read_fd until EOF, append to path.
void logger_loop(int pipe_read_fd, const std::string& path);

bool parse_log_level(const std::string& s, LogLevel& out);
const char* to_string(LogLevel level);

inline void log_debug(const std::string& tag, const std::string& msg) { log_line(LogLevel::Debug, tag, msg); }
inline void log_info (const std::string& tag, const std::string& msg) { log_line(LogLevel::Info,  tag, msg); }
inline void log_warn (const std::string& tag, const std::string& msg) { log_line(LogLevel::Warn,  tag, msg); }
inline void log_error(const std::string& tag, const std::string& msg) { log_line(LogLevel::Error, tag, msg); }
