#ifndef CONDUIT_LOGGER_HPP
#define CONDUIT_LOGGER_HPP

#include <cstddef>
#include <cstring>

/**
 * conduit logger - routes zf_log output to the console and an optional log file.
 *
 * Basic Usage:
 *   conduit::LoggerConfig cfg;
 *   cfg.log_filepath = "/tmp/flow.log";
 *   cfg.level = conduit::LOG_DEBUG;
 *   auto ret = conduit::start_logging(cfg);
 *
 *   ZF_LOGI("flow started");
 *
 * Node runtimes log their lifecycle at debug level, channel shutdowns at info,
 * and failures of processing functions at error level.
 */

namespace conduit {

constexpr const char* COLOR_RED = "\x1b[31m";
constexpr const char* COLOR_YELLOW = "\x1b[33m";
constexpr const char* COLOR_WHITE = "\x1b[37m";
constexpr const char* COLOR_GREEN = "\x1b[32m";
constexpr const char* COLOR_BLUE = "\x1b[34m";
constexpr const char* COLOR_RESET = "\x1b[0m";
constexpr const char* COLOR_DARK_RED = "\x1b[31;1m";

// Log level constants (matching zf_log values)
constexpr int LOG_VERBOSE = 1;
constexpr int LOG_DEBUG   = 2;
constexpr int LOG_INFO    = 3;
constexpr int LOG_WARN    = 4;
constexpr int LOG_ERROR   = 5;
constexpr int LOG_FATAL   = 6;
constexpr int LOG_NONE    = 0xFF;

enum class LoggerStatus {
    Success = 0,
    FilepathEmpty,
    AlreadyStarted,
    NotStarted,
    CouldNotOpenFile,
    FilePtrIsNull,
    FileFailedFlush,
};

const char* to_str(LoggerStatus status) noexcept;

struct LoggerConfig {
    const char* log_filepath = nullptr;   // console only when null
    int level = LOG_INFO;
    bool console = true;
    bool colors = true;

    // size based rotation: log.txt -> log.txt.1 -> ... -> log.txt.N
    bool rotate = false;
    size_t max_file_size = 10 * 1024 * 1024;
    int max_backup_files = 5;
};

LoggerStatus start_logging(const LoggerConfig& config = LoggerConfig{}) noexcept;
LoggerStatus reset_logfile(const char* log_filepath) noexcept;
LoggerStatus flush_logfile() noexcept;
void stop_logging() noexcept;
bool is_logging_started() noexcept;
void set_log_level(int level) noexcept;

inline const char* filename(const char* file) noexcept {
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

} // namespace conduit

#if RELEASE_MODE
    #define ZF_ADD_LOCATION(msg, ...) "%s: " msg, conduit::filename(__FILE__), ##__VA_ARGS__
#else
    #define ZF_ADD_LOCATION(msg, ...) "%s @ line: %d: " msg, conduit::filename(__FILE__), __LINE__, ##__VA_ARGS__
#endif

#endif // CONDUIT_LOGGER_HPP
