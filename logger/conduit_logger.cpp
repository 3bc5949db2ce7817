#include "conduit_logger.hpp"
#include "zf_log.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <atomic>

namespace {

std::mutex _log_mutex;
FILE* _log_file = nullptr;
std::string _log_filepath;
conduit::LoggerConfig _config;
bool _started = false;
std::atomic<bool> _shutting_down{false};

void close_file_locked() noexcept {
    if (_log_file) fclose(_log_file);
    _log_file = nullptr;
}

void rotate_locked() noexcept {
    if (_log_filepath.empty()) return;
    close_file_locked();

    std::remove((_log_filepath + "." + std::to_string(_config.max_backup_files)).c_str());
    for (int i = _config.max_backup_files - 1; i > 0; --i) {
        std::rename((_log_filepath + "." + std::to_string(i)).c_str(),
                    (_log_filepath + "." + std::to_string(i + 1)).c_str());
    }
    std::rename(_log_filepath.c_str(), (_log_filepath + ".1").c_str());

    _log_file = fopen(_log_filepath.c_str(), "a");
}

void rotate_if_needed_locked() noexcept {
    if (!_config.rotate || !_log_file) return;
    long size = ftell(_log_file);
    if (size >= 0 && static_cast<size_t>(size) >= _config.max_file_size) {
        rotate_locked();
    }
}

void shutdown_at_exit() noexcept {
    _shutting_down = true;
    std::lock_guard<std::mutex> lock(_log_mutex);
    close_file_locked();
}

void output_callback(const zf_log_message* msg, void* arg) {
    (void)arg;
    if (_shutting_down.load(std::memory_order_relaxed)) return;

    thread_local char time_str[32];
    thread_local struct tm tm_buf;
    time_t t = time(nullptr);
    if (localtime_r(&t, &tm_buf)) {
        strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &tm_buf);
    } else {
        time_str[0] = '\0';
    }

    const char* color;
    const char* lvl;
    switch (msg->lvl) {
        case ZF_LOG_VERBOSE: color = conduit::COLOR_GREEN; lvl = "v"; break;
        case ZF_LOG_DEBUG: color = conduit::COLOR_BLUE; lvl = "d"; break;
        case ZF_LOG_INFO: color = conduit::COLOR_WHITE; lvl = "I"; break;
        case ZF_LOG_WARN: color = conduit::COLOR_YELLOW; lvl = "W"; break;
        case ZF_LOG_ERROR: color = conduit::COLOR_RED; lvl = "E"; break;
        case ZF_LOG_FATAL: color = conduit::COLOR_DARK_RED; lvl = "F"; break;
        default: color = conduit::COLOR_WHITE; lvl = "N"; break;
    }
    const int len = static_cast<int>(msg->p - msg->msg_b);

    std::lock_guard<std::mutex> lock(_log_mutex);
    if (_config.console) {
        if (_config.colors) {
            fprintf(stdout, "%s[%s] [%s] %.*s%s\n", color, time_str, lvl, len, msg->msg_b, conduit::COLOR_RESET);
        } else {
            fprintf(stdout, "[%s] [%s] %.*s\n", time_str, lvl, len, msg->msg_b);
        }
        fflush(stdout);
    }
    if (_log_file) {
        rotate_if_needed_locked();
        if (_log_file) {
            fprintf(_log_file, "[%s] [%s] %.*s\n", time_str, lvl, len, msg->msg_b);
            fflush(_log_file);
        }
    }
}

} // namespace

namespace conduit {

const char* to_str(LoggerStatus status) noexcept {
    switch (status) {
        case LoggerStatus::Success: return "Success";
        case LoggerStatus::FilepathEmpty: return "Log file path is empty";
        case LoggerStatus::AlreadyStarted: return "Logger already started";
        case LoggerStatus::NotStarted: return "Logger not started";
        case LoggerStatus::CouldNotOpenFile: return "Could not open log file";
        case LoggerStatus::FilePtrIsNull: return "Log file is not open";
        case LoggerStatus::FileFailedFlush: return "Failed to flush log file";
        default: return "Unknown logger status";
    }
}

LoggerStatus start_logging(const LoggerConfig& config) noexcept {
    {
        std::lock_guard<std::mutex> lock(_log_mutex);
        if (_started) return LoggerStatus::AlreadyStarted;

        _config = config;
        if (_config.max_file_size < 1024) _config.max_file_size = 1024;
        if (_config.max_backup_files < 1) _config.max_backup_files = 1;

        zf_log_set_output_v(ZF_LOG_PUT_STD, nullptr, output_callback);
        zf_log_set_output_level(_config.level);
        _started = true;
        _shutting_down = false;
        static bool registered = false;
        if (!registered) {
            atexit(shutdown_at_exit);
            registered = true;
        }
    }

    if (config.log_filepath) return reset_logfile(config.log_filepath);
    return LoggerStatus::Success;
}

LoggerStatus reset_logfile(const char* log_filepath) noexcept {
    if (!log_filepath || !*log_filepath) return LoggerStatus::FilepathEmpty;

    std::lock_guard<std::mutex> lock(_log_mutex);
    if (!_started) return LoggerStatus::NotStarted;

    close_file_locked();
    _log_filepath = log_filepath;
    _log_file = fopen(log_filepath, "a");
    if (!_log_file) {
        _log_filepath.clear();
        return LoggerStatus::CouldNotOpenFile;
    }
    return LoggerStatus::Success;
}

LoggerStatus flush_logfile() noexcept {
    std::lock_guard<std::mutex> lock(_log_mutex);
    if (!_log_file) return LoggerStatus::FilePtrIsNull;
    if (fflush(_log_file) != 0) {
        close_file_locked();
        return LoggerStatus::FileFailedFlush;
    }
    return LoggerStatus::Success;
}

void stop_logging() noexcept {
    std::lock_guard<std::mutex> lock(_log_mutex);
    close_file_locked();
    _log_filepath.clear();
    _started = false;
}

bool is_logging_started() noexcept {
    std::lock_guard<std::mutex> lock(_log_mutex);
    return _started;
}

void set_log_level(int level) noexcept {
    zf_log_set_output_level(level);
}

} // namespace conduit
