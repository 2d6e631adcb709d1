#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex log_mutex;
std::string log_path;
bool log_echo = false;
bool open_failure_reported = false;

std::string default_log_path() {
    return (platform::temp_dir() / DEFAULT_LOG_NAME).string();
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

void set_probe_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_path = path;
    open_failure_reported = false;
}

std::string probe_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_path.empty() ? default_log_path() : log_path;
}

void set_probe_log_echo(bool echo) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_echo = echo;
}

void probe_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::string line = fmt::format("[{}] {}", timestamp(), msg);

    if (log_echo) {
        std::cerr << line << "\n";
    }

    std::string path = log_path.empty() ? default_log_path() : log_path;
    std::ofstream out(path, std::ios::app);
    if (!out) {
        if (!open_failure_reported) {
            std::cerr << "devprobe: cannot write log file " << path << "\n";
            open_failure_reported = true;
        }
        return;
    }
    out << line << "\n";
}

void probe_log_command(const std::string& label, const std::string& cmd,
                       const CommandResult& r) {
    probe_log(fmt::format("{} CMD: {}", label, cmd));
    probe_log(fmt::format("{} status={} output({})={}", label, to_string(r.status),
                          r.output.size(), r.output.substr(0, LOG_OUTPUT_PREVIEW_CHARS)));
    if (!r.error.empty())
        probe_log(fmt::format("{} error[{}]={}", label, to_string(r.kind), r.error));
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:           return "none";
    case ErrorKind::Connection:     return "connection";
    case ErrorKind::Authentication: return "authentication";
    case ErrorKind::Channel:        return "channel";
    case ErrorKind::Timeout:        return "timeout";
    case ErrorKind::Other:          return "other";
    }
    return "other";
}

const char* to_string(CommandStatus status) {
    switch (status) {
    case CommandStatus::Complete: return "complete";
    case CommandStatus::TimedOut: return "timed-out";
    case CommandStatus::Failed:   return "failed";
    }
    return "failed";
}
