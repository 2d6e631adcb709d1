#pragma once

#include <string>
#include <core/types.hpp>

// Redirect the debug log. Empty path restores the default (<tmp>/devprobe_debug.log).
void set_probe_log_path(const std::string& path);
std::string probe_log_path();

// Also echo every log line to stderr (debug mode).
void set_probe_log_echo(bool echo);

// Append a timestamped line. Never throws; if the file cannot be opened the
// failure is reported once on stderr and the message is dropped.
void probe_log(const std::string& msg);

void probe_log_command(const std::string& label, const std::string& cmd,
                       const CommandResult& r);

const char* to_string(ErrorKind kind);
const char* to_string(CommandStatus status);
