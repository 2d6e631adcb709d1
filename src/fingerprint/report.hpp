#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "device_record.hpp"

// Serialize a record as a YAML document. The password key is always
// present and always null; the username is never written.
std::string to_yaml(const DeviceRecord& record, bool include_outputs = true);

// Write to_yaml(record) to path, creating parent directories.
Result<void> write_report(const DeviceRecord& record, const std::filesystem::path& path,
                          bool include_outputs = true);

// Raw output of the given commands in order, joined by newlines, carriage
// returns removed. An empty list takes every recorded output.
std::string command_output_text(const DeviceRecord& record,
                                const std::vector<std::string>& commands = {});

Result<void> write_command_output(const DeviceRecord& record,
                                  const std::vector<std::string>& commands,
                                  const std::filesystem::path& path);
