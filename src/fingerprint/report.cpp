#include "report.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

std::string to_yaml(const DeviceRecord& record, bool include_outputs) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "host" << YAML::Value << record.host;
    out << YAML::Key << "port" << YAML::Value << record.port;
    out << YAML::Key << "password" << YAML::Value << YAML::Null;
    out << YAML::Key << "device_type" << YAML::Value << to_string(record.type);
    out << YAML::Key << "detected_prompt" << YAML::Value << record.detected_prompt;
    out << YAML::Key << "disable_paging_command" << YAML::Value << record.paging_command;
    out << YAML::Key << "hostname" << YAML::Value << record.hostname;
    out << YAML::Key << "model" << YAML::Value << record.model;
    out << YAML::Key << "version" << YAML::Value << record.version;
    out << YAML::Key << "serial_number" << YAML::Value << record.serial_number;
    out << YAML::Key << "uptime" << YAML::Value << record.uptime;
    out << YAML::Key << "cpu_info" << YAML::Value << record.cpu_info;
    out << YAML::Key << "memory" << YAML::Value << record.memory;

    out << YAML::Key << "ip_addresses" << YAML::Value << YAML::BeginSeq;
    for (const auto& ip : record.ip_addresses) {
        out << ip;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "interfaces" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, info] : record.interfaces) {
        out << YAML::Key << name << YAML::Value << info;
    }
    out << YAML::EndMap;

    if (include_outputs) {
        out << YAML::Key << "command_outputs" << YAML::Value << YAML::BeginMap;
        for (const auto& [cmd, text] : record.command_outputs) {
            out << YAML::Key << cmd << YAML::Value << text;
        }
        out << YAML::EndMap;
    }

    out << YAML::Key << "success" << YAML::Value << record.success;
    if (!record.error.empty()) {
        out << YAML::Key << "error" << YAML::Value << record.error;
    }
    out << YAML::Key << "fingerprint_time" << YAML::Value << record.fingerprint_time;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

static Result<void> write_text(const std::string& text, const std::filesystem::path& path,
                               const char* what) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err("Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return Result<void>::Err(fmt::format("Cannot write {}: {}", what, path.string()));
    }
    file << text;
    if (!file) {
        return Result<void>::Err(fmt::format("Failed writing {}: {}", what, path.string()));
    }

    probe_log(fmt::format("report: wrote {} to {}", what, path.string()));
    return Result<void>::Ok();
}

Result<void> write_report(const DeviceRecord& record, const std::filesystem::path& path,
                          bool include_outputs) {
    return write_text(to_yaml(record, include_outputs), path, "report");
}

std::string command_output_text(const DeviceRecord& record,
                                const std::vector<std::string>& commands) {
    std::vector<std::string> parts;
    if (commands.empty()) {
        for (const auto& [cmd, text] : record.command_outputs) parts.push_back(text);
    } else {
        for (const auto& cmd : commands) {
            auto it = record.command_outputs.find(cmd);
            if (it != record.command_outputs.end()) parts.push_back(it->second);
        }
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += "\n";
        out += parts[i];
    }
    out.erase(std::remove(out.begin(), out.end(), '\r'), out.end());
    return out;
}

Result<void> write_command_output(const DeviceRecord& record,
                                  const std::vector<std::string>& commands,
                                  const std::filesystem::path& path) {
    return write_text(command_output_text(record, commands), path, "command output");
}
