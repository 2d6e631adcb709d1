#include "profile_store.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

DeviceProfileEntry profile_from_record(const DeviceRecord& record) {
    DeviceProfileEntry e;
    e.host = record.host;
    e.port = record.port;
    e.type = record.type;
    e.prompt = record.detected_prompt;
    e.paging_command = record.paging_command;
    e.hostname = record.hostname;
    e.model = record.model;
    e.version = record.version;
    e.serial_number = record.serial_number;
    e.last_fingerprinted = record.fingerprint_time.empty() ? now_iso() : record.fingerprint_time;
    return e;
}

ProfileStore::ProfileStore()
    : path_(get_devprobe_dir() / PROFILES_FILE_NAME) {
}

ProfileStore::ProfileStore(const fs::path& path)
    : path_(path) {
}

void ProfileStore::load() {
    entries_.clear();

    if (!fs::exists(path_)) {
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());

        if (root["devices"] && root["devices"].IsSequence()) {
            for (const auto& n : root["devices"]) {
                DeviceProfileEntry e;
                e.host = n["host"].as<std::string>("");
                e.port = n["port"].as<int>(DEFAULT_SSH_PORT);
                e.type = device_type_from_string(n["device_type"].as<std::string>(""))
                             .value_or(DeviceType::Unknown);
                e.prompt = n["prompt"].as<std::string>("");
                e.paging_command = n["paging_command"].as<std::string>("");
                e.hostname = n["hostname"].as<std::string>("");
                e.model = n["model"].as<std::string>("");
                e.version = n["version"].as<std::string>("");
                e.serial_number = n["serial_number"].as<std::string>("");
                e.last_fingerprinted = n["last_fingerprinted"].as<std::string>("");
                if (!e.host.empty()) entries_.push_back(e);
            }
        }
    } catch (const std::exception& ex) {
        // Corrupted profile file; start fresh
        probe_log("profiles: ignoring unreadable " + path_.string() + ": " + ex.what());
        entries_.clear();
    }
}

Result<void> ProfileStore::save() const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Cannot create " + path_.parent_path().string() + ": " + ec.message());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "devices" << YAML::Value << YAML::BeginSeq;
    for (const auto& e : entries_) {
        out << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << e.host;
        out << YAML::Key << "port" << YAML::Value << e.port;
        out << YAML::Key << "device_type" << YAML::Value << to_string(e.type);
        out << YAML::Key << "prompt" << YAML::Value << e.prompt;
        out << YAML::Key << "paging_command" << YAML::Value << e.paging_command;
        out << YAML::Key << "hostname" << YAML::Value << e.hostname;
        out << YAML::Key << "model" << YAML::Value << e.model;
        out << YAML::Key << "version" << YAML::Value << e.version;
        out << YAML::Key << "serial_number" << YAML::Value << e.serial_number;
        out << YAML::Key << "last_fingerprinted" << YAML::Value << e.last_fingerprinted;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream fout(path_.string());
    if (!fout) {
        return Result<void>::Err("Cannot write " + path_.string());
    }
    fout << out.c_str() << "\n";
    return Result<void>::Ok();
}

void ProfileStore::add_or_update(const DeviceProfileEntry& entry) {
    for (auto& e : entries_) {
        if (e.host == entry.host && e.port == entry.port) {
            e = entry;
            return;
        }
    }
    entries_.push_back(entry);
}

std::optional<DeviceProfileEntry> ProfileStore::find(const std::string& host, int port) const {
    for (const auto& e : entries_) {
        if (e.host == host && e.port == port) return e;
    }
    return std::nullopt;
}

bool ProfileStore::remove(const std::string& host, int port) {
    auto it = std::remove_if(entries_.begin(), entries_.end(), [&](const DeviceProfileEntry& e) {
        return e.host == host && e.port == port;
    });
    if (it == entries_.end()) return false;
    entries_.erase(it, entries_.end());
    return true;
}
