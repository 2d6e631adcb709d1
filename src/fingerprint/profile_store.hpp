#pragma once

#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "device_record.hpp"
#include "device_type.hpp"

namespace fs = std::filesystem;

// What is remembered about a device between runs. No credentials.
struct DeviceProfileEntry {
    std::string host;
    int port = 22;
    DeviceType type = DeviceType::Unknown;
    std::string prompt;
    std::string paging_command;
    std::string hostname;
    std::string model;
    std::string version;
    std::string serial_number;
    std::string last_fingerprinted;     // ISO timestamp
};

// Entry built from a finished fingerprint run
DeviceProfileEntry profile_from_record(const DeviceRecord& record);

// ~/.devprobe/profiles.yaml
class ProfileStore {
public:
    ProfileStore();
    explicit ProfileStore(const fs::path& path);

    // Missing or corrupt file loads as empty.
    void load();
    Result<void> save() const;

    // Replace the entry for host:port, or append a new one.
    void add_or_update(const DeviceProfileEntry& entry);
    std::optional<DeviceProfileEntry> find(const std::string& host, int port) const;
    bool remove(const std::string& host, int port);

    const std::vector<DeviceProfileEntry>& all() const { return entries_; }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::vector<DeviceProfileEntry> entries_;
};
