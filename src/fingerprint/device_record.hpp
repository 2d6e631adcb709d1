#pragma once

#include <map>
#include <string>
#include <vector>
#include "device_type.hpp"

// Facts gathered about one device during a fingerprint run.
struct DeviceRecord {
    std::string host;
    int port = 22;
    std::string username;           // never written to reports
    DeviceType type = DeviceType::Unknown;
    std::string detected_prompt;
    std::string paging_command;     // the one actually sent, empty if none

    std::string hostname;
    std::string model;
    std::string version;
    std::string serial_number;
    std::string uptime;
    std::string cpu_info;
    std::string memory;

    std::map<std::string, std::string> command_outputs;   // command -> raw text
    std::map<std::string, std::string> interfaces;        // name -> "Status: up, IP: x"
    std::vector<std::string> ip_addresses;

    bool success = false;
    std::string error;              // why the run failed, empty on success
    std::string fingerprint_time;   // ISO-8601, set when the run ends

    // Multi-line human-readable overview
    std::string summary() const;
    std::string interface_summary() const;

    // Force the record into the failed state (Unknown, unsuccessful).
    void mark_failed(const std::string& reason);
};
