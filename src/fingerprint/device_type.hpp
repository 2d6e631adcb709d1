#pragma once

#include <optional>
#include <string>
#include <vector>

enum class DeviceType {
    Unknown,
    CiscoIOS,
    CiscoNXOS,
    CiscoASA,
    AristaEOS,
    JuniperJunOS,
    HPProCurve,
    FortiOS,
    PaloAltoOS,
    Linux,
    FreeBSD,
    Windows,
    GenericUnix,
};

// One extraction rule. The first capture group is the value; prefix is
// prepended to it (e.g. "Nexus ").
struct FieldPattern {
    std::string regex;
    std::string prefix;
    bool icase = true;
};

using PatternList = std::vector<FieldPattern>;

// Everything type-dependent lives in this table. Adding a vendor means
// adding one entry to device_profiles().
struct DeviceProfile {
    DeviceType type;
    std::string name;
    std::vector<std::string> identification_commands;
    std::string paging_command;     // empty = none
    PatternList hostname;
    PatternList version;
    PatternList model;
    PatternList uptime;
    PatternList cpu;
    PatternList memory;
    bool parse_interfaces = false;
};

const std::vector<DeviceProfile>& device_profiles();
const DeviceProfile& device_profile(DeviceType type);

const char* to_string(DeviceType type);
std::optional<DeviceType> device_type_from_string(const std::string& name);
