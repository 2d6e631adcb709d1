#include "device_record.hpp"
#include <fmt/format.h>
#include <algorithm>

static void add_field(std::string& out, const char* label, const std::string& value) {
    if (value.empty()) return;
    out += fmt::format("  {:<14}{}\n", label, value);
}

std::string DeviceRecord::summary() const {
    std::string out = fmt::format("Device {}:{}\n", host, port);
    add_field(out, "Type", to_string(type));
    add_field(out, "Prompt", detected_prompt);
    add_field(out, "Hostname", hostname);
    add_field(out, "Model", model);
    add_field(out, "Version", version);
    add_field(out, "Serial", serial_number);
    add_field(out, "Uptime", uptime);
    add_field(out, "CPU", cpu_info);
    add_field(out, "Memory", memory);
    add_field(out, "Paging", paging_command);

    if (!ip_addresses.empty()) {
        std::string ips;
        for (size_t i = 0; i < ip_addresses.size(); i++) {
            if (i > 0) ips += ", ";
            ips += ip_addresses[i];
        }
        add_field(out, "IP addresses", ips);
    }
    if (!interfaces.empty()) {
        add_field(out, "Interfaces", std::to_string(interfaces.size()));
    }

    add_field(out, "Result", success ? "success" : "failed");
    add_field(out, "Error", error);
    add_field(out, "Time", fingerprint_time);
    return out;
}

std::string DeviceRecord::interface_summary() const {
    if (interfaces.empty()) return "  (no interfaces found)\n";

    size_t width = 0;
    for (const auto& [name, _] : interfaces) {
        width = std::max(width, name.size());
    }

    std::string out;
    for (const auto& [name, status] : interfaces) {
        out += fmt::format("  {:<{}}  {}\n", name, width, status);
    }
    return out;
}

void DeviceRecord::mark_failed(const std::string& reason) {
    type = DeviceType::Unknown;
    success = false;
    if (error.empty()) error = reason;
}
