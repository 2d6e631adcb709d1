#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "device_record.hpp"
#include "device_type.hpp"

// Table-driven field extraction over the full session text. Every field is
// best-effort: a pattern either matches or the field stays as it was.
class FieldExtractor {
public:
    explicit FieldExtractor(const ExtractionConfig& config = ExtractionConfig{});

    // Fill hostname, serial, version, model, uptime, cpu, memory, IPs and
    // (for network OS types) interfaces on record, using record.type and
    // record.detected_prompt.
    void extract(const std::string& text, DeviceRecord& record) const;

    std::string hostname(const std::string& text, DeviceType type, const std::string& prompt) const;
    std::string serial_number(const std::string& text) const;
    std::vector<std::string> ip_addresses(const std::string& text) const;
    std::map<std::string, std::string> interfaces(const std::string& text) const;

private:
    ExtractionConfig config_;
};

// First capture of the first pattern that matches, with prefix applied and
// whitespace trimmed. nullopt if none match.
std::optional<std::string> first_match(const std::string& text, const PatternList& patterns);

// Leading name of a prompt such as "router1#" or "sw-core>".
std::string hostname_from_prompt(const std::string& prompt);

// Dotted quad with every octet <= 255, optionally with a /nn suffix.
bool is_plausible_ipv4(const std::string& token);
