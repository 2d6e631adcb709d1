#include "extractor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <regex>

namespace {

const char* IP_PATTERN = R"(\b(?:\d{1,3}\.){3}\d{1,3}(?:/\d{1,2})?\b)";
const char* INTERFACE_LINE = R"(^\s*([A-Za-z][\w/\-\.:]*)\s+is\s+(administratively down|up|down)\b)";
const PatternList SERIAL_PATTERNS = {{R"(serial\s*number\s*:?\s*([A-Za-z0-9\-]+))"}};
const char* PROMPT_HOSTNAME = R"(^([A-Za-z0-9\-._]+)(?:[>#]|$))";

const std::regex& ip_regex() {
    static const std::regex re(IP_PATTERN);
    return re;
}

struct Line {
    size_t offset;
    std::string text;
};

std::vector<Line> split_lines(const std::string& text) {
    std::vector<Line> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = nl == std::string::npos ? text.size() : nl;
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back({start, line});
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

} // namespace

std::optional<std::string> first_match(const std::string& text, const PatternList& patterns) {
    for (const auto& p : patterns) {
        try {
            auto flags = std::regex::ECMAScript;
            if (p.icase) flags |= std::regex::icase;
            std::regex re(p.regex, flags);
            std::smatch m;
            if (std::regex_search(text, m, re) && m.size() > 1 && m[1].matched) {
                std::string value = m[1].str();
                trim(value);
                if (!value.empty()) return p.prefix + value;
            }
        } catch (const std::regex_error& e) {
            probe_log(fmt::format("extractor: bad pattern '{}': {}", p.regex, e.what()));
        }
    }
    return std::nullopt;
}

std::string hostname_from_prompt(const std::string& prompt) {
    std::smatch m;
    static const std::regex re(PROMPT_HOSTNAME);
    if (std::regex_search(prompt, m, re)) {
        return m[1].str();
    }
    return "";
}

bool is_plausible_ipv4(const std::string& token) {
    std::string addr = token.substr(0, token.find('/'));
    int octets = 0;
    size_t start = 0;
    while (start <= addr.size()) {
        size_t dot = addr.find('.', start);
        std::string part = addr.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (part.empty() || part.size() > 3) return false;
        if (safe_stoi(part, 256) > 255) return false;
        octets++;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return octets == 4;
}

FieldExtractor::FieldExtractor(const ExtractionConfig& config)
    : config_(config) {
}

std::string FieldExtractor::hostname(const std::string& text, DeviceType type,
                                     const std::string& prompt) const {
    if (auto h = first_match(text, device_profile(type).hostname)) {
        return *h;
    }
    return hostname_from_prompt(prompt);
}

std::string FieldExtractor::serial_number(const std::string& text) const {
    return first_match(text, SERIAL_PATTERNS).value_or("");
}

std::vector<std::string> FieldExtractor::ip_addresses(const std::string& text) const {
    std::vector<std::string> found;
    const size_t window = static_cast<size_t>(std::max(0, config_.ip_context_window));
    const size_t cap = static_cast<size_t>(std::max(0, config_.max_ip_addresses));

    for (auto it = std::sregex_iterator(text.begin(), text.end(), ip_regex());
         it != std::sregex_iterator() && found.size() < cap; ++it) {
        std::string ip = it->str();
        if (ip.rfind("0.", 0) == 0 || ip.rfind("255.", 0) == 0) continue;
        if (!is_plausible_ipv4(ip)) continue;

        size_t pos = static_cast<size_t>(it->position());
        size_t from = pos > window ? pos - window : 0;
        size_t to = std::min(text.size(), pos + ip.size() + window);
        std::string context = to_lower(text.substr(from, to - from));

        bool relevant = std::any_of(config_.ip_context_terms.begin(), config_.ip_context_terms.end(),
                                    [&](const std::string& term) {
                                        return context.find(to_lower(term)) != std::string::npos;
                                    });
        if (!relevant) continue;

        if (std::find(found.begin(), found.end(), ip) == found.end()) {
            found.push_back(ip);
        }
    }
    return found;
}

std::map<std::string, std::string> FieldExtractor::interfaces(const std::string& text) const {
    std::map<std::string, std::string> result;
    static const std::regex line_re(INTERFACE_LINE);

    auto lines = split_lines(text);
    for (size_t i = 0; i < lines.size(); i++) {
        std::smatch m;
        if (!std::regex_search(lines[i].text, m, line_re)) continue;

        std::string name = m[1].str();
        std::string status = m[2].str();

        // The interface's block runs until the next interface line
        std::string block;
        for (size_t j = i + 1; j < lines.size(); j++) {
            if (std::regex_search(lines[j].text, line_re)) break;
            block += lines[j].text;
            block += '\n';
        }
        std::string rest = lines[i].text.substr(static_cast<size_t>(m.position(0) + m.length(0)));

        std::string info = "Status: " + status;
        std::smatch ip;
        std::string scope = rest + "\n" + block;
        if (std::regex_search(scope, ip, ip_regex())) {
            info += ", IP: " + ip.str();
        }
        result[name] = info;
    }
    return result;
}

void FieldExtractor::extract(const std::string& text, DeviceRecord& record) const {
    const DeviceProfile& profile = device_profile(record.type);

    std::string host = hostname(text, record.type, record.detected_prompt);
    if (!host.empty()) record.hostname = host;

    std::string serial = serial_number(text);
    if (!serial.empty()) record.serial_number = serial;

    if (auto v = first_match(text, profile.version)) record.version = *v;
    if (auto v = first_match(text, profile.model)) record.model = *v;
    if (auto v = first_match(text, profile.uptime)) record.uptime = *v;
    if (auto v = first_match(text, profile.cpu)) record.cpu_info = *v;
    if (auto v = first_match(text, profile.memory)) record.memory = *v;

    for (const auto& ip : ip_addresses(text)) {
        if (std::find(record.ip_addresses.begin(), record.ip_addresses.end(), ip)
                == record.ip_addresses.end()) {
            record.ip_addresses.push_back(ip);
        }
    }

    if (profile.parse_interfaces) {
        for (const auto& [name, info] : interfaces(text)) {
            record.interfaces[name] = info;
        }
    }

    probe_log(fmt::format("extractor: {} hostname='{}' version='{}' model='{}' serial='{}' ips={} ifaces={}",
                          to_string(record.type), record.hostname, record.version, record.model,
                          record.serial_number, record.ip_addresses.size(), record.interfaces.size()));
}
