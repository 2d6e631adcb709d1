#include "classifier.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <regex>

namespace {

bool contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (contains(text, n)) return true;
    }
    return false;
}

bool search(const std::string& text, const char* pattern) {
    try {
        return std::regex_search(text, std::regex(pattern));
    } catch (const std::regex_error& e) {
        probe_log(std::string("classifier: bad pattern ") + pattern + ": " + e.what());
        return false;
    }
}

} // namespace

DeviceClassifier::DeviceClassifier() {
    signatures_ = {
        {"cisco-ios", DeviceType::CiscoIOS, [](const std::string& t) {
            return contains_any(t, {"cisco ios", "cisco internetwork operating system", "ios-xe"});
        }},
        {"cisco-nxos", DeviceType::CiscoNXOS, [](const std::string& t) {
            return contains_any(t, {"nx-os", "nexus"});
        }},
        {"cisco-asa", DeviceType::CiscoASA, [](const std::string& t) {
            return contains(t, "adaptive security appliance") || search(t, R"(\basa)");
        }},
        // "eos" shows up in Cisco output too, so Cisco text never counts as Arista
        {"arista-eos", DeviceType::AristaEOS, [](const std::string& t) {
            return (contains(t, "arista") || search(t, R"(\beos\b)")) && !contains(t, "cisco");
        }},
        {"juniper-junos", DeviceType::JuniperJunOS, [](const std::string& t) {
            return contains_any(t, {"junos", "juniper"});
        }},
        {"hp-procurve", DeviceType::HPProCurve, [](const std::string& t) {
            return (contains(t, "procurve") && contains_any(t, {"hp", "hewlett-packard"}))
                || contains(t, "aruba");
        }},
        {"fortios", DeviceType::FortiOS, [](const std::string& t) {
            return contains_any(t, {"fortigate", "fortios"});
        }},
        {"pan-os", DeviceType::PaloAltoOS, [](const std::string& t) {
            return contains_any(t, {"pan-os", "palo alto"});
        }},
        {"linux", DeviceType::Linux, [](const std::string& t) {
            return contains_any(t, {"linux", "ubuntu", "centos", "debian", "redhat", "red hat", "fedora"});
        }},
        {"freebsd", DeviceType::FreeBSD, [](const std::string& t) {
            return contains(t, "freebsd");
        }},
        {"windows", DeviceType::Windows, [](const std::string& t) {
            return contains_any(t, {"windows", "microsoft"});
        }},
        {"cisco-model", DeviceType::CiscoIOS, [](const std::string& t) {
            return search(t, R"(\bws-c\d{4})") || search(t, R"(\bc\d{4}\b)");
        }},
        {"nexus-model", DeviceType::CiscoNXOS, [](const std::string& t) {
            return search(t, R"(\bn\d{4}\b)");
        }},
        // user@host:~$ style prompt with nothing more specific
        {"unix-prompt", DeviceType::GenericUnix, [](const std::string& t) {
            return search(t, R"([a-z0-9_\-]+@[a-z0-9_\-\.]+:\S*\s?[$#])");
        }},
    };
}

DeviceType DeviceClassifier::classify(const std::string& text) const {
    last_match_.clear();
    std::string lower = to_lower(text);
    for (const auto& sig : signatures_) {
        if (sig.test(lower)) {
            last_match_ = sig.name;
            return sig.type;
        }
    }
    return DeviceType::Unknown;
}

DeviceType classify_device(const std::string& text) {
    static const DeviceClassifier classifier;
    return classifier.classify(text);
}
