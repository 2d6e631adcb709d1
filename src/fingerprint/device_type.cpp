#include "device_type.hpp"
#include <core/utils.hpp>

namespace {

const char* UNIX_PAGING = "export TERM=xterm; stty rows 1000";

const PatternList CISCO_HOSTNAME = {{R"(hostname\s+(\S+))"}};
const PatternList NET_UPTIME = {{R"(uptime is\s+([^\r\n]+))"}};

std::vector<DeviceProfile> build_profiles() {
    std::vector<DeviceProfile> p;

    DeviceProfile ios;
    ios.type = DeviceType::CiscoIOS;
    ios.name = "CiscoIOS";
    ios.identification_commands = {"show version", "show inventory"};
    ios.paging_command = "terminal length 0";
    ios.hostname = CISCO_HOSTNAME;
    ios.version = {{R"((?:IOS|Software).+?Version\s+([^,\s]+))"}};
    ios.model = {
        {R"(Model number\s*:\s*(\S+))"},
        {R"(cisco\s+([A-Za-z0-9\-]+)\s+[^\n]*?(?:processor|chassis|router|switch))"},
    };
    ios.uptime = NET_UPTIME;
    ios.parse_interfaces = true;
    p.push_back(ios);

    DeviceProfile nxos;
    nxos.type = DeviceType::CiscoNXOS;
    nxos.name = "CiscoNXOS";
    nxos.identification_commands = {"show version", "show inventory"};
    nxos.paging_command = "terminal length 0";
    nxos.hostname = CISCO_HOSTNAME;
    nxos.version = {
        {R"(NXOS:\s+version\s+([^,\s]+))"},
        {R"(system:\s+version\s+([^,\s]+))"},
    };
    nxos.model = {{R"(cisco\s+Nexus\s*(\S+))", "Nexus "}};
    nxos.uptime = NET_UPTIME;
    nxos.parse_interfaces = true;
    p.push_back(nxos);

    DeviceProfile asa;
    asa.type = DeviceType::CiscoASA;
    asa.name = "CiscoASA";
    asa.identification_commands = {"show version", "show inventory"};
    asa.paging_command = "terminal pager 0";
    asa.hostname = CISCO_HOSTNAME;
    asa.version = {{R"(Adaptive Security Appliance.*?Version\s+([^,\s]+))"}};
    asa.model = {{R"(Hardware:\s+([^,\r\n]+))"}};
    asa.uptime = {{R"(\bup\s+(\d+\s+(?:days?|hours?|mins?)[^\r\n]*))"}};
    asa.parse_interfaces = true;
    p.push_back(asa);

    DeviceProfile eos;
    eos.type = DeviceType::AristaEOS;
    eos.name = "AristaEOS";
    eos.identification_commands = {"show version", "show inventory"};
    eos.paging_command = "terminal length 0";
    eos.hostname = CISCO_HOSTNAME;
    eos.version = {
        {R"(Software image version:\s*(\S+))"},
        {R"(EOS\s+version\s*:?\s*([^,\s]+))"},
    };
    eos.model = {{R"(Arista\s+(?!Networks\b)([A-Za-z0-9\-]+))"}};
    eos.uptime = {{R"(Uptime:\s*([^\r\n]+))"}, {R"(uptime is\s+([^\r\n]+))"}};
    eos.parse_interfaces = true;
    p.push_back(eos);

    DeviceProfile junos;
    junos.type = DeviceType::JuniperJunOS;
    junos.name = "JuniperJunOS";
    junos.identification_commands = {"show version", "show chassis hardware"};
    junos.paging_command = "set cli screen-length 0";
    junos.hostname = {{R"(host-name\s+([^\s;]+))"}, {R"(Hostname:\s*(\S+))"}};
    junos.version = {
        {R"(Junos:\s*(\S+))"},
        {R"(JUNOS\s+[^\[\r\n]*\[([^\]]+)\])"},
        {R"(JUNOS\s+([^,\s\]]+))"},
    };
    junos.model = {{R"(Model:\s*([^\r\n]+))"}};
    junos.uptime = {{R"(System booted:\s*([^\r\n]+))"}};
    junos.parse_interfaces = true;
    p.push_back(junos);

    DeviceProfile hp;
    hp.type = DeviceType::HPProCurve;
    hp.name = "HPProCurve";
    hp.identification_commands = {"show system", "show system-information"};
    hp.paging_command = "no page";
    hp.hostname = {{R"(System Name\s*:\s*(\S+))"}};
    hp.version = {{R"(Software\s+revision\s*:?\s*([^\r\n]+))"}};
    hp.model = {{R"([Ss]witch\s+([A-Za-z0-9\-]+))", "", false}};
    hp.uptime = {{R"(Up Time\s*:\s*([^\r\n]+))"}};
    p.push_back(hp);

    DeviceProfile forti;
    forti.type = DeviceType::FortiOS;
    forti.name = "FortiOS";
    forti.identification_commands = {"get system status", "get hardware status"};
    forti.paging_command = "config system console\nset output standard\nend";
    forti.hostname = {{R"(Hostname:\s*(\S+))"}};
    forti.version = {{R"(Version:\s*([^\r\n]+))"}};
    forti.model = {{R"(FortiGate-([A-Za-z0-9\-]+))", "FortiGate-"}};
    p.push_back(forti);

    DeviceProfile pan;
    pan.type = DeviceType::PaloAltoOS;
    pan.name = "PaloAltoOS";
    pan.identification_commands = {"show system info"};
    pan.paging_command = "set cli pager off";
    pan.hostname = {{R"(hostname:\s*(\S+))"}};
    pan.version = {{R"(sw-version:\s*([^\r\n]+))"}};
    pan.model = {{R"(model:\s*([^\r\n]+))"}};
    pan.uptime = {{R"(uptime:\s*([^\r\n]+))"}};
    p.push_back(pan);

    DeviceProfile linux_host;
    linux_host.type = DeviceType::Linux;
    linux_host.name = "Linux";
    linux_host.identification_commands = {"uname -a", "cat /etc/os-release", "hostnamectl"};
    linux_host.paging_command = UNIX_PAGING;
    linux_host.hostname = {
        {R"(Static hostname:\s*(\S+))"},
        {R"(Linux\s+(\S+)\s+\d)", "", false},
    };
    linux_host.version = {
        {R"re(PRETTY_NAME="([^"]+)")re"},
        {R"(Operating System:\s*([^\r\n]+))"},
        {R"(Linux\s+\S+\s+(\S+))", "", false},
    };
    linux_host.model = {{R"(Hardware Model:\s*([^\r\n]+))"}};
    linux_host.cpu = {{R"(model name\s*:\s*([^\r\n]+))"}};
    linux_host.memory = {{R"(MemTotal:\s*([^\r\n]+))"}};
    p.push_back(linux_host);

    DeviceProfile bsd;
    bsd.type = DeviceType::FreeBSD;
    bsd.name = "FreeBSD";
    bsd.identification_commands = {"uname -a", "freebsd-version"};
    bsd.paging_command = UNIX_PAGING;
    bsd.hostname = {{R"(FreeBSD\s+(\S+)\s+\d)", "", false}};
    bsd.version = {{R"(FreeBSD\s+\S+\s+(\S+))", "", false}};
    p.push_back(bsd);

    DeviceProfile win;
    win.type = DeviceType::Windows;
    win.name = "Windows";
    win.identification_commands = {"ver", "systeminfo"};
    win.hostname = {{R"(Host Name:\s*(\S+))"}};
    win.version = {{R"(OS Name:\s*([^\r\n]+))"}};
    win.model = {{R"(System Model:\s*([^\r\n]+))"}};
    win.uptime = {{R"(System Boot Time:\s*([^\r\n]+))"}};
    win.memory = {{R"(Total Physical Memory:\s*([^\r\n]+))"}};
    p.push_back(win);

    DeviceProfile unix_host;
    unix_host.type = DeviceType::GenericUnix;
    unix_host.name = "GenericUnix";
    unix_host.identification_commands = {"uname -a"};
    unix_host.paging_command = UNIX_PAGING;
    unix_host.hostname = {{R"([\w\-]+@([A-Za-z0-9\-\.]+):)"}};
    p.push_back(unix_host);

    DeviceProfile unknown;
    unknown.type = DeviceType::Unknown;
    unknown.name = "Unknown";
    unknown.identification_commands = {"show version", "show system info"};
    p.push_back(unknown);

    return p;
}

} // namespace

const std::vector<DeviceProfile>& device_profiles() {
    static const std::vector<DeviceProfile> profiles = build_profiles();
    return profiles;
}

const DeviceProfile& device_profile(DeviceType type) {
    for (const auto& p : device_profiles()) {
        if (p.type == type) return p;
    }
    // Unknown is always the last entry
    return device_profiles().back();
}

const char* to_string(DeviceType type) {
    return device_profile(type).name.c_str();
}

std::optional<DeviceType> device_type_from_string(const std::string& name) {
    std::string lower = to_lower(name);
    for (const auto& p : device_profiles()) {
        if (to_lower(p.name) == lower) return p.type;
    }
    return std::nullopt;
}
