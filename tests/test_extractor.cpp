#include <gtest/gtest.h>
#include <fingerprint/extractor.hpp>

// ── Helpers ─────────────────────────────────────────────────

TEST(ExtractorHelpers, FirstMatchAppliesPrefixAndTrim) {
    PatternList patterns = {{R"(cisco\s+Nexus\s*(\S+))", "Nexus "}};
    EXPECT_EQ(first_match("cisco Nexus9000 C93180YC-EX chassis", patterns), "Nexus 9000");
    EXPECT_FALSE(first_match("nothing here", patterns).has_value());
}

TEST(ExtractorHelpers, FirstMatchTriesPatternsInOrder) {
    const auto& junos = device_profile(DeviceType::JuniperJunOS).version;
    EXPECT_EQ(first_match("Junos: 20.4R3-S1", junos), "20.4R3-S1");
    EXPECT_EQ(first_match("JUNOS Software Release [18.4R2.7]", junos), "18.4R2.7");
}

TEST(ExtractorHelpers, BadPatternIsSkipped) {
    PatternList patterns = {{R"(([unclosed)"}, {R"(Version\s+(\S+))"}};
    EXPECT_EQ(first_match("Version 1.2", patterns), "1.2");
}

TEST(ExtractorHelpers, HostnameFromPrompt) {
    EXPECT_EQ(hostname_from_prompt("router1#"), "router1");
    EXPECT_EQ(hostname_from_prompt("sw-core.lab>"), "sw-core.lab");
    EXPECT_EQ(hostname_from_prompt("edge01"), "edge01");
    EXPECT_EQ(hostname_from_prompt("[admin@fw]"), "");
    EXPECT_EQ(hostname_from_prompt(""), "");
}

TEST(ExtractorHelpers, PlausibleIPv4) {
    EXPECT_TRUE(is_plausible_ipv4("10.0.0.1"));
    EXPECT_TRUE(is_plausible_ipv4("192.168.10.254/24"));
    EXPECT_FALSE(is_plausible_ipv4("10.0.0.300"));
    EXPECT_FALSE(is_plausible_ipv4("1.2.3"));
    EXPECT_FALSE(is_plausible_ipv4("1..2.3"));
}

// ── IP addresses ────────────────────────────────────────────

TEST(IpExtraction, KeepsAddressWithContext) {
    FieldExtractor x;
    auto ips = x.ip_addresses("interface Vlan10\n ip address 10.0.0.1/24\n");
    ASSERT_EQ(ips.size(), 1u);
    EXPECT_EQ(ips[0], "10.0.0.1/24");
}

TEST(IpExtraction, DropsAddressWithoutContext) {
    FieldExtractor x;
    EXPECT_TRUE(x.ip_addresses("NTP server 192.168.5.5 reachable").empty());
}

TEST(IpExtraction, RejectsZeroAndBroadcastPrefixes) {
    FieldExtractor x;
    EXPECT_TRUE(x.ip_addresses("ip address 0.0.0.0 255.255.255.0").empty());
    EXPECT_TRUE(x.ip_addresses("ip address 10.0.0.300").empty());
}

TEST(IpExtraction, DeduplicatesAndCaps) {
    ExtractionConfig cfg;
    cfg.max_ip_addresses = 2;
    FieldExtractor x(cfg);

    auto ips = x.ip_addresses(
        "ip address 10.1.1.1\n"
        "ip address 10.1.1.1\n"
        "ip address 10.1.1.2\n"
        "ip address 10.1.1.3\n");
    ASSERT_EQ(ips.size(), 2u);
    EXPECT_EQ(ips[0], "10.1.1.1");
    EXPECT_EQ(ips[1], "10.1.1.2");
}

TEST(IpExtraction, CustomContextTerms) {
    ExtractionConfig cfg;
    cfg.ip_context_terms = {"MGMT"};
    FieldExtractor x(cfg);

    EXPECT_EQ(x.ip_addresses("mgmt0 10.9.9.9").size(), 1u);
    EXPECT_TRUE(x.ip_addresses("ip address 10.9.9.9").empty());
}

// ── Interfaces ──────────────────────────────────────────────

TEST(InterfaceExtraction, StatusAndAddressPerBlock) {
    FieldExtractor x;
    auto ifaces = x.interfaces(
        "GigabitEthernet0/1 is up, line protocol is up\r\n"
        "  Internet address is 10.0.0.1/24\r\n"
        "GigabitEthernet0/2 is administratively down, line protocol is down\r\n"
        "  Hardware is Gigabit Ethernet\r\n"
        "Vlan1 is down, line protocol is down\r\n");

    ASSERT_EQ(ifaces.size(), 3u);
    EXPECT_EQ(ifaces["GigabitEthernet0/1"], "Status: up, IP: 10.0.0.1/24");
    EXPECT_EQ(ifaces["GigabitEthernet0/2"], "Status: administratively down");
    EXPECT_EQ(ifaces["Vlan1"], "Status: down");
}

TEST(InterfaceExtraction, NoInterfaceLines) {
    FieldExtractor x;
    EXPECT_TRUE(x.interfaces("uptime is 3 weeks\nrouter1#").empty());
}

// ── Whole record ────────────────────────────────────────────

TEST(RecordExtraction, CiscoIOS) {
    DeviceRecord r;
    r.type = DeviceType::CiscoIOS;
    r.detected_prompt = "core-sw1#";

    FieldExtractor().extract(
        "Cisco IOS Software, C2960 Software (C2960-LANBASEK9-M), Version 15.2(4)E7, RELEASE\r\n"
        "core-sw1 uptime is 3 weeks, 2 days\r\n"
        "System serial number : FOC1234X0AB\r\n"
        "Model number : WS-C2960X-48TS-L\r\n"
        "core-sw1#", r);

    EXPECT_EQ(r.version, "15.2(4)E7");
    EXPECT_EQ(r.hostname, "core-sw1");
    EXPECT_EQ(r.serial_number, "FOC1234X0AB");
    EXPECT_EQ(r.model, "WS-C2960X-48TS-L");
    EXPECT_EQ(r.uptime, "3 weeks, 2 days");
}

TEST(RecordExtraction, HostnameCommandBeatsPrompt) {
    FieldExtractor x;
    EXPECT_EQ(x.hostname("hostname dist-rtr\n", DeviceType::CiscoIOS, "r1#"), "dist-rtr");
    EXPECT_EQ(x.hostname("no name here", DeviceType::CiscoIOS, "r1#"), "r1");
}

TEST(RecordExtraction, NexusModelPrefix) {
    DeviceRecord r;
    r.type = DeviceType::CiscoNXOS;
    FieldExtractor().extract("  NXOS: version 9.3(8)\r\n  cisco Nexus9000 C93180YC-EX chassis\r\n", r);
    EXPECT_EQ(r.version, "9.3(8)");
    EXPECT_EQ(r.model, "Nexus 9000");
}

TEST(RecordExtraction, LinuxHost) {
    DeviceRecord r;
    r.type = DeviceType::Linux;
    r.detected_prompt = "admin@web01:~$";

    FieldExtractor().extract(
        "Linux web01 5.15.0-91-generic #101-Ubuntu SMP x86_64 GNU/Linux\n"
        "PRETTY_NAME=\"Ubuntu 22.04.3 LTS\"\n"
        "GigabitEthernet0/1 is up\n", r);

    EXPECT_EQ(r.hostname, "web01");
    EXPECT_EQ(r.version, "Ubuntu 22.04.3 LTS");
    // Interface parsing is only for network operating systems
    EXPECT_TRUE(r.interfaces.empty());
}

TEST(RecordExtraction, MissingFieldsStayAsTheyWere) {
    DeviceRecord r;
    r.type = DeviceType::FortiOS;
    r.version = "preset";

    FieldExtractor().extract("nothing useful", r);
    EXPECT_EQ(r.version, "preset");
    EXPECT_TRUE(r.model.empty());
    EXPECT_TRUE(r.ip_addresses.empty());
}
