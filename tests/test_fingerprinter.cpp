#include <gtest/gtest.h>
#include <fingerprint/fingerprinter.hpp>
#include "fake_transport.hpp"

class FingerprinterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto t = std::make_unique<ScriptedTransport>(clock);
        transport = t.get();
        session = std::make_unique<ShellSession>(std::move(t), clock);
        target.host = "10.0.0.5";
        target.user = "admin";
        target.password = "secret";
    }

    DeviceRecord run(const std::vector<std::string>& extras = {}) {
        Fingerprinter fp(*session, config);
        return fp.run(target, extras, [this](const std::string& m) { statuses.push_back(m); });
    }

    ManualClock clock;
    ScriptedTransport* transport = nullptr;
    std::unique_ptr<ShellSession> session;
    ProbeConfig config;
    ProbeTarget target;
    std::vector<std::string> statuses;
};

TEST_F(FingerprinterTest, IdentifiesCiscoFromShowVersion) {
    transport->on_connect = "router1#";
    transport->responses["show version"] = "Cisco IOS Software, Version 15.2\nrouter1#";
    transport->default_response = "\r\nrouter1#";

    DeviceRecord r = run();

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.type, DeviceType::CiscoIOS);
    EXPECT_EQ(r.detected_prompt, "router1#");
    EXPECT_EQ(r.version, "15.2");
    EXPECT_EQ(r.hostname, "router1");
    EXPECT_EQ(r.paging_command, "terminal length 0");
    EXPECT_EQ(r.host, "10.0.0.5");
    EXPECT_EQ(r.username, "admin");
    EXPECT_FALSE(r.fingerprint_time.empty());

    // Unknown probe first, then paging, then the rest of the IOS list
    ASSERT_EQ(transport->sent.size(), 3u);
    EXPECT_EQ(transport->sent[0], "show version\n");
    EXPECT_EQ(transport->sent[1], "terminal length 0\n");
    EXPECT_EQ(transport->sent[2], "show inventory\n");

    EXPECT_EQ(r.command_outputs["show version"], "Cisco IOS Software, Version 15.2\nrouter1#");
    EXPECT_EQ(r.command_outputs.count("show inventory"), 1u);
    EXPECT_EQ(r.command_outputs.count("terminal length 0"), 0u);

    EXPECT_EQ(session->state(), ConnectionState::Disconnected);
    EXPECT_EQ(transport->close_calls, 1);
}

TEST_F(FingerprinterTest, ExpectedPromptSkipsProbing) {
    transport->on_connect = "Authorized access only\r\n";
    transport->responses["show version"] = "Cisco IOS Software, Version 15.2\r\nedge1#";
    transport->default_response = "\r\nedge1#";
    config.prompt.expected_prompt = "edge1#";

    DeviceRecord r = run();

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.type, DeviceType::CiscoIOS);
    EXPECT_EQ(r.detected_prompt, "edge1#");
    ASSERT_FALSE(transport->sent.empty());
    EXPECT_EQ(transport->sent[0], "show version\n");
    EXPECT_EQ(transport->sends_of(""), 0);
    EXPECT_EQ(transport->sends_of("?"), 0);
}

TEST_F(FingerprinterTest, BannerClassificationDisablesPagingFirst) {
    transport->on_connect = "Arista Networks EOS\r\nleaf1>";
    transport->default_response = "\r\nleaf1>";

    DeviceRecord r = run();

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.type, DeviceType::AristaEOS);
    EXPECT_EQ(r.hostname, "leaf1");
    ASSERT_EQ(transport->sent.size(), 3u);
    EXPECT_EQ(transport->sent[0], "terminal length 0\n");
    EXPECT_EQ(transport->sends_of("show version"), 1);
    EXPECT_EQ(transport->sends_of("show inventory"), 1);
}

TEST_F(FingerprinterTest, UnixPromptHost) {
    transport->on_connect = "Last login: Mon Oct  2 09:00\r\nops@box01:~$ ";
    transport->default_response = "\r\nops@box01:~$ ";

    DeviceRecord r = run();

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.type, DeviceType::GenericUnix);
    EXPECT_EQ(r.detected_prompt, "ops@box01:~$");
    EXPECT_EQ(r.hostname, "box01");
    EXPECT_EQ(transport->sends_of("uname -a"), 1);
}

TEST_F(FingerprinterTest, ExtraCommandsAreRecorded) {
    transport->on_connect = "router1#";
    transport->responses["show version"] = "Cisco IOS Software, Version 15.2\nrouter1#";
    transport->responses["show clock"] = "*12:00:00.000 UTC Mon Oct 2 2023\r\nrouter1#";
    transport->default_response = "\r\nrouter1#";

    DeviceRecord r = run({"show clock"});

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.command_outputs["show clock"], "*12:00:00.000 UTC Mon Oct 2 2023\r\nrouter1#");
    EXPECT_EQ(transport->sent.back(), "show clock\n");
}

TEST_F(FingerprinterTest, UnrecognisedDeviceIsUnsuccessful) {
    transport->on_connect = "login ok\r\nbox>";
    transport->default_response = "% Unknown command\r\nbox>";

    DeviceRecord r = run();

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.type, DeviceType::Unknown);
    EXPECT_EQ(r.detected_prompt, "box>");
    EXPECT_TRUE(r.paging_command.empty());
    EXPECT_EQ(r.command_outputs.count("show version"), 1u);
    EXPECT_EQ(r.command_outputs.count("show system info"), 1u);
}

TEST_F(FingerprinterTest, SilentShellFallsBackToPattern) {
    DeviceRecord r = run();

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.detected_prompt, "[#>$]");
    EXPECT_EQ(transport->sent[0], "\n");
    EXPECT_EQ(transport->sent[1], "?\n");
}

TEST_F(FingerprinterTest, PromptRecoveredFromCommandOutput) {
    // Both probes stay silent; the device only shows its prompt after real commands
    transport->responses[""] = "";
    transport->responses["?"] = "";
    transport->default_response = "Cisco IOS Software, Version 15.2\r\nrouter1#";

    DeviceRecord r = run();

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.type, DeviceType::CiscoIOS);
    EXPECT_EQ(r.detected_prompt, "router1#");
    EXPECT_EQ(r.hostname, "router1");
}

TEST_F(FingerprinterTest, ConnectFailureIsReported) {
    transport->connect_errors.push_back(
        Result<void>::Err("Authentication failed", ErrorKind::Authentication));

    DeviceRecord r = run();

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.type, DeviceType::Unknown);
    EXPECT_EQ(r.error, "Authentication failed");
    EXPECT_TRUE(transport->sent.empty());
    ASSERT_FALSE(statuses.empty());
    EXPECT_EQ(statuses.front(), "Connecting to 10.0.0.5:22");
    EXPECT_EQ(statuses.back(), "Finished: Unknown (failed)");
}

TEST_F(FingerprinterTest, LostConnectionEndsRun) {
    transport->on_connect = "router1#";
    transport->connect_errors.push_back(Result<void>::Ok());
    transport->connect_errors.push_back(Result<void>::Err("Connection refused", ErrorKind::Connection));
    transport->send_errors.push_back(Result<void>::Err("Channel write failed", ErrorKind::Channel));

    DeviceRecord r = run();

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.type, DeviceType::Unknown);
    EXPECT_EQ(r.error.rfind("Connection lost running 'show version'", 0), 0u) << r.error;
    EXPECT_EQ(transport->connect_calls, 2);
    EXPECT_EQ(transport->sends_of("show version"), 1);
}

TEST_F(FingerprinterTest, CredentialsReachTransport) {
    transport->on_connect = "router1#";
    target.port = 2222;
    config.timing.connect_timeout_secs = 7;

    run();

    EXPECT_EQ(transport->last_options.host, "10.0.0.5");
    EXPECT_EQ(transport->last_options.port, 2222);
    EXPECT_EQ(transport->last_options.user, "admin");
    EXPECT_EQ(transport->last_options.password, "secret");
    EXPECT_EQ(transport->last_options.timeout_secs, 7);
}
