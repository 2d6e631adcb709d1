#include <gtest/gtest.h>
#include <fingerprint/profile_store.hpp>
#include <fingerprint/report.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static DeviceRecord sample_record() {
    DeviceRecord r;
    r.host = "10.0.0.5";
    r.port = 2222;
    r.username = "admin";
    r.type = DeviceType::CiscoIOS;
    r.detected_prompt = "router1#";
    r.paging_command = "terminal length 0";
    r.hostname = "router1";
    r.version = "15.2";
    r.ip_addresses = {"10.0.0.5/24"};
    r.interfaces["GigabitEthernet0/1"] = "Status: up, IP: 10.0.0.5/24";
    r.command_outputs["show version"] = "Cisco IOS Software, Version 15.2\r\n  indented\r\nrouter1#";
    r.success = true;
    r.fingerprint_time = "2025-01-15T10:00:00";
    return r;
}

TEST(Report, PasswordIsNullAndUsernameAbsent) {
    YAML::Node doc = YAML::Load(to_yaml(sample_record()));

    ASSERT_TRUE(doc["password"]);
    EXPECT_TRUE(doc["password"].IsNull());
    EXPECT_FALSE(doc["username"]);
    EXPECT_FALSE(doc["user"]);
}

TEST(Report, FieldsSurviveParsing) {
    DeviceRecord r = sample_record();
    YAML::Node doc = YAML::Load(to_yaml(r));

    EXPECT_EQ(doc["host"].as<std::string>(), "10.0.0.5");
    EXPECT_EQ(doc["port"].as<int>(), 2222);
    EXPECT_EQ(doc["device_type"].as<std::string>(), "CiscoIOS");
    EXPECT_EQ(doc["detected_prompt"].as<std::string>(), "router1#");
    EXPECT_EQ(doc["disable_paging_command"].as<std::string>(), "terminal length 0");
    EXPECT_EQ(doc["ip_addresses"][0].as<std::string>(), "10.0.0.5/24");
    EXPECT_EQ(doc["interfaces"]["GigabitEthernet0/1"].as<std::string>(), "Status: up, IP: 10.0.0.5/24");
    EXPECT_EQ(doc["command_outputs"]["show version"].as<std::string>(), r.command_outputs["show version"]);
    EXPECT_TRUE(doc["success"].as<bool>());
    EXPECT_FALSE(doc["error"]);
}

TEST(Report, OutputsCanBeOmitted) {
    YAML::Node doc = YAML::Load(to_yaml(sample_record(), false));
    EXPECT_FALSE(doc["command_outputs"]);
    EXPECT_TRUE(doc["interfaces"]);
}

TEST(Report, FailedRecordCarriesError) {
    DeviceRecord r;
    r.host = "10.0.0.9";
    r.mark_failed("Authentication failed");

    YAML::Node doc = YAML::Load(to_yaml(r));
    EXPECT_FALSE(doc["success"].as<bool>());
    EXPECT_EQ(doc["error"].as<std::string>(), "Authentication failed");
    EXPECT_EQ(doc["device_type"].as<std::string>(), "Unknown");
}

TEST(CommandOutput, SelectedCommandsInOrderWithoutCarriageReturns) {
    DeviceRecord r;
    r.command_outputs["show clock"] = "12:00 UTC\r\nr1#";
    r.command_outputs["show users"] = "admin vty0\r\nr1#";
    r.command_outputs["show version"] = "IOS 15.2\r\nr1#";

    EXPECT_EQ(command_output_text(r, {"show users", "show clock", "not run"}),
              "admin vty0\nr1#\n12:00 UTC\nr1#");
    EXPECT_EQ(command_output_text(r),
              "12:00 UTC\nr1#\nadmin vty0\nr1#\nIOS 15.2\nr1#");
    EXPECT_EQ(command_output_text(DeviceRecord{}), "");
}

TEST(DeviceRecordText, SummaryAndInterfaces) {
    DeviceRecord r = sample_record();
    std::string s = r.summary();
    EXPECT_NE(s.find("Device 10.0.0.5:2222"), std::string::npos);
    EXPECT_NE(s.find("CiscoIOS"), std::string::npos);
    EXPECT_EQ(s.find("Serial"), std::string::npos);

    EXPECT_NE(r.interface_summary().find("GigabitEthernet0/1  Status: up"), std::string::npos);
    EXPECT_EQ(DeviceRecord{}.interface_summary(), "  (no interfaces found)\n");
}

TEST(DeviceRecordText, MarkFailedKeepsFirstReason) {
    DeviceRecord r;
    r.type = DeviceType::Linux;
    r.mark_failed("first");
    r.mark_failed("second");
    EXPECT_EQ(r.type, DeviceType::Unknown);
    EXPECT_EQ(r.error, "first");
}

class StorageTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "devprobe_report_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(StorageTest, WriteReportCreatesDirectories) {
    fs::path out = test_dir / "reports" / "r1.yaml";
    auto w = write_report(sample_record(), out);
    ASSERT_TRUE(w.is_ok()) << w.error;

    YAML::Node doc = YAML::LoadFile(out.string());
    EXPECT_EQ(doc["hostname"].as<std::string>(), "router1");
}

TEST_F(StorageTest, WriteCommandOutputSavesRawText) {
    fs::path out = test_dir / "out" / "commands.txt";
    auto w = write_command_output(sample_record(), {"show version"}, out);
    ASSERT_TRUE(w.is_ok()) << w.error;

    std::ifstream in(out, std::ios::binary);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text, "Cisco IOS Software, Version 15.2\n  indented\nrouter1#");
}

TEST_F(StorageTest, ProfileStoreRoundTrip) {
    fs::path file = test_dir / "profiles.yaml";
    {
        ProfileStore store(file);
        store.load();
        EXPECT_TRUE(store.all().empty());

        store.add_or_update(profile_from_record(sample_record()));
        DeviceProfileEntry other;
        other.host = "10.0.0.6";
        other.type = DeviceType::JuniperJunOS;
        store.add_or_update(other);
        ASSERT_TRUE(store.save().is_ok());
    }

    ProfileStore store(file);
    store.load();
    ASSERT_EQ(store.all().size(), 2u);

    auto found = store.find("10.0.0.5", 2222);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->type, DeviceType::CiscoIOS);
    EXPECT_EQ(found->prompt, "router1#");
    EXPECT_EQ(found->paging_command, "terminal length 0");
    EXPECT_EQ(found->last_fingerprinted, "2025-01-15T10:00:00");

    EXPECT_FALSE(store.find("10.0.0.5", 22).has_value());
    auto junos = store.find("10.0.0.6", 22);
    ASSERT_TRUE(junos.has_value());
    EXPECT_EQ(junos->type, DeviceType::JuniperJunOS);
}

TEST_F(StorageTest, AddOrUpdateReplacesSameEndpoint) {
    ProfileStore store(test_dir / "profiles.yaml");
    DeviceProfileEntry e;
    e.host = "sw1";
    e.version = "1.0";
    store.add_or_update(e);
    e.version = "2.0";
    store.add_or_update(e);

    ASSERT_EQ(store.all().size(), 1u);
    EXPECT_EQ(store.all()[0].version, "2.0");

    EXPECT_TRUE(store.remove("sw1", 22));
    EXPECT_FALSE(store.remove("sw1", 22));
    EXPECT_TRUE(store.all().empty());
}

TEST_F(StorageTest, CorruptProfileFileLoadsEmpty) {
    fs::path file = test_dir / "profiles.yaml";
    std::ofstream(file) << "devices: [ {host: \"a\"\n";

    ProfileStore store(file);
    store.load();
    EXPECT_TRUE(store.all().empty());
}

TEST_F(StorageTest, ProfileFileNeverHoldsCredentials) {
    fs::path file = test_dir / "profiles.yaml";
    ProfileStore store(file);
    store.add_or_update(profile_from_record(sample_record()));
    ASSERT_TRUE(store.save().is_ok());

    std::ifstream in(file);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text.find("admin"), std::string::npos);
    EXPECT_EQ(text.find("password"), std::string::npos);
}
