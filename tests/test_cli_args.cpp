#include <gtest/gtest.h>
#include <cli/probe_cli.hpp>

TEST(CliArgs, HostUserAndPassword) {
    auto r = parse_args({"10.0.0.5", "-u", "admin", "-p", "secret"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.target.host, "10.0.0.5");
    EXPECT_EQ(r.value.target.port, 22);
    EXPECT_EQ(r.value.target.user, "admin");
    EXPECT_EQ(r.value.target.password, "secret");
    EXPECT_FALSE(r.value.output_path.has_value());
}

TEST(CliArgs, AllOptions) {
    auto r = parse_args({"sw1:2222", "--user", "ops", "-o", "out.yaml",
                         "--cmd", "show clock, show users", "--cmd", "show vlan",
                         "--config", "c.yaml", "--log-file", "l.log",
                         "--save-profile", "-d", "-v"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const CliOptions& o = r.value;
    EXPECT_EQ(o.target.host, "sw1");
    EXPECT_EQ(o.target.port, 2222);
    EXPECT_EQ(o.output_path, std::optional<std::string>("out.yaml"));
    ASSERT_EQ(o.extra_commands.size(), 3u);
    EXPECT_EQ(o.extra_commands[1], "show users");
    EXPECT_EQ(o.extra_commands[2], "show vlan");
    EXPECT_EQ(o.config_path, std::optional<std::string>("c.yaml"));
    EXPECT_EQ(o.log_file, std::optional<std::string>("l.log"));
    EXPECT_TRUE(o.save_profile);
    EXPECT_TRUE(o.debug);
    EXPECT_TRUE(o.verbose);
}

TEST(CliArgs, PromptTimingAndSaveOptions) {
    auto r = parse_args({"r1", "-u", "ops", "--prompt", "r1#", "--prompt-count", "2",
                         "-i", "3", "-s", "out.txt"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const CliOptions& o = r.value;
    EXPECT_EQ(o.expected_prompt, std::optional<std::string>("r1#"));
    EXPECT_EQ(o.prompt_count, std::optional<int>(2));
    EXPECT_EQ(o.inter_command_secs, std::optional<int>(3));
    EXPECT_EQ(o.save_path, std::optional<std::string>("out.txt"));

    auto defaults = parse_args({"r1", "-u", "ops"});
    EXPECT_FALSE(defaults.value.expected_prompt.has_value());
    EXPECT_FALSE(defaults.value.prompt_count.has_value());
    EXPECT_FALSE(defaults.value.inter_command_secs.has_value());
    EXPECT_FALSE(defaults.value.save_path.has_value());
}

TEST(CliArgs, RejectsBadNumbers) {
    EXPECT_EQ(parse_args({"r1", "-u", "a", "--prompt-count", "0"}).error,
              "Invalid value for --prompt-count: 0");
    EXPECT_EQ(parse_args({"r1", "-u", "a", "-i", "soon"}).error,
              "Invalid value for -i: soon");
    EXPECT_TRUE(parse_args({"r1", "-u", "a", "-i", "0"}).is_ok());
    EXPECT_EQ(parse_args({"r1", "-u", "a", "--prompt-count"}).error,
              "Missing value for --prompt-count");
}

TEST(CliArgs, PasswordFromEnvironment) {
    auto r = parse_args({"h", "-u", "admin"}, "from-env");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.target.password, "from-env");

    auto explicit_pw = parse_args({"h", "-u", "admin", "-p", "cli"}, "from-env");
    EXPECT_EQ(explicit_pw.value.target.password, "cli");
}

TEST(CliArgs, Errors) {
    EXPECT_EQ(parse_args({"-u", "admin"}).error, "Missing host");
    EXPECT_EQ(parse_args({"h"}).error, "Missing username (-u)");
    EXPECT_EQ(parse_args({"h", "-u"}).error, "Missing value for -u");
    EXPECT_EQ(parse_args({"h", "-u", "a", "--bogus"}).error, "Unknown option: --bogus");
    EXPECT_EQ(parse_args({"h", "-u", "a", "extra"}).error, "Unexpected argument: extra");
}

TEST(CliArgs, InfoFlagsNeedNoTarget) {
    EXPECT_TRUE(parse_args({"--help"}).value.show_help);
    EXPECT_TRUE(parse_args({"--version"}).value.show_version);
    EXPECT_TRUE(parse_args({"--profiles"}).value.list_profiles);

    auto show = parse_args({"--profile", "sw1:2222"});
    ASSERT_TRUE(show.is_ok()) << show.error;
    EXPECT_EQ(show.value.show_profile, std::optional<std::string>("sw1:2222"));

    auto forget = parse_args({"--forget", "sw1"});
    ASSERT_TRUE(forget.is_ok()) << forget.error;
    EXPECT_EQ(forget.value.forget_profile, std::optional<std::string>("sw1"));
}

TEST(CliArgs, SplitHostPort) {
    EXPECT_EQ(split_host_port("r1", 22), std::make_pair(std::string("r1"), 22));
    EXPECT_EQ(split_host_port("r1:2022", 22), std::make_pair(std::string("r1"), 2022));
    EXPECT_EQ(split_host_port("r1:notaport", 22), std::make_pair(std::string("r1"), 22));
    EXPECT_EQ(split_host_port("r1:70000", 22), std::make_pair(std::string("r1"), 22));
    EXPECT_EQ(split_host_port("fe80::1", 22), std::make_pair(std::string("fe80::1"), 22));
}

TEST(CliArgs, SplitCommands) {
    auto cmds = split_commands(" show ip route ,, show arp,");
    ASSERT_EQ(cmds.size(), 2u);
    EXPECT_EQ(cmds[0], "show ip route");
    EXPECT_EQ(cmds[1], "show arp");
    EXPECT_TRUE(split_commands("").empty());
}
