#include "readygate/cli/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

using readygate::cli::parse_command_line;
using namespace std::chrono_literals;

TEST(cli_test, defaults_without_arguments) {
    const auto parsed = parse_command_line({});
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->timeout, 30s);
    EXPECT_EQ(parsed->probe_timeout, 5s);
    EXPECT_FALSE(parsed->debug);
    EXPECT_FALSE(parsed->quiet);
    EXPECT_FALSE(parsed->help);
    EXPECT_TRUE(parsed->endpoints.empty());
    EXPECT_TRUE(parsed->endpoint_timeouts.empty());
}

TEST(cli_test, collects_positional_endpoints_and_flags) {
    const auto parsed = parse_command_line(
        {"-t", "12", "tcp://db:5432", "--quiet", "unix:///tmp/x.sock", "-d"});
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->timeout, 12s);
    EXPECT_TRUE(parsed->quiet);
    EXPECT_TRUE(parsed->debug);
    const std::vector<std::string> expected{"tcp://db:5432",
                                            "unix:///tmp/x.sock"};
    EXPECT_EQ(parsed->endpoints, expected);
}

TEST(cli_test, accepts_inline_values) {
    const auto parsed =
        parse_command_line({"--timeout=7", "--probe-timeout=2", "tcp://a:1"});
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->timeout, 7s);
    EXPECT_EQ(parsed->probe_timeout, 2s);
}

TEST(cli_test, endpoint_timeout_splits_on_last_equals) {
    const auto parsed = parse_command_line(
        {"--endpoint-timeout", "tcp://db:5432=90", "tcp://db:5432"});
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    ASSERT_EQ(parsed->endpoint_timeouts.count("tcp://db:5432"), 1U);
    EXPECT_EQ(parsed->endpoint_timeouts.at("tcp://db:5432"), 90s);
}

TEST(cli_test, double_dash_ends_option_parsing) {
    const auto parsed = parse_command_line({"--", "-weird"});
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    ASSERT_EQ(parsed->endpoints.size(), 1U);
    EXPECT_EQ(parsed->endpoints.front(), "-weird");
}

TEST(cli_test, rejects_bad_input) {
    EXPECT_FALSE(parse_command_line({"--timeout"}).has_value());
    EXPECT_FALSE(parse_command_line({"--timeout", "abc"}).has_value());
    EXPECT_FALSE(parse_command_line({"--timeout", "-3"}).has_value());
    EXPECT_FALSE(parse_command_line({"--frobnicate"}).has_value());
    EXPECT_FALSE(parse_command_line({"--endpoint-timeout", "novalue"}).has_value());
    EXPECT_FALSE(
        parse_command_line({"--endpoint-timeout", "tcp://a:1=x"}).has_value());

    const auto zero_probe = parse_command_line({"--probe-timeout", "0"});
    ASSERT_FALSE(zero_probe.has_value());
    EXPECT_NE(zero_probe.error().message.find("at least 1 second"),
              std::string::npos);

    const auto unknown = parse_command_line({"-x"});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_NE(unknown.error().message.find("-x"), std::string::npos);
}

TEST(cli_test, environment_provides_defaults) {
    const auto parsed = parse_command_line(
        {}, {"READYGATE_TIMEOUT=45", "READYGATE_QUIET=true", "OTHER=1"});
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->timeout, 45s);
    EXPECT_TRUE(parsed->quiet);
    EXPECT_FALSE(parsed->debug);
}

TEST(cli_test, arguments_override_environment) {
    const auto parsed =
        parse_command_line({"--timeout", "3"}, {"READYGATE_TIMEOUT=45"});
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->timeout, 3s);
}

TEST(cli_test, invalid_environment_timeout_is_a_usage_error) {
    EXPECT_FALSE(parse_command_line({}, {"READYGATE_TIMEOUT=soon"}).has_value());
}

TEST(cli_test, verbosity_follows_flags) {
    readygate::cli::options opts{};
    EXPECT_EQ(readygate::cli::verbosity_of(opts),
              readygate::log::verbosity::normal);
    opts.quiet = true;
    EXPECT_EQ(readygate::cli::verbosity_of(opts),
              readygate::log::verbosity::quiet);
    opts.debug = true;
    EXPECT_EQ(readygate::cli::verbosity_of(opts),
              readygate::log::verbosity::debug);
}

TEST(cli_test, wait_options_carry_timeouts) {
    readygate::cli::options opts{};
    opts.timeout = 11s;
    opts.probe_timeout = 1s;
    opts.endpoint_timeouts["tcp://a:1"] = 2s;

    const auto wait = readygate::cli::to_wait_options(opts, nullptr);
    EXPECT_EQ(wait.timeout, 11s);
    EXPECT_EQ(wait.probe.timeout, 1s);
    EXPECT_EQ(readygate::gate::timeout_for("tcp://a:1", wait), 2s);
    EXPECT_EQ(readygate::gate::timeout_for("tcp://b:1", wait), 11s);
    EXPECT_EQ(wait.logger, nullptr);
}

TEST(cli_test, help_flag_and_usage_text) {
    const auto parsed = parse_command_line({"--help"});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->help);
    EXPECT_NE(readygate::cli::usage().find("tcp://HOST:PORT"), std::string::npos);
}

TEST(cli_test, rejects_seconds_beyond_one_year) {
    EXPECT_FALSE(parse_command_line({"--probe-timeout", "9223372036854775807"})
                     .has_value());
    EXPECT_FALSE(parse_command_line({"-t", "31536001"}).has_value());
    EXPECT_FALSE(parse_command_line({"--endpoint-timeout",
                                     "tcp://a:1=99999999999"})
                     .has_value());
    EXPECT_FALSE(parse_command_line({}, {"READYGATE_TIMEOUT=31536001"})
                     .has_value());
}

TEST(cli_test, largest_connect_timeout_converts_exactly) {
    const auto parsed = parse_command_line({"--probe-timeout", "31536000"});
    ASSERT_TRUE(parsed.has_value());

    const auto wait = readygate::cli::to_wait_options(*parsed, nullptr);
    EXPECT_EQ(wait.probe.timeout, std::chrono::seconds{31536000});
    EXPECT_GT(wait.probe.timeout.count(), 0);
}

} // namespace
