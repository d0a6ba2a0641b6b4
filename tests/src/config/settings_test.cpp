#include <gtest/gtest.h>
#include <trustgate/config/settings.hpp>
#include <trustgate/testing/common.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

void parse(const std::vector<std::string>& args,
           const po::options_description& description,
           po::variables_map& vm) {
  auto argv = std::vector<const char*>{"trustgate_tool"};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  po::store(po::command_line_parser(static_cast<int>(argv.size()), argv.data())
                .options(description)
                .run(),
            vm);
  po::notify(vm);
}

}  // namespace

TEST(settings, defaults_match_component_defaults) {
  auto config = trustgate::config::settings{};
  auto gate = trustgate::config::gate_options(config);
  EXPECT_TRUE(gate.require_certificate);
  EXPECT_EQ(gate.success_ttl.count(), 60000);
  EXPECT_EQ(gate.failure_ttl.count(), 10000);

  auto sessions = trustgate::config::session_options(config);
  EXPECT_EQ(sessions.session_duration.count(), 24 * 60 * 60 * 1000);
  EXPECT_EQ(sessions.timing_anomaly_threshold.count(), 500);
  EXPECT_TRUE(sessions.start_sweeper);

  auto audit = trustgate::config::audit_options(config);
  EXPECT_FALSE(audit.anchor_to_ledger);
  EXPECT_EQ(audit.anchor_interval_entries, 100u);

  auto authority = trustgate::config::authority_options(config);
  EXPECT_EQ(authority.organization_name, "trustgate");
  EXPECT_FALSE(authority.organization_id.has_value());
}

TEST(settings, command_line_values_reach_the_options) {
  auto config = trustgate::config::settings{};
  auto description = trustgate::config::make_options(config);
  auto vm = po::variables_map{};
  parse({"--organization-name", "Example Corp", "--organization-id",
         "00aa11bb22cc33dd", "--cache-failure-ttl-ms", "2500",
         "--require-certificate", "false", "--trusted-certifier",
         std::string(66, 'a'), std::string(66, 'b')},
        description, vm);

  EXPECT_EQ(config.organization_name, "Example Corp");
  EXPECT_EQ(config.trusted_certifiers.size(), 2u);

  auto gate = trustgate::config::gate_options(config);
  EXPECT_FALSE(gate.require_certificate);
  EXPECT_EQ(gate.failure_ttl.count(), 2500);
  EXPECT_EQ(gate.trusted_certifiers.size(), 2u);
  EXPECT_EQ(trustgate::config::authority_options(config).organization_id,
            "00aa11bb22cc33dd");
}

TEST(settings, command_line_wins_over_config_file) {
  auto path = trustgate::testing::make_db_path("trustgate_settings") + ".ini";
  {
    auto file = std::ofstream{path};
    file << "organization-name = From File\n"
         << "session-duration-ms = 3600000\n"
         << "anchor-to-ledger = true\n"
         << "unrelated-key = ignored\n";
  }

  auto config = trustgate::config::settings{};
  auto description = trustgate::config::make_options(config);
  auto vm = po::variables_map{};
  parse({"--organization-name", "From Command Line"}, description, vm);
  ASSERT_TRUE(trustgate::config::merge_config_file(path, description, vm));

  EXPECT_EQ(config.organization_name, "From Command Line");
  EXPECT_EQ(config.session_duration_ms, 3600000u);
  EXPECT_TRUE(config.anchor_to_ledger);
  trustgate::testing::remove_path(path);
}

TEST(settings, missing_config_file_is_reported) {
  auto config = trustgate::config::settings{};
  auto description = trustgate::config::make_options(config);
  auto vm = po::variables_map{};
  EXPECT_FALSE(trustgate::config::merge_config_file(
      "/nonexistent/trustgate.ini", description, vm));
}

TEST(settings, log_levels_parse) {
  EXPECT_EQ(trustgate::config::parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(trustgate::config::parse_log_level("warn"), spdlog::level::warn);
  EXPECT_EQ(trustgate::config::parse_log_level("off"), spdlog::level::off);
  EXPECT_FALSE(trustgate::config::parse_log_level("verbose").has_value());
}
