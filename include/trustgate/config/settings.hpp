#pragma once

#include <trustgate/audit/signed_audit_trail.hpp>
#include <trustgate/identity/certificate_authority.hpp>
#include <trustgate/identity/identity_gate.hpp>
#include <trustgate/schema/primitives.hpp>
#include <trustgate/session/session_manager.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trustgate::config {

/// Every tunable of the trust layer. Defaults match the component defaults.
struct settings final {
  std::string organization_name{"trustgate"};
  // Empty means generate one.
  std::string organization_id;
  std::vector<trustgate::schema::public_key_t> trusted_certifiers;
  bool require_certificate{true};

  uint64_t cache_success_ttl_ms{60000};
  uint64_t cache_failure_ttl_ms{10000};

  uint64_t session_duration_ms{24 * 60 * 60 * 1000};
  uint64_t timing_anomaly_threshold_ms{500};
  uint64_t session_sweep_interval_ms{60 * 1000};

  bool anchor_to_ledger{false};
  uint64_t anchor_interval_entries{100};

  uint64_t signing_timeout_ms{5000};
  uint64_t ledger_timeout_ms{5000};

  std::string storage_path{"trustgate.db"};
  std::string key_file{"trustgate.key"};
  std::string log_level{"info"};
  std::string log_file{"trustgate.log"};
};

/// Option descriptions bound to the members of `target`.
boost::program_options::options_description make_options(settings& target);

/// Merges an INI-style file into `vm`. Values already present (from the
/// command line) win. Returns false when the file cannot be read or parsed.
bool merge_config_file(
    const std::string& path,
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string& level);

trustgate::identity::certificate_authority_options authority_options(
    const settings& config);
trustgate::identity::identity_gate_options gate_options(
    const settings& config);
trustgate::session::session_manager_options session_options(
    const settings& config);
trustgate::audit::signed_audit_trail_options audit_options(
    const settings& config);

}  // namespace trustgate::config
