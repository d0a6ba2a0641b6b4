#include <trustgate/config/settings.hpp>

#include <chrono>
#include <exception>
#include <filesystem>

namespace po = boost::program_options;

namespace trustgate::config {

namespace {

std::chrono::milliseconds milliseconds(const uint64_t value) {
  return std::chrono::milliseconds{
      static_cast<std::chrono::milliseconds::rep>(value)};
}

}  // namespace

po::options_description make_options(settings& target) {
  auto description = po::options_description{"trustgate settings"};
  description.add_options()(
      "organization-name",
      po::value<std::string>(&target.organization_name)
          ->default_value(target.organization_name),
      "organization named in issued certificates")(
      "organization-id",
      po::value<std::string>(&target.organization_id)
          ->default_value(target.organization_id),
      "organization id prefix of certificate types (when empty, the id kept "
      "in the store, else random)")(
      "trusted-certifier",
      po::value<std::vector<std::string>>(&target.trusted_certifiers)
          ->multitoken()
          ->composing(),
      "additional trusted certifier public keys")(
      "require-certificate",
      po::value<bool>(&target.require_certificate)
          ->default_value(target.require_certificate),
      "reject keys without a registered certificate")(
      "cache-success-ttl-ms",
      po::value<uint64_t>(&target.cache_success_ttl_ms)
          ->default_value(target.cache_success_ttl_ms),
      "lifetime of a cached successful verification")(
      "cache-failure-ttl-ms",
      po::value<uint64_t>(&target.cache_failure_ttl_ms)
          ->default_value(target.cache_failure_ttl_ms),
      "lifetime of a cached failed verification")(
      "session-duration-ms",
      po::value<uint64_t>(&target.session_duration_ms)
          ->default_value(target.session_duration_ms),
      "session lifetime")(
      "timing-anomaly-threshold-ms",
      po::value<uint64_t>(&target.timing_anomaly_threshold_ms)
          ->default_value(target.timing_anomaly_threshold_ms),
      "largest accepted client clock drift")(
      "session-sweep-interval-ms",
      po::value<uint64_t>(&target.session_sweep_interval_ms)
          ->default_value(target.session_sweep_interval_ms),
      "expired session sweep period")(
      "anchor-to-ledger",
      po::value<bool>(&target.anchor_to_ledger)
          ->default_value(target.anchor_to_ledger),
      "anchor the audit trail automatically")(
      "anchor-interval-entries",
      po::value<uint64_t>(&target.anchor_interval_entries)
          ->default_value(target.anchor_interval_entries),
      "audit entries per anchor")(
      "signing-timeout-ms",
      po::value<uint64_t>(&target.signing_timeout_ms)
          ->default_value(target.signing_timeout_ms),
      "deadline for signing capability calls")(
      "ledger-timeout-ms",
      po::value<uint64_t>(&target.ledger_timeout_ms)
          ->default_value(target.ledger_timeout_ms),
      "deadline for ledger capability calls")(
      "storage-path",
      po::value<std::string>(&target.storage_path)
          ->default_value(target.storage_path),
      "RocksDB directory")(
      "key-file",
      po::value<std::string>(&target.key_file)->default_value(target.key_file),
      "hex private key of this identity")(
      "log-level",
      po::value<std::string>(&target.log_level)
          ->default_value(target.log_level),
      "trace|debug|info|warn|error|critical|off")(
      "log-file",
      po::value<std::string>(&target.log_file)->default_value(target.log_file),
      "log file path");
  return description;
}

bool merge_config_file(const std::string& path,
                       const po::options_description& description,
                       po::variables_map& vm) {
  auto ec = std::error_code{};
  if (!std::filesystem::is_regular_file(path, ec)) {
    spdlog::error("config file {} not found", path);
    return false;
  }
  try {
    po::store(po::parse_config_file<char>(path.c_str(), description, true),
              vm);
    po::notify(vm);
  } catch (const std::exception& ex) {
    spdlog::error("config file {} rejected: {}", path, ex.what());
    return false;
  }
  return true;
}

std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    return std::nullopt;
  }
  return parsed;
}

trustgate::identity::certificate_authority_options authority_options(
    const settings& config) {
  auto options = trustgate::identity::certificate_authority_options{};
  options.organization_name = config.organization_name;
  if (!config.organization_id.empty()) {
    options.organization_id = config.organization_id;
  }
  options.trusted_certifiers = config.trusted_certifiers;
  options.signing_timeout = milliseconds(config.signing_timeout_ms);
  options.ledger_timeout = milliseconds(config.ledger_timeout_ms);
  return options;
}

trustgate::identity::identity_gate_options gate_options(
    const settings& config) {
  auto options = trustgate::identity::identity_gate_options{};
  options.trusted_certifiers = config.trusted_certifiers;
  options.require_certificate = config.require_certificate;
  options.success_ttl = milliseconds(config.cache_success_ttl_ms);
  options.failure_ttl = milliseconds(config.cache_failure_ttl_ms);
  options.signing_timeout = milliseconds(config.signing_timeout_ms);
  return options;
}

trustgate::session::session_manager_options session_options(
    const settings& config) {
  auto options = trustgate::session::session_manager_options{};
  options.session_duration =
      milliseconds(config.session_duration_ms);
  options.timing_anomaly_threshold =
      milliseconds(config.timing_anomaly_threshold_ms);
  options.sweep_interval =
      milliseconds(config.session_sweep_interval_ms);
  options.signing_timeout = milliseconds(config.signing_timeout_ms);
  return options;
}

trustgate::audit::signed_audit_trail_options audit_options(
    const settings& config) {
  auto options = trustgate::audit::signed_audit_trail_options{};
  options.anchor_to_ledger = config.anchor_to_ledger;
  options.anchor_interval_entries = config.anchor_interval_entries;
  options.signing_timeout = milliseconds(config.signing_timeout_ms);
  options.ledger_timeout = milliseconds(config.ledger_timeout_ms);
  return options;
}

}  // namespace trustgate::config
