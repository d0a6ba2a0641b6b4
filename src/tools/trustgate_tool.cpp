#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <trustgate/audit/anchor_chain.hpp>
#include <trustgate/audit/merkle.hpp>
#include <trustgate/audit/signed_audit_trail.hpp>
#include <trustgate/common/critical.hpp>
#include <trustgate/config/settings.hpp>
#include <trustgate/crypto/local_signer.hpp>
#include <trustgate/identity/certificate_authority.hpp>
#include <trustgate/schema/encoding/json/anchor_point.hpp>
#include <trustgate/schema/encoding/json/audit_entry.hpp>
#include <trustgate/schema/encoding/json/certificate.hpp>
#include <trustgate/schema/encoding/json/encoder.hpp>
#include <trustgate/storage/rocksdb/storage.hpp>

#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

void configure_logging(const trustgate::config::settings& config) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "trustgate", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto level = trustgate::config::parse_log_level(config.log_level);
  if (!level) {
    spdlog::warn("unknown log level {}, using info", config.log_level);
  }
  spdlog::set_level(level.value_or(spdlog::level::info));
}

void print(const nlohmann::json& value) {
  std::cout << trustgate::schema::encoding::json::pretty(value) << '\n';
}

std::optional<std::string> read_file(const std::string& path) {
  auto in = std::ifstream{path};
  if (!in) {
    spdlog::error("cannot read {}", path);
    return std::nullopt;
  }
  auto buffer = std::stringstream{};
  buffer << in.rdbuf();
  return buffer.str();
}

std::shared_ptr<trustgate::crypto::local_signer> load_signer(
    const std::string& key_file) {
  auto contents = read_file(key_file);
  if (!contents) {
    trustgate::common::critical("identity key file is required; run keygen");
  }
  auto hex = contents.value();
  std::erase_if(hex, [](const char c) { return std::isspace(
                                                   static_cast<unsigned char>(
                                                       c)) != 0; });
  auto signer = trustgate::crypto::local_signer::from_private_key_hex(hex);
  if (!signer) {
    trustgate::common::critical("identity key file does not hold a valid key");
  }
  return std::make_shared<trustgate::crypto::local_signer>(
      std::move(signer.value()));
}

std::optional<std::string> optional_string(const po::variables_map& vm,
                                           const char* name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

std::string required_string(const po::variables_map& vm, const char* name) {
  auto value = optional_string(vm, name);
  if (!value || value->empty()) {
    spdlog::error("--{} is required", name);
    trustgate::common::critical("missing required option");
  }
  return value.value();
}

trustgate::schema::certificate_extensions_t parse_extensions(
    const po::variables_map& vm) {
  auto extensions = trustgate::schema::certificate_extensions_t{};
  if (!vm.contains("extension")) {
    return extensions;
  }
  for (const auto& item : vm["extension"].as<std::vector<std::string>>()) {
    auto separator = item.find('=');
    if (separator == std::string::npos || separator == 0) {
      spdlog::error("extension {} is not key=value", item);
      trustgate::common::critical("malformed --extension");
    }
    extensions[item.substr(0, separator)] = item.substr(separator + 1);
  }
  return extensions;
}

int run_keygen(const trustgate::config::settings& config, const bool force) {
  auto ec = std::error_code{};
  if (std::filesystem::exists(config.key_file, ec) && !force) {
    spdlog::error("{} already exists; pass --force to replace it",
                  config.key_file);
    return 1;
  }
  auto signer = trustgate::crypto::local_signer::generate();
  {
    auto out = std::ofstream{config.key_file, std::ios::trunc};
    if (!out) {
      spdlog::error("cannot write {}", config.key_file);
      return 1;
    }
    out << signer.private_key_hex() << '\n';
  }
  std::filesystem::permissions(config.key_file,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               ec);
  if (ec) {
    spdlog::warn("could not restrict permissions of {}: {}", config.key_file,
                 ec.message());
  }
  std::cout << signer.public_key() << '\n';
  return 0;
}

int run_issue(trustgate::identity::certificate_authority& authority,
              const po::variables_map& vm) {
  auto type_name = vm["type"].as<std::string>();
  auto type =
      trustgate::schema::try_from_string<trustgate::schema::certificate_type_t>(
          type_name);
  if (!type) {
    spdlog::error("unknown certificate type {}", type_name);
    return 1;
  }

  auto request = trustgate::schema::certificate_request_t{};
  request.subject = required_string(vm, "subject");
  request.certificate_type = type.value();
  request.expires_in_days = vm["days"].as<uint32_t>();
  request.extensions = parse_extensions(vm);
  if (trustgate::schema::is_agent_type(type.value())) {
    auto claims = trustgate::schema::agent_claims{};
    claims.name = required_string(vm, "name");
    claims.email = required_string(vm, "email");
    claims.department = optional_string(vm, "department");
    claims.permissions = optional_string(vm, "permissions");
    request.claims = std::move(claims);
  } else {
    auto claims = trustgate::schema::person_claims{};
    claims.name = required_string(vm, "name");
    claims.email = required_string(vm, "email");
    claims.department = optional_string(vm, "department");
    claims.title = optional_string(vm, "title");
    claims.employee_id = optional_string(vm, "employee-id");
    claims.permissions = optional_string(vm, "permissions");
    request.claims = std::move(claims);
  }

  auto result = authority.issue_certificate(request);
  if (!result.issued) {
    spdlog::error("issuance failed: {}", result.message);
    return 1;
  }
  print(nlohmann::json(result.issued.value()));
  return 0;
}

int run_revoke(trustgate::identity::certificate_authority& authority,
               const po::variables_map& vm) {
  auto serial = required_string(vm, "serial");
  auto result =
      authority.revoke_certificate(serial, vm["reason"].as<std::string>());
  auto out = nlohmann::json{{"serialNumber", serial},
                            {"revoked", result.revoked},
                            {"alreadyRevoked", result.already_revoked},
                            {"propagated", result.propagated}};
  if (result.error) {
    out["error"] = std::string{trustgate::schema::to_string(result.error.value())};
    out["message"] = result.message;
  }
  print(out);
  return result.revoked ? 0 : 1;
}

int run_verify_certificate(trustgate::identity::certificate_authority& authority,
                           const po::variables_map& vm) {
  auto contents = read_file(required_string(vm, "certificate"));
  if (!contents) {
    return 1;
  }
  auto certificate = trustgate::schema::certificate_t{};
  try {
    auto json = nlohmann::json::parse(contents.value());
    certificate = json.contains("certificate")
                      ? json.at("certificate").get<trustgate::schema::certificate_t>()
                      : json.get<trustgate::schema::certificate_t>();
  } catch (const std::exception& ex) {
    spdlog::error("certificate file is not a certificate: {}", ex.what());
    return 1;
  }

  auto result = authority.verify_certificate(certificate);
  auto out = nlohmann::json{{"serialNumber", certificate.serial_number},
                            {"valid", result.valid},
                            {"revoked", result.revoked},
                            {"expired", result.expired},
                            {"notYetValid", result.not_yet_valid}};
  if (result.error) {
    out["error"] = std::string{trustgate::schema::to_string(result.error.value())};
    out["message"] = result.message;
  }
  print(out);
  return result.valid ? 0 : 2;
}

nlohmann::json describe(
    const trustgate::schema::chain_verification_result_t& result) {
  auto errors = nlohmann::json::array();
  for (const auto& error : result.errors) {
    errors.push_back({{"entryId", error.entry_id},
                      {"code", std::string{trustgate::schema::to_string(
                                   error.code)}},
                      {"message", error.message}});
  }
  return nlohmann::json{{"valid", result.valid},
                        {"entriesVerified", result.entries_verified},
                        {"errors", errors}};
}

int run_verify_audit(const trustgate::config::settings& config,
                     const po::variables_map& vm) {
  auto signer = load_signer(config.key_file);
  auto path = optional_string(vm, "audit");
  if (path) {
    auto contents = read_file(path.value());
    if (!contents) {
      return 1;
    }
    auto trail = trustgate::audit::signed_audit_trail{
        signer, trustgate::config::audit_options(config)};
    auto result = trail.import_from_json(contents.value());
    print(describe(result));
    return result.valid ? 0 : 2;
  }

  auto store = trustgate::storage::make_storage<
      trustgate::storage::rocksdb_storage_tag>(config.storage_path);
  auto trail = trustgate::audit::signed_audit_trail{
      signer, trustgate::config::audit_options(config),
      trustgate::common::system_clock(), nullptr, &store};
  auto result = trail.verify_chain();
  print(describe(result));
  return result.valid ? 0 : 2;
}

int run_anchor_root(const po::variables_map& vm) {
  if (auto path = optional_string(vm, "anchors")) {
    auto contents = read_file(path.value());
    if (!contents) {
      return 1;
    }
    auto data = trustgate::schema::anchor_chain_data_t{};
    try {
      data = nlohmann::json::parse(contents.value())
                 .get<trustgate::schema::anchor_chain_data_t>();
    } catch (const std::exception& ex) {
      spdlog::error("anchor chain file is malformed: {}", ex.what());
      return 1;
    }
    auto chain = trustgate::audit::anchor_chain::from_serialized(data);
    auto verification = chain.verify();
    auto root = chain.merkle_root();
    auto out = nlohmann::json{{"sessionId", chain.session_id()},
                              {"merkleRoot", root},
                              {"anchorCount", chain.anchor_count()},
                              {"valid", verification.valid},
                              {"errors", verification.errors}};
    if (!data.merkle_root.empty()) {
      out["matchesRecordedRoot"] = data.merkle_root == root;
    }
    print(out);
    return verification.valid ? 0 : 2;
  }

  auto contents = read_file(required_string(vm, "audit"));
  if (!contents) {
    return 1;
  }
  auto chain = trustgate::schema::audit_chain_t{};
  try {
    chain = nlohmann::json::parse(contents.value())
                .get<trustgate::schema::audit_chain_t>();
  } catch (const std::exception& ex) {
    spdlog::error("audit chain file is malformed: {}", ex.what());
    return 1;
  }
  auto hashes = std::vector<trustgate::schema::hash_hex_t>{};
  hashes.reserve(chain.entries.size());
  for (const auto& entry : chain.entries) {
    hashes.push_back(trustgate::audit::hash_entry(entry));
  }
  auto out = nlohmann::json{
      {"entryCount", hashes.size()},
      {"headHash", chain.head_hash},
      {"merkleRoot", trustgate::audit::compute_merkle_root(std::move(hashes))}};
  print(out);
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "usage: trustgate_tool <command> [options]\n"
            << "commands: keygen issue revoke verify-certificate verify-audit "
               "anchor-root\n\n"
            << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto config = trustgate::config::settings{};
  auto command = std::string{};
  auto force = false;

  auto commands = po::options_description{"trustgate_tool options"};
  commands.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|issue|revoke|verify-certificate|verify-audit|anchor-root")(
      "config,c", po::value<std::string>(), "INI-style settings file")(
      "subject", po::value<std::string>(), "subject public key hex")(
      "type", po::value<std::string>()->default_value("employee"),
      "employee|admin|contractor|bot|service")(
      "name", po::value<std::string>(), "subject name")(
      "email", po::value<std::string>(), "subject or operator email")(
      "department", po::value<std::string>(), "department")(
      "title", po::value<std::string>(), "job title")(
      "employee-id", po::value<std::string>(), "employee id")(
      "permissions", po::value<std::string>(), "JSON permission list")(
      "extension", po::value<std::vector<std::string>>()->multitoken(),
      "custom key=value attributes")(
      "days", po::value<uint32_t>()->default_value(365),
      "certificate lifetime in days")(
      "serial", po::value<std::string>(), "certificate serial number")(
      "reason", po::value<std::string>()->default_value(""),
      "revocation reason")(
      "certificate", po::value<std::string>(), "certificate JSON file")(
      "audit", po::value<std::string>(), "exported audit chain JSON file")(
      "anchors", po::value<std::string>(), "serialized anchor chain JSON file")(
      "force", po::bool_switch(&force), "overwrite an existing key file");
  commands.add(trustgate::config::make_options(config));

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(commands)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(commands);
    return 0;
  }

  if (vm.contains("config") &&
      !trustgate::config::merge_config_file(vm["config"].as<std::string>(),
                                            commands, vm)) {
    return 1;
  }
  configure_logging(config);

  auto status = 0;
  if (command == "keygen") {
    status = run_keygen(config, force);
  } else if (command == "issue" || command == "revoke" ||
             command == "verify-certificate") {
    auto store = trustgate::storage::make_storage<
        trustgate::storage::rocksdb_storage_tag>(config.storage_path);
    auto authority = trustgate::identity::certificate_authority{
        load_signer(config.key_file),
        trustgate::config::authority_options(config),
        trustgate::common::system_clock(), nullptr, &store};
    if (command == "issue") {
      status = run_issue(authority, vm);
    } else if (command == "revoke") {
      status = run_revoke(authority, vm);
    } else {
      status = run_verify_certificate(authority, vm);
    }
  } else if (command == "verify-audit") {
    status = run_verify_audit(config, vm);
  } else if (command == "anchor-root") {
    status = run_anchor_root(vm);
  } else {
    spdlog::error("unknown command {}", command);
    print_help(commands);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
