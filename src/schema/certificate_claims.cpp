#include <trustgate/schema/certificate_claims.hpp>

#include <fmt/format.h>

#include <array>
#include <string_view>
#include <variant>

namespace trustgate::schema {

namespace {

inline constexpr auto kReservedFields =
    std::array{certificate_field::kOrganizationName,
               certificate_field::kOrganizationId,
               certificate_field::kCertificateType,
               certificate_field::kName,
               certificate_field::kEmail,
               certificate_field::kDepartment,
               certificate_field::kTitle,
               certificate_field::kEmployeeId,
               certificate_field::kPermissions,
               certificate_field::kValidFrom,
               certificate_field::kValidUntil};

void put_optional(certificate_fields_t& fields,
                  const std::string_view key,
                  const std::optional<std::string>& value) {
  if (value.has_value() && !value->empty()) {
    fields[std::string{key}] = value.value();
  }
}

std::optional<std::string> lookup(const certificate_fields_t& fields,
                                  const std::string_view key) {
  auto it = fields.find(std::string{key});
  if (it == std::end(fields)) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

bool is_reserved_field(const std::string_view key) {
  for (const auto& reserved : kReservedFields) {
    if (reserved == key) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> validate_request(
    const certificate_request_t& request) {
  if (request.subject.empty()) {
    return std::string{"subject public key is required"};
  }
  if (request.certificate_type == certificate_type_t::unverified) {
    return std::string{"certificate type 'unverified' cannot be issued"};
  }

  auto error = std::optional<std::string>{};
  std::visit(
      overloaded{
          [&](const person_claims& claims) {
            if (!is_person_type(request.certificate_type)) {
              error = fmt::format("person claims do not fit type '{}'",
                                  to_string(request.certificate_type));
            } else if (claims.name.empty() || claims.email.empty()) {
              error = std::string{"name and email are required"};
            }
          },
          [&](const agent_claims& claims) {
            if (!is_agent_type(request.certificate_type)) {
              error = fmt::format("agent claims do not fit type '{}'",
                                  to_string(request.certificate_type));
            } else if (claims.name.empty() || claims.email.empty()) {
              error = std::string{"name and operator email are required"};
            }
          }},
      request.claims);
  if (error) {
    return error;
  }

  for (const auto& [key, value] : request.extensions) {
    static_cast<void>(value);
    if (key.empty()) {
      return std::string{"extension keys must not be empty"};
    }
    if (is_reserved_field(key)) {
      return fmt::format("extension '{}' collides with a reserved field", key);
    }
  }

  if (request.valid_from && request.valid_until &&
      request.valid_from.value() > request.valid_until.value()) {
    return std::string{"validFrom is after validUntil"};
  }
  return std::nullopt;
}

void flatten_claims(const certificate_claims_t& claims,
                    const certificate_extensions_t& extensions,
                    certificate_fields_t& fields) {
  for (const auto& [key, value] : extensions) {
    fields[key] = value;
  }
  std::visit(overloaded{[&](const person_claims& value) {
                          fields[std::string{certificate_field::kName}] =
                              value.name;
                          fields[std::string{certificate_field::kEmail}] =
                              value.email;
                          put_optional(fields, certificate_field::kDepartment,
                                       value.department);
                          put_optional(fields, certificate_field::kTitle,
                                       value.title);
                          put_optional(fields, certificate_field::kEmployeeId,
                                       value.employee_id);
                          put_optional(fields, certificate_field::kPermissions,
                                       value.permissions);
                        },
                        [&](const agent_claims& value) {
                          fields[std::string{certificate_field::kName}] =
                              value.name;
                          fields[std::string{certificate_field::kEmail}] =
                              value.email;
                          put_optional(fields, certificate_field::kDepartment,
                                       value.department);
                          put_optional(fields, certificate_field::kPermissions,
                                       value.permissions);
                        }},
             claims);
}

std::optional<certificate_claims_t> try_parse_claims(
    const certificate_type_t type,
    const certificate_fields_t& fields) {
  auto name = lookup(fields, certificate_field::kName);
  auto email = lookup(fields, certificate_field::kEmail);
  if (!name || !email) {
    return std::nullopt;
  }

  if (is_person_type(type)) {
    return certificate_claims_t{person_claims{
        .name = name.value(),
        .email = email.value(),
        .department = lookup(fields, certificate_field::kDepartment),
        .title = lookup(fields, certificate_field::kTitle),
        .employee_id = lookup(fields, certificate_field::kEmployeeId),
        .permissions = lookup(fields, certificate_field::kPermissions)}};
  }
  if (is_agent_type(type)) {
    return certificate_claims_t{agent_claims{
        .name = name.value(),
        .email = email.value(),
        .department = lookup(fields, certificate_field::kDepartment),
        .permissions = lookup(fields, certificate_field::kPermissions)}};
  }
  return std::nullopt;
}

certificate_extensions_t extensions_of(const certificate_fields_t& fields) {
  auto extensions = certificate_extensions_t{};
  for (const auto& [key, value] : fields) {
    if (!is_reserved_field(key)) {
      extensions.emplace(key, value);
    }
  }
  return extensions;
}

}  // namespace trustgate::schema
