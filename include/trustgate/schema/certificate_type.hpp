#pragma once

#include <trustgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: certificate type.
// Identity workflow: role a certificate grants its subject. People hold
// employee/admin/contractor, automated principals hold bot/service.
// `unverified` is never issued; the gate reports it in development mode for
// keys with no registered certificate.
namespace trustgate::schema {

enum class certificate_type_t : uint8_t {
  employee = 0,
  admin = 1,
  contractor = 2,
  bot = 3,
  service = 4,
  unverified = 255
};

inline constexpr auto kCertificateTypeNames = enum_names_t<certificate_type_t, 6>{{
     {"employee", certificate_type_t::employee},
     {"admin", certificate_type_t::admin},
     {"contractor", certificate_type_t::contractor},
     {"bot", certificate_type_t::bot},
     {"service", certificate_type_t::service},
     {"unverified", certificate_type_t::unverified}}};

template <>
inline std::optional<certificate_type_t> try_from_string<certificate_type_t>(
    const std::string_view value) {
  return find_enum(value, kCertificateTypeNames);
}

inline constexpr std::string_view to_string(const certificate_type_t value) {
  return name_of(value, kCertificateTypeNames);
}

inline constexpr bool is_person_type(const certificate_type_t value) {
  return value == certificate_type_t::employee ||
         value == certificate_type_t::admin ||
         value == certificate_type_t::contractor;
}

inline constexpr bool is_agent_type(const certificate_type_t value) {
  return value == certificate_type_t::bot ||
         value == certificate_type_t::service;
}

}  // namespace trustgate::schema
