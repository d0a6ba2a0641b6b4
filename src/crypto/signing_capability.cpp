#include <trustgate/crypto/signing_capability.hpp>

#include <fmt/format.h>

namespace trustgate::crypto {

std::string make_invoice(const protocol_id_t& protocol,
                         const std::string_view& key_id) {
  return fmt::format("{}-{}-{}", protocol.security_level, protocol.name,
                     key_id);
}

}  // namespace trustgate::crypto
