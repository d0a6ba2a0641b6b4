#include <trustgate/common/critical.hpp>
#include <trustgate/crypto/random.hpp>

#include <openssl/rand.h>

namespace trustgate::crypto {

trustgate::schema::bytes_t random_bytes(const std::size_t count) {
  auto out = trustgate::schema::bytes_t(count);
  if (count == 0) {
    return out;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    trustgate::common::critical("CSPRNG failed to produce random bytes");
  }
  return out;
}

std::string random_hex(const std::size_t count) {
  return trustgate::schema::to_hex(
      trustgate::schema::make_bytes_view(random_bytes(count)));
}

}  // namespace trustgate::crypto
