#pragma once

#include <trustgate/schema/primitives.hpp>

#include <cstddef>
#include <string>

namespace trustgate::crypto {

/// CSPRNG bytes from OpenSSL. Entropy failure is fatal.
trustgate::schema::bytes_t random_bytes(std::size_t count);

/// `count` random bytes as lowercase hex.
std::string random_hex(std::size_t count);

}  // namespace trustgate::crypto
