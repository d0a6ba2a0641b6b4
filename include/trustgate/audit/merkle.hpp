#pragma once

#include <trustgate/schema/primitives.hpp>

#include <vector>

namespace trustgate::audit {

/// Binary Merkle root over hex leaf hashes. Each parent is the hash of the
/// concatenated left and right hex strings; an odd level pairs its last leaf
/// with itself. No leaves give 64 zeros, one leaf is its own root.
trustgate::schema::hash_hex_t compute_merkle_root(
    std::vector<trustgate::schema::hash_hex_t> leaves);

}  // namespace trustgate::audit
