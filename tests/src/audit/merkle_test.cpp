#include <gtest/gtest.h>
#include <trustgate/audit/merkle.hpp>
#include <trustgate/blake3/hash.hpp>

#include <string>
#include <vector>

namespace {

trustgate::schema::hash_hex_t leaf(const char c) {
  return trustgate::blake3::hash_hex(std::string(1, c));
}

trustgate::schema::hash_hex_t parent(const trustgate::schema::hash_hex_t& left,
                                     const trustgate::schema::hash_hex_t& right) {
  return trustgate::blake3::hash_hex(left + right);
}

}  // namespace

TEST(blake3, hash_hex_matches_reference_vector) {
  EXPECT_EQ(trustgate::blake3::hash_hex(""),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3, incremental_hasher_matches_one_shot) {
  auto hasher = trustgate::blake3::hasher{};
  hasher.update(std::string_view{"hello "}).update(std::string_view{"world"});
  EXPECT_EQ(hasher.finalize(), trustgate::blake3::hash("hello world"));
}

TEST(merkle, empty_leaves_give_zero_hash) {
  EXPECT_EQ(trustgate::audit::compute_merkle_root({}),
            trustgate::schema::make_zero_hash_hex());
}

TEST(merkle, single_leaf_is_its_own_root) {
  EXPECT_EQ(trustgate::audit::compute_merkle_root({leaf('a')}), leaf('a'));
}

TEST(merkle, pairs_hash_concatenated_hex) {
  EXPECT_EQ(trustgate::audit::compute_merkle_root({leaf('a'), leaf('b')}),
            parent(leaf('a'), leaf('b')));
}

TEST(merkle, odd_levels_duplicate_the_last_leaf) {
  auto expected = parent(parent(leaf('a'), leaf('b')),
                         parent(leaf('c'), leaf('c')));
  EXPECT_EQ(
      trustgate::audit::compute_merkle_root({leaf('a'), leaf('b'), leaf('c')}),
      expected);

  auto five = std::vector{leaf('a'), leaf('b'), leaf('c'), leaf('d'),
                          leaf('e')};
  auto left = parent(parent(leaf('a'), leaf('b')), parent(leaf('c'), leaf('d')));
  auto right = parent(parent(leaf('e'), leaf('e')),
                      parent(leaf('e'), leaf('e')));
  EXPECT_EQ(trustgate::audit::compute_merkle_root(five), parent(left, right));
}

TEST(merkle, root_is_deterministic_and_order_sensitive) {
  auto leaves = std::vector{leaf('a'), leaf('b'), leaf('c'), leaf('d')};
  EXPECT_EQ(trustgate::audit::compute_merkle_root(leaves),
            trustgate::audit::compute_merkle_root(leaves));
  auto swapped = std::vector{leaf('b'), leaf('a'), leaf('c'), leaf('d')};
  EXPECT_NE(trustgate::audit::compute_merkle_root(leaves),
            trustgate::audit::compute_merkle_root(swapped));
}
