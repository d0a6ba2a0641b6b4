#include <gtest/gtest.h>
#include <trustgate/common/clock.hpp>
#include <trustgate/common/format.hpp>
#include <trustgate/schema/certificate_type.hpp>
#include <trustgate/schema/primitives.hpp>
#include <trustgate/schema/trust_error_code.hpp>

TEST(primitives, hex_round_trips_bytes) {
  auto payload = trustgate::schema::bytes_t{0x00, 0x01, 0xAB, 0xFE, 0xFF};
  auto encoded =
      trustgate::schema::to_hex(trustgate::schema::make_bytes_view(payload));
  EXPECT_EQ(encoded, "0001abfeff");
  auto decoded = trustgate::schema::try_from_hex(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded.value(), payload);
}

TEST(primitives, try_from_hex_accepts_prefix_and_rejects_garbage) {
  EXPECT_TRUE(trustgate::schema::try_from_hex("0xABcd").has_value());
  EXPECT_FALSE(trustgate::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(trustgate::schema::try_from_hex("zz").has_value());
}

TEST(primitives, try_make_hash32_requires_32_bytes) {
  auto hash = trustgate::schema::try_make_hash32(
      "0102030405060708090a0b0c0d0e0f10"
      "1112131415161718191a1b1c1d1e1f20");
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_FALSE(trustgate::schema::try_make_hash32("0102").has_value());
}

TEST(primitives, zero_hash_hex_is_64_zeros) {
  auto zero = trustgate::schema::make_zero_hash_hex();
  EXPECT_EQ(zero.size(), 64u);
  EXPECT_EQ(zero.find_first_not_of('0'), std::string::npos);
}

TEST(primitives, certificate_type_strings_round_trip) {
  using trustgate::schema::certificate_type_t;
  for (auto type : {certificate_type_t::employee, certificate_type_t::admin,
                    certificate_type_t::contractor, certificate_type_t::bot,
                    certificate_type_t::service}) {
    auto parsed = trustgate::schema::try_from_string<certificate_type_t>(
        trustgate::schema::to_string(type));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), type);
  }
  EXPECT_FALSE(trustgate::schema::try_from_string<certificate_type_t>("intern")
                   .has_value());
  EXPECT_TRUE(trustgate::schema::is_agent_type(certificate_type_t::service));
  EXPECT_TRUE(trustgate::schema::is_person_type(certificate_type_t::admin));
  EXPECT_FALSE(trustgate::schema::is_person_type(certificate_type_t::bot));
}

TEST(primitives, trust_error_code_names_are_stable) {
  using trustgate::schema::trust_error_code;
  EXPECT_EQ(trustgate::schema::to_string(trust_error_code::chain_linkage_broken),
            "chain_linkage_broken");
  EXPECT_EQ(trustgate::schema::try_from_string<trust_error_code>(
                "timing_anomaly"),
            trust_error_code::timing_anomaly);
}

TEST(primitives, iso8601_formats_and_parses_milliseconds) {
  auto ms = trustgate::schema::timestamp_milliseconds_t{1700000000123};
  auto text = trustgate::common::format_iso8601(ms);
  EXPECT_EQ(text, "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(trustgate::common::parse_iso8601(text), ms);
  EXPECT_EQ(trustgate::common::parse_iso8601("2023-11-14"),
            trustgate::schema::timestamp_milliseconds_t{1699920000000});
  EXPECT_EQ(trustgate::common::parse_iso8601("2023-11-14T22:13:20"),
            trustgate::schema::timestamp_milliseconds_t{1700000000000});
}

TEST(primitives, iso8601_rejects_malformed_dates) {
  EXPECT_FALSE(trustgate::common::parse_iso8601("").has_value());
  EXPECT_FALSE(trustgate::common::parse_iso8601("2023-13-01").has_value());
  EXPECT_FALSE(trustgate::common::parse_iso8601("2023-02-30").has_value());
  EXPECT_FALSE(
      trustgate::common::parse_iso8601("2023-11-14T25:00:00").has_value());
  EXPECT_FALSE(trustgate::common::parse_iso8601("not a date").has_value());
}

TEST(primitives, short_key_truncates_long_values) {
  EXPECT_EQ(trustgate::common::short_key("abc"), "abc");
  EXPECT_EQ(trustgate::common::short_key(std::string(66, 'f')),
            std::string(16, 'f') + "...");
}
