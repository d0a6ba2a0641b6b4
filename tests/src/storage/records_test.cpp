#include <gtest/gtest.h>
#include <trustgate/storage/records.hpp>
#include <trustgate/storage/rocksdb/storage.hpp>
#include <trustgate/testing/common.hpp>

#include <optional>
#include <string>

namespace {

trustgate::schema::issued_certificate_t make_record(const std::string& serial) {
  auto record = trustgate::schema::issued_certificate_t{};
  record.certificate.type = "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=";
  record.certificate.serial_number = serial;
  record.certificate.subject = std::string(66, 'a');
  record.certificate.certifier = std::string(66, 'b');
  record.certificate.revocation_outpoint = std::string(64, 'c') + ":0";
  record.certificate.fields = {{"name", "Ada Lovelace"},
                               {"email", "ada@example.com"}};
  record.certificate.signature = "3044";
  record.issued_at = trustgate::testing::kStartMs;
  record.issued_by = record.certificate.certifier;
  record.subject = record.certificate.subject;
  record.certificate_type = trustgate::schema::certificate_type_t::contractor;
  return record;
}

trustgate::schema::blockchain_anchor_t make_anchor(const std::string& tx_id) {
  auto anchor = trustgate::schema::blockchain_anchor_t{};
  anchor.tx_id = tx_id;
  anchor.block_height = 7;
  anchor.timestamp = trustgate::testing::kStartMs;
  anchor.entry_hashes = {std::string(64, '1'), std::string(64, '2')};
  return anchor;
}

}  // namespace

TEST(storage_records, audit_keys_sort_in_append_order) {
  auto first = trustgate::storage::make_audit_entry_key(255);
  auto second = trustgate::storage::make_audit_entry_key(256);
  EXPECT_EQ(first.size(),
            trustgate::storage::kAuditEntryPrefix.size() + sizeof(uint64_t));
  EXPECT_LT(first, second);
  EXPECT_EQ(trustgate::storage::make_certificate_key("abc"),
            trustgate::schema::make_bytes(std::string{"CA|CERT|abc"}));
}

TEST(storage_records, issued_certificate_round_trips) {
  auto db = trustgate::testing::make_db_path("trustgate_records_certificate");
  {
    auto store =
        trustgate::storage::make_storage<trustgate::storage::rocksdb_storage_tag>(
            db);
    auto record = make_record("serial-1");
    trustgate::storage::save_issued_certificate(store, record);

    auto loaded = trustgate::storage::load_issued_certificate(store, "serial-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->certificate.fields, record.certificate.fields);
    EXPECT_EQ(loaded->certificate.revocation_outpoint,
              record.certificate.revocation_outpoint);
    EXPECT_EQ(loaded->certificate_type, record.certificate_type);
    EXPECT_FALSE(loaded->revoked);
    EXPECT_FALSE(loaded->revoked_at.has_value());
    EXPECT_FALSE(
        trustgate::storage::load_issued_certificate(store, "missing").has_value());

    record.revoked = true;
    record.revoked_at = trustgate::testing::kStartMs + 1;
    record.revocation_reason = "Left the company";
    record.revocation_propagated = false;
    trustgate::storage::save_issued_certificate(store, record);
    trustgate::storage::save_issued_certificate(store, make_record("serial-2"));

    auto all = trustgate::storage::load_issued_certificates(store);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].certificate.serial_number, "serial-1");
    EXPECT_TRUE(all[0].revoked);
    EXPECT_EQ(all[0].revocation_reason, "Left the company");
    EXPECT_FALSE(all[0].revocation_propagated);
    EXPECT_FALSE(all[1].revoked);
  }
  trustgate::testing::remove_path(db);
}

TEST(storage_records, audit_chain_is_saved_and_replaced) {
  auto db = trustgate::testing::make_db_path("trustgate_records_audit");
  {
    auto store =
        trustgate::storage::make_storage<trustgate::storage::rocksdb_storage_tag>(
            db);
    auto empty = trustgate::storage::load_audit_chain(store);
    EXPECT_TRUE(empty.entries.empty());
    EXPECT_EQ(empty.anchored_entries, 0u);

    trustgate::storage::save_audit_entry(store, 0, R"({"index":0})");
    trustgate::storage::save_audit_entry(store, 1, R"({"index":1})");
    trustgate::storage::save_audit_anchor(store, 0, make_anchor("tx-1"), 2);

    auto loaded = trustgate::storage::load_audit_chain(store);
    ASSERT_EQ(loaded.entries.size(), 2u);
    EXPECT_EQ(loaded.entries[1], R"({"index":1})");
    ASSERT_EQ(loaded.anchors.size(), 1u);
    EXPECT_EQ(loaded.anchors[0].tx_id, "tx-1");
    EXPECT_EQ(loaded.anchors[0].entry_hashes.size(), 2u);
    EXPECT_EQ(loaded.anchored_entries, 2u);

    auto replacement = trustgate::storage::stored_audit_chain{};
    replacement.entries = {R"({"index":"imported"})"};
    trustgate::storage::replace_audit_chain(store, replacement);

    auto replaced = trustgate::storage::load_audit_chain(store);
    ASSERT_EQ(replaced.entries.size(), 1u);
    EXPECT_EQ(replaced.entries[0], R"({"index":"imported"})");
    EXPECT_TRUE(replaced.anchors.empty());
    EXPECT_EQ(replaced.anchored_entries, 0u);
  }
  trustgate::testing::remove_path(db);
}
