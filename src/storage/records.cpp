#include <trustgate/common/critical.hpp>
#include <trustgate/schema/encoding/json/certificate.hpp>
#include <trustgate/schema/encoding/json/encoder.hpp>
#include <trustgate/schema/encoding/scale/encoder.hpp>
#include <trustgate/storage/records.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

using namespace trustgate::schema;

namespace trustgate::storage {

namespace {

using encoder_t =
    trustgate::schema::encoding::encoder<encoding::scale_encoder_tag>;
using json_encoder_t =
    trustgate::schema::encoding::encoder<encoding::json_encoder_tag>;

using issued_certificate_record_t =
    std::tuple<uint16_t,
               std::string,
               uint64_t,
               std::string,
               std::string,
               uint8_t,
               bool,
               std::optional<uint64_t>,
               std::optional<std::string>,
               std::optional<std::string>,
               bool>;
using audit_entry_record_t = std::tuple<uint64_t, std::string>;
using audit_anchor_record_t = std::tuple<uint64_t,
                                         std::string,
                                         uint64_t,
                                         uint64_t,
                                         std::vector<std::string>>;

bytes_t make_prefixed_key(const std::string_view prefix,
                          const std::string_view suffix) {
  auto key = make_bytes(prefix);
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

// Big-endian so RocksDB iterates in append order.
bytes_t make_indexed_key(const std::string_view prefix, const uint64_t index) {
  auto key = make_bytes(prefix);
  for (auto shift = 56; shift >= 0; shift -= 8) {
    key.push_back(static_cast<uint8_t>((index >> shift) & 0xff));
  }
  return key;
}

issued_certificate_t from_record(issued_certificate_record_t&& stored) {
  auto& [version, certificate_json, issued_at, issued_by, subject, type,
         revoked, revoked_at, revoked_by, reason, propagated] = stored;

  auto json_encoder = json_encoder_t{};
  auto certificate = json_encoder.try_decode<certificate_t>(
      make_bytes_view(certificate_json));
  if (!certificate) {
    trustgate::common::critical("failed to decode stored certificate JSON");
  }

  auto record = issued_certificate_t{};
  record.version = version;
  record.certificate = std::move(certificate.value());
  record.issued_at = issued_at;
  record.issued_by = std::move(issued_by);
  record.subject = std::move(subject);
  record.certificate_type = static_cast<certificate_type_t>(type);
  record.revoked = revoked;
  record.revoked_at = revoked_at;
  record.revoked_by = std::move(revoked_by);
  record.revocation_reason = std::move(reason);
  record.revocation_propagated = propagated;
  return record;
}

}  // namespace

bytes_t make_certificate_key(const std::string_view serial) {
  return make_prefixed_key(kCertificatePrefix, serial);
}

bytes_t make_audit_entry_key(const uint64_t index) {
  return make_indexed_key(kAuditEntryPrefix, index);
}

bytes_t make_audit_anchor_key(const uint64_t index) {
  return make_indexed_key(kAuditAnchorPrefix, index);
}

void save_issued_certificate(const rocksdb_storage_t& store,
                             const issued_certificate_t& record) {
  auto encoder = encoder_t{};
  auto certificate_json =
      encoding::json::to_canonical(record.certificate);
  auto key = make_certificate_key(record.certificate.serial_number);
  store.put(encoder, make_bytes_view(key),
            issued_certificate_record_t{
                record.version, certificate_json, record.issued_at,
                record.issued_by, record.subject,
                static_cast<uint8_t>(record.certificate_type), record.revoked,
                record.revoked_at, record.revoked_by, record.revocation_reason,
                record.revocation_propagated});
}

std::optional<issued_certificate_t> load_issued_certificate(
    const rocksdb_storage_t& store,
    const std::string_view serial) {
  auto encoder = encoder_t{};
  auto key = make_certificate_key(serial);
  auto stored =
      store.get<issued_certificate_record_t>(encoder, make_bytes_view(key));
  if (!stored) {
    return std::nullopt;
  }
  return from_record(std::move(stored.value()));
}

std::vector<issued_certificate_t> load_issued_certificates(
    const rocksdb_storage_t& store) {
  auto prefix = make_bytes(kCertificatePrefix);
  auto out = std::vector<issued_certificate_t>{};
  for (const auto& [key, value] :
       store.list_by_prefix(make_bytes_view(prefix))) {
    static_cast<void>(key);
    auto encoder = encoder_t{};
    auto decoded = encoder.try_decode<issued_certificate_record_t>(
        make_bytes_view(value));
    if (!decoded) {
      trustgate::common::critical("failed to decode issued certificate record");
    }
    out.push_back(from_record(std::move(decoded.value())));
  }
  return out;
}

void save_organization_id(const rocksdb_storage_t& store,
                          const std::string& organization_id) {
  auto encoder = encoder_t{};
  auto key = make_bytes(kOrganizationIdKey);
  store.put(encoder, make_bytes_view(key),
            std::tuple<std::string>{organization_id});
}

std::optional<std::string> load_organization_id(
    const rocksdb_storage_t& store) {
  auto encoder = encoder_t{};
  auto key = make_bytes(kOrganizationIdKey);
  auto stored =
      store.get<std::tuple<std::string>>(encoder, make_bytes_view(key));
  if (!stored) {
    return std::nullopt;
  }
  return std::get<0>(std::move(stored.value()));
}

void save_audit_entry(const rocksdb_storage_t& store,
                      const uint64_t index,
                      const std::string& entry_json) {
  auto encoder = encoder_t{};
  auto key = make_audit_entry_key(index);
  store.put(encoder, make_bytes_view(key),
            audit_entry_record_t{index, entry_json});
}

void save_audit_anchor(const rocksdb_storage_t& store,
                       const uint64_t index,
                       const blockchain_anchor_t& anchor,
                       const uint64_t anchored_entries) {
  auto encoder = encoder_t{};
  auto key = make_audit_anchor_key(index);
  store.put(encoder, make_bytes_view(key),
            audit_anchor_record_t{index, anchor.tx_id, anchor.block_height,
                                  anchor.timestamp, anchor.entry_hashes});
  auto meta_key = make_bytes(kAuditAnchoredKey);
  store.put(encoder, make_bytes_view(meta_key),
            std::tuple<uint64_t>{anchored_entries});
}

stored_audit_chain load_audit_chain(const rocksdb_storage_t& store) {
  auto encoder = encoder_t{};
  auto chain = stored_audit_chain{};

  auto entry_prefix = make_bytes(kAuditEntryPrefix);
  auto expected_index = uint64_t{};
  for (const auto& [key, value] :
       store.list_by_prefix(make_bytes_view(entry_prefix))) {
    static_cast<void>(key);
    auto decoded =
        encoder.try_decode<audit_entry_record_t>(make_bytes_view(value));
    if (!decoded) {
      trustgate::common::critical("failed to decode audit entry record");
    }
    if (std::get<0>(decoded.value()) != expected_index) {
      trustgate::common::critical(
          "audit entry index {} found where {} was expected",
          std::get<0>(decoded.value()), expected_index);
    }
    chain.entries.push_back(std::move(std::get<1>(decoded.value())));
    ++expected_index;
  }

  auto anchor_prefix = make_bytes(kAuditAnchorPrefix);
  for (const auto& [key, value] :
       store.list_by_prefix(make_bytes_view(anchor_prefix))) {
    static_cast<void>(key);
    auto decoded =
        encoder.try_decode<audit_anchor_record_t>(make_bytes_view(value));
    if (!decoded) {
      trustgate::common::critical("failed to decode audit anchor record");
    }
    auto& [index, tx_id, block_height, timestamp, entry_hashes] =
        decoded.value();
    static_cast<void>(index);
    chain.anchors.push_back(blockchain_anchor_t{.tx_id = std::move(tx_id),
                                                .block_height = block_height,
                                                .timestamp = timestamp,
                                                .entry_hashes =
                                                    std::move(entry_hashes)});
  }

  auto meta_key = make_bytes(kAuditAnchoredKey);
  if (auto anchored =
          store.get<std::tuple<uint64_t>>(encoder, make_bytes_view(meta_key))) {
    chain.anchored_entries = std::get<0>(anchored.value());
  }
  return chain;
}

void replace_audit_chain(const rocksdb_storage_t& store,
                         const stored_audit_chain& chain) {
  auto encoder = encoder_t{};
  auto entries = std::vector<key_value_entry_t>{};
  for (auto index = uint64_t{}; index < chain.entries.size(); ++index) {
    entries.emplace_back(
        make_audit_entry_key(index),
        encoder.encode(audit_entry_record_t{index, chain.entries[index]}));
  }
  for (auto index = uint64_t{}; index < chain.anchors.size(); ++index) {
    const auto& anchor = chain.anchors[index];
    entries.emplace_back(
        make_audit_anchor_key(index),
        encoder.encode(audit_anchor_record_t{index, anchor.tx_id,
                                             anchor.block_height,
                                             anchor.timestamp,
                                             anchor.entry_hashes}));
  }
  entries.emplace_back(make_bytes(kAuditAnchoredKey),
                       encoder.encode(std::tuple<uint64_t>{
                           chain.anchored_entries}));
  auto prefix = make_bytes(kAuditPrefix);
  store.replace_by_prefix(make_bytes_view(prefix), entries);
}

}  // namespace trustgate::storage
