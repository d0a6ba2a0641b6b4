#pragma once

#include <trustgate/schema/audit_entry.hpp>
#include <trustgate/schema/issued_certificate.hpp>
#include <trustgate/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Persistent layout of the trust state.
//   CA|CERT|<serial>           issued certificate record
//   CA|META|ORGANIZATION       organization id stamped into certificate types
//   AUDIT|ENTRY|<index:be64>   exact canonical entry JSON
//   AUDIT|ANCHOR|<index:be64>  blockchain anchor
//   AUDIT|META|ANCHORED        number of entries covered by anchors
namespace trustgate::storage {

inline constexpr auto kCertificatePrefix = std::string_view{"CA|CERT|"};
inline constexpr auto kOrganizationIdKey =
    std::string_view{"CA|META|ORGANIZATION"};
inline constexpr auto kAuditPrefix = std::string_view{"AUDIT|"};
inline constexpr auto kAuditEntryPrefix = std::string_view{"AUDIT|ENTRY|"};
inline constexpr auto kAuditAnchorPrefix = std::string_view{"AUDIT|ANCHOR|"};
inline constexpr auto kAuditAnchoredKey =
    std::string_view{"AUDIT|META|ANCHORED"};

trustgate::schema::bytes_t make_certificate_key(std::string_view serial);
trustgate::schema::bytes_t make_audit_entry_key(uint64_t index);
trustgate::schema::bytes_t make_audit_anchor_key(uint64_t index);

void save_issued_certificate(
    const rocksdb_storage_t& store,
    const trustgate::schema::issued_certificate_t& record);
std::optional<trustgate::schema::issued_certificate_t> load_issued_certificate(
    const rocksdb_storage_t& store,
    std::string_view serial);
std::vector<trustgate::schema::issued_certificate_t> load_issued_certificates(
    const rocksdb_storage_t& store);

void save_organization_id(const rocksdb_storage_t& store,
                          const std::string& organization_id);
std::optional<std::string> load_organization_id(const rocksdb_storage_t& store);

struct stored_audit_chain final {
  std::vector<std::string> entries;
  std::vector<trustgate::schema::blockchain_anchor_t> anchors;
  uint64_t anchored_entries{};
};

void save_audit_entry(const rocksdb_storage_t& store,
                      uint64_t index,
                      const std::string& entry_json);
void save_audit_anchor(const rocksdb_storage_t& store,
                       uint64_t index,
                       const trustgate::schema::blockchain_anchor_t& anchor,
                       uint64_t anchored_entries);
stored_audit_chain load_audit_chain(const rocksdb_storage_t& store);

/// Replaces everything under `AUDIT|` in one write batch.
void replace_audit_chain(const rocksdb_storage_t& store,
                         const stored_audit_chain& chain);

}  // namespace trustgate::storage
