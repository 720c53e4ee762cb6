#pragma once

#include <warden/execution/engine.hpp>
#include <warden/schema/operation_request.hpp>
#include <warden/schema/operation_result.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/resource_record.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace warden::ledger {

struct ledger_info final {
  uint64_t sequence{};
  warden::schema::hash32_t state_root{};
};

/// Durable host for the engine.
///
/// Operations that share an address are serialized through striped locks,
/// always taken in ascending stripe order; operations on disjoint addresses
/// run concurrently. An accepted operation's records, the new sequence number
/// and the folded state root land in a single RocksDB write batch.
class ledger final {
 public:
  ledger(const warden::execution::engine& engine,
         warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
         std::size_t lock_stripes = 64);

  warden::schema::operation_result_t submit(
      const warden::schema::operation_request_t& request);

  /// Admission only; nothing is written.
  warden::schema::operation_result_t check(
      const warden::schema::operation_request_t& request) const;

  std::optional<warden::schema::resource_record_t> load(
      const warden::schema::address_t& address) const;

  /// Seed records directly, bypassing the engine. Used for genesis state.
  void install(const std::vector<warden::schema::resource_record_t>& records);

  /// Every stored record, ordered by address.
  std::vector<warden::schema::resource_record_t> records() const;

  ledger_info info() const;

 private:
  std::vector<std::unique_lock<std::mutex>> lock_addresses(
      const std::vector<warden::schema::address_t>& addresses) const;
  std::size_t stripe_of(const warden::schema::address_t& address) const;
  void load_persisted_state();

  const warden::execution::engine& engine_;
  warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage_;
  mutable std::vector<std::mutex> stripes_;
  mutable std::mutex commit_mutex_;
  uint64_t sequence_{};
  warden::schema::hash32_t state_root_{};
};

}  // namespace warden::ledger
