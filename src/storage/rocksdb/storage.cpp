#include <rocksdb/iterator.h>
#include <rocksdb/write_batch.h>
#include <warden/common/critical.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <tuple>

namespace warden::storage {

namespace {

using encoder_t = warden::schema::encoding::scale_encoder_t;
using committed_encoding_t = std::tuple<uint64_t, warden::schema::hash32_t>;

warden::schema::bytes_t encode_committed_state(const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(committed_encoding_t{state.sequence, state.state_root});
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    warden::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB ledger store at {}", path);
  store.database.reset(database);

  return store;
}

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::checked_database() const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  return *database;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = std::string{};
  auto status = checked_database().Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      std::string{warden::schema::key::kCommittedStateKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    warden::common::critical("failed to load committed state: {}",
                             status.ToString());
  }

  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<committed_encoding_t>(
      warden::schema::make_bytes_view(std::string_view{raw}));
  if (!decoded.has_value()) {
    warden::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(*decoded),
                         .state_root = std::get<1>(*decoded)};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  auto encoded = encode_committed_state(state);
  auto status = checked_database().Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      std::string{warden::schema::key::kCommittedStateKey},
      detail::make_slice(warden::schema::make_bytes_view(encoded)));
  if (!status.ok()) {
    warden::common::critical("failed to persist committed state: {}",
                             status.ToString());
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const warden::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = warden::schema::make_string(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      checked_database().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    warden::common::critical("failed iterating RocksDB prefix: {}",
                             iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::make_slice(warden::schema::make_bytes_view(key)),
                  detail::make_slice(warden::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      warden::common::critical("failed staging ledger write: {}",
                               put_status.ToString());
    }
  }

  auto encoded = encode_committed_state(state);
  auto state_status =
      batch.Put(std::string{warden::schema::key::kCommittedStateKey},
                detail::make_slice(warden::schema::make_bytes_view(encoded)));
  if (!state_status.ok()) {
    warden::common::critical("failed staging committed state: {}",
                             state_status.ToString());
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = checked_database().Write(write_options, &batch);
  if (!write_status.ok()) {
    warden::common::critical("failed to commit ledger batch: {}",
                             write_status.ToString());
  }
}

}  // namespace warden::storage
