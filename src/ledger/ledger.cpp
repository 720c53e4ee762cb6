#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/ledger/ledger.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/engine_keys.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <tuple>

namespace warden::ledger {

namespace {

using encoder_t = warden::schema::encoding::scale_encoder_t;

warden::schema::hash32_t fold_state_root(
    const warden::schema::hash32_t& previous,
    const warden::schema::bytes_t& signing_message,
    const uint64_t sequence) {
  auto encoder = encoder_t{};
  auto encoded_sequence = encoder.encode(sequence);
  return warden::blake3::hasher{}
      .update(warden::schema::bytes_view_t{previous})
      .update(warden::schema::make_bytes_view(signing_message))
      .update(warden::schema::make_bytes_view(encoded_sequence))
      .finalize();
}

std::vector<warden::storage::key_value_entry_t> make_entries(
    const std::map<warden::schema::address_t,
                   warden::schema::resource_record_t>& records) {
  auto encoder = encoder_t{};
  auto entries = std::vector<warden::storage::key_value_entry_t>{};
  entries.reserve(records.size());
  for (const auto& [address, record] : records) {
    entries.emplace_back(warden::schema::key::make_record_key(address),
                         encoder.encode(record));
  }
  return entries;
}

}  // namespace

ledger::ledger(
    const warden::execution::engine& engine,
    warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
    const std::size_t lock_stripes)
    : engine_{engine},
      storage_{storage},
      stripes_(std::max<std::size_t>(lock_stripes, 1)) {
  load_persisted_state();
  spdlog::info("Ledger ready at sequence {} with {} lock stripe(s)", sequence_,
               stripes_.size());
}

warden::schema::operation_result_t ledger::submit(
    const warden::schema::operation_request_t& request) {
  auto addresses = std::vector<warden::schema::address_t>{};
  addresses.reserve(request.slots.size());
  for (const auto& slot : request.slots) {
    addresses.push_back(slot.address);
  }
  auto locks = lock_addresses(addresses);

  auto overlay = warden::execution::state_overlay{
      [this](const warden::schema::address_t& address) {
        return load(address);
      },
      std::set<warden::schema::address_t>{std::begin(addresses),
                                          std::end(addresses)}};
  auto result = engine_.process(request, overlay);
  if (!warden::schema::is_accepted(result)) {
    return result;
  }

  auto entries = make_entries(overlay.writes());
  const auto signing_message = warden::execution::make_signing_message(request);
  auto next_sequence = uint64_t{};
  {
    auto commit_lock = std::scoped_lock{commit_mutex_};
    next_sequence = sequence_ + 1;
    const auto next_root =
        fold_state_root(state_root_, signing_message, next_sequence);
    storage_.commit(entries, warden::storage::committed_state{
                                 .sequence = next_sequence,
                                 .state_root = next_root});
    sequence_ = next_sequence;
    state_root_ = next_root;
  }
  spdlog::debug("Committed '{}' at sequence {} with {} record write(s)",
                request.operation_type, next_sequence, entries.size());
  return result;
}

warden::schema::operation_result_t ledger::check(
    const warden::schema::operation_request_t& request) const {
  auto overlay = warden::execution::state_overlay{
      [this](const warden::schema::address_t& address) {
        return load(address);
      }};
  return engine_.check(request, overlay);
}

std::optional<warden::schema::resource_record_t> ledger::load(
    const warden::schema::address_t& address) const {
  auto encoder = encoder_t{};
  auto key = warden::schema::key::make_record_key(address);
  return storage_.get<warden::schema::resource_record_t>(
      encoder, warden::schema::make_bytes_view(key));
}

void ledger::install(
    const std::vector<warden::schema::resource_record_t>& records) {
  auto addresses = std::vector<warden::schema::address_t>{};
  auto by_address = std::map<warden::schema::address_t,
                             warden::schema::resource_record_t>{};
  for (const auto& record : records) {
    addresses.push_back(record.address);
    by_address.insert_or_assign(record.address, record);
  }
  auto locks = lock_addresses(addresses);
  auto commit_lock = std::scoped_lock{commit_mutex_};
  storage_.commit(make_entries(by_address),
                  warden::storage::committed_state{.sequence = sequence_,
                                                   .state_root = state_root_});
  spdlog::info("Installed {} genesis record(s)", by_address.size());
}

std::vector<warden::schema::resource_record_t> ledger::records() const {
  auto encoder = encoder_t{};
  auto out = std::vector<warden::schema::resource_record_t>{};
  auto entries = storage_.list_by_prefix(
      warden::schema::make_bytes_view(warden::schema::key::kRecordKeyPrefix));
  out.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    if (!warden::schema::key::parse_record_key(key).has_value()) {
      continue;
    }
    out.push_back(encoder.decode<warden::schema::resource_record_t>(value));
  }
  return out;
}

ledger_info ledger::info() const {
  auto lock = std::scoped_lock{commit_mutex_};
  return ledger_info{.sequence = sequence_, .state_root = state_root_};
}

std::size_t ledger::stripe_of(const warden::schema::address_t& address) const {
  auto value = std::size_t{};
  for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
    value = (value << 8u) | address[i];
  }
  return value % stripes_.size();
}

std::vector<std::unique_lock<std::mutex>> ledger::lock_addresses(
    const std::vector<warden::schema::address_t>& addresses) const {
  auto indices = std::set<std::size_t>{};
  for (const auto& address : addresses) {
    indices.insert(stripe_of(address));
  }
  auto locks = std::vector<std::unique_lock<std::mutex>>{};
  locks.reserve(indices.size());
  for (const auto index : indices) {
    locks.emplace_back(stripes_[index]);
  }
  return locks;
}

void ledger::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  if (auto committed = storage_.load_committed_state()) {
    sequence_ = committed->sequence;
    state_root_ = committed->state_root;
  }
}

}  // namespace warden::ledger
