#include <warden/execution/state_overlay.hpp>

#include <utility>

namespace warden::execution {

state_overlay::state_overlay(record_loader_t loader,
                             std::optional<std::set<schema::address_t>> scope)
    : loader_{std::move(loader)}, scope_{std::move(scope)} {}

std::optional<schema::resource_record_t> state_overlay::load(
    const schema::address_t& address) const {
  if (auto written = writes_.find(address); written != std::end(writes_)) {
    return written->second;
  }
  if (!loader_) {
    return std::nullopt;
  }
  return loader_(address);
}

void state_overlay::write(schema::resource_record_t record) {
  auto address = record.address;
  writes_.insert_or_assign(address, std::move(record));
}

bool state_overlay::in_scope(const schema::address_t& address) const {
  return !scope_.has_value() || scope_->contains(address);
}

state_overlay::savepoint_t state_overlay::savepoint() const {
  return writes_;
}

void state_overlay::restore(savepoint_t savepoint) {
  writes_ = std::move(savepoint);
}

const std::map<schema::address_t, schema::resource_record_t>&
state_overlay::writes() const {
  return writes_;
}

}  // namespace warden::execution
