#pragma once
#include <warden/schema/primitives.hpp>
#include <warden/schema/resource_record.hpp>

#include <functional>
#include <map>
#include <optional>
#include <set>

namespace warden::execution {

using record_loader_t = std::function<std::optional<schema::resource_record_t>(
    const schema::address_t&)>;

/// Copy-on-write view of ledger records for the duration of one submitted
/// operation, including everything it invokes.
///
/// Reads fall through to `loader` for untouched addresses. When a scope is
/// given, only addresses inside it may be referenced.
class state_overlay final {
 public:
  using savepoint_t = std::map<schema::address_t, schema::resource_record_t>;

  explicit state_overlay(
      record_loader_t loader,
      std::optional<std::set<schema::address_t>> scope = std::nullopt);

  std::optional<schema::resource_record_t> load(
      const schema::address_t& address) const;

  void write(schema::resource_record_t record);

  bool in_scope(const schema::address_t& address) const;

  savepoint_t savepoint() const;
  void restore(savepoint_t savepoint);

  /// Every record written since construction, keyed by address.
  const std::map<schema::address_t, schema::resource_record_t>& writes() const;

 private:
  record_loader_t loader_;
  std::optional<std::set<schema::address_t>> scope_;
  std::map<schema::address_t, schema::resource_record_t> writes_;
};

}  // namespace warden::execution
