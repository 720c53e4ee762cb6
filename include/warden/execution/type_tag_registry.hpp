#pragma once
#include <warden/schema/error.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/record_type.hpp>
#include <warden/schema/resource_record.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace warden::execution {

inline constexpr std::string_view kTypeTagDomain{"record:"};

/// Maps declared record type names to their 8-byte discriminators and field
/// layouts.
///
/// Types are registered while the engine is assembled; lookups are safe from
/// any thread afterwards.
class type_tag_registry final {
 public:
  /// First 8 bytes of blake3("record:" + name).
  static schema::type_tag_t compute_tag(std::string_view name);

  /// Fails with `type_tag_collision` on a duplicate name or when the tag is
  /// already owned by a different type.
  schema::status_t register_type(schema::record_type_t type);

  bool contains(std::string_view name) const;

  schema::type_tag_t tag_for(std::string_view name) const;

  /// `type_tag_mismatch` unless the record carries the tag of `expected`.
  schema::status_t verify(const schema::resource_record_t& record,
                          std::string_view expected) const;

  std::optional<schema::field_layout_t> field(std::string_view type,
                                              std::string_view name) const;

  /// Field bytes, or nothing when the payload is shorter than the layout.
  static std::optional<schema::bytes_view_t> read_field(
      const schema::resource_record_t& record,
      const schema::field_layout_t& layout);

 private:
  mutable std::mutex mutex_;
  mutable std::map<std::string, schema::type_tag_t, std::less<>> tag_cache_;
  std::map<std::string, schema::record_type_t, std::less<>> types_;
  std::map<schema::type_tag_t, std::string> tag_owners_;
};

}  // namespace warden::execution
