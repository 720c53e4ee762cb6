#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/execution/type_tag_registry.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace warden::execution {

schema::type_tag_t type_tag_registry::compute_tag(const std::string_view name) {
  auto digest =
      warden::blake3::hasher{}.update(kTypeTagDomain).update(name).finalize();
  auto tag = schema::type_tag_t{};
  std::copy_n(std::begin(digest), tag.size(), std::begin(tag));
  return tag;
}

schema::status_t type_tag_registry::register_type(schema::record_type_t type) {
  auto lock = std::scoped_lock{mutex_};
  if (types_.contains(type.name)) {
    return schema::make_error(schema::error_kind::type_tag_collision,
                              "type '" + type.name + "' already registered");
  }
  auto tag = compute_tag(type.name);
  if (auto owner = tag_owners_.find(tag); owner != std::end(tag_owners_)) {
    spdlog::error("Type tag collision between '{}' and '{}'", owner->second,
                  type.name);
    return schema::make_error(
        schema::error_kind::type_tag_collision,
        "type '" + type.name + "' collides with '" + owner->second + "'");
  }
  spdlog::debug("Registered record type '{}' with tag {}", type.name,
                schema::to_hex(tag));
  tag_owners_.emplace(tag, type.name);
  tag_cache_.emplace(type.name, tag);
  auto name = type.name;
  types_.emplace(std::move(name), std::move(type));
  return std::nullopt;
}

bool type_tag_registry::contains(const std::string_view name) const {
  auto lock = std::scoped_lock{mutex_};
  return types_.find(name) != std::end(types_);
}

schema::type_tag_t type_tag_registry::tag_for(
    const std::string_view name) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto cached = tag_cache_.find(name); cached != std::end(tag_cache_)) {
    return cached->second;
  }
  auto tag = compute_tag(name);
  tag_cache_.emplace(std::string{name}, tag);
  return tag;
}

schema::status_t type_tag_registry::verify(
    const schema::resource_record_t& record,
    const std::string_view expected) const {
  if (record.type_tag == tag_for(expected)) {
    return std::nullopt;
  }
  return schema::make_error(
      schema::error_kind::type_tag_mismatch,
      "record " + schema::to_hex(record.address) + " is not a '" +
          std::string{expected} + "'");
}

std::optional<schema::field_layout_t> type_tag_registry::field(
    const std::string_view type,
    const std::string_view name) const {
  auto lock = std::scoped_lock{mutex_};
  auto declared = types_.find(type);
  if (declared == std::end(types_)) {
    return std::nullopt;
  }
  const auto& fields = declared->second.fields;
  auto found = std::find_if(
      std::begin(fields), std::end(fields),
      [&](const schema::field_layout_t& layout) { return layout.name == name; });
  if (found == std::end(fields)) {
    return std::nullopt;
  }
  return *found;
}

std::optional<schema::bytes_view_t> type_tag_registry::read_field(
    const schema::resource_record_t& record,
    const schema::field_layout_t& layout) {
  if (layout.offset + layout.size > record.payload.size()) {
    return std::nullopt;
  }
  return schema::bytes_view_t{record.payload}.subspan(layout.offset,
                                                      layout.size);
}

}  // namespace warden::execution
