#include <warden/execution/authorization_checker.hpp>

#include <utility>

namespace warden::execution {

authorization_context::authorization_context(
    std::set<schema::identity_t> identities)
    : identities_{std::move(identities)} {}

bool authorization_context::endorsed_by(
    const schema::identity_t& identity) const {
  return identities_.contains(identity);
}

const std::set<schema::identity_t>& authorization_context::identities() const {
  return identities_;
}

schema::status_t require_endorsement(const authorization_context& context,
                                     const schema::identity_t& identity) {
  if (context.endorsed_by(identity)) {
    return std::nullopt;
  }
  return schema::make_error(schema::error_kind::missing_endorsement,
                            "missing endorsement from " +
                                schema::to_hex(identity));
}

schema::status_t require_controller(const schema::resource_record_t& record,
                                    const schema::component_id_t& expected) {
  if (record.controller == expected) {
    return std::nullopt;
  }
  return schema::make_error(schema::error_kind::invalid_controller,
                            "record " + schema::to_hex(record.address) +
                                " is controlled by " +
                                schema::to_hex(record.controller));
}

}  // namespace warden::execution
