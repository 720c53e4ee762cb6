#pragma once
#include <warden/schema/error.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/resource_record.hpp>

#include <set>

namespace warden::execution {

/// Identities whose endorsements were verified for the current request.
/// Built once per request and never modified.
class authorization_context final {
 public:
  authorization_context() = default;
  explicit authorization_context(std::set<schema::identity_t> identities);

  bool endorsed_by(const schema::identity_t& identity) const;
  const std::set<schema::identity_t>& identities() const;

 private:
  std::set<schema::identity_t> identities_;
};

schema::status_t require_endorsement(const authorization_context& context,
                                     const schema::identity_t& identity);

schema::status_t require_controller(const schema::resource_record_t& record,
                                    const schema::component_id_t& expected);

}  // namespace warden::execution
