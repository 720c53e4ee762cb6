#include <spdlog/spdlog.h>
#include <warden/execution/mutation_sequencer.hpp>

#include <algorithm>
#include <utility>

namespace warden::execution {

mutation_sequencer::mutation_sequencer(const invocation_guard& guard,
                                       commit_sink_t commit_sink,
                                       dispatch_t dispatch)
    : guard_{guard},
      commit_sink_{std::move(commit_sink)},
      dispatch_{std::move(dispatch)} {}

mutation_handle mutation_sequencer::begin_mutation() const {
  return mutation_handle{};
}

schema::status_t mutation_sequencer::stage(
    mutation_handle& handle,
    schema::resource_record_t record) const {
  if (handle.committed()) {
    return schema::make_error(schema::error_kind::sequencing_violation,
                              "cannot stage after commit");
  }
  auto existing = std::find_if(
      std::begin(handle.staged_), std::end(handle.staged_),
      [&](const schema::resource_record_t& staged) {
        return staged.address == record.address;
      });
  if (existing != std::end(handle.staged_)) {
    *existing = std::move(record);
  } else {
    handle.staged_.push_back(std::move(record));
  }
  return std::nullopt;
}

schema::status_t mutation_sequencer::commit(mutation_handle& handle) const {
  if (handle.committed()) {
    return schema::make_error(schema::error_kind::sequencing_violation,
                              "mutation already committed");
  }
  if (commit_sink_) {
    commit_sink_(handle.staged_);
  }
  handle.phase_ = mutation_handle::phase::committed;
  spdlog::debug("Committed {} staged record(s)", handle.staged_.size());
  return std::nullopt;
}

schema::status_t mutation_sequencer::invoke_external(
    const mutation_handle& handle,
    const schema::component_id_t& target,
    const schema::bytes_t& payload) const {
  if (!handle.committed()) {
    spdlog::warn("Invocation of {} attempted before commit",
                 schema::to_hex(target));
    return schema::make_error(schema::error_kind::sequencing_violation,
                              "external invocation before commit");
  }
  if (auto denied = guard_.authorize(target)) {
    return denied;
  }
  if (!dispatch_) {
    return schema::make_error(schema::error_kind::unknown_component,
                              "no dispatcher installed");
  }
  return dispatch_(target, payload);
}

}  // namespace warden::execution
