#pragma once
#include <warden/execution/invocation_guard.hpp>
#include <warden/schema/error.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/resource_record.hpp>

#include <cstdint>
#include <functional>
#include <vector>

namespace warden::execution {

/// Staged record writes of one operation. Move-only; it is sealed once
/// committed.
class mutation_handle final {
 public:
  mutation_handle(const mutation_handle&) = delete;
  mutation_handle& operator=(const mutation_handle&) = delete;
  mutation_handle(mutation_handle&&) = default;
  mutation_handle& operator=(mutation_handle&&) = default;
  ~mutation_handle() = default;

  bool committed() const { return phase_ == phase::committed; }
  const std::vector<schema::resource_record_t>& staged() const {
    return staged_;
  }

 private:
  friend class mutation_sequencer;

  enum class phase : uint8_t { open, committed };

  mutation_handle() = default;

  phase phase_{phase::open};
  std::vector<schema::resource_record_t> staged_;
};

/// Receives the staged records when a handle is committed.
using commit_sink_t =
    std::function<void(const std::vector<schema::resource_record_t>&)>;

/// Delivers an authorized invocation to its target component.
using dispatch_t = std::function<schema::status_t(
    const schema::component_id_t& target,
    const schema::bytes_t& payload)>;

/// Enforces mutate, then commit, then invoke.
///
/// An external invocation can only observe state that has already been
/// committed, so a re-entrant call never sees a stale balance.
class mutation_sequencer final {
 public:
  mutation_sequencer(const invocation_guard& guard,
                     commit_sink_t commit_sink,
                     dispatch_t dispatch);

  mutation_handle begin_mutation() const;

  /// Replaces any record already staged at the same address.
  schema::status_t stage(mutation_handle& handle,
                         schema::resource_record_t record) const;

  schema::status_t commit(mutation_handle& handle) const;

  /// `sequencing_violation` before commit, even for whitelisted targets;
  /// otherwise the guard decides.
  schema::status_t invoke_external(const mutation_handle& handle,
                                   const schema::component_id_t& target,
                                   const schema::bytes_t& payload) const;

 private:
  const invocation_guard& guard_;
  commit_sink_t commit_sink_;
  dispatch_t dispatch_;
};

}  // namespace warden::execution
