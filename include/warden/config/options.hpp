#pragma once

#include <warden/common/logging.hpp>
#include <warden/execution/engine.hpp>

#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace warden::config {

/// Everything a host needs to stand up an engine and its ledger.
struct node_options final {
  warden::execution::engine_options engine;
  warden::common::logging_options logging;
  std::string ledger_path{"warden-ledger"};
};

/// Parse an ini-style configuration:
///
///   [invocation]
///   whitelist = <hex component id>   (repeatable)
///   max_depth = 4
///   [crypto]
///   strict = true
///   [ledger]
///   path = /var/lib/warden
///   [log]
///   level = info
///   file = /var/log/warden.log
///
/// Returns std::nullopt (and logs why) on malformed input.
std::optional<node_options> parse_options(std::istream& input);

std::optional<node_options> load_options(std::string_view path);

}  // namespace warden::config
