#pragma once

#include <optional>
#include <string>

namespace warden::common {

struct logging_options final {
  std::string level{"info"};
  std::optional<std::string> file;
  bool async{true};
};

/// Install the process-wide default logger.
///
/// Console output is always enabled; a file sink is added when `file` is set.
/// Unknown level names fall back to `info`.
void configure_logging(const logging_options& options);

}  // namespace warden::common
