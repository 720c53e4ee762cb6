#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/config/options.hpp>

#include <fstream>
#include <vector>

namespace warden::config {

std::optional<node_options> parse_options(std::istream& input) {
  namespace po = boost::program_options;

  auto options = node_options{};
  auto whitelist = std::vector<std::string>{};
  auto log_file = std::string{};

  auto description = po::options_description{"Warden"};
  description.add_options()(
      "invocation.whitelist",
      po::value<std::vector<std::string>>(&whitelist)->composing(),
      "Component id (hex) that operations may invoke")(
      "invocation.max_depth",
      po::value<std::size_t>(&options.engine.max_invocation_depth)
          ->default_value(options.engine.max_invocation_depth),
      "Maximum nesting of component invocations")(
      "crypto.strict",
      po::value<bool>(&options.engine.require_strict_crypto)
          ->default_value(options.engine.require_strict_crypto),
      "Verify endorsement signatures")(
      "ledger.path",
      po::value<std::string>(&options.ledger_path)
          ->default_value(options.ledger_path),
      "RocksDB directory of the ledger")(
      "log.level",
      po::value<std::string>(&options.logging.level)
          ->default_value(options.logging.level),
      "spdlog level name")("log.file", po::value<std::string>(&log_file),
                           "Optional log file");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(input, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    spdlog::error("Invalid configuration: {}", ex.what());
    return std::nullopt;
  }

  for (const auto& entry : whitelist) {
    auto component = warden::schema::try_make_hash32(entry);
    if (!component.has_value()) {
      spdlog::error("Invalid component id '{}' in invocation.whitelist",
                    entry);
      return std::nullopt;
    }
    options.engine.invocation_whitelist.insert(*component);
  }
  if (vm.contains("log.file")) {
    options.logging.file = log_file;
  }
  return options;
}

std::optional<node_options> load_options(const std::string_view path) {
  auto input = std::ifstream{std::string{path}};
  if (!input) {
    spdlog::error("Unable to open configuration file '{}'", path);
    return std::nullopt;
  }
  return parse_options(input);
}

}  // namespace warden::config
