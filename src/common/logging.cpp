#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <warden/common/logging.hpp>

#include <memory>
#include <vector>

namespace warden::common {

void configure_logging(const logging_options& options) {
  auto level = spdlog::level::from_str(options.level);
  if (level == spdlog::level::off && options.level != "off") {
    level = spdlog::level::info;
  }

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (options.file.has_value()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        *options.file, false));
  }

  auto logger = std::shared_ptr<spdlog::logger>{};
  if (options.async) {
    if (!spdlog::thread_pool()) {
      spdlog::init_thread_pool(8192, 1);
    }
    logger = std::make_shared<spdlog::async_logger>(
        "warden", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
        spdlog::async_overflow_policy::block);
  } else {
    logger = std::make_shared<spdlog::logger>("warden", std::begin(sinks),
                                              std::end(sinks));
  }

  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::debug("Logging configured at level '{}'", options.level);
}

}  // namespace warden::common
