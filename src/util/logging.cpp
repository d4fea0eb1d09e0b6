#include "idkit/util/logging.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "idkit/util/paths.hpp"

namespace idkit::util {

void Logging::initialize(const LogOptions& options) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  std::vector<spdlog::sink_ptr> sinks = {console_sink};

  std::string file_error;
  if (!options.log_file.empty()) {
    auto dir_result = paths::ensureParentDirectory(options.log_file);
    if (dir_result.has_value()) {
      try {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.log_file.string(), options.max_file_size, options.max_files));
      } catch (const spdlog::spdlog_ex& e) {
        file_error = e.what();
      }
    } else {
      file_error = dir_result.error().message();
    }
  }

  // Without a file sink logging stays console-only
  auto logger = std::make_shared<spdlog::logger>("idkit", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(options.level);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }
}

Result<spdlog::level::level_enum> Logging::parseLevel(std::string_view name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;

  return std::unexpected(makeError(ErrorCode::kValidationError,
                                   "Unknown log level: " + std::string(name)));
}

spdlog::level::level_enum Logging::verbosityLevel(int verbose, spdlog::level::level_enum base) {
  spdlog::level::level_enum requested = base;
  if (verbose >= 3) {
    requested = spdlog::level::trace;
  } else if (verbose == 2) {
    requested = spdlog::level::debug;
  } else if (verbose == 1) {
    requested = spdlog::level::info;
  }
  return requested < base ? requested : base;
}

}  // namespace idkit::util
