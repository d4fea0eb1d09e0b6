#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>

#include <spdlog/common.h>

#include "idkit/common.hpp"

namespace idkit::util {

struct LogOptions {
  spdlog::level::level_enum level = spdlog::level::warn;
  std::filesystem::path log_file;   // empty: console only
  std::size_t max_file_size = 1024 * 1024 * 5;
  std::size_t max_files = 3;
};

// Logger setup for the idkit tool
class Logging {
 public:
  // Install the `idkit` logger as spdlog's default. Console output goes to
  // stderr; a rotating file sink is added when `log_file` is set.
  static void initialize(const LogOptions& options);

  // Parse a level name (trace, debug, info, warn, error, critical, off)
  static Result<spdlog::level::level_enum> parseLevel(std::string_view name);

  // Map repeated -v flags onto a level, never raising it above `base`
  static spdlog::level::level_enum verbosityLevel(int verbose, spdlog::level::level_enum base);
};

}  // namespace idkit::util
