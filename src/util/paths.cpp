#include "idkit/util/paths.hpp"

#include <cstdlib>
#include <system_error>

namespace idkit::util::paths {

namespace {

// The XDG variable when set and absolute, otherwise $HOME/<fallback>.
// Without HOME the working directory stands in for it.
std::filesystem::path baseDirectory(const char* xdg_variable,
                                    const std::filesystem::path& home_fallback) {
  if (const char* xdg = std::getenv(xdg_variable); xdg && *xdg) {
    std::filesystem::path dir(xdg);
    if (dir.is_absolute()) {
      return dir;
    }
  }

  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / home_fallback;
  }
  return std::filesystem::current_path() / home_fallback;
}

}  // namespace

std::filesystem::path configFile() {
  return baseDirectory("XDG_CONFIG_HOME", ".config") / "idkit" / "config.toml";
}

std::filesystem::path logDir() {
  return baseDirectory("XDG_DATA_HOME", std::filesystem::path(".local") / "share") / "idkit" / "logs";
}

std::filesystem::path resolveLogFile(const std::filesystem::path& configured) {
  if (configured.empty() || configured.is_absolute()) {
    return configured;
  }
  return logDir() / configured;
}

Result<void> ensureParentDirectory(const std::filesystem::path& file) {
  auto parent = file.parent_path();
  if (parent.empty()) {
    return {};
  }

  std::error_code ec;
  if (std::filesystem::is_directory(parent, ec)) {
    return {};
  }

  if (!std::filesystem::create_directories(parent, ec) || ec) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError,
                                 "Cannot create directory " + parent.string() + ": " + ec.message());
  }
  std::filesystem::permissions(parent, std::filesystem::perms::owner_all, ec);
  return {};
}

}  // namespace idkit::util::paths
