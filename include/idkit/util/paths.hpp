#pragma once

#include <filesystem>

#include "idkit/common.hpp"

namespace idkit::util::paths {

// $XDG_CONFIG_HOME/idkit/config.toml, or ~/.config/idkit/config.toml
std::filesystem::path configFile();

// $XDG_DATA_HOME/idkit/logs, or ~/.local/share/idkit/logs
std::filesystem::path logDir();

// Absolute paths are kept; relative ones are placed under logDir()
std::filesystem::path resolveLogFile(const std::filesystem::path& configured);

// Create the directory that will hold `file`, owner-only when newly made
Result<void> ensureParentDirectory(const std::filesystem::path& file);

}  // namespace idkit::util::paths
