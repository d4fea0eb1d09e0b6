#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "idkit/common.hpp"

namespace idkit::config {

// Configuration for the idkit tool
class Config {
 public:
  // Default constructor loads from default config file
  Config();

  // Load from specific file
  explicit Config(const std::filesystem::path& config_path);

  // Logging
  std::string log_level = "warn";
  std::filesystem::path log_file;      // empty: console only

  // Random source configuration
  struct RandomConfig {
    std::int64_t seed = 0;             // 0: seed from std::random_device
  };
  RandomConfig random;

  // UUID rendering
  struct UuidConfig {
    bool uppercase = false;
  };
  UuidConfig uuid;

  // Codec defaults
  struct CodecConfig {
    std::string default_tag = "id";    // Tag used when --tag is not given
  };
  CodecConfig codec;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (empty path: the loaded path, else the default)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration value by dot-notation key (e.g. "random.seed")
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Validate configuration
  Result<void> validate() const;

  // Path this configuration was loaded from, empty if none
  const std::filesystem::path& path() const noexcept { return config_path_; }

  // Why the constructor fell back to defaults. The constructors run before
  // logging is set up, so the caller reports this.
  const std::optional<Error>& loadError() const noexcept { return load_error_; }

  // All supported dot-notation keys
  static std::vector<std::string> keys();

  // Get default config file path
  static std::filesystem::path defaultConfigPath();

  // Create default configuration without touching the filesystem
  static Config createDefault();

 private:
  struct DefaultTag {};
  explicit Config(DefaultTag) {}

  std::filesystem::path config_path_;
  std::optional<Error> load_error_;

  // Dot notation helpers
  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace idkit::config
