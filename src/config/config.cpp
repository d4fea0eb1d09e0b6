#include "idkit/config/config.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "idkit/util/logging.hpp"
#include "idkit/util/paths.hpp"

namespace idkit::config {

namespace {

Result<std::int64_t> parseSeed(const std::string& value) {
  std::int64_t seed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seed);
  if (ec != std::errc{} || ptr != value.data() + value.size() || seed < 0) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "random.seed must be a non-negative integer: " + value));
  }
  return seed;
}

std::string joinPath(const std::vector<std::string>& path) {
  std::string joined;
  for (const auto& part : path) {
    if (!joined.empty()) joined += '.';
    joined += part;
  }
  return joined;
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
  if (value == "true") return true;
  if (value == "false") return false;
  return std::unexpected(makeError(ErrorCode::kValidationError,
                                   key + " must be true or false: " + value));
}

}  // namespace

Config::Config() {
  // Try to load from default location
  auto default_path = defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = load(default_path);
    if (!result.has_value()) {
      load_error_ = result.error();
    }
  }
}

Config::Config(const std::filesystem::path& config_path) {
  auto result = load(config_path);
  if (!result.has_value()) {
    // Continue with defaults so the tool still works with a missing/invalid config
    load_error_ = result.error();
  }
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Config file not found: " + config_path.string()));
  }

  // Values missing from the file keep their current setting
  Config loaded = *this;

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["log_level"].value<std::string>()) {
      loaded.log_level = *value;
    }
    if (auto value = config_data["log_file"].value<std::string>()) {
      loaded.log_file = *value;
    }

    if (auto random_table = config_data["random"].as_table()) {
      if (auto value = (*random_table)["seed"].value<std::int64_t>()) {
        loaded.random.seed = *value;
      }
    }

    if (auto uuid_table = config_data["uuid"].as_table()) {
      if (auto value = (*uuid_table)["uppercase"].value<bool>()) {
        loaded.uuid.uppercase = *value;
      }
    }

    if (auto codec_table = config_data["codec"].as_table()) {
      if (auto value = (*codec_table)["default_tag"].value<std::string>()) {
        loaded.codec.default_tag = *value;
      }
    }

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.description())));
  }

  auto valid = loaded.validate();
  if (!valid.has_value()) {
    return std::unexpected(makeError(valid.error().code(),
                                     config_path.string() + ": " + valid.error().message()));
  }

  loaded.config_path_ = config_path;
  loaded.load_error_.reset();
  *this = std::move(loaded);

  spdlog::debug("Loaded configuration from {}", config_path.string());
  return {};
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    config_data.insert_or_assign("log_level", log_level);
    if (!log_file.empty()) config_data.insert_or_assign("log_file", log_file.string());

    auto random_table = toml::table{};
    random_table.insert_or_assign("seed", random.seed);
    config_data.insert_or_assign("random", random_table);

    auto uuid_table = toml::table{};
    uuid_table.insert_or_assign("uppercase", uuid.uppercase);
    config_data.insert_or_assign("uuid", uuid_table);

    auto codec_table = toml::table{};
    codec_table.insert_or_assign("default_tag", codec.default_tag);
    config_data.insert_or_assign("codec", codec_table);

    auto dir_result = util::paths::ensureParentDirectory(save_path);
    if (!dir_result.has_value()) {
      return dir_result;
    }

    // Write next to the target, then rename over it
    auto temp_path = save_path;
    temp_path += ".tmp";
    {
      std::ofstream file(temp_path, std::ios::trunc);
      if (!file) {
        return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                         "Cannot write config file: " + temp_path.string()));
      }
      file << config_data << "\n";
      if (!file) {
        return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                         "Write failed: " + temp_path.string()));
      }
    }
    std::filesystem::rename(temp_path, save_path);

    spdlog::debug("Saved configuration to {}", save_path.string());
    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

Result<void> Config::validate() const {
  auto level = util::Logging::parseLevel(log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  if (random.seed < 0) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "random.seed must be a non-negative integer"));
  }

  if (codec.default_tag.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "codec.default_tag must not be empty"));
  }

  return {};
}

std::vector<std::string> Config::keys() {
  return {"log_level", "log_file", "random.seed", "uuid.uppercase", "codec.default_tag"};
}

std::filesystem::path Config::defaultConfigPath() {
  return util::paths::configFile();
}

Config Config::createDefault() {
  return Config(DefaultTag{});
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "log_level") return log_level;
    if (key == "log_file") return log_file.string();
  } else if (path.size() == 2) {
    if (path[0] == "random" && path[1] == "seed") return std::to_string(random.seed);
    if (path[0] == "uuid" && path[1] == "uppercase") return std::string(uuid.uppercase ? "true" : "false");
    if (path[0] == "codec" && path[1] == "default_tag") return codec.default_tag;
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + joinPath(path)));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "log_level") {
      auto level = util::Logging::parseLevel(value);
      if (!level.has_value()) {
        return std::unexpected(level.error());
      }
      log_level = value;
      return {};
    }
    if (key == "log_file") { log_file = value; return {}; }
  } else if (path.size() == 2) {
    if (path[0] == "random" && path[1] == "seed") {
      auto seed = parseSeed(value);
      if (!seed.has_value()) {
        return std::unexpected(seed.error());
      }
      random.seed = *seed;
      return {};
    }
    if (path[0] == "uuid" && path[1] == "uppercase") {
      auto flag = parseBool("uuid.uppercase", value);
      if (!flag.has_value()) {
        return std::unexpected(flag.error());
      }
      uuid.uppercase = *flag;
      return {};
    }
    if (path[0] == "codec" && path[1] == "default_tag") {
      if (value.empty()) {
        return std::unexpected(makeError(ErrorCode::kValidationError,
                                         "codec.default_tag must not be empty"));
      }
      codec.default_tag = value;
      return {};
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + joinPath(path)));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace idkit::config
