#include "idkit/cli/commands/config_command.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace idkit::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  cmd->description(description_);
  
  // Add subcommands
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });
  
  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });
  
  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { list_mode_ = true; });
  
  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });
  
  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });
  
  // Require exactly one subcommand
  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  (void)options;

  if (get_mode_) {
    return executeGet();
  } else if (set_mode_) {
    return executeSet();
  } else if (list_mode_) {
    return executeList();
  } else if (path_mode_) {
    return executePath();
  } else if (validate_mode_) {
    return executeValidate();
  }
  
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet() {
  auto result = app_.config().get(key_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  nlohmann::json output;
  output["key"] = key_;
  output["value"] = *result;
  app_.emit(output, *result);
  return 0;
}

Result<int> ConfigCommand::executeSet() {
  auto& config = app_.config();
  auto result = config.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  
  // Save configuration
  auto save_result = config.save();
  if (!save_result.has_value()) {
    return makeErrorResult<int>(save_result.error().code(),
                                "Failed to save configuration: " + save_result.error().message());
  }
  
  nlohmann::json output;
  output["success"] = true;
  output["key"] = key_;
  output["value"] = value_;
  app_.emit(output, "Configuration updated: " + key_ + " = " + value_);
  return 0;
}

Result<int> ConfigCommand::executeList() {
  auto& config = app_.config();

  nlohmann::json output;
  std::ostringstream text;
  bool first = true;
  for (const auto& key : config::Config::keys()) {
    auto result = config.get(key);
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
    output[key] = *result;

    if (!first) text << "\n";
    text << std::setw(18) << std::left << key << " = " << *result;
    first = false;
  }

  app_.emit(output, text.str());
  return 0;
}

Result<int> ConfigCommand::executePath() {
  auto config_path = app_.config().path();
  if (config_path.empty()) {
    config_path = config::Config::defaultConfigPath();
  }

  bool exists = std::filesystem::exists(config_path);

  nlohmann::json output;
  output["config_path"] = config_path.string();
  output["exists"] = exists;
  app_.emit(output, config_path.string() + (exists ? "" : " (not found, using defaults)"));
  return 0;
}

Result<int> ConfigCommand::executeValidate() {
  auto result = app_.config().validate();
  
  nlohmann::json output;
  output["valid"] = result.has_value();
  if (result.has_value()) {
    app_.emit(output, "Configuration is valid");
    return 0;
  }

  output["error"] = result.error().message();
  app_.emit(output, "Configuration validation failed: " + result.error().message());
  return 1;
}

} // namespace idkit::cli
