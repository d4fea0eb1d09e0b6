#pragma once

#include <string>

#include "idkit/cli/application.hpp"
#include "idkit/common.hpp"

namespace idkit::cli {

/**
 * Command for managing configuration
 * 
 * Subcommands:
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value
 * - list: List all configuration
 * - path: Show configuration file path
 * - validate: Validate current configuration
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);
  
  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;
  
  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "config";
  std::string description_ = "Manage configuration settings";
  
  // Subcommand flags
  bool get_mode_ = false;
  bool set_mode_ = false;
  bool list_mode_ = false;
  bool path_mode_ = false;
  bool validate_mode_ = false;
  
  // Command arguments
  std::string key_;
  std::string value_;
  
  // Command execution methods
  Result<int> executeGet();
  Result<int> executeSet();
  Result<int> executeList();
  Result<int> executePath();
  Result<int> executeValidate();
};

}  // namespace idkit::cli
