#pragma once

#include <string>

#include "idkit/cli/application.hpp"
#include "idkit/common.hpp"

namespace idkit::cli {

/**
 * Command for Version 4 UUIDs
 *
 * Subcommands:
 * - new [--count N]: Generate UUIDs
 * - validate <uuid>: Exit 0 when the UUID is canonical, 1 otherwise
 */
class UuidCommand : public Command {
public:
  explicit UuidCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "uuid";
  std::string description_ = "Generate and validate Version 4 UUIDs";

  bool new_mode_ = false;
  bool validate_mode_ = false;

  std::string input_;
  int count_ = 1;

  Result<int> executeNew();
  Result<int> executeValidate();
};

}  // namespace idkit::cli
