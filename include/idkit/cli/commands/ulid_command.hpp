#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "idkit/cli/application.hpp"
#include "idkit/common.hpp"

namespace idkit::cli {

/**
 * Command for working with ULIDs
 *
 * Subcommands:
 * - new [--timestamp MS | --time RFC3339] [--count N]: Generate ULIDs
 * - inspect <ulid>: Show validity, timestamp and UUID form
 * - to-uuid <ulid>: Convert to UUID text form
 * - from-uuid <uuid>: Convert UUID text back to a ULID
 */
class UlidCommand : public Command {
public:
  explicit UlidCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "ulid";
  std::string description_ = "Generate, inspect and convert ULIDs";

  // Subcommand flags
  bool new_mode_ = false;
  bool inspect_mode_ = false;
  bool to_uuid_mode_ = false;
  bool from_uuid_mode_ = false;

  // Command arguments
  std::string input_;
  std::optional<std::uint64_t> timestamp_ms_;
  std::string time_;
  int count_ = 1;

  // Command execution methods
  Result<int> executeNew();
  Result<int> executeInspect();
  Result<int> executeToUuid();
  Result<int> executeFromUuid();
};

}  // namespace idkit::cli
