#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "idkit/cli/application.hpp"
#include "idkit/common.hpp"

namespace idkit::cli {

// Print the tagged wire form of an integer identifier or a ULID
class EncodeCommand : public Command {
public:
  explicit EncodeCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "encode";
  std::string description_ = "Encode an identifier as [tag, value]";

  std::string tag_;
  std::optional<std::int64_t> id_;
  std::string ulid_;
};

}  // namespace idkit::cli
