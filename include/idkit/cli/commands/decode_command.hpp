#pragma once

#include <string>

#include "idkit/cli/application.hpp"
#include "idkit/common.hpp"

namespace idkit::cli {

// Decode [tag, value] wire text, checking the tag
class DecodeCommand : public Command {
public:
  explicit DecodeCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "decode";
  std::string description_ = "Decode [tag, value] and check the tag";

  std::string tag_;
  std::string input_;
  bool ulid_ = false;
};

}  // namespace idkit::cli
