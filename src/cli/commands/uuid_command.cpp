#include "idkit/cli/commands/uuid_command.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

#include "idkit/core/uuid.hpp"

namespace idkit::cli {

UuidCommand::UuidCommand(Application& app) : app_(app) {}

void UuidCommand::setupCommand(CLI::App* cmd) {
  cmd->description(description_);

  auto new_cmd = cmd->add_subcommand("new", "Generate Version 4 UUIDs");
  new_cmd->add_option("-n,--count", count_, "Number of UUIDs to generate")
      ->check(CLI::PositiveNumber);
  new_cmd->callback([this]() { new_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Check a UUID against the canonical form");
  validate_cmd->add_option("uuid", input_, "UUID to check")->required();
  validate_cmd->callback([this]() { validate_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> UuidCommand::execute(const GlobalOptions& options) {
  (void)options;

  if (new_mode_) {
    return executeNew();
  } else if (validate_mode_) {
    return executeValidate();
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> UuidCommand::executeNew() {
  const bool uppercase = app_.config().uuid.uppercase;
  auto& rng = app_.randomSource();

  for (int i = 0; i < count_; ++i) {
    auto uuid = core::Uuid::generate(rng);
    if (uppercase) {
      std::transform(uuid.begin(), uuid.end(), uuid.begin(),
                     [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    }

    nlohmann::json output;
    output["uuid"] = uuid;
    app_.emit(output, uuid);
  }
  return 0;
}

Result<int> UuidCommand::executeValidate() {
  bool valid = core::Uuid::isValid(input_);

  nlohmann::json output;
  output["uuid"] = input_;
  output["valid"] = valid;
  app_.emit(output, valid ? "valid" : "invalid");

  return valid ? 0 : 1;
}

}  // namespace idkit::cli
