#include "idkit/cli/commands/encode_command.hpp"

#include <nlohmann/json.hpp>

#include "idkit/codec/id_codec.hpp"
#include "idkit/core/id.hpp"
#include "idkit/core/ulid.hpp"

namespace idkit::cli {

namespace {

struct CommandLineTag {};

}  // namespace

EncodeCommand::EncodeCommand(Application& app) : app_(app) {}

void EncodeCommand::setupCommand(CLI::App* cmd) {
  cmd->description(description_);

  cmd->add_option("-t,--tag", tag_, "Type tag (default: codec.default_tag)");
  auto id_opt = cmd->add_option("--id", id_, "Non-negative integer identifier");
  auto ulid_opt = cmd->add_option("--ulid", ulid_, "ULID identifier");
  id_opt->excludes(ulid_opt);
  ulid_opt->excludes(id_opt);
}

Result<int> EncodeCommand::execute(const GlobalOptions& options) {
  (void)options;

  std::string tag = tag_.empty() ? app_.config().codec.default_tag : tag_;

  nlohmann::json encoded;
  if (id_) {
    auto id = core::Id<CommandLineTag>::fromValue(*id_);
    if (!id) {
      return makeErrorResult<int>(ErrorCode::kInvalidArgument,
                                  "Identifier must be non-negative: " + std::to_string(*id_));
    }
    encoded = codec::encodeId(tag, *id);
  } else if (!ulid_.empty()) {
    auto ulid = core::Ulid<CommandLineTag>::fromString(ulid_);
    if (!ulid.has_value()) {
      return std::unexpected(ulid.error());
    }
    encoded = codec::encodeUlid(tag, *ulid);
  } else {
    return makeErrorResult<int>(ErrorCode::kInvalidArgument, "One of --id or --ulid is required");
  }

  app_.emit(encoded, encoded.dump());
  return 0;
}

}  // namespace idkit::cli
