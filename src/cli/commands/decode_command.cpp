#include "idkit/cli/commands/decode_command.hpp"

#include <nlohmann/json.hpp>

#include "idkit/codec/id_codec.hpp"
#include "idkit/core/id.hpp"
#include "idkit/core/ulid.hpp"

namespace idkit::cli {

namespace {

struct CommandLineTag {};

}  // namespace

DecodeCommand::DecodeCommand(Application& app) : app_(app) {}

void DecodeCommand::setupCommand(CLI::App* cmd) {
  cmd->description(description_);

  cmd->add_option("-t,--tag", tag_, "Expected type tag (default: codec.default_tag)");
  cmd->add_flag("--ulid", ulid_, "Decode a ULID instead of an integer identifier");
  cmd->add_option("encoded", input_, "Wire text, e.g. '[\"user\", 7]'")->required();
}

Result<int> DecodeCommand::execute(const GlobalOptions& options) {
  (void)options;

  std::string tag = tag_.empty() ? app_.config().codec.default_tag : tag_;

  auto wire = codec::parseWire(input_);
  if (!wire.has_value()) {
    return std::unexpected(wire.error());
  }

  nlohmann::json output;
  output["tag"] = tag;

  if (ulid_) {
    auto ulid = codec::decodeUlid<CommandLineTag>(tag, *wire);
    if (!ulid.has_value()) {
      return std::unexpected(ulid.error());
    }
    output["value"] = ulid->toString();
    app_.emit(output, ulid->toString());
  } else {
    auto id = codec::decodeId<CommandLineTag>(tag, *wire);
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
    output["value"] = id->value();
    app_.emit(output, std::to_string(id->value()));
  }

  return 0;
}

}  // namespace idkit::cli
