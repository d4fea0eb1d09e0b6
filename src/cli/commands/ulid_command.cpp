#include "idkit/cli/commands/ulid_command.hpp"

#include <chrono>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "idkit/core/ulid.hpp"
#include "idkit/util/time.hpp"

namespace idkit::cli {

namespace {

// ULIDs typed on the command line belong to no particular domain
struct CommandLineTag {};
using CliUlid = core::Ulid<CommandLineTag>;

nlohmann::json describe(const CliUlid& ulid) {
  nlohmann::json output;
  output["ulid"] = ulid.toString();
  output["timestamp_ms"] = ulid.timestampMs();
  output["time"] = util::Time::toRfc3339(ulid.timestamp());
  output["uuid"] = ulid.toUuidString();
  return output;
}

}  // namespace

UlidCommand::UlidCommand(Application& app) : app_(app) {}

void UlidCommand::setupCommand(CLI::App* cmd) {
  cmd->description(description_);

  auto new_cmd = cmd->add_subcommand("new", "Generate ULIDs");
  auto ts_opt = new_cmd->add_option("--timestamp", timestamp_ms_,
                                    "Milliseconds since the Unix epoch (default: now)");
  new_cmd->add_option("--time", time_, "RFC3339 time (UTC), e.g. 2016-07-30T23:54:10.259Z")
      ->excludes(ts_opt);
  new_cmd->add_option("-n,--count", count_, "Number of ULIDs to generate")
      ->check(CLI::PositiveNumber);
  new_cmd->callback([this]() { new_mode_ = true; });

  auto inspect_cmd = cmd->add_subcommand("inspect", "Show the parts of a ULID");
  inspect_cmd->add_option("ulid", input_, "ULID to inspect")->required();
  inspect_cmd->callback([this]() { inspect_mode_ = true; });

  auto to_uuid_cmd = cmd->add_subcommand("to-uuid", "Convert a ULID to UUID text form");
  to_uuid_cmd->add_option("ulid", input_, "ULID to convert")->required();
  to_uuid_cmd->callback([this]() { to_uuid_mode_ = true; });

  auto from_uuid_cmd = cmd->add_subcommand("from-uuid", "Convert UUID text form to a ULID");
  from_uuid_cmd->add_option("uuid", input_, "UUID to convert")->required();
  from_uuid_cmd->callback([this]() { from_uuid_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> UlidCommand::execute(const GlobalOptions& options) {
  (void)options;

  if (new_mode_) {
    return executeNew();
  } else if (inspect_mode_) {
    return executeInspect();
  } else if (to_uuid_mode_) {
    return executeToUuid();
  } else if (from_uuid_mode_) {
    return executeFromUuid();
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> UlidCommand::executeNew() {
  std::uint64_t timestamp_ms = 0;

  if (timestamp_ms_) {
    timestamp_ms = *timestamp_ms_;
  } else if (!time_.empty()) {
    auto parsed = util::Time::fromRfc3339(time_);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        parsed->time_since_epoch()).count();
    if (ms < 0) {
      return makeErrorResult<int>(ErrorCode::kInvalidArgument,
                                  "Time is before the Unix epoch: " + time_);
    }
    timestamp_ms = static_cast<std::uint64_t>(ms);
  } else {
    timestamp_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
  }

  if (timestamp_ms > core::ulid_codec::kMaxTimestamp) {
    return makeErrorResult<int>(ErrorCode::kInvalidArgument,
                                "Timestamp does not fit in 48 bits: " + std::to_string(timestamp_ms));
  }

  spdlog::debug("Generating {} ULID(s) at {} ms", count_, timestamp_ms);

  auto& rng = app_.randomSource();
  for (int i = 0; i < count_; ++i) {
    auto ulid = CliUlid::generate(timestamp_ms, rng);
    app_.emit(describe(ulid), ulid.toString());
  }
  return 0;
}

Result<int> UlidCommand::executeInspect() {
  auto ulid = CliUlid::parse(input_);
  if (!ulid) {
    nlohmann::json output;
    output["ulid"] = input_;
    output["valid"] = false;
    app_.emit(output, "invalid: " + input_);
    return 1;
  }

  auto output = describe(*ulid);
  output["valid"] = true;

  std::string text = "ulid:      " + ulid->toString() + "\n" +
                     "timestamp: " + std::to_string(ulid->timestampMs()) + "\n" +
                     "time:      " + util::Time::toRfc3339(ulid->timestamp()) + "\n" +
                     "uuid:      " + ulid->toUuidString();
  app_.emit(output, text);
  return 0;
}

Result<int> UlidCommand::executeToUuid() {
  auto ulid = CliUlid::fromString(input_);
  if (!ulid.has_value()) {
    return std::unexpected(ulid.error());
  }

  nlohmann::json output;
  output["ulid"] = ulid->toString();
  output["uuid"] = ulid->toUuidString();
  app_.emit(output, ulid->toUuidString());
  return 0;
}

Result<int> UlidCommand::executeFromUuid() {
  auto ulid = CliUlid::fromUuidString(input_);
  if (!ulid) {
    return makeErrorResult<int>(ErrorCode::kInvalidArgument,
                                "Not a ULID in UUID form: " + input_);
  }

  nlohmann::json output;
  output["uuid"] = input_;
  output["ulid"] = ulid->toString();
  app_.emit(output, ulid->toString());
  return 0;
}

}  // namespace idkit::cli
