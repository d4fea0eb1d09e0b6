#include "idkit/cli/application.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

#include "idkit/util/logging.hpp"
#include "idkit/util/paths.hpp"

// Command includes
#include "idkit/cli/commands/ulid_command.hpp"
#include "idkit/cli/commands/uuid_command.hpp"
#include "idkit/cli/commands/encode_command.hpp"
#include "idkit/cli/commands/decode_command.hpp"
#include "idkit/cli/commands/config_command.hpp"

namespace idkit::cli {

Application::Application()
    : app_("idkit", "Generate, convert and validate ULIDs, UUIDs and typed identifiers")
    , services_initialized_(false) {

  // Set up the application
  app_.set_version_flag("--version", idkit::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  return *config_;
}

core::RandomSource& Application::randomSource() {
  return *random_source_;
}

void Application::emit(const nlohmann::json& json_value, const std::string& text) const {
  if (global_options_.json) {
    std::cout << json_value.dump() << "\n";
  } else {
    std::cout << text << "\n";
  }
}

void Application::emitError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json error_json;
    error_json["error"] = error.message();
    error_json["code"] = static_cast<int>(error.code());
    error_json["type"] = std::string(errorCodeToString(error.code()));
    std::cout << error_json.dump() << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--seed", global_options_.seed, "Seed the random source for reproducible output");
}

void Application::setupCommands() {
  // Identifier commands
  registerCommand(std::make_unique<UlidCommand>(*this));
  registerCommand(std::make_unique<UuidCommand>(*this));

  // Tagged wire format
  registerCommand(std::make_unique<EncodeCommand>(*this));
  registerCommand(std::make_unique<DecodeCommand>(*this));

  // Configuration management commands
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  // Add footer with examples
  app_.footer(R"(Examples:
  idkit ulid new --count 3
  idkit ulid inspect 01AN4Z07BY79KA1307SR9X4MV3
  idkit ulid to-uuid 01AN4Z07BY79KA1307SR9X4MV3
  idkit uuid new --seed 42
  idkit uuid validate 123e4567-e89b-42d3-a456-426614174000
  idkit encode --tag user --id 7
  idkit decode --tag user '["user", 7]'

For more information on a specific command, run:
  idkit <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    // Initialize services before running command
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      emitError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      spdlog::debug("Command '{}' failed: {}", cmd_ptr->name(), result.error().message());
      emitError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  if (!global_options_.config_file.empty()) {
    config_ = std::make_unique<config::Config>(config::Config::createDefault());
    auto load_result = config_->load(global_options_.config_file);
    if (!load_result.has_value()) {
      return std::unexpected(load_result.error());
    }
  } else {
    config_ = std::make_unique<config::Config>();
  }

  auto level = util::Logging::parseLevel(config_->log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  util::LogOptions log_options;
  log_options.level = global_options_.quiet
      ? spdlog::level::err
      : util::Logging::verbosityLevel(global_options_.verbose, *level);
  log_options.log_file = util::paths::resolveLogFile(config_->log_file);
  util::Logging::initialize(log_options);

  if (const auto& load_error = config_->loadError()) {
    spdlog::warn("Ignoring config file, using defaults: {}", load_error->message());
  }

  if (global_options_.seed) {
    random_source_ = std::make_unique<core::Mt19937RandomSource>(*global_options_.seed);
  } else if (config_->random.seed != 0) {
    random_source_ = std::make_unique<core::Mt19937RandomSource>(
        static_cast<std::uint64_t>(config_->random.seed));
  } else {
    random_source_ = std::make_unique<core::Mt19937RandomSource>();
  }

  services_initialized_ = true;
  return {};
}

} // namespace idkit::cli
