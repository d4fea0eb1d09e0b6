#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "idkit/common.hpp"
#include "idkit/config/config.hpp"
#include "idkit/core/random_source.hpp"

namespace idkit::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;                   // --json: Output in JSON format
  int verbose = 0;                     // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;                  // --quiet: Suppress normal output
  std::string config_file;             // --config: Path to config file
  std::optional<std::uint64_t> seed;   // --seed: Reproducible random source
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  /**
   * @brief Get the command name
   */
  virtual std::string name() const = 0;

  /**
   * @brief Get the command description
   */
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @param argc Argument count
   * @param argv Argument vector
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();
  core::RandomSource& randomSource();

  /**
   * @brief Print one result, as JSON when --json is set
   * @param json_value Value printed in JSON mode
   * @param text Line printed otherwise
   */
  void emit(const nlohmann::json& json_value, const std::string& text) const;

  /**
   * @brief Print an error in the current output format
   */
  void emitError(const Error& error) const;

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Initialization
  Result<void> initializeServices();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  // Services, created on first command execution
  std::unique_ptr<config::Config> config_;
  std::unique_ptr<core::RandomSource> random_source_;
  bool services_initialized_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace idkit::cli
