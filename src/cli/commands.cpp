#include "mnemobox/cli/commands.hpp"

#include "mnemobox/common/fs.hpp"
#include "mnemobox/config/config.hpp"
#include "mnemobox/observability/factory.hpp"
#include "mnemobox/observability/global.hpp"
#include "mnemobox/observability/metrics_monitor.hpp"
#include "mnemobox/observability/multi_observer.hpp"
#include "mnemobox/sandbox/code_validator.hpp"
#include "mnemobox/sandbox/coordinator.hpp"
#include "mnemobox/sandbox/process_isolator.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace mnemobox::cli {

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_TIMEOUT = 3;
constexpr int EXIT_VIOLATION = 4;

std::string version_string() {
#ifdef MNEMOBOX_VERSION
  std::string version = MNEMOBOX_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef MNEMOBOX_GIT_COMMIT
  const std::string commit = MNEMOBOX_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "mnemobox " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

common::Result<std::string> read_source(const std::string &source) {
  if (source == "-") {
    return common::Result<std::string>::success(read_stdin_all());
  }
  return common::read_file(common::expand_path(source));
}

/// Loads the config, applies a --preset override and validates it, printing
/// warnings. Returns nullopt after printing the error.
std::optional<config::Config> load_checked_config(std::vector<std::string> &args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  std::string preset;
  if (take_option(args, "--preset", "-p", preset)) {
    cfg.value().sandbox.preset = preset;
  }

  const auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    std::cerr << "invalid configuration: " << warnings.error() << "\n";
    return std::nullopt;
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "[WARN] " << warning << "\n";
  }
  return std::move(cfg.value());
}

int exit_code_for(const sandbox::ExecutionResult &result) {
  switch (sandbox::outcome_kind(result)) {
  case sandbox::OutcomeKind::Success:
    return 0;
  case sandbox::OutcomeKind::Error:
    return 1;
  case sandbox::OutcomeKind::Timeout:
    return EXIT_TIMEOUT;
  case sandbox::OutcomeKind::SecurityViolation:
    return EXIT_VIOLATION;
  }
  return 1;
}

int run_execute(std::vector<std::string> args) {
  auto cfg = load_checked_config(args);
  if (!cfg.has_value()) {
    return 1;
  }

  sandbox::ExecutionContext context;
  (void)take_option(args, "--task", "-t", context.task);
  std::string input;
  if (take_option(args, "--input", "-i", input)) {
    context.input = input;
  }
  std::string meta;
  while (take_option(args, "--meta", "", meta)) {
    const auto equals = meta.find('=');
    if (equals == std::string::npos || equals == 0) {
      std::cerr << "--meta expects key=value\n";
      return EXIT_USAGE;
    }
    context.metadata[meta.substr(0, equals)] = meta.substr(equals + 1);
  }
  const bool show_stats = take_flag(args, "--stats");

  if (args.size() != 1) {
    std::cerr << "usage: mnemobox run [--preset P] [--task T] [--input JSON] [--meta K=V] "
                 "[--stats] <file|->\n";
    return EXIT_USAGE;
  }
  const auto code = read_source(args[0]);
  if (!code.ok()) {
    std::cerr << code.error() << "\n";
    return 1;
  }

  const auto policy = config::build_policy(*cfg);
  if (!policy.ok()) {
    std::cerr << policy.error() << "\n";
    return 1;
  }

  auto backend = observability::create_observer(cfg->observability.backend);
  if (!backend.ok()) {
    std::cerr << backend.error() << "\n";
    return 1;
  }
  auto metrics = std::make_shared<observability::MetricsMonitor>();
  auto observer = std::make_shared<observability::MultiObserver>();
  observer->add(backend.value());
  observer->add(metrics);

  sandbox::CoordinatorOptions options;
  options.max_concurrency = static_cast<std::size_t>(cfg->sandbox.max_concurrency);
  if (cfg->sandbox.slot_timeout_ms.has_value()) {
    options.slot_timeout = std::chrono::milliseconds(*cfg->sandbox.slot_timeout_ms);
  }
  options.default_policy = policy.value();
  observability::set_global_observer(observer);

  sandbox::IsolatorOptions isolator_options;
  isolator_options.runtime_path = cfg->sandbox.runtime_path;
  sandbox::SandboxCoordinator coordinator(
      std::move(options), std::make_shared<sandbox::NodeProcessIsolator>(std::move(isolator_options)));

  const auto result = coordinator.execute(code.value(), context);
  observer->flush();
  std::cout << sandbox::to_json(result) << "\n";
  if (show_stats) {
    std::cerr << metrics->snapshot().to_json() << "\n";
  }
  return exit_code_for(result);
}

int run_validate(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: mnemobox validate <file|->\n";
    return EXIT_USAGE;
  }
  const auto code = read_source(args[0]);
  if (!code.ok()) {
    std::cerr << code.error() << "\n";
    return 1;
  }

  const sandbox::CodeValidator validator;
  if (const auto violation = validator.validate(code.value()); violation.has_value()) {
    std::cout << sandbox::to_json(sandbox::SecurityViolation{
                     .reason = violation->reason, .violation_type = violation->type})
              << "\n";
    return EXIT_VIOLATION;
  }
  std::cout << "ok\n";
  return 0;
}

int run_policy(std::vector<std::string> args) {
  auto cfg = load_checked_config(args);
  if (!cfg.has_value()) {
    return 1;
  }
  const auto policy = config::build_policy(*cfg);
  if (!policy.ok()) {
    std::cerr << policy.error() << "\n";
    return 1;
  }
  std::cout << policy.value().to_json() << "\n";
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    const auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }
  if (!args.empty() && args[0] != "show") {
    std::cerr << "usage: mnemobox config [show|path]\n";
    return EXIT_USAGE;
  }
  if (!args.empty()) {
    args.erase(args.begin());
  }

  auto cfg = load_checked_config(args);
  if (!cfg.has_value()) {
    return 1;
  }
  const auto policy = config::build_policy(*cfg);
  if (!policy.ok()) {
    std::cerr << policy.error() << "\n";
    return 1;
  }
  std::cout << config::render_config(*cfg, policy.value());
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  mnemobox" << RESET << DIM << "  sandboxed execution of untrusted snippets"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "mnemobox [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << " FILE" << DIM
            << "       Execute a snippet (- reads stdin) and print the result" << RESET << "\n";
  std::cout << "  " << GREEN << "validate" << RESET << " FILE" << DIM
            << "  Run only the static checks" << RESET << "\n";
  std::cout << "  " << GREEN << "policy" << RESET << DIM
            << "         Print the effective policy and its limit guarantees" << RESET << "\n";
  std::cout << "  " << GREEN << "config" << RESET << " [show|path]" << DIM
            << " Show the effective configuration or its location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Print the version" << RESET
            << "\n\n";

  std::cout << BOLD << "  RUN OPTIONS" << RESET << "\n";
  std::cout << "  --preset restrictive|default|permissive\n";
  std::cout << "  --task NAME        Task label passed to the snippet\n";
  std::cout << "  --input JSON       Value exposed as context.input\n";
  std::cout << "  --meta KEY=VALUE   Metadata entry (repeatable)\n";
  std::cout << "  --stats            Print execution metrics to stderr\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return EXIT_USAGE;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_execute(std::move(args));
  }
  if (subcommand == "validate") {
    return run_validate(std::move(args));
  }
  if (subcommand == "policy") {
    return run_policy(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return EXIT_USAGE;
}

} // namespace mnemobox::cli
