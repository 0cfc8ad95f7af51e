#include "test_framework.hpp"

#include "mnemobox/cli/commands.hpp"
#include "mnemobox/config/config.hpp"
#include "mnemobox/common/json_util.hpp"
#include "mnemobox/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

CliRun run(std::vector<std::string> args) {
  args.insert(args.begin(), "mnemobox");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::ostringstream out;
  std::ostringstream err;
  auto *old_out = std::cout.rdbuf(out.rdbuf());
  auto *old_err = std::cerr.rdbuf(err.rdbuf());
  const int code = mnemobox::cli::run_cli(static_cast<int>(args.size()), argv.data());
  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  mnemobox::config::clear_config_path_override();
  mnemobox::observability::set_global_observer(nullptr);
  return CliRun{.code = code, .out = out.str(), .err = err.str()};
}

} // namespace

void register_cli_tests(std::vector<mnemobox::tests::TestCase> &tests) {
  using mnemobox::tests::require;
  using mnemobox::testing::TempWorkspace;

  tests.push_back({"cli_version_and_unknown_command", [] {
                     const auto version = run({"version"});
                     require(version.code == 0, "version should succeed");
                     require(version.out.rfind("mnemobox ", 0) == 0, "version output: " + version.out);

                     const auto unknown = run({"frobnicate"});
                     require(unknown.code == 2, "unknown command should be a usage error");
                   }});

  tests.push_back({"cli_validate_exit_codes", [] {
                     TempWorkspace workspace;
                     workspace.create_file("good.js", "return context.input;");
                     workspace.create_file("bad.js", "return eval('1');");

                     const auto good = run({"validate", (workspace.path() / "good.js").string()});
                     require(good.code == 0 && good.out == "ok\n", "clean snippet rejected");

                     const auto bad = run({"validate", (workspace.path() / "bad.js").string()});
                     require(bad.code == 4, "violation exit code");
                     const auto parsed = mnemobox::common::json_parse_flat(bad.out);
                     require(parsed.at("kind") == "security_violation", "output: " + bad.out);
                     require(parsed.at("violation_type") == "code_injection", "output: " + bad.out);

                     const auto missing = run({"validate"});
                     require(missing.code == 2, "missing file should be a usage error");
                   }});

  tests.push_back({"cli_policy_uses_config_file", [] {
                     TempWorkspace workspace;
                     workspace.create_file("config.toml",
                                           "[sandbox]\npreset = \"restrictive\"\n"
                                           "runtime_path = \"/bin/sh\"\n"
                                           "[sandbox.limits]\nmax_execution_time_ms = 1234\n");
                     const auto policy =
                         run({"--config", (workspace.path() / "config.toml").string(), "policy"});
                     require(policy.code == 0, "policy failed: " + policy.err);
                     require(policy.out.find("\"max_execution_time_ms\":1234") != std::string::npos,
                             "override missing: " + policy.out);
                     require(policy.out.find("\"max_memory_bytes\":67108864") != std::string::npos,
                             "preset value missing: " + policy.out);

                     const auto preset = run({"--config", (workspace.path() / "config.toml").string(),
                                              "policy", "--preset", "permissive"});
                     require(preset.code == 0, "preset flag failed: " + preset.err);
                     require(preset.out.find("\"max_memory_bytes\":268435456") != std::string::npos,
                             "preset flag ignored: " + preset.out);

                     const auto path = run({"--config", workspace.path().string(), "config", "path"});
                     require(path.out == (workspace.path() / "config.toml").string() + "\n",
                             "config path: " + path.out);
                   }});

  tests.push_back({"cli_run_reports_rejections_without_runtime", [] {
                     TempWorkspace workspace;
                     workspace.create_file("config.toml", "[observability]\nbackend = \"none\"\n");
                     workspace.create_file("loop.js", "while (true) {}");
                     const auto result = run({"--config", (workspace.path() / "config.toml").string(),
                                              "run", (workspace.path() / "loop.js").string()});
                     require(result.code == 4, "rejected snippet exit code: " + result.err);
                     require(result.out.find("resource_exhaustion") != std::string::npos,
                             "output: " + result.out);

                     const auto usage = run({"--config", (workspace.path() / "config.toml").string(),
                                             "run", "--meta", "novalue", "x.js"});
                     require(usage.code == 2, "bad --meta should be a usage error");
                   }});
}
