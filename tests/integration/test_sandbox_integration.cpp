#include "../test_framework.hpp"

#include "mnemobox/common/fs.hpp"
#include "mnemobox/sandbox/coordinator.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cerrno>
#include <future>
#include <memory>
#include <sys/wait.h>

namespace {

namespace sb = mnemobox::sandbox;
using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

std::shared_ptr<sb::IProcessIsolator> node_isolator() {
  return std::make_shared<sb::NodeProcessIsolator>(sb::IsolatorOptions{
      .runtime_path = "node",
      .http_client = std::make_shared<mnemobox::testing::FakeHttpClient>(),
      .resolver = [](const std::string &) {
        return mnemobox::common::Result<std::vector<std::string>>::success({"93.184.216.34"});
      },
  });
}

sb::PolicyConfig policy_with_limits(const std::chrono::milliseconds time,
                                    const std::uint64_t memory_mb) {
  return sb::PolicyConfig::custom(
             sb::ResourceLimits{.max_execution_time = time,
                                .max_memory_bytes = memory_mb * 1024 * 1024,
                                .max_cpu_percent = 100},
             sb::FilesystemRules{}, sb::NetworkRules{})
      .value();
}

bool no_children_left() {
  errno = 0;
  return waitpid(-1, nullptr, WNOHANG) == -1 && errno == ECHILD;
}

std::string describe(const sb::ExecutionResult &result) { return sb::to_json(result); }

} // namespace

void register_sandbox_integration_tests(std::vector<mnemobox::tests::TestCase> &tests) {
  using mnemobox::tests::require;

  tests.push_back({"integration_returns_json_output", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     sb::SandboxCoordinator coordinator({}, node_isolator());
                     const auto result = coordinator.execute("return 1 + 1", sb::ExecutionContext{});
                     require(std::holds_alternative<sb::Success>(result), describe(result));
                     require(std::get<sb::Success>(result).output == "2", describe(result));
                   }});

  tests.push_back({"integration_exposes_context", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     sb::SandboxCoordinator coordinator({}, node_isolator());
                     const sb::ExecutionContext context{
                         .task = "summarize",
                         .input = R"({"values":[3,4,5]})",
                         .metadata = {{"user", "u-17"}}};
                     const auto result = coordinator.execute(
                         "console.log('task', context.task);\n"
                         "const sum = context.input.values.reduce((a, b) => a + b, 0);\n"
                         "return { sum, user: context.metadata.user };",
                         context);
                     require(std::holds_alternative<sb::Success>(result), describe(result));
                     const auto &success = std::get<sb::Success>(result);
                     require(success.output == R"({"sum":12,"user":"u-17"})", success.output);
                     require(success.captured_stdout == "task summarize\n", success.captured_stdout);
                   }});

  tests.push_back({"integration_reports_errors", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     sb::SandboxCoordinator coordinator({}, node_isolator());

                     const auto syntax = coordinator.execute("return (", sb::ExecutionContext{});
                     require(std::holds_alternative<sb::Error>(syntax), describe(syntax));
                     require(std::get<sb::Error>(syntax).error_type == sb::ErrorType::Syntax,
                             describe(syntax));

                     const auto runtime =
                         coordinator.execute("throw new TypeError('bad input');", sb::ExecutionContext{});
                     require(std::holds_alternative<sb::Error>(runtime), describe(runtime));
                     const auto &error = std::get<sb::Error>(runtime);
                     require(error.error_type == sb::ErrorType::Runtime, describe(runtime));
                     require(error.message == "TypeError: bad input", error.message);

                     const auto bad_input =
                         coordinator.execute("return context.input;", sb::ExecutionContext{.input = "{oops"});
                     require(std::holds_alternative<sb::Error>(bad_input), describe(bad_input));
                   }});

  tests.push_back({"integration_enforces_timeout", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     sb::SandboxCoordinator coordinator({}, node_isolator());
                     const auto started = Clock::now();
                     const auto result = coordinator.execute(
                         "console.log('tick'); let i = 0; while (i >= 0) { i++; }",
                         sb::ExecutionContext{}, policy_with_limits(1000ms, 128));
                     const auto wall =
                         std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

                     require(std::holds_alternative<sb::Timeout>(result), describe(result));
                     const auto &timeout = std::get<sb::Timeout>(result);
                     require(timeout.elapsed >= 950ms, "stopped early: " + describe(result));
                     require(wall < 1200ms, "timeout overshoot: " + std::to_string(wall.count()));
                     require(timeout.partial_output == std::optional<std::string>("tick\n"),
                             "partial output: " + describe(result));
                     require(no_children_left(), "runtime process left behind");
                   }});

  tests.push_back({"integration_blocks_filesystem_and_network", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     sb::SandboxCoordinator coordinator({}, node_isolator());

                     const auto read = coordinator.execute("return sandbox.readText('/etc/passwd');",
                                                           sb::ExecutionContext{});
                     require(std::holds_alternative<sb::SecurityViolation>(read), describe(read));
                     require(std::get<sb::SecurityViolation>(read).violation_type ==
                                 sb::ViolationType::FilesystemAccess,
                             describe(read));

                     const auto request = coordinator.execute(
                         "return sandbox.request('https://evil.com/').status;", sb::ExecutionContext{});
                     require(std::holds_alternative<sb::SecurityViolation>(request), describe(request));
                     require(std::get<sb::SecurityViolation>(request).violation_type ==
                                 sb::ViolationType::NetworkAccess,
                             describe(request));

                     const auto blocked = coordinator.execute("const fs = require('fs');",
                                                              sb::ExecutionContext{});
                     require(std::holds_alternative<sb::SecurityViolation>(blocked), describe(blocked));
                   }});

  tests.push_back({"integration_workspace_round_trip", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     mnemobox::testing::TempWorkspace workspace;
                     sb::FilesystemRules filesystem;
                     filesystem.allowed_paths = {workspace.path()};
                     filesystem.read_only = false;
                     const auto policy =
                         sb::PolicyConfig::custom(sb::ResourceLimits{}, filesystem, sb::NetworkRules{});
                     require(policy.ok(), "workspace policy rejected");

                     sb::SandboxCoordinator coordinator({}, node_isolator());
                     const auto result = coordinator.execute(
                         "sandbox.writeText('report.txt', 'total=' + context.input.total);\n"
                         "return sandbox.readText('report.txt');",
                         sb::ExecutionContext{.input = R"({"total":9})"}, policy.value());
                     require(std::holds_alternative<sb::Success>(result), describe(result));
                     require(std::get<sb::Success>(result).output == "\"total=9\"", describe(result));
                     const auto content = mnemobox::common::read_file(workspace.path() / "report.txt");
                     require(content.ok() && content.value() == "total=9", "file not written");
                   }});

  tests.push_back({"integration_context_has_no_host_handles", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     sb::SandboxCoordinator coordinator({}, node_isolator());
                     const auto globals = coordinator.execute(
                         "return [typeof process, typeof require, typeof Buffer, typeof module];",
                         sb::ExecutionContext{});
                     require(std::holds_alternative<sb::Success>(globals), describe(globals));
                     require(std::get<sb::Success>(globals).output ==
                                 R"(["undefined","undefined","undefined","undefined"])",
                             describe(globals));

                     const auto climb = coordinator.execute(
                         "return (function () {}).constructor.constructor('return process')();",
                         sb::ExecutionContext{});
                     require(std::holds_alternative<sb::Error>(climb), describe(climb));

                     // Process metadata is a frozen snapshot, not the live object.
                     const auto snapshot = coordinator.execute(
                         "sandbox.process.platform = 'x'; return sandbox.process.platform;",
                         sb::ExecutionContext{});
                     require(std::holds_alternative<sb::Success>(snapshot), describe(snapshot));
                     require(std::get<sb::Success>(snapshot).output != "\"x\"",
                             "process snapshot is writable");
                   }});

  tests.push_back({"integration_memory_exhaustion", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     sb::SandboxCoordinator coordinator({}, node_isolator());
                     const auto result = coordinator.execute(
                         "const hoard = []; let i = 0;\n"
                         "while (i >= 0) { hoard.push('x'.repeat(1024) + i); i++; }",
                         sb::ExecutionContext{}, policy_with_limits(10000ms, 64));
                     require(std::holds_alternative<sb::SecurityViolation>(result), describe(result));
                     require(std::get<sb::SecurityViolation>(result).violation_type ==
                                 sb::ViolationType::ResourceExhaustion,
                             describe(result));
                     require(no_children_left(), "runtime process left behind");
                   }});

  tests.push_back({"integration_parallel_executions", [] {
                     if (!mnemobox::testing::node_available()) {
                       return;
                     }
                     sb::SandboxCoordinator coordinator({.max_concurrency = 2}, node_isolator());
                     std::vector<std::future<sb::ExecutionResult>> futures;
                     for (int i = 0; i < 4; ++i) {
                       futures.push_back(coordinator.execute_async(
                           "return context.input * 2;",
                           sb::ExecutionContext{.input = std::to_string(i)}));
                     }
                     for (int i = 0; i < 4; ++i) {
                       const auto result = futures[static_cast<std::size_t>(i)].get();
                       require(std::holds_alternative<sb::Success>(result), describe(result));
                       require(std::get<sb::Success>(result).output == std::to_string(i * 2),
                               describe(result));
                     }
                   }});
}
