#include "test_framework.hpp"

#include "mnemobox/common/json_util.hpp"
#include "mnemobox/sandbox/policy.hpp"
#include "mnemobox/sandbox/runtime_bootstrap.hpp"
#include "mnemobox/sandbox/types.hpp"

#include <algorithm>

void register_policy_tests(std::vector<mnemobox::tests::TestCase> &tests) {
  using mnemobox::tests::require;
  namespace sb = mnemobox::sandbox;
  using std::chrono::milliseconds;
  constexpr std::uint64_t MIB = 1024ULL * 1024ULL;

  tests.push_back({"policy_presets_have_expected_limits", [] {
                     const auto restrictive = sb::PolicyConfig::restrictive();
                     require(restrictive.limits().max_execution_time == milliseconds(3000),
                             "restrictive time");
                     require(restrictive.limits().max_memory_bytes == 64 * MIB, "restrictive memory");
                     require(restrictive.limits().max_cpu_percent == 30, "restrictive cpu");

                     const auto standard = sb::PolicyConfig::standard();
                     require(standard.limits().max_execution_time == milliseconds(5000),
                             "standard time");
                     require(standard.limits().max_memory_bytes == 128 * MIB, "standard memory");
                     require(standard.filesystem().allowed_paths.empty(), "standard fs not deny-all");
                     require(standard.network().block_all_network, "standard network not blocked");

                     const auto permissive = sb::PolicyConfig::permissive();
                     require(permissive.limits().max_execution_time == milliseconds(10000),
                             "permissive time");
                     require(permissive.filesystem().allowed_paths.count("/tmp") == 1,
                             "permissive should allow /tmp");
                     require(!permissive.filesystem().read_only, "permissive should be writable");
                     require(permissive.network().max_requests == 10, "permissive request budget");
                   }});

  tests.push_back({"policy_default_constructor_is_standard", [] {
                     const sb::PolicyConfig policy;
                     require(policy.to_json() == sb::PolicyConfig::standard().to_json(),
                             "default constructor should match the standard preset");
                   }});

  tests.push_back({"policy_from_preset_round_trips_names", [] {
                     for (const auto preset : {sb::PolicyPreset::Restrictive, sb::PolicyPreset::Default,
                                               sb::PolicyPreset::Permissive}) {
                       const auto parsed = sb::preset_from_string(sb::preset_to_string(preset));
                       require(parsed.ok() && parsed.value() == preset, "preset name mismatch");
                     }
                     const auto upper = sb::preset_from_string("  RESTRICTIVE ");
                     require(upper.ok() && upper.value() == sb::PolicyPreset::Restrictive,
                             "preset names are case-insensitive");
                     require(!sb::preset_from_string("yolo").ok(), "unknown preset accepted");
                   }});

  tests.push_back({"policy_custom_rejects_impossible_limits", [] {
                     const auto zero_time = sb::PolicyConfig::custom(
                         sb::ResourceLimits{.max_execution_time = milliseconds(0)}, {}, {});
                     require(!zero_time.ok(), "zero execution time accepted");

                     const auto cpu = sb::PolicyConfig::custom(
                         sb::ResourceLimits{.max_cpu_percent = 150}, {}, {});
                     require(!cpu.ok(), "cpu percent above 100 accepted");

                     sb::FilesystemRules relative;
                     relative.allowed_paths = {"data"};
                     require(!sb::PolicyConfig::custom({}, relative, {}).ok(),
                             "relative allowed path accepted");
                   }});

  tests.push_back({"policy_custom_normalizes_domains", [] {
                     sb::NetworkRules network;
                     network.block_all_network = false;
                     network.allowed_domains = {" API.Example.COM. "};
                     const auto policy = sb::PolicyConfig::custom({}, {}, network);
                     require(policy.ok(), policy.ok() ? "" : policy.error());
                     require(policy.value().network().allowed_domains.count("api.example.com") == 1,
                             "domain not normalized");
                   }});

  tests.push_back({"policy_reports_limit_guarantees", [] {
                     const auto policy = sb::PolicyConfig::standard();
                     const auto guarantees = policy.limit_guarantees();
                     require(guarantees.execution_time == sb::LimitGuarantee::Enforced,
                             "time must be enforced");
                     require(guarantees.memory == sb::LimitGuarantee::BestEffort, "memory guarantee");
                     require(guarantees.cpu == sb::LimitGuarantee::Advisory, "cpu guarantee");
                     const auto json = policy.to_json();
                     require(json.find(R"("execution_time":"enforced")") != std::string::npos,
                             "guarantees missing from json: " + json);
                     require(json.find(R"("cpu":"advisory")") != std::string::npos,
                             "cpu guarantee missing from json");
                     require(guarantees.process_count == sb::LimitGuarantee::BestEffort,
                             "process ceiling without a uid drop");
                     require(json.find(R"("max_processes_guarantee":"best_effort")") !=
                                 std::string::npos,
                             "process guarantee missing from json: " + json);

                     sb::IsolationRules isolation;
                     isolation.drop_to_uid = 65534;
                     const auto dropped = sb::PolicyConfig::custom(sb::ResourceLimits{},
                                                                   sb::FilesystemRules{},
                                                                   sb::NetworkRules{}, isolation);
                     require(dropped.ok(), dropped.ok() ? "" : dropped.error());
                     require(dropped.value().limit_guarantees().process_count ==
                                 sb::LimitGuarantee::Enforced,
                             "uid drop should enforce the process ceiling");
                     require(dropped.value().to_json().find(
                                 R"("max_processes_guarantee":"enforced")") != std::string::npos,
                             "enforced process guarantee missing from json");
                   }});

  tests.push_back({"types_outcome_kind_and_json", [] {
                     const sb::ExecutionResult violation =
                         sb::SecurityViolation{.reason = "Domain not in allowlist",
                                               .violation_type = sb::ViolationType::NetworkAccess};
                     require(sb::outcome_kind(violation) == sb::OutcomeKind::SecurityViolation,
                             "kind mismatch");
                     const auto json = sb::to_json(violation);
                     const auto fields = mnemobox::common::json_parse_flat(json);
                     require(fields.at("kind") == "security_violation", "kind field");
                     require(fields.at("violation_type") == "network_access", "violation type field");

                     const sb::ExecutionResult timeout = sb::Timeout{.elapsed = milliseconds(1000)};
                     require(mnemobox::common::json_parse_flat(sb::to_json(timeout))
                                     .at("partial_output") == "null",
                             "missing partial output should be null");
                   }});

  tests.push_back({"runtime_flags_disable_codegen_and_cap_heap", [] {
                     const auto flags = sb::runtime_flags(sb::PolicyConfig::restrictive());
                     const auto has = [&flags](const std::string &flag) {
                       return std::find(flags.begin(), flags.end(), flag) != flags.end();
                     };
                     require(has("--experimental-permission"), "permission model not enabled");
                     require(has("--disallow-code-generation-from-strings"), "codegen not disabled");
                     require(has("--max-old-space-size=64"), "heap flag mismatch");
                     require(flags.back() == "-", "program must come from stdin");
                   }});

  tests.push_back({"runtime_heap_has_floor", [] {
                     const auto tiny = sb::PolicyConfig::custom(
                         sb::ResourceLimits{.max_memory_bytes = 1024}, {}, {});
                     require(tiny.ok(), "tiny memory policy should be valid");
                     require(sb::runtime_heap_megabytes(tiny.value()) == 8, "heap floor not applied");
                   }});

  tests.push_back({"runtime_program_embeds_payload_as_json", [] {
                     sb::ExecutionContext context;
                     context.task = "t\"ask";
                     context.input = R"({"n":3})";
                     context.metadata = {{"tenant", "acme"}};
                     const auto program = sb::build_runtime_program("return `</script>`;", context);
                     require(program.rfind("'use strict';\n", 0) == 0, "strict directive not first");
                     require(program.find(R"("task":"t\"ask")") != std::string::npos,
                             "task not escaped");
                     require(program.find(R"("input":"{\"n\":3}")") != std::string::npos,
                             "input not embedded as a string");
                     require(program.find(R"("metadata":{"tenant":"acme"})") != std::string::npos,
                             "metadata missing");
                   }});
}
