#include "test_framework.hpp"

#include "mnemobox/sandbox/code_validator.hpp"

namespace {

namespace sb = mnemobox::sandbox;

void require_blocked(const std::string &code, const sb::ViolationType expected) {
  const sb::CodeValidator validator;
  const auto violation = validator.validate(code);
  mnemobox::tests::require(violation.has_value(), "validator accepted: " + code);
  mnemobox::tests::require(violation->type == expected,
                           "wrong category for `" + code + "`: " +
                               sb::violation_type_to_string(violation->type));
}

} // namespace

void register_code_validator_tests(std::vector<mnemobox::tests::TestCase> &tests) {
  using mnemobox::tests::require;

  tests.push_back({"validator_accepts_benign_code", [] {
                     const sb::CodeValidator validator;
                     for (const std::string code :
                          {"return 1 + 1;",
                           "const total = context.input.items.reduce((a, b) => a + b, 0);\nreturn total;",
                           "let i = 0; while (i < 10) { i++; } return i;",
                           "const executor = {}; return executor.name;",
                           "return sandbox.readText('notes.txt').length;",
                           "const filename = 'report.txt'; return filename;"}) {
                       const auto violation = validator.validate(code);
                       require(!violation.has_value(),
                               "benign code rejected: " + code + " -> " +
                                   (violation.has_value() ? violation->reason : std::string()));
                     }
                   }});

  tests.push_back({"validator_blocks_filesystem_access", [] {
                     require_blocked("const fs = require('fs');", sb::ViolationType::FilesystemAccess);
                     require_blocked("const fs = require(\"node:fs/promises\");",
                                     sb::ViolationType::FilesystemAccess);
                     require_blocked("import { readFileSync } from 'fs';",
                                     sb::ViolationType::FilesystemAccess);
                     require_blocked("obj.writeFile('/tmp/x', data)", sb::ViolationType::FilesystemAccess);
                     require_blocked("return __dirname;", sb::ViolationType::FilesystemAccess);
                   }});

  tests.push_back({"validator_blocks_network_access", [] {
                     require_blocked("const net = require('net');", sb::ViolationType::NetworkAccess);
                     require_blocked("await fetch('https://example.com')", sb::ViolationType::NetworkAccess);
                     require_blocked("new WebSocket('wss://example.com')", sb::ViolationType::NetworkAccess);
                   }});

  tests.push_back({"validator_blocks_process_spawn", [] {
                     require_blocked("require('child_process')", sb::ViolationType::ProcessSpawn);
                     require_blocked("exec('ls')", sb::ViolationType::ProcessSpawn);
                     require_blocked("cp.spawn('sh')", sb::ViolationType::ProcessSpawn);
                     require_blocked("process.exit(1)", sb::ViolationType::ProcessSpawn);
                   }});

  tests.push_back({"validator_blocks_code_injection", [] {
                     require_blocked("eval('1 + 1')", sb::ViolationType::CodeInjection);
                     require_blocked("new Function('return 1')", sb::ViolationType::CodeInjection);
                     require_blocked("const m = await import('os');", sb::ViolationType::CodeInjection);
                   }});

  tests.push_back({"validator_blocks_unbounded_loops", [] {
                     require_blocked("while(true){}", sb::ViolationType::ResourceExhaustion);
                     require_blocked("while (1) { work(); }", sb::ViolationType::ResourceExhaustion);
                     require_blocked("for(;;){}", sb::ViolationType::ResourceExhaustion);
                   }});

  tests.push_back({"validator_normalizes_whitespace", [] {
                     require_blocked("eval   \t (x)", sb::ViolationType::CodeInjection);
                     require_blocked("while\n(\n  true\n)\n{}", sb::ViolationType::ResourceExhaustion);
                     require_blocked("for ( ;\t; ) {}", sb::ViolationType::ResourceExhaustion);
                     require_blocked("require  (  'fs'  )", sb::ViolationType::FilesystemAccess);
                   }});

  tests.push_back({"validator_rejects_oversized_and_malformed_input", [] {
                     const sb::CodeValidator validator;
                     const std::string big(sb::CodeValidator::MAX_CODE_BYTES + 1, ' ');
                     const auto oversized = validator.validate(big);
                     require(oversized.has_value() &&
                                 oversized->type == sb::ViolationType::ResourceExhaustion,
                             "oversized code accepted");

                     const std::string at_limit(sb::CodeValidator::MAX_CODE_BYTES, ' ');
                     require(!validator.validate(at_limit).has_value(), "code at the limit rejected");

                     require_blocked(std::string("return 1;\0", 10), sb::ViolationType::CodeInjection);
                     require_blocked("return '\xC3\x28';", sb::ViolationType::CodeInjection);
                     require_blocked("return '\xED\xA0\x80';", sb::ViolationType::CodeInjection);
                   }});

  tests.push_back({"validator_reason_names_category_and_match", [] {
                     const sb::CodeValidator validator;
                     const auto violation = validator.validate("let x = eval('2');");
                     require(violation.has_value(), "eval accepted");
                     require(violation->reason.rfind("Code injection detected (eval call)", 0) == 0,
                             "reason format: " + violation->reason);
                     require(violation->reason.find("eval(") != std::string::npos,
                             "reason does not quote the match");
                   }});

  tests.push_back({"utf8_validation", [] {
                     require(sb::is_valid_utf8("plain ascii"), "ascii rejected");
                     require(sb::is_valid_utf8("caf\xC3\xA9 \xF0\x9F\x98\x80"), "multi-byte rejected");
                     require(!sb::is_valid_utf8("\xC0\xAF"), "overlong accepted");
                     require(!sb::is_valid_utf8("\xF4\x90\x80\x80"), "out-of-range accepted");
                     require(!sb::is_valid_utf8("\xE2\x82"), "truncated sequence accepted");
                   }});
}
