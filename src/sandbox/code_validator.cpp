#include "mnemobox/sandbox/code_validator.hpp"

#include "mnemobox/common/fs.hpp"

#include <cctype>
#include <cstdint>
#include <regex>
#include <vector>

namespace mnemobox::sandbox {

namespace {

struct PatternRule {
  ViolationType type;
  std::regex pattern;
  std::string description;
};

PatternRule rule(const ViolationType type, const char *pattern, std::string description) {
  return PatternRule{.type = type,
                     .pattern = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize),
                     .description = std::move(description)};
}

// Order matters: the first matching rule names the violation.
const std::vector<PatternRule> &rules() {
  static const std::vector<PatternRule> kRules = [] {
    std::vector<PatternRule> out;
    out.push_back(rule(ViolationType::FilesystemAccess,
                       R"(\b(require|import)\s?\(\s?['"`](node:)?fs(/promises)?['"`])",
                       "fs module import"));
    out.push_back(rule(ViolationType::FilesystemAccess,
                       R"(\bimport\b[^;\n]{0,256}?\bfrom\s?['"`](node:)?fs(/promises)?['"`])",
                       "fs module import"));
    out.push_back(rule(ViolationType::FilesystemAccess, R"(\bimport\s?\*\s?as\s?fs\b)",
                       "fs module import"));
    out.push_back(rule(ViolationType::FilesystemAccess, R"(\b(readFile|writeFile|mkdir|rmdir|unlink))",
                       "filesystem primitive"));
    out.push_back(rule(ViolationType::FilesystemAccess, R"(\b__(dirname|filename)\b)",
                       "module path global"));

    out.push_back(rule(ViolationType::NetworkAccess,
                       R"(\b(require|import)\s?\(\s?['"`](node:)?(https?|http2|net|tls|dgram)['"`])",
                       "network module import"));
    out.push_back(
        rule(ViolationType::NetworkAccess,
             R"(\bimport\b[^;\n]{0,256}?\bfrom\s?['"`](node:)?(https?|http2|net|tls|dgram)['"`])",
             "network module import"));
    out.push_back(rule(ViolationType::NetworkAccess, R"(\bfetch\s?\()", "fetch call"));
    out.push_back(rule(ViolationType::NetworkAccess, R"(\b(XMLHttpRequest|WebSocket)\b)",
                       "browser network API"));

    out.push_back(rule(ViolationType::ProcessSpawn, R"(\bchild_process\b)",
                       "child_process module"));
    out.push_back(rule(ViolationType::ProcessSpawn, R"((^|[^.\w$])exec\s?\()", "exec call"));
    out.push_back(rule(ViolationType::ProcessSpawn,
                       R"(\b(execSync|execFile|execFileSync|spawn|spawnSync|fork)\s?\()",
                       "process spawn call"));
    out.push_back(rule(ViolationType::ProcessSpawn, R"(\bprocess\s?\.\s?exit\b)",
                       "process.exit"));

    out.push_back(rule(ViolationType::ResourceExhaustion, R"(\bwhile\s?\(\s?(true|1)\s?\))",
                       "unbounded while loop"));
    out.push_back(rule(ViolationType::ResourceExhaustion, R"(\bfor\s?\(\s?;\s?;\s?\))",
                       "unbounded for loop"));

    out.push_back(rule(ViolationType::CodeInjection, R"(\beval\s?\()", "eval call"));
    out.push_back(rule(ViolationType::CodeInjection, R"(\bFunction\s?\()",
                       "Function constructor"));
    out.push_back(rule(ViolationType::CodeInjection, R"((^|[^.\w$])import\s?\()",
                       "dynamic import"));
    return out;
  }();
  return kRules;
}

// Collapses whitespace runs to a single character so every `\s?` in the
// rules covers any amount of spacing and matching never recurses deeply.
std::string collapse_whitespace(const std::string &code) {
  std::string out;
  out.reserve(code.size());
  bool in_run = false;
  for (const char ch : code) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (!in_run) {
        out.push_back(ch == '\n' ? '\n' : ' ');
        in_run = true;
      } else if (ch == '\n') {
        out.back() = '\n';
      }
      continue;
    }
    in_run = false;
    out.push_back(ch);
  }
  return out;
}

std::string category_label(const ViolationType type) {
  switch (type) {
  case ViolationType::FilesystemAccess:
    return "Filesystem access";
  case ViolationType::NetworkAccess:
    return "Network access";
  case ViolationType::ProcessSpawn:
    return "Process spawn";
  case ViolationType::CodeInjection:
    return "Code injection";
  case ViolationType::ResourceExhaustion:
    return "Resource exhaustion";
  }
  return "Violation";
}

} // namespace

bool is_valid_utf8(const std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t length = 0;
    std::uint32_t cp = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      cp = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > text.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6U) | (cont & 0x3FU);
    }
    const bool overlong = (length == 2 && cp < 0x80) || (length == 3 && cp < 0x800) ||
                          (length == 4 && cp < 0x10000);
    if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

std::optional<Violation> CodeValidator::validate(const std::string &code) const {
  if (code.size() > MAX_CODE_BYTES) {
    return Violation{.type = ViolationType::ResourceExhaustion,
                     .reason = "Code exceeds maximum size of " + std::to_string(MAX_CODE_BYTES) +
                               " bytes"};
  }
  if (code.find('\0') != std::string::npos) {
    return Violation{.type = ViolationType::CodeInjection, .reason = "Code contains a NUL byte"};
  }
  if (!is_valid_utf8(code)) {
    return Violation{.type = ViolationType::CodeInjection, .reason = "Code is not valid UTF-8"};
  }

  const std::string normalized = collapse_whitespace(code);
  for (const auto &candidate : rules()) {
    std::smatch match;
    if (std::regex_search(normalized, match, candidate.pattern)) {
      std::string snippet = match.str(0);
      if (snippet.size() > 64) {
        snippet = snippet.substr(0, 64);
      }
      return Violation{.type = candidate.type,
                       .reason = category_label(candidate.type) + " detected (" +
                                 candidate.description + "): " + common::trim(snippet)};
    }
  }
  return std::nullopt;
}

} // namespace mnemobox::sandbox
