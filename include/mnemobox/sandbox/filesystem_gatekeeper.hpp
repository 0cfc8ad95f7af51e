#pragma once

#include "mnemobox/common/result.hpp"
#include "mnemobox/sandbox/policy.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mnemobox::sandbox {

enum class AccessIntent { Read, Write, Create, Delete };

/// Decides whether a path the snippet names may be touched. Deny-all unless
/// the rules list allowed roots; `..` is rejected, never resolved.
class FilesystemGatekeeper {
public:
  explicit FilesystemGatekeeper(FilesystemRules rules);

  [[nodiscard]] bool permit(const std::string &path, AccessIntent intent = AccessIntent::Read) const;

  /// Returns the normalized path on success, the denial reason otherwise.
  [[nodiscard]] common::Result<std::filesystem::path>
  check(const std::string &path, AccessIntent intent = AccessIntent::Read) const;

  [[nodiscard]] const FilesystemRules &rules() const { return rules_; }

private:
  [[nodiscard]] common::Status check_symlinks(const std::filesystem::path &path) const;

  FilesystemRules rules_;
  std::vector<std::filesystem::path> allowed_roots_;
};

[[nodiscard]] std::string access_intent_to_string(AccessIntent intent);

/// Single-pass %XX decoding; malformed escapes are kept literally.
[[nodiscard]] std::string percent_decode(const std::string &value);

} // namespace mnemobox::sandbox
