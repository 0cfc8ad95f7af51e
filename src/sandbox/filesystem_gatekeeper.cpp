#include "mnemobox/sandbox/filesystem_gatekeeper.hpp"

#include "mnemobox/common/fs.hpp"

#include <sstream>

namespace mnemobox::sandbox {

namespace {

int hex_digit(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool has_control_character(const std::string &value) {
  for (const char ch : value) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x20 || byte == 0x7F) {
      return true;
    }
  }
  return false;
}

// Zero-width spaces and joiners, bidi overrides, word joiner and BOM.
bool has_invisible_character(const std::string &value) {
  for (std::size_t i = 0; i + 2 < value.size(); ++i) {
    const auto b0 = static_cast<unsigned char>(value[i]);
    const auto b1 = static_cast<unsigned char>(value[i + 1]);
    const auto b2 = static_cast<unsigned char>(value[i + 2]);
    if (b0 == 0xE2 && b1 == 0x80 && ((b2 >= 0x8B && b2 <= 0x8F) || (b2 >= 0xAA && b2 <= 0xAE))) {
      return true;
    }
    if (b0 == 0xE2 && b1 == 0x81 && b2 == 0xA0) {
      return true;
    }
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) {
      return true;
    }
  }
  return false;
}

bool has_parent_segment(const std::string &value) {
  std::string segment;
  std::stringstream stream(value);
  while (std::getline(stream, segment, '/')) {
    std::stringstream inner(segment);
    std::string part;
    while (std::getline(inner, part, '\\')) {
      if (part == "..") {
        return true;
      }
    }
  }
  return false;
}

bool has_encoded_separator(const std::string &value) {
  const std::string lowered = common::to_lower(value);
  return lowered.find("%2e") != std::string::npos || lowered.find("%2f") != std::string::npos ||
         lowered.find("%5c") != std::string::npos || lowered.find("%00") != std::string::npos;
}

std::filesystem::path strip_trailing_separator(std::filesystem::path path) {
  path = path.lexically_normal();
  std::string text = path.string();
  while (text.size() > 1 && text.back() == '/') {
    text.pop_back();
  }
  return std::filesystem::path(text);
}

std::size_t path_depth(const std::filesystem::path &path) {
  std::size_t depth = 0;
  for (const auto &part : path.relative_path()) {
    if (!part.empty()) {
      ++depth;
    }
  }
  return depth;
}

} // namespace

std::string percent_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      const int hi = hex_digit(value[i + 1]);
      const int lo = hex_digit(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

std::string access_intent_to_string(const AccessIntent intent) {
  switch (intent) {
  case AccessIntent::Read:
    return "read";
  case AccessIntent::Write:
    return "write";
  case AccessIntent::Create:
    return "create";
  case AccessIntent::Delete:
    return "delete";
  }
  return "read";
}

FilesystemGatekeeper::FilesystemGatekeeper(FilesystemRules rules) : rules_(std::move(rules)) {
  for (const auto &root : rules_.allowed_paths) {
    if (root.empty() || !root.is_absolute()) {
      continue;
    }
    auto normalized = strip_trailing_separator(root);
    if (rules_.follow_symlinks) {
      std::error_code ec;
      auto canonical = std::filesystem::weakly_canonical(normalized, ec);
      if (!ec) {
        normalized = strip_trailing_separator(canonical);
      }
    }
    allowed_roots_.push_back(std::move(normalized));
  }
}

bool FilesystemGatekeeper::permit(const std::string &path, const AccessIntent intent) const {
  return check(path, intent).ok();
}

common::Result<std::filesystem::path> FilesystemGatekeeper::check(const std::string &path,
                                                                  const AccessIntent intent) const {
  using PathResult = common::Result<std::filesystem::path>;

  if (path.empty()) {
    return PathResult::failure("Empty path");
  }

  const std::string decoded = percent_decode(path);
  for (const auto *candidate : {&path, &decoded}) {
    if (candidate->find('\0') != std::string::npos) {
      return PathResult::failure("Path contains null byte");
    }
    if (has_control_character(*candidate)) {
      return PathResult::failure("Path contains control character");
    }
    if (has_invisible_character(*candidate)) {
      return PathResult::failure("Path contains invisible character");
    }
    if (has_parent_segment(*candidate)) {
      return PathResult::failure("Path traversal detected: " + path);
    }
  }
  if (has_encoded_separator(decoded)) {
    return PathResult::failure("Path contains nested percent-encoding: " + path);
  }

  if (allowed_roots_.empty()) {
    return PathResult::failure("Filesystem access denied: no paths are allowed");
  }

  std::filesystem::path candidate(decoded);
  if (candidate.is_relative()) {
    candidate = allowed_roots_.front() / candidate;
  }
  candidate = strip_trailing_separator(candidate);

  if (path_depth(candidate) > rules_.max_path_depth) {
    return PathResult::failure("Path depth " + std::to_string(path_depth(candidate)) +
                               " exceeds limit of " + std::to_string(rules_.max_path_depth));
  }

  if (rules_.follow_symlinks) {
    std::error_code ec;
    const auto canonical = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
      return PathResult::failure("Path canonicalization failed: " + ec.message());
    }
    candidate = strip_trailing_separator(canonical);
  } else if (const auto status = check_symlinks(candidate); !status.ok()) {
    return PathResult::failure(status.error());
  }

  bool allowed = false;
  for (const auto &root : allowed_roots_) {
    if (common::is_subpath(candidate, root)) {
      allowed = true;
      break;
    }
  }
  if (!allowed) {
    return PathResult::failure("Path is outside the allowed paths: " + candidate.string());
  }

  if (rules_.read_only && intent != AccessIntent::Read) {
    return PathResult::failure("Filesystem is read-only; " + access_intent_to_string(intent) +
                               " denied for " + candidate.string());
  }

  return PathResult::success(candidate);
}

common::Status FilesystemGatekeeper::check_symlinks(const std::filesystem::path &path) const {
  std::filesystem::path prefix;
  for (const auto &part : path) {
    prefix /= part;
    if (part.empty() || prefix == path.root_path()) {
      continue;
    }
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(prefix, ec);
    if (ec || !std::filesystem::exists(status)) {
      // Components below a missing directory cannot be links either.
      break;
    }
    if (std::filesystem::is_symlink(status)) {
      return common::Status::error("Path traverses a symbolic link: " + prefix.string());
    }
  }
  return common::Status::success();
}

} // namespace mnemobox::sandbox
