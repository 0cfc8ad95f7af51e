#pragma once

#include "mnemobox/sandbox/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mnemobox::sandbox {

/// Static screen run against the raw source before any execution resource is
/// allocated. Obfuscated code can slip past it; the runtime gates still apply.
class CodeValidator {
public:
  static constexpr std::size_t MAX_CODE_BYTES = 100 * 1024;

  [[nodiscard]] std::optional<Violation> validate(const std::string &code) const;
};

[[nodiscard]] bool is_valid_utf8(std::string_view text);

} // namespace mnemobox::sandbox
