#pragma once

#include <cstddef>
#include <string>

namespace mnemobox::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Hex string of `bytes` random bytes from the OpenSSL generator.
[[nodiscard]] std::string random_hex(std::size_t bytes);

} // namespace mnemobox::common
