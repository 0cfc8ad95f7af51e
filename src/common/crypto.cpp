#include "mnemobox/common/crypto.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>

namespace mnemobox::common {

namespace {

template <typename Bytes> std::string to_hex(const Bytes &bytes) {
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (const unsigned char byte : bytes) {
    out << std::setw(2) << static_cast<int>(byte);
  }
  return out.str();
}

} // namespace

std::string sha256_hex(const std::string &text) {
  std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest.data());
  return to_hex(digest);
}

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    // Ids are not secrets; mix clock and counter when the generator fails.
    static std::atomic<std::uint64_t> counter{0};
    std::uint64_t seed = static_cast<std::uint64_t>(
                             std::chrono::steady_clock::now().time_since_epoch().count()) ^
                         (counter.fetch_add(1) << 32U);
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(seed & 0xffU);
      seed = (seed >> 8U) | (seed << 56U);
    }
  }
  return to_hex(data);
}

} // namespace mnemobox::common
