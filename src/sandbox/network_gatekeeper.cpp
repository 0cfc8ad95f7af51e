#include "mnemobox/sandbox/network_gatekeeper.hpp"

#include "mnemobox/common/fs.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <array>
#include <cctype>
#include <charconv>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace mnemobox::sandbox {

namespace {

bool looks_numeric_ipv4(const std::string &host) {
  if (host.empty() || std::isdigit(static_cast<unsigned char>(host.front())) == 0) {
    return false;
  }
  for (const char ch : host) {
    if (std::isxdigit(static_cast<unsigned char>(ch)) == 0 && ch != '.' && ch != 'x' &&
        ch != 'X') {
      return false;
    }
  }
  return true;
}

std::string ipv4_text(const in_addr &addr) {
  std::array<char, INET_ADDRSTRLEN> buffer{};
  inet_ntop(AF_INET, &addr, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

std::string ipv6_text(const in6_addr &addr) {
  std::array<char, INET6_ADDRSTRLEN> buffer{};
  inet_ntop(AF_INET6, &addr, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

std::uint32_t ipv4_host_order(const in_addr &addr) { return ntohl(addr.s_addr); }

bool in_v4_range(const std::uint32_t ip, const std::uint32_t base, const int prefix) {
  const std::uint32_t mask = prefix == 0 ? 0U : (~0U << (32 - prefix));
  return (ip & mask) == (base & mask);
}

constexpr std::uint32_t v4(const std::uint32_t a, const std::uint32_t b, const std::uint32_t c,
                           const std::uint32_t d) {
  return (a << 24U) | (b << 16U) | (c << 8U) | d;
}

bool v4_loopback(const std::uint32_t ip) { return in_v4_range(ip, v4(127, 0, 0, 0), 8) || ip == 0; }

bool v4_private(const std::uint32_t ip) {
  return in_v4_range(ip, v4(0, 0, 0, 0), 8) || in_v4_range(ip, v4(10, 0, 0, 0), 8) ||
         in_v4_range(ip, v4(100, 64, 0, 0), 10) || in_v4_range(ip, v4(169, 254, 0, 0), 16) ||
         in_v4_range(ip, v4(172, 16, 0, 0), 12) || in_v4_range(ip, v4(192, 0, 0, 0), 24) ||
         in_v4_range(ip, v4(192, 0, 2, 0), 24) || in_v4_range(ip, v4(192, 168, 0, 0), 16) ||
         in_v4_range(ip, v4(198, 18, 0, 0), 15) || in_v4_range(ip, v4(198, 51, 100, 0), 24) ||
         in_v4_range(ip, v4(203, 0, 113, 0), 24) || in_v4_range(ip, v4(224, 0, 0, 0), 4) ||
         in_v4_range(ip, v4(240, 0, 0, 0), 4);
}

// IPv4-mapped (::ffff:0:0/96), IPv4-compatible (::/96) and NAT64 (64:ff9b::/96)
// addresses carry an IPv4 address in their low 32 bits.
bool embedded_ipv4(const in6_addr &addr, std::uint32_t &out) {
  const auto *b = addr.s6_addr;
  const bool zero_prefix = std::all_of(b, b + 10, [](unsigned char v) { return v == 0; });
  const bool mapped = zero_prefix && b[10] == 0xFF && b[11] == 0xFF;
  const bool compatible = zero_prefix && b[10] == 0 && b[11] == 0 &&
                          !(b[12] == 0 && b[13] == 0 && b[14] == 0 && b[15] <= 1);
  const bool nat64 = b[0] == 0x00 && b[1] == 0x64 && b[2] == 0xFF && b[3] == 0x9B &&
                     std::all_of(b + 4, b + 12, [](unsigned char v) { return v == 0; });
  if (!mapped && !compatible && !nat64) {
    return false;
  }
  out = (static_cast<std::uint32_t>(b[12]) << 24U) | (static_cast<std::uint32_t>(b[13]) << 16U) |
        (static_cast<std::uint32_t>(b[14]) << 8U) | static_cast<std::uint32_t>(b[15]);
  return true;
}

bool v6_loopback(const in6_addr &addr) {
  return IN6_IS_ADDR_LOOPBACK(&addr) || IN6_IS_ADDR_UNSPECIFIED(&addr);
}

bool v6_private(const in6_addr &addr) {
  const auto *b = addr.s6_addr;
  const bool unique_local = (b[0] & 0xFE) == 0xFC;
  const bool link_local = b[0] == 0xFE && (b[1] & 0xC0) == 0x80;
  const bool site_local = b[0] == 0xFE && (b[1] & 0xC0) == 0xC0;
  const bool multicast = b[0] == 0xFF;
  const bool documentation = b[0] == 0x20 && b[1] == 0x01 && b[2] == 0x0D && b[3] == 0xB8;
  return unique_local || link_local || site_local || multicast || documentation;
}

bool is_localhost_name(const std::string &host) {
  return host == "localhost" || common::ends_with(host, ".localhost") ||
         host == "localhost.localdomain" || host == "ip6-localhost" || host == "ip6-loopback";
}

bool valid_hostname(const std::string &host) {
  if (host.empty() || host.size() > 253) {
    return false;
  }
  for (const char ch : host) {
    const auto byte = static_cast<unsigned char>(ch);
    if (std::isalnum(byte) == 0 && ch != '-' && ch != '.' && ch != '_') {
      return false;
    }
  }
  return host.front() != '.' && host.find("..") == std::string::npos;
}

} // namespace

common::Result<std::string> canonical_ip(const std::string &host) {
  std::string candidate = host;
  if (candidate.size() >= 2 && candidate.front() == '[' && candidate.back() == ']') {
    candidate = candidate.substr(1, candidate.size() - 2);
  }

  in6_addr addr6{};
  if (candidate.find(':') != std::string::npos &&
      inet_pton(AF_INET6, candidate.c_str(), &addr6) == 1) {
    return common::Result<std::string>::success(ipv6_text(addr6));
  }

  in_addr addr4{};
  if (looks_numeric_ipv4(candidate) && inet_aton(candidate.c_str(), &addr4) != 0) {
    return common::Result<std::string>::success(ipv4_text(addr4));
  }
  return common::Result<std::string>::failure("Not an IP address: " + host);
}

bool is_loopback_address(const std::string &ip) {
  in_addr addr4{};
  if (inet_pton(AF_INET, ip.c_str(), &addr4) == 1) {
    return v4_loopback(ipv4_host_order(addr4));
  }
  in6_addr addr6{};
  if (inet_pton(AF_INET6, ip.c_str(), &addr6) == 1) {
    std::uint32_t embedded = 0;
    if (embedded_ipv4(addr6, embedded)) {
      return v4_loopback(embedded);
    }
    return v6_loopback(addr6);
  }
  return false;
}

bool is_private_address(const std::string &ip) {
  in_addr addr4{};
  if (inet_pton(AF_INET, ip.c_str(), &addr4) == 1) {
    const auto value = ipv4_host_order(addr4);
    return v4_private(value) || value == v4(255, 255, 255, 255);
  }
  in6_addr addr6{};
  if (inet_pton(AF_INET6, ip.c_str(), &addr6) == 1) {
    std::uint32_t embedded = 0;
    if (embedded_ipv4(addr6, embedded)) {
      return v4_private(embedded);
    }
    return v6_private(addr6);
  }
  return false;
}

common::Result<ParsedUrl> parse_url(const std::string &url) {
  using UrlResult = common::Result<ParsedUrl>;

  for (const char ch : url) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte <= 0x20 || byte == 0x7F || ch == '\\') {
      return UrlResult::failure("URL contains forbidden characters");
    }
  }

  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return UrlResult::failure("URL has no scheme: " + url);
  }

  ParsedUrl parsed;
  parsed.scheme = common::to_lower(url.substr(0, scheme_end));

  const std::size_t authority_start = scheme_end + 3;
  const std::size_t authority_end = url.find_first_of("/?#", authority_start);
  std::string authority = url.substr(authority_start, authority_end == std::string::npos
                                                          ? std::string::npos
                                                          : authority_end - authority_start);
  if (authority_end != std::string::npos) {
    std::string rest = url.substr(authority_end);
    if (const auto fragment = rest.find('#'); fragment != std::string::npos) {
      rest.resize(fragment);
    }
    if (rest.empty() || rest.front() != '/') {
      rest.insert(rest.begin(), '/');
    }
    parsed.path_and_query = rest;
  }

  if (const auto at = authority.rfind('@'); at != std::string::npos) {
    authority = authority.substr(at + 1);
  }

  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      return UrlResult::failure("Unterminated IPv6 host in URL: " + url);
    }
    parsed.host = authority.substr(0, close + 1);
    const std::string tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return UrlResult::failure("Malformed authority in URL: " + url);
      }
      port_text = tail.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    parsed.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  parsed.host = common::to_lower(parsed.host);
  while (!parsed.host.empty() && parsed.host.back() == '.') {
    parsed.host.pop_back();
  }
  if (parsed.host.empty()) {
    return UrlResult::failure("URL has no host: " + url);
  }

  if (parsed.scheme == "https") {
    parsed.port = 443;
  } else if (parsed.scheme == "http") {
    parsed.port = 80;
  }
  if (!port_text.empty()) {
    unsigned int port = 0;
    const auto *first = port_text.data();
    const auto *last = first + port_text.size();
    const auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc() || ptr != last || port == 0 || port > 65535) {
      return UrlResult::failure("Invalid port in URL: " + url);
    }
    parsed.port = static_cast<std::uint16_t>(port);
  }

  if (const auto ip = canonical_ip(parsed.host); ip.ok()) {
    parsed.host_is_ip = true;
    parsed.host = ip.value();
  } else if (!valid_hostname(parsed.host)) {
    return UrlResult::failure("Invalid host in URL: " + parsed.host);
  }

  return UrlResult::success(std::move(parsed));
}

HostResolver system_resolver() {
  return [](const std::string &host) -> common::Result<std::vector<std::string>> {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *results = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (rc != 0) {
      return common::Result<std::vector<std::string>>::failure(
          "Unable to resolve " + host + ": " + gai_strerror(rc));
    }
    std::vector<std::string> addresses;
    for (const addrinfo *it = results; it != nullptr; it = it->ai_next) {
      std::string text;
      if (it->ai_family == AF_INET) {
        text = ipv4_text(reinterpret_cast<const sockaddr_in *>(it->ai_addr)->sin_addr);
      } else if (it->ai_family == AF_INET6) {
        text = ipv6_text(reinterpret_cast<const sockaddr_in6 *>(it->ai_addr)->sin6_addr);
      }
      if (!text.empty() && std::find(addresses.begin(), addresses.end(), text) == addresses.end()) {
        addresses.push_back(std::move(text));
      }
    }
    freeaddrinfo(results);
    return common::Result<std::vector<std::string>>::success(std::move(addresses));
  };
}

NetworkGatekeeper::NetworkGatekeeper(NetworkRules rules, HostResolver resolver)
    : rules_(std::move(rules)), resolver_(resolver ? std::move(resolver) : system_resolver()) {}

bool NetworkGatekeeper::permit(const std::string &url) { return check(url).ok(); }

common::Result<NetworkTarget> NetworkGatekeeper::check(const std::string &url) {
  auto evaluated = evaluate(url);
  if (!evaluated.ok()) {
    return evaluated;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (requests_made_ >= rules_.max_requests) {
    return common::Result<NetworkTarget>::failure(
        "Network request budget exhausted (max_requests=" + std::to_string(rules_.max_requests) +
        ")");
  }
  ++requests_made_;
  return evaluated;
}

common::Result<NetworkTarget> NetworkGatekeeper::evaluate(const std::string &url) const {
  using TargetResult = common::Result<NetworkTarget>;

  if (rules_.block_all_network) {
    return TargetResult::failure("All network access is blocked");
  }

  auto parsed = parse_url(url);
  if (!parsed.ok()) {
    return TargetResult::failure(parsed.error());
  }
  const ParsedUrl &target = parsed.value();

  if (target.scheme != "http" && target.scheme != "https") {
    return TargetResult::failure("Unsupported protocol: " + target.scheme);
  }
  if (rules_.https_only && target.scheme != "https") {
    return TargetResult::failure("Only HTTPS requests are allowed: " + url);
  }

  if (rules_.block_localhost && is_localhost_name(target.host)) {
    return TargetResult::failure("Localhost access denied: " + target.host);
  }
  if (target.host_is_ip) {
    if (const auto status = check_address(target.host); !status.ok()) {
      return TargetResult::failure(status.error());
    }
  }

  if (!host_allowed(target)) {
    return TargetResult::failure("Domain not in allowlist: " + target.host);
  }

  NetworkTarget result;
  result.url = target;
  if (target.host_is_ip) {
    result.resolved_addresses.push_back(target.host);
  } else {
    // A permitted hostname always carries at least one vetted pin.
    const auto resolved = resolver_(target.host);
    if (!resolved.ok()) {
      return TargetResult::failure("DNS resolution failed for " + target.host + ": " +
                                   resolved.error());
    }
    if (resolved.value().empty()) {
      return TargetResult::failure("DNS resolution returned no addresses for " + target.host);
    }
    for (const auto &address : resolved.value()) {
      if (const auto status = check_address(address); !status.ok()) {
        return TargetResult::failure(status.error() + " (resolved from " + target.host + ")");
      }
    }
    result.resolved_addresses = resolved.value();
  }

  const bool bracket = target.host.find(':') != std::string::npos;
  result.normalized_url = target.scheme + "://" + (bracket ? "[" + target.host + "]" : target.host) +
                          ":" + std::to_string(target.port) + target.path_and_query;
  return TargetResult::success(std::move(result));
}

std::uint32_t NetworkGatekeeper::requests_made() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_made_;
}

common::Status NetworkGatekeeper::check_address(const std::string &ip) const {
  if (rules_.block_localhost && is_loopback_address(ip)) {
    return common::Status::error("Localhost access denied: " + ip);
  }
  if (rules_.block_private_ips && is_private_address(ip)) {
    return common::Status::error("Private IP access denied: " + ip);
  }
  return common::Status::success();
}

bool NetworkGatekeeper::host_allowed(const ParsedUrl &url) const {
  for (const auto &entry : rules_.allowed_domains) {
    std::string domain = common::to_lower(common::trim(entry));
    while (!domain.empty() && domain.back() == '.') {
      domain.pop_back();
    }
    if (domain.empty()) {
      continue;
    }
    if (url.host_is_ip) {
      if (const auto ip = canonical_ip(domain); ip.ok() && ip.value() == url.host) {
        return true;
      }
      continue;
    }
    if (url.host == domain || common::ends_with(url.host, "." + domain)) {
      return true;
    }
  }
  return false;
}

} // namespace mnemobox::sandbox
