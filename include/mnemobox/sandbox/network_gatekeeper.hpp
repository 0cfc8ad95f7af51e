#pragma once

#include "mnemobox/common/result.hpp"
#include "mnemobox/sandbox/policy.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mnemobox::sandbox {

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::uint16_t port = 0;
  std::string path_and_query = "/";
  bool host_is_ip = false;
};

/// A request that passed every rule: the URL rebuilt from its parsed parts
/// plus the addresses the resolver vetted, so the caller can pin them.
struct NetworkTarget {
  ParsedUrl url;
  std::string normalized_url;
  std::vector<std::string> resolved_addresses;
};

using HostResolver =
    std::function<common::Result<std::vector<std::string>>(const std::string &host)>;

/// getaddrinfo-backed resolver returning numeric addresses.
[[nodiscard]] HostResolver system_resolver();

[[nodiscard]] common::Result<ParsedUrl> parse_url(const std::string &url);

/// Accepts dotted, bracketed and numeric IPv4 forms (`2130706433`, `0x7f.1`)
/// and IPv6 text; returns the canonical numeric text.
[[nodiscard]] common::Result<std::string> canonical_ip(const std::string &host);
[[nodiscard]] bool is_loopback_address(const std::string &ip);
[[nodiscard]] bool is_private_address(const std::string &ip);

class NetworkGatekeeper {
public:
  /// Without a resolver, hostnames are looked up with system_resolver().
  explicit NetworkGatekeeper(NetworkRules rules, HostResolver resolver = nullptr);

  /// Accepting consumes one unit of the request budget.
  [[nodiscard]] bool permit(const std::string &url);
  [[nodiscard]] common::Result<NetworkTarget> check(const std::string &url);

  /// Evaluates every rule except the budget without consuming it.
  [[nodiscard]] common::Result<NetworkTarget> evaluate(const std::string &url) const;

  [[nodiscard]] std::uint32_t requests_made() const;
  [[nodiscard]] const NetworkRules &rules() const { return rules_; }

private:
  [[nodiscard]] common::Status check_address(const std::string &ip) const;
  [[nodiscard]] bool host_allowed(const ParsedUrl &url) const;

  NetworkRules rules_;
  HostResolver resolver_;
  mutable std::mutex mutex_;
  std::uint32_t requests_made_ = 0;
};

} // namespace mnemobox::sandbox
