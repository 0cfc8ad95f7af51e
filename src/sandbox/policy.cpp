#include "mnemobox/sandbox/policy.hpp"

#include "mnemobox/common/fs.hpp"
#include "mnemobox/common/json_util.hpp"

#include <sstream>

namespace mnemobox::sandbox {

namespace {

constexpr std::uint64_t MIB = 1024ULL * 1024ULL;

std::string bool_json(const bool value) { return value ? "true" : "false"; }

template <typename Container, typename ToString>
std::string string_array_json(const Container &values, ToString to_string) {
  std::ostringstream out;
  out << '[';
  bool first = true;
  for (const auto &value : values) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << common::json_quote(to_string(value));
  }
  out << ']';
  return out.str();
}

} // namespace

PolicyConfig::PolicyConfig() : PolicyConfig(standard()) {}

PolicyConfig::PolicyConfig(ResourceLimits limits, FilesystemRules filesystem,
                           NetworkRules network, IsolationRules isolation)
    : limits_(std::move(limits)), filesystem_(std::move(filesystem)), network_(std::move(network)),
      isolation_(std::move(isolation)) {}

PolicyConfig PolicyConfig::restrictive() {
  return PolicyConfig(ResourceLimits{.max_execution_time = std::chrono::milliseconds(3000),
                                     .max_memory_bytes = 64 * MIB,
                                     .max_cpu_percent = 30},
                      FilesystemRules{}, NetworkRules{}, IsolationRules{});
}

PolicyConfig PolicyConfig::standard() {
  return PolicyConfig(ResourceLimits{.max_execution_time = std::chrono::milliseconds(5000),
                                     .max_memory_bytes = 128 * MIB,
                                     .max_cpu_percent = 50},
                      FilesystemRules{}, NetworkRules{}, IsolationRules{});
}

PolicyConfig PolicyConfig::permissive() {
  FilesystemRules filesystem;
  filesystem.allowed_paths = {"/tmp"};
  filesystem.read_only = false;

  NetworkRules network;
  network.max_requests = 10;

  return PolicyConfig(ResourceLimits{.max_execution_time = std::chrono::milliseconds(10000),
                                     .max_memory_bytes = 256 * MIB,
                                     .max_cpu_percent = 80},
                      std::move(filesystem), std::move(network), IsolationRules{});
}

PolicyConfig PolicyConfig::from_preset(const PolicyPreset preset) {
  switch (preset) {
  case PolicyPreset::Restrictive:
    return restrictive();
  case PolicyPreset::Permissive:
    return permissive();
  case PolicyPreset::Default:
    break;
  }
  return standard();
}

common::Result<PolicyConfig> PolicyConfig::custom(ResourceLimits limits, FilesystemRules filesystem,
                                                  NetworkRules network, IsolationRules isolation) {
  if (const auto status = validate_policy(limits, filesystem, network); !status.ok()) {
    return common::Result<PolicyConfig>::failure(status.error());
  }

  std::set<std::string> domains;
  for (const auto &domain : network.allowed_domains) {
    std::string normalized = common::to_lower(common::trim(domain));
    while (!normalized.empty() && normalized.back() == '.') {
      normalized.pop_back();
    }
    domains.insert(std::move(normalized));
  }
  network.allowed_domains = std::move(domains);

  return common::Result<PolicyConfig>::success(PolicyConfig(
      std::move(limits), std::move(filesystem), std::move(network), std::move(isolation)));
}

common::Status validate_policy(const ResourceLimits &limits, const FilesystemRules &filesystem,
                               const NetworkRules &network) {
  if (limits.max_execution_time.count() <= 0) {
    return common::Status::error("max_execution_time must be greater than zero");
  }
  if (limits.max_memory_bytes == 0) {
    return common::Status::error("max_memory_bytes must be greater than zero");
  }
  if (limits.max_cpu_percent == 0 || limits.max_cpu_percent > 100) {
    return common::Status::error("max_cpu_percent must be between 1 and 100");
  }
  if (filesystem.max_path_depth == 0) {
    return common::Status::error("max_path_depth must be greater than zero");
  }
  for (const auto &path : filesystem.allowed_paths) {
    if (path.empty() || !path.is_absolute()) {
      return common::Status::error("allowed path must be absolute: " + path.string());
    }
  }
  for (const auto &domain : network.allowed_domains) {
    if (common::trim(domain).empty()) {
      return common::Status::error("allowed domain must not be empty");
    }
  }
  return common::Status::success();
}

LimitGuarantees PolicyConfig::limit_guarantees() const {
  LimitGuarantees guarantees;
  if (isolation_.drop_to_uid.has_value()) {
    guarantees.process_count = LimitGuarantee::Enforced;
  }
  return guarantees;
}

std::string PolicyConfig::to_json() const {
  const auto guarantees = limit_guarantees();
  const auto optional_id = [](const std::optional<std::uint32_t> &id) {
    return id.has_value() ? std::to_string(*id) : std::string("null");
  };

  std::ostringstream out;
  out << "{\"limits\":{"
      << "\"max_execution_time_ms\":" << limits_.max_execution_time.count()
      << ",\"max_memory_bytes\":" << limits_.max_memory_bytes
      << ",\"max_cpu_percent\":" << limits_.max_cpu_percent << ",\"guarantees\":{"
      << "\"execution_time\":" << common::json_quote(limit_guarantee_to_string(guarantees.execution_time))
      << ",\"memory\":" << common::json_quote(limit_guarantee_to_string(guarantees.memory))
      << ",\"cpu\":" << common::json_quote(limit_guarantee_to_string(guarantees.cpu)) << "}}"
      << ",\"filesystem\":{"
      << "\"allowed_paths\":"
      << string_array_json(filesystem_.allowed_paths,
                           [](const std::filesystem::path &p) { return p.string(); })
      << ",\"read_only\":" << bool_json(filesystem_.read_only)
      << ",\"max_path_depth\":" << filesystem_.max_path_depth
      << ",\"follow_symlinks\":" << bool_json(filesystem_.follow_symlinks) << "}"
      << ",\"network\":{"
      << "\"block_all_network\":" << bool_json(network_.block_all_network)
      << ",\"allowed_domains\":"
      << string_array_json(network_.allowed_domains, [](const std::string &d) { return d; })
      << ",\"https_only\":" << bool_json(network_.https_only)
      << ",\"block_private_ips\":" << bool_json(network_.block_private_ips)
      << ",\"block_localhost\":" << bool_json(network_.block_localhost)
      << ",\"max_requests\":" << network_.max_requests << "}"
      << ",\"isolation\":{"
      << "\"drop_to_uid\":" << optional_id(isolation_.drop_to_uid)
      << ",\"drop_to_gid\":" << optional_id(isolation_.drop_to_gid)
      << ",\"max_processes\":" << isolation_.max_processes
      << ",\"max_processes_guarantee\":"
      << common::json_quote(limit_guarantee_to_string(guarantees.process_count))
      << ",\"isolate_network_namespace\":" << bool_json(isolation_.isolate_network_namespace)
      << "}}";
  return out.str();
}

common::Result<PolicyPreset> preset_from_string(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "restrictive") {
    return common::Result<PolicyPreset>::success(PolicyPreset::Restrictive);
  }
  if (normalized == "default" || normalized.empty()) {
    return common::Result<PolicyPreset>::success(PolicyPreset::Default);
  }
  if (normalized == "permissive") {
    return common::Result<PolicyPreset>::success(PolicyPreset::Permissive);
  }
  return common::Result<PolicyPreset>::failure("Unknown policy preset: " + name);
}

std::string preset_to_string(const PolicyPreset preset) {
  switch (preset) {
  case PolicyPreset::Restrictive:
    return "restrictive";
  case PolicyPreset::Default:
    return "default";
  case PolicyPreset::Permissive:
    return "permissive";
  }
  return "default";
}

std::string limit_guarantee_to_string(const LimitGuarantee guarantee) {
  switch (guarantee) {
  case LimitGuarantee::Enforced:
    return "enforced";
  case LimitGuarantee::BestEffort:
    return "best_effort";
  case LimitGuarantee::Advisory:
    return "advisory";
  }
  return "advisory";
}

} // namespace mnemobox::sandbox
