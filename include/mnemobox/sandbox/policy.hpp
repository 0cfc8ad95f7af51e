#pragma once

#include "mnemobox/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace mnemobox::sandbox {

struct ResourceLimits {
  std::chrono::milliseconds max_execution_time{5000};
  std::uint64_t max_memory_bytes = 128ULL * 1024 * 1024;
  std::uint32_t max_cpu_percent = 50;
};

struct FilesystemRules {
  std::set<std::filesystem::path> allowed_paths;
  bool read_only = true;
  std::size_t max_path_depth = 10;
  bool follow_symlinks = false;
};

/// When block_all_network is set the remaining fields are never consulted.
struct NetworkRules {
  bool block_all_network = true;
  std::set<std::string> allowed_domains;
  bool https_only = true;
  bool block_private_ips = true;
  bool block_localhost = true;
  std::uint32_t max_requests = 0;
};

struct IsolationRules {
  std::optional<std::uint32_t> drop_to_uid;
  std::optional<std::uint32_t> drop_to_gid;
  std::uint32_t max_processes = 1;
  bool isolate_network_namespace = true;
};

enum class PolicyPreset { Restrictive, Default, Permissive };

enum class LimitGuarantee { Enforced, BestEffort, Advisory };

struct LimitGuarantees {
  LimitGuarantee execution_time = LimitGuarantee::Enforced;
  LimitGuarantee memory = LimitGuarantee::BestEffort;
  LimitGuarantee cpu = LimitGuarantee::Advisory;
  /// RLIMIT_NPROC needs a dedicated uid to count against; without one the
  /// ceiling rests on the runtime's permission model alone.
  LimitGuarantee process_count = LimitGuarantee::BestEffort;
};

/// Immutable bundle of every rule an execution runs under. Copies are cheap
/// enough to hand one to each execution.
class PolicyConfig {
public:
  PolicyConfig();

  [[nodiscard]] static PolicyConfig restrictive();
  [[nodiscard]] static PolicyConfig standard();
  [[nodiscard]] static PolicyConfig permissive();
  [[nodiscard]] static PolicyConfig from_preset(PolicyPreset preset);

  /// Explicit override constructor; rejects limits that could never run code.
  [[nodiscard]] static common::Result<PolicyConfig> custom(ResourceLimits limits,
                                                           FilesystemRules filesystem,
                                                           NetworkRules network,
                                                           IsolationRules isolation = {});

  [[nodiscard]] const ResourceLimits &limits() const { return limits_; }
  [[nodiscard]] const FilesystemRules &filesystem() const { return filesystem_; }
  [[nodiscard]] const NetworkRules &network() const { return network_; }
  [[nodiscard]] const IsolationRules &isolation() const { return isolation_; }

  [[nodiscard]] LimitGuarantees limit_guarantees() const;

  [[nodiscard]] std::string to_json() const;

private:
  PolicyConfig(ResourceLimits limits, FilesystemRules filesystem, NetworkRules network,
               IsolationRules isolation);

  ResourceLimits limits_;
  FilesystemRules filesystem_;
  NetworkRules network_;
  IsolationRules isolation_;
};

[[nodiscard]] common::Status validate_policy(const ResourceLimits &limits,
                                             const FilesystemRules &filesystem,
                                             const NetworkRules &network);

[[nodiscard]] common::Result<PolicyPreset> preset_from_string(const std::string &name);
[[nodiscard]] std::string preset_to_string(PolicyPreset preset);
[[nodiscard]] std::string limit_guarantee_to_string(LimitGuarantee guarantee);

} // namespace mnemobox::sandbox
