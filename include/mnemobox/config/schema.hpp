#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mnemobox::config {

// Unset fields keep the value of the selected preset.

struct LimitsConfig {
  std::optional<std::uint64_t> max_execution_time_ms;
  std::optional<std::uint64_t> max_memory_mb;
  std::optional<std::uint32_t> max_cpu_percent;
};

struct FilesystemConfig {
  std::optional<std::vector<std::string>> allowed_paths;
  std::optional<bool> read_only;
  std::optional<std::uint64_t> max_path_depth;
  std::optional<bool> follow_symlinks;
};

struct NetworkConfig {
  std::optional<bool> block_all;
  std::optional<std::vector<std::string>> allowed_domains;
  std::optional<bool> https_only;
  std::optional<bool> block_private_ips;
  std::optional<bool> block_localhost;
  std::optional<std::uint32_t> max_requests;
};

struct IsolationConfig {
  std::optional<std::uint32_t> drop_to_uid;
  std::optional<std::uint32_t> drop_to_gid;
  std::optional<std::uint32_t> max_processes;
  std::optional<bool> isolate_network_namespace;
};

struct SandboxConfig {
  std::string preset = "default";
  std::uint64_t max_concurrency = 20;
  std::string runtime_path = "node";
  std::optional<std::uint64_t> slot_timeout_ms;
  LimitsConfig limits;
  FilesystemConfig filesystem;
  NetworkConfig network;
  IsolationConfig isolation;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SandboxConfig sandbox;
  ObservabilityConfig observability;
};

} // namespace mnemobox::config
