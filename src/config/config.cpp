#include "mnemobox/config/config.hpp"

#include "mnemobox/common/fs.hpp"
#include "mnemobox/common/toml.hpp"
#include "mnemobox/observability/factory.hpp"
#include "mnemobox/sandbox/process_isolator.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <unistd.h>

namespace mnemobox::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".mnemobox";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr std::uint64_t MIB = 1024ULL * 1024ULL;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("MNEMOBOX_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

common::Status invalid_value(const std::string &key) {
  return common::Status::error("Invalid value for " + key);
}

common::Status read_u64(const common::TomlDocument &doc, const std::string &key,
                        std::optional<std::uint64_t> &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const auto parsed = parse_u64(doc.values.at(key));
  if (!parsed.has_value()) {
    return invalid_value(key);
  }
  out = parsed;
  return common::Status::success();
}

common::Status read_u32(const common::TomlDocument &doc, const std::string &key,
                        std::optional<std::uint32_t> &out) {
  std::optional<std::uint64_t> wide;
  if (auto status = read_u64(doc, key, wide); !status.ok()) {
    return status;
  }
  if (wide.has_value()) {
    if (*wide > std::numeric_limits<std::uint32_t>::max()) {
      return invalid_value(key);
    }
    out = static_cast<std::uint32_t>(*wide);
  }
  return common::Status::success();
}

common::Status read_bool(const common::TomlDocument &doc, const std::string &key,
                         std::optional<bool> &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const std::string value = common::to_lower(common::trim(doc.values.at(key)));
  if (value != "true" && value != "false") {
    return invalid_value(key);
  }
  out = value == "true";
  return common::Status::success();
}

common::Status read_string_array(const common::TomlDocument &doc, const std::string &key,
                                 std::optional<std::vector<std::string>> &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const std::string raw = common::trim(doc.values.at(key));
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return invalid_value(key);
  }
  out = doc.get_string_array(key);
  return common::Status::success();
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

template <typename Container> std::string string_array_to_toml(const Container &values) {
  std::ostringstream out;
  out << "[";
  bool first = true;
  for (const auto &value : values) {
    if (!first) {
      out << ", ";
    }
    first = false;
    out << common::quote_toml_string(std::string(value));
  }
  out << "]";
  return out.str();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &sandbox = config.sandbox;
  sandbox.preset = doc.get_string("sandbox.preset", sandbox.preset);
  sandbox.runtime_path = common::expand_path(doc.get_string("sandbox.runtime_path", sandbox.runtime_path));
  config.observability.backend = doc.get_string("observability.backend", config.observability.backend);

  std::optional<std::uint64_t> max_concurrency;
  std::optional<std::vector<std::string>> allowed_paths;
  const common::Status checks[] = {
      read_u64(doc, "sandbox.max_concurrency", max_concurrency),
      read_u64(doc, "sandbox.slot_timeout_ms", sandbox.slot_timeout_ms),
      read_u64(doc, "sandbox.limits.max_execution_time_ms", sandbox.limits.max_execution_time_ms),
      read_u64(doc, "sandbox.limits.max_memory_mb", sandbox.limits.max_memory_mb),
      read_u32(doc, "sandbox.limits.max_cpu_percent", sandbox.limits.max_cpu_percent),
      read_string_array(doc, "sandbox.filesystem.allowed_paths", allowed_paths),
      read_bool(doc, "sandbox.filesystem.read_only", sandbox.filesystem.read_only),
      read_u64(doc, "sandbox.filesystem.max_path_depth", sandbox.filesystem.max_path_depth),
      read_bool(doc, "sandbox.filesystem.follow_symlinks", sandbox.filesystem.follow_symlinks),
      read_bool(doc, "sandbox.network.block_all", sandbox.network.block_all),
      read_string_array(doc, "sandbox.network.allowed_domains", sandbox.network.allowed_domains),
      read_bool(doc, "sandbox.network.https_only", sandbox.network.https_only),
      read_bool(doc, "sandbox.network.block_private_ips", sandbox.network.block_private_ips),
      read_bool(doc, "sandbox.network.block_localhost", sandbox.network.block_localhost),
      read_u32(doc, "sandbox.network.max_requests", sandbox.network.max_requests),
      read_u32(doc, "sandbox.isolation.drop_to_uid", sandbox.isolation.drop_to_uid),
      read_u32(doc, "sandbox.isolation.drop_to_gid", sandbox.isolation.drop_to_gid),
      read_u32(doc, "sandbox.isolation.max_processes", sandbox.isolation.max_processes),
      read_bool(doc, "sandbox.isolation.isolate_network_namespace",
                sandbox.isolation.isolate_network_namespace),
  };
  for (const auto &status : checks) {
    if (!status.ok()) {
      return common::Result<Config>::failure(status.error());
    }
  }

  if (max_concurrency.has_value()) {
    sandbox.max_concurrency = *max_concurrency;
  }
  if (allowed_paths.has_value()) {
    std::vector<std::string> expanded;
    for (const auto &path : *allowed_paths) {
      expanded.push_back(common::expand_path(path));
    }
    sandbox.filesystem.allowed_paths = std::move(expanded);
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  Config config;
  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    const auto content = common::read_file(path);
    if (!content.ok()) {
      return common::Result<Config>::failure(content.error());
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  if (auto status = apply_env_overrides(config); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  return common::Result<Config>::success(std::move(config));
}

common::Status apply_env_overrides(Config &config) {
  if (const char *preset = std::getenv("MNEMOBOX_PRESET"); preset != nullptr && *preset) {
    config.sandbox.preset = preset;
  }

  if (const char *concurrency = std::getenv("MNEMOBOX_MAX_CONCURRENCY");
      concurrency != nullptr && *concurrency) {
    const auto parsed = parse_u64(concurrency);
    if (!parsed.has_value()) {
      return common::Status::error("Invalid MNEMOBOX_MAX_CONCURRENCY: " + std::string(concurrency));
    }
    config.sandbox.max_concurrency = *parsed;
  }

  if (const char *runtime = std::getenv("MNEMOBOX_RUNTIME"); runtime != nullptr && *runtime) {
    config.sandbox.runtime_path = common::expand_path(runtime);
  }

  if (const char *backend = std::getenv("MNEMOBOX_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
  return common::Status::success();
}

common::Result<sandbox::PolicyConfig> build_policy(const Config &config) {
  const auto preset = sandbox::preset_from_string(config.sandbox.preset);
  if (!preset.ok()) {
    return common::Result<sandbox::PolicyConfig>::failure(preset.error());
  }
  const auto base = sandbox::PolicyConfig::from_preset(preset.value());
  const auto &overrides = config.sandbox;

  sandbox::ResourceLimits limits = base.limits();
  if (overrides.limits.max_execution_time_ms.has_value()) {
    limits.max_execution_time = std::chrono::milliseconds(*overrides.limits.max_execution_time_ms);
  }
  if (overrides.limits.max_memory_mb.has_value()) {
    limits.max_memory_bytes = *overrides.limits.max_memory_mb * MIB;
  }
  if (overrides.limits.max_cpu_percent.has_value()) {
    limits.max_cpu_percent = *overrides.limits.max_cpu_percent;
  }

  sandbox::FilesystemRules filesystem = base.filesystem();
  if (overrides.filesystem.allowed_paths.has_value()) {
    filesystem.allowed_paths.clear();
    for (const auto &path : *overrides.filesystem.allowed_paths) {
      filesystem.allowed_paths.insert(std::filesystem::path(path));
    }
  }
  filesystem.read_only = overrides.filesystem.read_only.value_or(filesystem.read_only);
  if (overrides.filesystem.max_path_depth.has_value()) {
    filesystem.max_path_depth = static_cast<std::size_t>(*overrides.filesystem.max_path_depth);
  }
  filesystem.follow_symlinks =
      overrides.filesystem.follow_symlinks.value_or(filesystem.follow_symlinks);

  sandbox::NetworkRules network = base.network();
  network.block_all_network = overrides.network.block_all.value_or(network.block_all_network);
  if (overrides.network.allowed_domains.has_value()) {
    network.allowed_domains = std::set<std::string>(overrides.network.allowed_domains->begin(),
                                                    overrides.network.allowed_domains->end());
  }
  network.https_only = overrides.network.https_only.value_or(network.https_only);
  network.block_private_ips = overrides.network.block_private_ips.value_or(network.block_private_ips);
  network.block_localhost = overrides.network.block_localhost.value_or(network.block_localhost);
  network.max_requests = overrides.network.max_requests.value_or(network.max_requests);

  sandbox::IsolationRules isolation = base.isolation();
  if (overrides.isolation.drop_to_uid.has_value()) {
    isolation.drop_to_uid = overrides.isolation.drop_to_uid;
  }
  if (overrides.isolation.drop_to_gid.has_value()) {
    isolation.drop_to_gid = overrides.isolation.drop_to_gid;
  }
  isolation.max_processes = overrides.isolation.max_processes.value_or(isolation.max_processes);
  isolation.isolate_network_namespace =
      overrides.isolation.isolate_network_namespace.value_or(isolation.isolate_network_namespace);

  return sandbox::PolicyConfig::custom(std::move(limits), std::move(filesystem), std::move(network),
                                       std::move(isolation));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.sandbox.max_concurrency == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "sandbox.max_concurrency must be greater than zero");
  }

  if (!observability::is_known_backend(config.observability.backend)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  const auto policy = build_policy(config);
  if (!policy.ok()) {
    return common::Result<std::vector<std::string>>::failure(policy.error());
  }

  const auto &network = policy.value().network();
  if (network.block_all_network && !network.allowed_domains.empty()) {
    warnings.push_back(
        "sandbox.network.allowed_domains has no effect while sandbox.network.block_all is true");
  }
  if (!network.block_all_network && network.max_requests == 0) {
    warnings.push_back("sandbox.network.max_requests is 0; every request will be denied");
  }

  const auto &isolation = policy.value().isolation();
  if ((isolation.drop_to_uid.has_value() || isolation.drop_to_gid.has_value()) && geteuid() != 0) {
    warnings.push_back("sandbox.isolation privilege drop needs root; executions will fail to launch");
  }

  if (config.sandbox.slot_timeout_ms.has_value() && *config.sandbox.slot_timeout_ms == 0) {
    warnings.push_back("sandbox.slot_timeout_ms is 0; executions time out whenever all slots are busy");
  }

  if (!sandbox::runtime_available(config.sandbox.runtime_path)) {
    warnings.push_back("sandbox runtime not found: " + config.sandbox.runtime_path);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::string render_config(const Config &config, const sandbox::PolicyConfig &policy) {
  const auto &limits = policy.limits();
  const auto &filesystem = policy.filesystem();
  const auto &network = policy.network();
  const auto &isolation = policy.isolation();

  std::vector<std::string> allowed_paths;
  for (const auto &path : filesystem.allowed_paths) {
    allowed_paths.push_back(path.string());
  }

  std::ostringstream out;
  out << "[sandbox]\n";
  out << "preset = " << common::quote_toml_string(config.sandbox.preset) << "\n";
  out << "max_concurrency = " << config.sandbox.max_concurrency << "\n";
  out << "runtime_path = " << common::quote_toml_string(config.sandbox.runtime_path) << "\n";
  if (config.sandbox.slot_timeout_ms.has_value()) {
    out << "slot_timeout_ms = " << *config.sandbox.slot_timeout_ms << "\n";
  }

  out << "\n[sandbox.limits]\n";
  out << "max_execution_time_ms = " << limits.max_execution_time.count() << "\n";
  out << "max_memory_mb = " << limits.max_memory_bytes / MIB << "\n";
  out << "max_cpu_percent = " << limits.max_cpu_percent << "\n";

  out << "\n[sandbox.filesystem]\n";
  out << "allowed_paths = " << string_array_to_toml(allowed_paths) << "\n";
  out << "read_only = " << bool_to_toml(filesystem.read_only) << "\n";
  out << "max_path_depth = " << filesystem.max_path_depth << "\n";
  out << "follow_symlinks = " << bool_to_toml(filesystem.follow_symlinks) << "\n";

  out << "\n[sandbox.network]\n";
  out << "block_all = " << bool_to_toml(network.block_all_network) << "\n";
  out << "allowed_domains = " << string_array_to_toml(network.allowed_domains) << "\n";
  out << "https_only = " << bool_to_toml(network.https_only) << "\n";
  out << "block_private_ips = " << bool_to_toml(network.block_private_ips) << "\n";
  out << "block_localhost = " << bool_to_toml(network.block_localhost) << "\n";
  out << "max_requests = " << network.max_requests << "\n";

  out << "\n[sandbox.isolation]\n";
  if (isolation.drop_to_uid.has_value()) {
    out << "drop_to_uid = " << *isolation.drop_to_uid << "\n";
  }
  if (isolation.drop_to_gid.has_value()) {
    out << "drop_to_gid = " << *isolation.drop_to_gid << "\n";
  }
  out << "max_processes = " << isolation.max_processes << "\n";
  out << "isolate_network_namespace = " << bool_to_toml(isolation.isolate_network_namespace)
      << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

} // namespace mnemobox::config
