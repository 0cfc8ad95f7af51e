#include "bench_common.hpp"

#include "mnemobox/config/config.hpp"

void run_config_benchmark() {
  mnemobox::bench::run_bench("config_build_policy", 2000, [] {
    mnemobox::config::Config config;
    config.sandbox.preset = "permissive";
    config.sandbox.network.allowed_domains = std::vector<std::string>{"api.example.com"};
    (void)mnemobox::config::build_policy(config);
  });
}
