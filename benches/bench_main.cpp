#include <iostream>

void run_validator_benchmark();
void run_gatekeeper_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "mnemobox Benchmarks\n";
  run_validator_benchmark();
  run_gatekeeper_benchmark();
  run_config_benchmark();
  return 0;
}
