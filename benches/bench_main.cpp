#include <iostream>

void run_memory_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "engram benchmarks\n";
  run_memory_benchmark();
  run_config_benchmark();
  return 0;
}
