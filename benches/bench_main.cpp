#include <iostream>

void run_startup_benchmark();
void run_cache_benchmark();
void run_index_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "MemoryBank Benchmarks\n";
  run_startup_benchmark();
  run_cache_benchmark();
  run_index_benchmark();
  run_config_benchmark();
  return 0;
}
