#include <iostream>

void run_hash_benchmarks();
void run_build_benchmarks();

int main() {
  std::cout << "skillreg benchmarks\n";
  run_hash_benchmarks();
  run_build_benchmarks();
  return 0;
}
