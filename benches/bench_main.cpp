#include <iostream>

void run_validation_benchmark();
void run_file_operations_benchmark();

int main() {
  std::cout << "prdguard Benchmarks\n";
  run_validation_benchmark();
  run_file_operations_benchmark();
  return 0;
}
