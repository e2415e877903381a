#include <iostream>

void run_chunker_benchmark();
void run_vector_index_benchmark();
void run_storage_benchmark();

int main() {
  std::cout << "MemoryOS Benchmarks\n";
  run_chunker_benchmark();
  run_vector_index_benchmark();
  run_storage_benchmark();
  return 0;
}
