#include <stdlib.h>
#include <string.h>

#include <chrono>
#include <thread>

// Allocates and touches argv[1] MiB, then keeps them for a short while.
int main(int argc, char** argv) {
  const size_t size = atoi(argv[1]) * 1024 * 1024LL;
  char* data = static_cast<char*>(malloc(size));
  if (data == nullptr) return 1;
  memset(data, 1, size);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  int sum = 0;
  for (size_t i = 0; i < size; i += 4096) sum += data[i];
  free(data);
  return sum == 0 ? 1 : 0;
}
