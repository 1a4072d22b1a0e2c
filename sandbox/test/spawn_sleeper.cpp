#include <stdio.h>
#include <unistd.h>

// Leaves a sleeping process behind and exits. Its pid is printed on stdout.
int main() {
  pid_t pid = fork();
  if (pid == -1) return 1;
  if (pid == 0) {
    sleep(30);
    return 0;
  }
  printf("%d\n", static_cast<int>(pid));
  return 0;
}
