#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include <unistd.h>

// Stands in for a long-running launcher: publishes its PID in the file named
// by $PID_WAIT_FILE, then sleeps for 10 seconds.
int main() {
  const char* path = getenv("PID_WAIT_FILE");
  if (path == nullptr) return 100;
  std::string tmp = std::string(path) + ".tmp";
  FILE* out = fopen(tmp.c_str(), "w");
  if (out == nullptr) return 101;
  fprintf(out, "%d\n", static_cast<int>(getpid()));
  fclose(out);
  // Readers never see a partially written file.
  if (rename(tmp.c_str(), path) == -1) return 102;
  std::this_thread::sleep_for(std::chrono::seconds(10));
  return 0;
}
