#include <cstdio>

// Prints each argument on its own line on stdout, and a marker on stderr.
int main(int argc, char** argv) {
  for (int i = 1; i < argc; i++) printf("%s\n", argv[i]);
  fprintf(stderr, "print_args: done\n");
  return 0;
}
