#include <stdio.h>

// Copies stdin to stdout, and writes argv[1] (if any) to stderr.
int main(int argc, char** argv) {
  int c;
  while ((c = getchar()) != EOF) putchar(c);
  if (argc > 1) fputs(argv[1], stderr);
  return 0;
}
