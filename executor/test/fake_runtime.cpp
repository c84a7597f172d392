#include <stdio.h>
#include <string.h>
#include <unistd.h>

// Stands in for the container runtime CLI. "rm" takes a second. "run" prints
// its arguments, one per line, and then behaves according to the image:
//   no-time: fails like docker when /usr/bin/time is not in the image.
//   sh-no-time: fails like a shell that cannot find /usr/bin/time.
//   with-time: writes an accounting report when the wrapper is used.
//   sleep: never terminates.
//   fail: fails like a runtime that cannot start the container.
int main(int argc, char** argv) {
  if (argc >= 2 && strcmp(argv[1], "rm") == 0) {
    sleep(1);
    return 0;
  }
  if (argc < 2 || strcmp(argv[1], "run") != 0) return 0;
  const char* image = nullptr;
  bool wrapped = false;
  for (int i = 2; i < argc; i++) {
    printf("%s\n", argv[i]);
    if (strcmp(argv[i], "-o") == 0) wrapped = true;
    if (strcmp(argv[i], "no-time") == 0 || strcmp(argv[i], "sh-no-time") == 0 ||
        strcmp(argv[i], "with-time") == 0 || strcmp(argv[i], "sleep") == 0 ||
        strcmp(argv[i], "fail") == 0)
      image = argv[i];
  }
  fflush(stdout);
  if (image == nullptr) return 0;
  if (strcmp(image, "no-time") == 0 && wrapped) {
    fprintf(stderr,
            "docker: Error response from daemon: failed to create task for "
            "container: failed to create shim task: OCI runtime create "
            "failed: runc create failed: unable to start container process: "
            "exec: \"/usr/bin/time\": stat /usr/bin/time: no such file or "
            "directory: unknown.\n");
    return 127;
  }
  if (strcmp(image, "sh-no-time") == 0 && wrapped) {
    fprintf(stderr, "sh: 1: /usr/bin/time: NOT FOUND\n");
    return 127;
  }
  if (strcmp(image, "with-time") == 0 && wrapped) {
    FILE* report = fopen(".judgebox_time", "w");
    if (report == nullptr) return 1;
    fprintf(report,
            "\tCommand being timed: \"./main\"\n"
            "\tUser time (seconds): 0.10\n"
            "\tSystem time (seconds): 0.02\n"
            "\tElapsed (wall clock) time (h:mm:ss or m:ss): 0:00.15\n"
            "\tMaximum resident set size (kbytes): 2048\n");
    fclose(report);
    return 0;
  }
  if (strcmp(image, "sleep") == 0) {
    while (true) sleep(1);
  }
  if (strcmp(image, "fail") == 0) {
    fprintf(stderr, "Unable to find image 'fail:latest' locally\n");
    return 125;
  }
  return 0;
}
