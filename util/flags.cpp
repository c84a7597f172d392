#include "util/flags.hpp"

DEFINE_string(sandbox_mode, "host",
              "Where submissions run: host (toolchains installed locally) or "
              "container (one disposable container per execution)");
DEFINE_string(temp_directory, "/tmp/judgebox",
              "Where the scratch directories should be created");
DEFINE_int64(run_timeout_ms, 3000, "Default wall-clock limit of a test run");
DEFINE_int64(compile_timeout_ms, 8000, "Wall-clock limit of a compilation");
DEFINE_int64(max_output_kb, 1024,
             "Maximum amount of stdout/stderr kept for each execution");
DEFINE_bool(host_network_isolation, true,
            "In host mode, run submissions in an empty network namespace");
DEFINE_int32(parallel_test_cases, 1,
             "Maximum number of test cases of a submission run at once");
DEFINE_string(container_runtime, "docker",
              "Container runtime CLI used in container mode");
DEFINE_int64(container_overhead_ms, 250,
             "Extra wall-clock time granted to container startup");
DEFINE_string(accounting_wrapper, "/usr/bin/time",
              "GNU time binary inside the images, empty to disable");
DEFINE_int64(toolchain_cache_ttl_ms, 30000,
             "How long toolchain lookups are cached");
DEFINE_string(request, "-",
              "File with the JSON request of the command, - for stdin");

DEFINE_string(javascript_image, "node:20-slim", "Image for JavaScript");
DEFINE_double(javascript_cpus, 1.0, "CPU share for JavaScript");
DEFINE_int64(javascript_memory_mb, 512, "Memory ceiling for JavaScript");
DEFINE_int32(javascript_max_processes, 256, "Process ceiling for JavaScript");

DEFINE_string(python_image, "python:3.11-slim", "Image for Python");
DEFINE_double(python_cpus, 1.0, "CPU share for Python");
DEFINE_int64(python_memory_mb, 512, "Memory ceiling for Python");
DEFINE_int32(python_max_processes, 256, "Process ceiling for Python");

DEFINE_string(cpp_image, "gcc:12.2.0", "Image for C++");
DEFINE_double(cpp_cpus, 1.0, "CPU share for C++");
DEFINE_int64(cpp_memory_mb, 512, "Memory ceiling for C++");
DEFINE_int32(cpp_max_processes, 256, "Process ceiling for C++");

DEFINE_string(java_image, "eclipse-temurin:17-jdk-jammy", "Image for Java");
DEFINE_double(java_cpus, 1.0, "CPU share for Java");
DEFINE_int64(java_memory_mb, 512, "Memory ceiling for Java");
DEFINE_int32(java_max_processes, 256, "Process ceiling for Java");

DEFINE_string(csharp_image, "mono:6.12", "Image for C#");
DEFINE_double(csharp_cpus, 1.0, "CPU share for C#");
DEFINE_int64(csharp_memory_mb, 512, "Memory ceiling for C#");
DEFINE_int32(csharp_max_processes, 256, "Process ceiling for C#");
