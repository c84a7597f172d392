#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(sandbox_mode);
DECLARE_string(temp_directory);
DECLARE_int64(run_timeout_ms);
DECLARE_int64(compile_timeout_ms);
DECLARE_int64(max_output_kb);
DECLARE_bool(host_network_isolation);
DECLARE_int32(parallel_test_cases);
DECLARE_string(container_runtime);
DECLARE_int64(container_overhead_ms);
DECLARE_string(accounting_wrapper);
DECLARE_int64(toolchain_cache_ttl_ms);
DECLARE_string(request);

#define JUDGEBOX_DECLARE_LANGUAGE_FLAGS(lang) \
  DECLARE_string(lang##_image);               \
  DECLARE_double(lang##_cpus);                \
  DECLARE_int64(lang##_memory_mb);            \
  DECLARE_int32(lang##_max_processes)

JUDGEBOX_DECLARE_LANGUAGE_FLAGS(javascript);
JUDGEBOX_DECLARE_LANGUAGE_FLAGS(python);
JUDGEBOX_DECLARE_LANGUAGE_FLAGS(cpp);
JUDGEBOX_DECLARE_LANGUAGE_FLAGS(java);
JUDGEBOX_DECLARE_LANGUAGE_FLAGS(csharp);

#undef JUDGEBOX_DECLARE_LANGUAGE_FLAGS

#endif
