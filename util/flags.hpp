#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Environments
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);
DECLARE_int32(max_environments);
DECLARE_string(sandbox);
DECLARE_int32(sandbox_uid);
DECLARE_int32(sandbox_gid);
DECLARE_string(cgroup_root);

// Resource limits
DECLARE_int64(timeout_millis);
DECLARE_int64(compile_timeout_millis);
DECLARE_int64(memory_limit_mb);
DECLARE_double(cpu_share);
DECLARE_int32(max_processes);
DECLARE_int64(output_limit_kb);

// Command line
DECLARE_string(input);
DECLARE_bool(list_languages);

#endif
