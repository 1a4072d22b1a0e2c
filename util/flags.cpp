#include "util/flags.hpp"

DEFINE_string(temp_directory, "/tmp/evalbox",
              "Where the environments should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove the scratch directories of destroyed environments");
DEFINE_int32(max_environments, 4,
             "Maximum number of environments that may be alive at once");
DEFINE_string(sandbox, "",
              "Force the use of the given sandbox backend (namespaced, unix). "
              "If unset, the best available isolating one is used; unix "
              "does not isolate and is only used when named here");
DEFINE_int32(sandbox_uid, 65534,
             "User id commands run as when evalbox runs as root");
DEFINE_int32(sandbox_gid, 65534,
             "Group id commands run as when evalbox runs as root");
DEFINE_string(cgroup_root, "/sys/fs/cgroup/evalbox",
              "Parent cgroup (v2) used by the namespaced sandbox");

DEFINE_int64(timeout_millis, 5000,
             "Wall clock limit for each test case run, in milliseconds");
DEFINE_int64(compile_timeout_millis, 10000,
             "Wall clock limit for the build step, in milliseconds");
DEFINE_int64(memory_limit_mb, 128, "Memory limit of an environment, in MiB");
DEFINE_double(cpu_share, 0.5, "Fraction of a core available to an environment");
DEFINE_int32(max_processes, 64,
             "Maximum number of processes and threads in an environment");
DEFINE_int64(output_limit_kb, 8192,
             "Maximum size of each captured output stream, in KiB");

DEFINE_string(input, "",
              "File containing the submission (or batch) as JSON. If unset, "
              "stdin is read");
DEFINE_bool(list_languages, false, "Print the supported languages and exit");
