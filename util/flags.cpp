#include "util/flags.hpp"

DEFINE_string(environment_root, "/opt/stagejudge/environments",
              "Directory holding one prepared environment per subdirectory");
DEFINE_string(runner_dir, "/opt/stagejudge/runners",
              "Directory holding the runner executables");
DEFINE_string(limiter_command, "/opt/stagejudge/bin/stagejudge-limiter",
              "Resource limiter executed inside the sandbox");
DEFINE_string(firejail_command, "firejail", "Firejail executable");
DEFINE_string(nsjail_command, "nsjail", "NsJail executable");
DEFINE_string(sandbox_hostname, "stagejudge",
              "Hostname seen by the sandboxed processes");
DEFINE_bool(sandbox_debug, false, "Allow debuggers inside the sandbox");
DEFINE_int32(kill_grace_seconds, 1,
             "Seconds between the soft and the hard kill of a state");
DEFINE_int32(wall_clock_margin_seconds, 3,
             "Seconds added to the time limit for the outer wall clock limit");

DEFINE_string(log_level, "ERROR",
              "One of DEBUG, INFO, WARNING, ERROR, CRITICAL");  // NOLINT
DEFINE_bool(dry_run, false,
            "Validate the setting and print the composed commands only");
DEFINE_string(submission_key, "", "Identity of the evaluated submission");
DEFINE_string(evaluation_key, "", "Identity of this evaluation");
