#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP
#include "gflags/gflags.h"

DECLARE_string(environment_root);
DECLARE_string(runner_dir);
DECLARE_string(limiter_command);
DECLARE_string(firejail_command);
DECLARE_string(nsjail_command);
DECLARE_string(sandbox_hostname);
DECLARE_bool(sandbox_debug);
DECLARE_int32(kill_grace_seconds);
DECLARE_int32(wall_clock_margin_seconds);

DECLARE_string(log_level);
DECLARE_bool(dry_run);
DECLARE_string(submission_key);
DECLARE_string(evaluation_key);

#endif
