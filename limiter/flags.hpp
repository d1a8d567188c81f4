#ifndef LIMITER_FLAGS_HPP
#define LIMITER_FLAGS_HPP
#include <string>
#include <vector>

#include "gflags/gflags.h"
#include "limiter/limiter.hpp"

DECLARE_int32(time_limit);
DECLARE_int32(kill_after);
DECLARE_string(signal);
DECLARE_int32(limiter_default_time_limit);

namespace limiter {

// Fills the options for running command from the flags above. Returns false
// and sets error_msg if a flag has an invalid value.
bool OptionsFromFlags(const std::vector<std::string>& command,
                      LimiterOptions* options, std::string* error_msg);

}  // namespace limiter

#endif
