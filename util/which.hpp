#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP
#include <string>

namespace util {

// Resolves cmd against the directories listed in $PATH. Returns an empty
// string if the command is not found. Commands containing a slash are
// returned unchanged when they exist.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
