#ifndef UTIL_VERSION_HPP
#define UTIL_VERSION_HPP

#ifndef STAGEJUDGE_VERSION
#define STAGEJUDGE_VERSION "0.0.0"
#endif

namespace util {

static const constexpr char* kEvaluatorName = "stagejudge";
static const constexpr char* kEvaluatorVersion = STAGEJUDGE_VERSION;

}  // namespace util

#endif
