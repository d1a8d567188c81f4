#ifndef LIMITER_STATISTICS_HPP
#define LIMITER_STATISTICS_HPP

#include <cstdint>
#include <string>

namespace limiter {

// First line of the trailer the limiter appends to stderr.
static const constexpr char* kStatisticsHeader =
    "====    limiter statistics    ====";

// Resource usage of the limited command and its descendants.
struct ResourceUsage {
  int64_t utime_usec = 0;
  int64_t stime_usec = 0;
  int64_t time_usec = 0;
  int64_t maxrss_kb = 0;
  int64_t minflt = 0;
  int64_t majflt = 0;
  int64_t inblock = 0;
  int64_t oublock = 0;
  int64_t nvcsw = 0;
  int64_t nivcsw = 0;
  int64_t elapsed_nsec = 0;
};

struct LimitDetection {
  bool cpu_overuse = false;
  bool memory_overuse = false;
  bool utime_overuse = false;
  bool stime_overuse = false;
  bool as_overuse = false;
  bool rss_overuse = false;
  // Exit code of the command, or 128 + signal number if it was killed.
  int exit_status = 0;
};

struct Trailer {
  ResourceUsage usage;
  LimitDetection detection;
};

// Formats the three trailer lines: the header, the usage record and the
// detection record, each a tab separated list of key:value pairs.
std::string FormatTrailer(const Trailer& trailer);

// Parses the trailer at the end of stream, ignoring trailing whitespace, and
// stores the text that precedes it in before. Throws std::invalid_argument
// if the stream does not end with a well formed trailer.
Trailer SplitTrailer(const std::string& stream, std::string* before);

}  // namespace limiter

#endif
