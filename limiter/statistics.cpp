#include "limiter/statistics.hpp"

#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace limiter {

namespace {

using Record = std::vector<std::pair<std::string, int64_t>>;

Record UsageRecord(const ResourceUsage& usage) {
  return {{"ru_utime_usec", usage.utime_usec},
          {"ru_stime_usec", usage.stime_usec},
          {"ru_time_usec", usage.time_usec},
          {"ru_maxrss", usage.maxrss_kb},
          {"ru_minflt", usage.minflt},
          {"ru_majflt", usage.majflt},
          {"ru_inblock", usage.inblock},
          {"ru_oublock", usage.oublock},
          {"ru_nvcsw", usage.nvcsw},
          {"ru_nivcsw", usage.nivcsw},
          {"time_elapse_nsec", usage.elapsed_nsec}};
}

Record DetectionRecord(const LimitDetection& detection) {
  return {{"cpu_overuse", detection.cpu_overuse},
          {"memory_overuse", detection.memory_overuse},
          {"utime_overuse", detection.utime_overuse},
          {"stime_overuse", detection.stime_overuse},
          {"as_overuse", detection.as_overuse},
          {"rss_overuse", detection.rss_overuse},
          {"exit_status", detection.exit_status}};
}

std::string FormatRecord(const Record& record) {
  std::string line;
  for (const auto& field : record) {
    if (!line.empty()) line += '\t';
    line += field.first + ":" + std::to_string(field.second);
  }
  return line;
}

std::map<std::string, int64_t> ParseRecord(const std::string& line) {
  std::map<std::string, int64_t> values;
  std::stringstream ss(line);
  std::string field;
  while (std::getline(ss, field, '\t')) {
    size_t colon = field.find(':');
    if (colon == std::string::npos)
      throw std::invalid_argument("malformed statistics field '" + field + "'");
    size_t parsed = 0;
    int64_t value = 0;
    try {
      value = std::stoll(field.substr(colon + 1), &parsed);
    } catch (const std::out_of_range&) {
      throw std::invalid_argument("statistics value out of range '" + field +
                                  "'");
    }
    if (parsed != field.size() - colon - 1)
      throw std::invalid_argument("malformed statistics field '" + field + "'");
    values[field.substr(0, colon)] = value;
  }
  return values;
}

int64_t Take(const std::map<std::string, int64_t>& values,
             const std::string& key) {
  auto it = values.find(key);
  if (it == values.end())
    throw std::invalid_argument("missing statistics field '" + key + "'");
  return it->second;
}

}  // namespace

std::string FormatTrailer(const Trailer& trailer) {
  return std::string(kStatisticsHeader) + "\n" +
         FormatRecord(UsageRecord(trailer.usage)) + "\n" +
         FormatRecord(DetectionRecord(trailer.detection)) + "\n";
}

Trailer SplitTrailer(const std::string& stream, std::string* before) {
  size_t end = stream.find_last_not_of(" \t\r\n\v\f");
  if (end == std::string::npos)
    throw std::invalid_argument("empty limiter output");
  std::string text = stream.substr(0, end + 1);

  std::string lines[3];
  for (int i = 2; i >= 0; i--) {
    size_t newline = text.rfind('\n');
    if (newline == std::string::npos) {
      if (i != 0) throw std::invalid_argument("truncated limiter output");
      lines[i] = text;
      text.clear();
    } else {
      lines[i] = text.substr(newline + 1);
      text.erase(newline);
    }
  }
  if (lines[0] != kStatisticsHeader)
    throw std::invalid_argument("limiter statistics header not found");

  auto usage = ParseRecord(lines[1]);
  auto detection = ParseRecord(lines[2]);
  Trailer trailer;
  trailer.usage.utime_usec = Take(usage, "ru_utime_usec");
  trailer.usage.stime_usec = Take(usage, "ru_stime_usec");
  trailer.usage.time_usec = Take(usage, "ru_time_usec");
  trailer.usage.maxrss_kb = Take(usage, "ru_maxrss");
  trailer.usage.minflt = Take(usage, "ru_minflt");
  trailer.usage.majflt = Take(usage, "ru_majflt");
  trailer.usage.inblock = Take(usage, "ru_inblock");
  trailer.usage.oublock = Take(usage, "ru_oublock");
  trailer.usage.nvcsw = Take(usage, "ru_nvcsw");
  trailer.usage.nivcsw = Take(usage, "ru_nivcsw");
  trailer.usage.elapsed_nsec = Take(usage, "time_elapse_nsec");
  trailer.detection.cpu_overuse = Take(detection, "cpu_overuse") != 0;
  trailer.detection.memory_overuse = Take(detection, "memory_overuse") != 0;
  trailer.detection.utime_overuse = Take(detection, "utime_overuse") != 0;
  trailer.detection.stime_overuse = Take(detection, "stime_overuse") != 0;
  trailer.detection.as_overuse = Take(detection, "as_overuse") != 0;
  trailer.detection.rss_overuse = Take(detection, "rss_overuse") != 0;
  trailer.detection.exit_status =
      static_cast<int>(Take(detection, "exit_status"));

  *before = text;
  return trailer;
}

}  // namespace limiter
