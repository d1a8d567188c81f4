#include "util/logging.hpp"

#include "glog/logging.h"
#include "util/file.hpp"

namespace util {

bool SetLogLevel(const std::string& level) {
  if (level == "DEBUG") {
    FLAGS_stderrthreshold = google::GLOG_INFO;
    FLAGS_v = 1;
  } else if (level == "INFO") {
    FLAGS_stderrthreshold = google::GLOG_INFO;
    FLAGS_v = 0;
  } else if (level == "WARNING") {
    FLAGS_stderrthreshold = google::GLOG_WARNING;
    FLAGS_v = 0;
  } else if (level == "ERROR") {
    FLAGS_stderrthreshold = google::GLOG_ERROR;
    FLAGS_v = 0;
  } else if (level == "CRITICAL") {
    FLAGS_stderrthreshold = google::GLOG_FATAL;
    FLAGS_v = 0;
  } else {
    return false;
  }
  return true;
}

void LogToEvaluationDirectory(const std::string& directory) {
  File::MakeDirs(directory);
  FLAGS_timestamp_in_logfile_name = false;
  FLAGS_logbuflevel = -1;
  google::SetLogDestination(
      google::GLOG_INFO,
      File::JoinPath(directory, "evaluation.debug.log").c_str());
  google::SetLogDestination(google::GLOG_WARNING, "");
  google::SetLogDestination(
      google::GLOG_ERROR,
      File::JoinPath(directory, "evaluation.error.log").c_str());
  google::SetLogDestination(google::GLOG_FATAL, "");
}

}  // namespace util
