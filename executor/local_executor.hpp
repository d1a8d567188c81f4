#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include "executor/executor.hpp"

namespace executor {

// Runs commands as local subprocesses, capturing stdout and stderr in
// memory.
class LocalExecutor : public Executor {
 public:
  std::string Id() const override { return "local"; }
  bool Execute(const Request& request, Response* response,
               std::string* error_msg) override;
};

}  // namespace executor

#endif
