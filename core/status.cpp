#include "core/status.hpp"

namespace core {

const char* StatusName(Status status) {
  switch (status) {
    case Status::PASS:
      return "pass";
    case Status::FAIL:
      return "fail";
    case Status::ERROR:
      return "error";
    case Status::FATAL:
      return "fatal";
  }
  return "fatal";
}

bool ParseStatus(const std::string& name, Status* status) {
  for (Status candidate :
       {Status::PASS, Status::FAIL, Status::ERROR, Status::FATAL}) {
    if (name == StatusName(candidate)) {
      *status = candidate;
      return true;
    }
  }
  return false;
}

int DisplayOrder(Status status) {
  switch (status) {
    case Status::PASS:
      return 50;
    case Status::ERROR:
      return 40;
    case Status::FAIL:
      return 30;
    case Status::FATAL:
      return 20;
  }
  return 0;
}

}  // namespace core
