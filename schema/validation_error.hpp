#ifndef SCHEMA_VALIDATION_ERROR_HPP
#define SCHEMA_VALIDATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace schema {

// Raised when an exercise setting does not describe a valid evaluation.
class SchemaValidationError : public std::runtime_error {
 public:
  explicit SchemaValidationError(const std::string& msg)
      : std::runtime_error(msg) {}
  SchemaValidationError(const std::string& path, const std::string& msg)
      : std::runtime_error(path + ": " + msg) {}
};

}  // namespace schema

#endif
