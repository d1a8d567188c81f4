#ifndef SCHEMA_UNITS_HPP
#define SCHEMA_UNITS_HPP

#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"

namespace schema {

// Parses a memory limit into bytes. Integers are bytes; strings are a
// decimal number followed by GiB, MiB, KiB, GB, MB, KB or nothing (bytes).
// Throws SchemaValidationError, prefixing the message with path.
int64_t ParseMemoryLimit(const nlohmann::json& value, const std::string& path);

// Parses a time limit into microseconds. Integers are seconds; strings are a
// decimal number followed by m, s, ms, us or nothing (seconds).
int64_t ParseTimeLimit(const nlohmann::json& value, const std::string& path);

// Whole seconds needed to cover a time limit, rounded up.
int64_t CeilSeconds(int64_t micros);

}  // namespace schema

#endif
