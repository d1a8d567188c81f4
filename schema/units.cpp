#include "schema/units.hpp"

#include <cctype>
#include <limits>
#include <utility>
#include <vector>

#include "schema/validation_error.hpp"

namespace schema {

namespace {

using UnitTable = std::vector<std::pair<std::string, int64_t>>;

const UnitTable& MemoryUnits() {
  static const UnitTable units = {
      {"GiB", int64_t{1} << 30}, {"MiB", int64_t{1} << 20},
      {"KiB", int64_t{1} << 10}, {"GB", 1000 * 1000 * 1000},
      {"MB", 1000 * 1000},       {"KB", 1000},
      {"", 1}};
  return units;
}

const UnitTable& TimeUnits() {
  static const UnitTable units = {
      {"m", 60 * 1000 * 1000}, {"s", 1000 * 1000}, {"ms", 1000},
      {"us", 1},               {"", 1000 * 1000}};
  return units;
}

int64_t Multiply(int64_t amount, int64_t factor, const std::string& path) {
  if (amount > std::numeric_limits<int64_t>::max() / factor)
    throw SchemaValidationError(path, "value out of range");
  return amount * factor;
}

int64_t ParseWithUnits(const nlohmann::json& value, const UnitTable& units,
                       int64_t integer_factor, const char* what,
                       const std::string& path) {
  if (value.is_number_integer()) {
    int64_t amount = value.get<int64_t>();
    if (amount < 0)
      throw SchemaValidationError(path, "negative " + std::string(what));
    return Multiply(amount, integer_factor, path);
  }
  if (!value.is_string())
    throw SchemaValidationError(path, std::string(what) +
                                          " must be an integer or a string");
  const std::string text = value.get<std::string>();
  size_t digits = 0;
  while (digits < text.size() &&
         isdigit(static_cast<unsigned char>(text[digits])))
    digits++;
  if (digits == 0 || digits > 18)
    throw SchemaValidationError(
        path, "invalid " + std::string(what) + " '" + text + "'");
  const int64_t amount = std::stoll(text.substr(0, digits));
  const std::string suffix = text.substr(digits);
  for (const auto& unit : units) {
    if (unit.first == suffix) return Multiply(amount, unit.second, path);
  }
  throw SchemaValidationError(path, "unknown unit '" + suffix + "' in " +
                                        std::string(what) + " '" + text + "'");
}

}  // namespace

int64_t ParseMemoryLimit(const nlohmann::json& value, const std::string& path) {
  return ParseWithUnits(value, MemoryUnits(), 1, "memory limit", path);
}

int64_t ParseTimeLimit(const nlohmann::json& value, const std::string& path) {
  return ParseWithUnits(value, TimeUnits(), 1000 * 1000, "time limit", path);
}

int64_t CeilSeconds(int64_t micros) {
  return (micros + 999999) / 1000000;
}

}  // namespace schema
