#ifndef SCHEMA_LOADER_HPP
#define SCHEMA_LOADER_HPP

#include <string>

#include "nlohmann/json.hpp"
#include "schema/setting.hpp"
#include "schema/validation_error.hpp"

namespace schema {

// All of these throw SchemaValidationError.
Setting LoadSetting(const nlohmann::json& document);
Setting LoadSettingFile(const std::string& path);
ExerciseConcrete LoadExerciseConcrete(const std::string& directory);

}  // namespace schema

#endif
