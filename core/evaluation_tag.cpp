#include "core/evaluation_tag.hpp"

#include <cctype>
#include <tuple>

namespace core {

bool EvaluationTag::operator<(const EvaluationTag& other) const {
  return std::tie(name, description, background_color, font_color, visible) <
         std::tie(other.name, other.description, other.background_color,
                  other.font_color, other.visible);
}

bool EvaluationTag::operator==(const EvaluationTag& other) const {
  return std::tie(name, description, background_color, font_color, visible) ==
         std::tie(other.name, other.description, other.background_color,
                  other.font_color, other.visible);
}

bool IsHtmlColor(const std::string& color) {
  if (color.size() != 4 && color.size() != 7) return false;
  if (color[0] != '#') return false;
  for (size_t i = 1; i < color.size(); i++) {
    if (!isxdigit(static_cast<unsigned char>(color[i]))) return false;
  }
  return true;
}

const EvaluationTag& BackendSystemError() {
  static const EvaluationTag tag("BSE", "Backend System Error", "#bb00bb",
                                 "#ffdfff");
  return tag;
}

const EvaluationTag& EvaluationSystemError() {
  static const EvaluationTag tag("ESE", "Evaluation System Error", "#dd00dd",
                                 "#ffdfff");
  return tag;
}

const EvaluationTag& TimeLimitExceeded() {
  static const EvaluationTag tag("TLE", "Time Limit Exceeded", "#ffdf3f",
                                 "#ffefcf");
  return tag;
}

const EvaluationTag& PermissionViolation() {
  static const EvaluationTag tag("PV", "Permission Violation", "#ffdf3f",
                                 "#ffefcf");
  return tag;
}

const EvaluationTag& UnexpectedAbortion() {
  static const EvaluationTag tag("UA", "Unexpected Abortion", "#ff00ff",
                                 "#ffdfff");
  return tag;
}

const std::vector<EvaluationTag>& BuiltinTags() {
  static const std::vector<EvaluationTag> tags = {
      BackendSystemError(), EvaluationSystemError(), TimeLimitExceeded(),
      PermissionViolation(), UnexpectedAbortion()};
  return tags;
}

bool IsBuiltinTagName(const std::string& name) {
  for (const EvaluationTag& tag : BuiltinTags()) {
    if (tag.name == name) return true;
  }
  return false;
}

}  // namespace core
