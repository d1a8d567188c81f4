#ifndef CORE_EVALUATION_TAG_HPP
#define CORE_EVALUATION_TAG_HPP

#include <set>
#include <string>
#include <vector>

namespace core {

// Label attached to case results. Tags compare by value, ordered
// lexicographically on all their fields.
struct EvaluationTag {
  std::string name;
  std::string description;
  std::string background_color;
  std::string font_color;
  bool visible = true;

  EvaluationTag() = default;
  EvaluationTag(std::string name, std::string description,
                std::string background_color, std::string font_color,
                bool visible = true)
      : name(std::move(name)),
        description(std::move(description)),
        background_color(std::move(background_color)),
        font_color(std::move(font_color)),
        visible(visible) {}

  bool operator<(const EvaluationTag& other) const;
  bool operator==(const EvaluationTag& other) const;
  bool operator!=(const EvaluationTag& other) const {
    return !(*this == other);
  }
};

using TagSet = std::set<EvaluationTag>;

// True for "#rgb" and "#rrggbb" hexadecimal colors.
bool IsHtmlColor(const std::string& color);

// Reserved tags emitted by the judge itself.
const EvaluationTag& BackendSystemError();     // BSE
const EvaluationTag& EvaluationSystemError();  // ESE
const EvaluationTag& TimeLimitExceeded();      // TLE
const EvaluationTag& PermissionViolation();    // PV
const EvaluationTag& UnexpectedAbortion();     // UA

const std::vector<EvaluationTag>& BuiltinTags();
bool IsBuiltinTagName(const std::string& name);

}  // namespace core

#endif
