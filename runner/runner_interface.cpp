#include "runner/runner_interface.hpp"

#include <cstdint>
#include <set>

namespace runner {

namespace {

static const constexpr char* kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_+";

int DecodeChar(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '_') return 62;
  if (c == '+') return 63;
  return -1;
}

const nlohmann::json& Field(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end())
    throw malformed_payload(std::string("missing field '") + key + "'");
  return *it;
}

std::string StringField(const nlohmann::json& object, const char* key) {
  const nlohmann::json& value = Field(object, key);
  if (!value.is_string())
    throw malformed_payload(std::string("field '") + key +
                            "' is not a string");
  return value.get<std::string>();
}

core::EvaluationTag TagFromWire(const nlohmann::json& j) {
  if (!j.is_object()) throw malformed_payload("tag is not an object");
  core::EvaluationTag tag;
  tag.name = StringField(j, "name");
  tag.description = StringField(j, "description");
  tag.background_color = StringField(j, "background_color");
  tag.font_color = StringField(j, "font_color");
  if (!core::IsHtmlColor(tag.background_color) ||
      !core::IsHtmlColor(tag.font_color)) {
    throw malformed_payload("invalid color in tag '" + tag.name + "'");
  }
  auto visible = j.find("visible");
  if (visible != j.end()) {
    if (!visible->is_boolean())
      throw malformed_payload("field 'visible' is not a boolean");
    tag.visible = visible->get<bool>();
  }
  return tag;
}

nlohmann::json TagToWire(const core::EvaluationTag& tag) {
  return nlohmann::json{{"name", tag.name},
                        {"description", tag.description},
                        {"background_color", tag.background_color},
                        {"font_color", tag.font_color},
                        {"visible", tag.visible}};
}

}  // namespace

std::string EncodeOptions(const std::string& data) {
  std::string out;
  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    uint32_t v = (static_cast<unsigned char>(data[i]) << 16) |
                 (static_cast<unsigned char>(data[i + 1]) << 8) |
                 static_cast<unsigned char>(data[i + 2]);
    out += kAlphabet[(v >> 18) & 63];
    out += kAlphabet[(v >> 12) & 63];
    out += kAlphabet[(v >> 6) & 63];
    out += kAlphabet[v & 63];
  }
  if (i + 1 == data.size()) {
    uint32_t v = static_cast<unsigned char>(data[i]) << 16;
    out += kAlphabet[(v >> 18) & 63];
    out += kAlphabet[(v >> 12) & 63];
    out += "==";
  } else if (i + 2 == data.size()) {
    uint32_t v = (static_cast<unsigned char>(data[i]) << 16) |
                 (static_cast<unsigned char>(data[i + 1]) << 8);
    out += kAlphabet[(v >> 18) & 63];
    out += kAlphabet[(v >> 12) & 63];
    out += kAlphabet[(v >> 6) & 63];
    out += '=';
  }
  return out;
}

std::string DecodeOptions(const std::string& encoded) {
  if (encoded.size() % 4 != 0)
    throw malformed_payload("invalid base64 length");
  std::string out;
  for (size_t i = 0; i < encoded.size(); i += 4) {
    int values[4];
    int padding = 0;
    for (int k = 0; k < 4; k++) {
      char c = encoded[i + k];
      if (c == '=' && i + 4 == encoded.size() && k >= 2) {
        values[k] = 0;
        padding++;
        continue;
      }
      if (padding) throw malformed_payload("invalid base64 padding");
      values[k] = DecodeChar(c);
      if (values[k] < 0) throw malformed_payload("invalid base64 character");
    }
    uint32_t v = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) |
                 values[3];
    out += static_cast<char>((v >> 16) & 0xff);
    if (padding < 2) out += static_cast<char>((v >> 8) & 0xff);
    if (padding < 1) out += static_cast<char>(v & 0xff);
  }
  return out;
}

nlohmann::json CaseToWire(const core::CaseResult& result) {
  nlohmann::json tags = nlohmann::json::array();
  for (const core::EvaluationTag& tag : result.tags)
    tags.push_back(TagToWire(tag));
  return nlohmann::json{{"name", result.name},
                        {"status", core::StatusName(result.status)},
                        {"tags", tags},
                        {"msg", result.student_message},
                        {"err", result.reviewer_message},
                        {"system_message", result.system_message}};
}

nlohmann::json CasesToWire(const std::vector<core::CaseResult>& results) {
  nlohmann::json j = nlohmann::json::array();
  for (const core::CaseResult& result : results)
    j.push_back(CaseToWire(result));
  return j;
}

std::vector<core::CaseResult> ParseCaseResults(const std::string& line) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& e) {
    throw malformed_payload(e.what());
  }
  if (!j.is_array()) throw malformed_payload("case results are not an array");

  std::vector<core::CaseResult> results;
  std::set<std::string> names;
  for (const nlohmann::json& item : j) {
    if (!item.is_object()) throw malformed_payload("case is not an object");
    core::CaseResult result;
    result.name = StringField(item, "name");
    if (result.name.empty()) throw malformed_payload("case without a name");
    if (!names.insert(result.name).second)
      throw malformed_payload("duplicate case name '" + result.name + "'");
    std::string status = StringField(item, "status");
    if (!core::ParseStatus(status, &result.status))
      throw malformed_payload("unknown status '" + status + "'");
    const nlohmann::json& tags = Field(item, "tags");
    if (!tags.is_array()) throw malformed_payload("field 'tags' is not a list");
    for (const nlohmann::json& tag : tags)
      result.tags.push_back(TagFromWire(tag));
    result.student_message = StringField(item, "msg");
    result.reviewer_message = StringField(item, "err");
    if (item.count("system_message") && !item["system_message"].is_null())
      result.system_message = StringField(item, "system_message");
    results.push_back(std::move(result));
  }
  return results;
}

}  // namespace runner
