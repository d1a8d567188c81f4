#include "util/misc.hpp"

#include <cctype>
#include <sstream>

#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> result;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) result.push_back(item);
  }
  return result;
}

std::string ShellQuote(const std::string& word) {
  if (word.empty()) return "''";
  bool safe = true;
  for (char c : word) {
    if (!isalnum(static_cast<unsigned char>(c)) &&
        std::string("@%+=:,./_-").find(c) == std::string::npos) {
      safe = false;
      break;
    }
  }
  if (safe) return word;
  return "'" + absl::StrReplaceAll(word, {{"'", "'\"'\"'"}}) + "'";
}

std::string ShellJoin(const std::vector<std::string>& argv) {
  return absl::StrJoin(argv, " ",
                       [](std::string* out, const std::string& word) {
                         out->append(ShellQuote(word));
                       });
}

std::string RStrip(const std::string& s) {
  size_t end = s.find_last_not_of(" \t\r\n\v\f");
  if (end == std::string::npos) return "";
  return s.substr(0, end + 1);
}

}  // namespace util
