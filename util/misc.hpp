#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <string>
#include <vector>

namespace util {

std::vector<std::string> split(const std::string& s, char delim);

// Quotes a single word for a POSIX shell. Words made only of safe characters
// are returned unchanged.
std::string ShellQuote(const std::string& word);

// Joins argv into a command line that a POSIX shell splits back into argv.
std::string ShellJoin(const std::vector<std::string>& argv);

// Removes trailing whitespace.
std::string RStrip(const std::string& s);

}  // namespace util
#endif
