#ifndef CORE_STATUS_HPP
#define CORE_STATUS_HPP

#include <set>
#include <string>

namespace core {

// Outcome of a single test case. The declaration order is the display order
// used when sorting status sets.
enum class Status { FATAL, FAIL, ERROR, PASS };

using StatusSet = std::set<Status>;

// Lower-case wire name of a status ("pass", "fail", "error", "fatal").
const char* StatusName(Status status);

// Parses a wire name. Returns false if the name is unknown.
bool ParseStatus(const std::string& name, Status* status);

// Rank used to order statuses for display: fatal 20, fail 30, error 40,
// pass 50.
int DisplayOrder(Status status);

}  // namespace core

#endif
