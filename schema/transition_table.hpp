#ifndef SCHEMA_TRANSITION_TABLE_HPP
#define SCHEMA_TRANSITION_TABLE_HPP

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>

#include "absl/types/optional.h"
#include "core/status.hpp"

namespace schema {

// Name of the terminal pseudo-state.
static const constexpr char* kTerminalState = "$";

struct TransitionTarget {
  std::string next_state;
  absl::optional<int64_t> grade;

  bool IsTerminal() const { return next_state == kTerminalState; }
};

// Maps (state, set of observed statuses) to the next state and the grade to
// record. Rows match a status set exactly; each state may also have one
// "otherwise" row used when no exact row matches.
class TransitionTable {
 public:
  // Both throw SchemaValidationError if the row is already present.
  void AddRule(const std::string& state, const core::StatusSet& outcome,
               TransitionTarget target);
  void AddOtherwise(const std::string& state, TransitionTarget target);

  absl::optional<TransitionTarget> Lookup(const std::string& state,
                                          const core::StatusSet& outcome) const;

  // Every state referenced by the table, as source or target, excluding the
  // terminal marker.
  std::set<std::string> ReferencedStates() const;

  // Returns a state that can reach itself, or an empty string if the table
  // has no cycles.
  std::string FindCycle() const;

  size_t size() const { return exact_.size() + otherwise_.size(); }

 private:
  std::map<std::string, std::set<std::string>> Successors() const;

  std::map<std::pair<std::string, core::StatusSet>, TransitionTarget> exact_;
  std::map<std::string, TransitionTarget> otherwise_;
};

}  // namespace schema

#endif
