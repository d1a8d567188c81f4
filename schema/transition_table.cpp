#include "schema/transition_table.hpp"

#include <functional>

#include "absl/strings/str_join.h"
#include "schema/validation_error.hpp"

namespace schema {

namespace {

std::string OutcomeToString(const core::StatusSet& outcome) {
  return "[" +
         absl::StrJoin(outcome, ", ",
                       [](std::string* out, core::Status status) {
                         out->append(core::StatusName(status));
                       }) +
         "]";
}

}  // namespace

void TransitionTable::AddRule(const std::string& state,
                              const core::StatusSet& outcome,
                              TransitionTarget target) {
  if (!exact_.emplace(std::make_pair(state, outcome), std::move(target))
           .second) {
    throw SchemaValidationError("duplicate transition for state '" + state +
                                "' on " + OutcomeToString(outcome));
  }
}

void TransitionTable::AddOtherwise(const std::string& state,
                                   TransitionTarget target) {
  if (!otherwise_.emplace(state, std::move(target)).second) {
    throw SchemaValidationError("duplicate 'otherwise' transition for state '" +
                                state + "'");
  }
}

absl::optional<TransitionTarget> TransitionTable::Lookup(
    const std::string& state, const core::StatusSet& outcome) const {
  auto exact = exact_.find(std::make_pair(state, outcome));
  if (exact != exact_.end()) return exact->second;
  auto otherwise = otherwise_.find(state);
  if (otherwise != otherwise_.end()) return otherwise->second;
  return absl::nullopt;
}

std::set<std::string> TransitionTable::ReferencedStates() const {
  std::set<std::string> states;
  auto add = [&states](const std::string& state) {
    if (state != kTerminalState) states.insert(state);
  };
  for (const auto& row : exact_) {
    add(row.first.first);
    add(row.second.next_state);
  }
  for (const auto& row : otherwise_) {
    add(row.first);
    add(row.second.next_state);
  }
  return states;
}

std::map<std::string, std::set<std::string>> TransitionTable::Successors()
    const {
  std::map<std::string, std::set<std::string>> successors;
  for (const auto& row : exact_) {
    if (!row.second.IsTerminal())
      successors[row.first.first].insert(row.second.next_state);
  }
  for (const auto& row : otherwise_) {
    if (!row.second.IsTerminal())
      successors[row.first].insert(row.second.next_state);
  }
  return successors;
}

std::string TransitionTable::FindCycle() const {
  const auto successors = Successors();
  enum Color { WHITE, GREY, BLACK };
  std::map<std::string, Color> color;
  std::string cycle;

  std::function<bool(const std::string&)> visit =
      [&](const std::string& state) {
        color[state] = GREY;
        auto it = successors.find(state);
        if (it != successors.end()) {
          for (const std::string& next : it->second) {
            if (color[next] == GREY) {
              cycle = next;
              return true;
            }
            if (color[next] == WHITE && visit(next)) return true;
          }
        }
        color[state] = BLACK;
        return false;
      };

  for (const auto& entry : successors) {
    if (color[entry.first] == WHITE && visit(entry.first)) return cycle;
  }
  return "";
}

}  // namespace schema
