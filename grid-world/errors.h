#ifndef GRID_WORLD_ERRORS_H
#define GRID_WORLD_ERRORS_H

#include <stdexcept>
#include <string>

// Raised by Environment::step for an action outside the action set.
class InvalidAction : public std::invalid_argument {
public:
  explicit InvalidAction(int action)
    : std::invalid_argument("Invalid action: " + std::to_string(action)), action_(action) {}

  int action() const { return action_; }

private:
  int action_;
};

// Raised when a sweep loop exceeds its iteration cap without reaching theta
// (or, for policy iteration, without the policy becoming stable).
class DidNotConverge : public std::runtime_error {
public:
  DidNotConverge(const std::string &solver, int cap)
    : std::runtime_error(solver + " did not converge within " + std::to_string(cap) + " iterations"),
      cap_(cap) {}

  int cap() const { return cap_; }

private:
  int cap_;
};

#endif //GRID_WORLD_ERRORS_H
