#ifndef GRID_WORLD_ENVIRONMENT_H
#define GRID_WORLD_ENVIRONMENT_H

#include <string>
#include <vector>

// Type aliases shared by the planners and the learners
using State  = int;
using Action = int;
using Vector = std::vector<double>;   // V[s] over the state index space
using Policy = std::vector<int>;      // Policy[s] = action index, kNoAction if undefined

constexpr int kNoAction = -1;

/**
 * Result of taking one step in the environment.
 */
struct StepResult {
  State  next_state{0};
  double reward{0.0};
  bool   done{false};
};

/**
 * Environment - contract consumed by the DP solvers and the TD learners.
 *
 * States are indices in [0, num_states()); states() lists the ones that are
 * actually reachable cells (goal included). Dynamic programming queries step()
 * for arbitrary states (full model), TD learners only for the state they occupy.
 *
 * step() on the goal state returns (goal, 0, true).
 */
class Environment {
public:
  virtual ~Environment() = default;

  virtual int num_states() const = 0;
  virtual std::vector<State> states() const = 0;

  virtual int num_actions() const = 0;
  virtual std::vector<Action> actions() const = 0;

  virtual State start_state() const = 0;
  virtual State goal_state() const = 0;
  bool is_terminal(State s) const { return s == goal_state(); }

  // Throws InvalidAction if a is not one of actions().
  virtual StepResult step(State s, Action a) const = 0;

  // Environment name for logging
  virtual std::string name() const = 0;
};

#endif //GRID_WORLD_ENVIRONMENT_H
