#ifndef GRID_WORLD_ROLLOUT_H
#define GRID_WORLD_ROLLOUT_H

#include "environment.h"
#include <vector>

// Follows a deterministic policy from the start state (epsilon = 0).
// Returns the visited states, start included. Stops on reaching the goal, on a
// state without an action, or after max_steps transitions.
std::vector<State> greedy_rollout(const Environment &env, const Policy &policy, int max_steps);

// True if the rollout ended in the goal state.
bool reaches_goal(const Environment &env, const std::vector<State> &path);

#endif //GRID_WORLD_ROLLOUT_H
