#include "rollout.h"

std::vector<State> greedy_rollout(const Environment &env, const Policy &policy, int max_steps) {
  std::vector<State> path;
  State s = env.start_state();
  path.push_back(s);
  for (int t = 0; t < max_steps; ++t) {
    if (env.is_terminal(s)) break;
    if (s < 0 || s >= static_cast<int>(policy.size()) || policy[s] == kNoAction) break;
    StepResult r = env.step(s, policy[s]);
    s = r.next_state;
    path.push_back(s);
    if (r.done) break;
  }
  return path;
}

bool reaches_goal(const Environment &env, const std::vector<State> &path) {
  return !path.empty() && env.is_terminal(path.back());
}
