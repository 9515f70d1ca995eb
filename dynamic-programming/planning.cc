#include "planning.h"
#include <limits>
#include <stdexcept>
#include <string>

void validate_config(const DPConfig &config) {
  if (!(config.gamma > 0.0 && config.gamma <= 1.0)) {
    throw std::invalid_argument("gamma must be in (0, 1], got " + std::to_string(config.gamma));
  }
  if (!(config.theta > 0.0)) {
    throw std::invalid_argument("theta must be positive, got " + std::to_string(config.theta));
  }
  if (config.truncation < 1) {
    throw std::invalid_argument("truncation must be at least 1, got " + std::to_string(config.truncation));
  }
  if (config.max_sweeps < 1 || config.max_policy_iterations < 1) {
    throw std::invalid_argument("iteration caps must be at least 1");
  }
  if (config.tie_tolerance < 0.0) {
    throw std::invalid_argument("tie_tolerance must be non-negative");
  }
}

double compute_state_value(const Environment &env, State s, Action a, const Vector &V, double gamma) {
  StepResult r = env.step(s, a);
  return r.reward + gamma * V[r.next_state];
}

Action greedy_action(const Environment &env, State s, const Vector &V, double gamma, double *best_value) {
  double best_q = -std::numeric_limits<double>::infinity();
  Action best_a = kNoAction;
  for (Action a : env.actions()) {
    double q = compute_state_value(env, s, a, V, gamma);
    // Strict comparison keeps the first maximal action
    if (q > best_q) {
      best_q = q;
      best_a = a;
    }
  }
  if (best_value) *best_value = best_q;
  return best_a;
}

std::vector<State> sweep_states(const Environment &env) {
  std::vector<State> out;
  for (State s : env.states()) {
    if (!env.is_terminal(s)) out.push_back(s);
  }
  return out;
}
