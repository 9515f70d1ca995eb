#include "td_control.h"
#include "epsilon_greedy.h"
#include <stdexcept>
#include <string>

void validate_config(const TDConfig &config) {
  if (config.episodes < 0) {
    throw std::invalid_argument("episodes must be non-negative, got " + std::to_string(config.episodes));
  }
  if (!(config.alpha > 0.0 && config.alpha <= 1.0)) {
    throw std::invalid_argument("alpha must be in (0, 1], got " + std::to_string(config.alpha));
  }
  if (!(config.gamma > 0.0 && config.gamma <= 1.0)) {
    throw std::invalid_argument("gamma must be in (0, 1], got " + std::to_string(config.gamma));
  }
  if (!(config.epsilon >= 0.0 && config.epsilon <= 1.0)) {
    throw std::invalid_argument("epsilon must be in [0, 1], got " + std::to_string(config.epsilon));
  }
  if (!(config.epsilon_decay > 0.0 && config.epsilon_decay <= 1.0)) {
    throw std::invalid_argument("epsilon_decay must be in (0, 1], got " + std::to_string(config.epsilon_decay));
  }
  if (!(config.min_epsilon >= 0.0 && config.min_epsilon <= config.epsilon)) {
    throw std::invalid_argument("min_epsilon must be in [0, epsilon], got " + std::to_string(config.min_epsilon));
  }
  if (config.n < 1) {
    throw std::invalid_argument("n must be at least 1, got " + std::to_string(config.n));
  }
  if (config.max_steps_per_episode < 1) {
    throw std::invalid_argument("max_steps_per_episode must be at least 1, got " +
                                std::to_string(config.max_steps_per_episode));
  }
}

Policy derive_policy(const Environment &env, const QTable &q) {
  Policy policy(env.num_states(), kNoAction);
  for (State s : q.visited_states()) {
    if (s < 0 || s >= env.num_states() || env.is_terminal(s)) continue;
    policy[s] = greedy_action(*q.find(s));
  }
  return policy;
}
