#include "epsilon_greedy.h"
#include <algorithm>
#include <stdexcept>

Action choose_action_epsilon_greedy(const std::vector<double> &q_values, double epsilon, std::mt19937 &rng) {
  if (q_values.empty()) throw std::invalid_argument("Cannot choose an action from an empty row");
  const int num_actions = static_cast<int>(q_values.size());

  std::uniform_real_distribution<double> uni(0.0, 1.0);
  if (uni(rng) < epsilon) {
    std::uniform_int_distribution<int> act_dist(0, num_actions - 1);
    return act_dist(rng);
  }

  double max_q = *std::max_element(q_values.begin(), q_values.end());
  std::vector<Action> best_actions;
  for (int a = 0; a < num_actions; ++a) {
    if (q_values[a] == max_q) best_actions.push_back(a);
  }
  std::uniform_int_distribution<size_t> tie_dist(0, best_actions.size() - 1);
  return best_actions[tie_dist(rng)];
}

Action greedy_action(const std::vector<double> &q_values) {
  if (q_values.empty()) return kNoAction;
  return static_cast<Action>(std::max_element(q_values.begin(), q_values.end()) - q_values.begin());
}

std::vector<double> epsilon_greedy_probabilities(const std::vector<double> &q_values, double epsilon) {
  const int num_actions = static_cast<int>(q_values.size());
  std::vector<double> probs(num_actions, epsilon / num_actions);
  Action best = greedy_action(q_values);
  if (best != kNoAction) probs[best] = 1.0 - epsilon + epsilon / num_actions;
  return probs;
}
