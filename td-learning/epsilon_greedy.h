#ifndef TD_LEARNING_EPSILON_GREEDY_H
#define TD_LEARNING_EPSILON_GREEDY_H

#include "environment.h"
#include <random>
#include <vector>

// With probability epsilon: a uniformly random action (explore).
// Otherwise: a uniformly random choice among the actions attaining the row
// maximum (exploit, randomized tie-break).
Action choose_action_epsilon_greedy(const std::vector<double> &q_values, double epsilon, std::mt19937 &rng);

// First action attaining the row maximum. Deterministic.
Action greedy_action(const std::vector<double> &q_values);

// Probability of each action under the epsilon-greedy policy, with the
// greedy_action() as the favoured one: 1 - eps + eps/|A| for it, eps/|A| for the rest.
std::vector<double> epsilon_greedy_probabilities(const std::vector<double> &q_values, double epsilon);

#endif //TD_LEARNING_EPSILON_GREEDY_H
