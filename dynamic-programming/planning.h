/**
 * @file planning.h
 * @brief Shared types and Bellman helpers for the dynamic-programming solvers
 *
 * The solvers in this directory require full-model access: they query
 * Environment::step() for every non-terminal state on every sweep, not only
 * for states an agent happens to visit.
 */

#ifndef DYNAMIC_PROGRAMMING_PLANNING_H
#define DYNAMIC_PROGRAMMING_PLANNING_H

#include "environment.h"
#include <vector>

/**
 * @brief Solver parameters
 *
 * max_sweeps bounds value-iteration sweeps and the sweeps of each policy
 * evaluation phase; max_policy_iterations bounds the outer evaluate/improve
 * loop. Exceeding either raises DidNotConverge.
 */
struct DPConfig {
  double gamma = 0.9;               ///< Discount factor, 0 < gamma <= 1
  double theta = 1e-6;              ///< Convergence threshold on the max per-sweep change
  int truncation = 5;               ///< Evaluation sweeps per phase (truncated policy iteration)
  int max_sweeps = 100000;
  int max_policy_iterations = 10000;
  double tie_tolerance = 1e-6;      ///< Improvement must beat the current action by more than this
};

/**
 * @brief Output of a planning run
 *
 * history[0] is the all-zero initial table; every later entry is a snapshot
 * taken after a sweep (value iteration) or after an evaluation phase
 * (policy iteration).
 */
struct PlanningResult {
  Vector values;
  Policy policy;
  std::vector<Vector> history;
};

/**
 * @brief Validate solver parameters
 * @throws std::invalid_argument if any parameter is out of range
 */
void validate_config(const DPConfig &config);

/**
 * @brief One-step lookahead value of taking action a in state s
 *
 * Q(s,a) = r(s,a) + gamma * V[s'] where (s', r) = env.step(s, a)
 */
double compute_state_value(const Environment &env, State s, Action a, const Vector &V, double gamma);

/**
 * @brief Greedy action with respect to V
 *
 * Ties are broken by selecting the first action in env.actions() order.
 *
 * @param[out] best_value Q-value of the returned action (may be nullptr)
 */
Action greedy_action(const Environment &env, State s, const Vector &V, double gamma,
                     double *best_value = nullptr);

/**
 * @brief All non-terminal states, in env.states() order
 */
std::vector<State> sweep_states(const Environment &env);

#endif //DYNAMIC_PROGRAMMING_PLANNING_H
