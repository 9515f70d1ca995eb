/**
 * @file policy_iteration.h
 * @brief Policy iteration and truncated policy iteration for grid-world MDPs
 */

#ifndef DYNAMIC_PROGRAMMING_POLICY_ITERATION_H
#define DYNAMIC_PROGRAMMING_POLICY_ITERATION_H

#include "planning.h"
#include <random>

/**
 * @class PolicyIteration
 * @brief Alternates policy evaluation and greedy policy improvement
 *
 * The algorithm alternates between:
 * 1. Policy Evaluation: computing V^π for the current deterministic policy π
 * 2. Policy Improvement: replacing π by the greedy policy with respect to V^π
 *
 * and stops once an improvement step changes no action.
 *
 * Two evaluation schemes are offered:
 * - solve(): in-place (Gauss-Seidel) sweeps of
 *   \f$ V(s) \leftarrow r(s,\pi(s)) + \gamma V(s') \f$ until the max change
 *   in a sweep is below theta. Values updated earlier in the sweep are used.
 * - solve_truncated(): exactly config.truncation synchronous (Jacobi) sweeps
 *   per phase, each reading the table as it stood at the start of the sweep.
 *
 * The initial policy assigns a uniformly random action to every non-terminal
 * state and is drawn from the caller's random source. The goal never gets an
 * action.
 *
 * @note The environment is held by reference and must outlive the solver.
 */
class PolicyIteration {
public:
  /**
   * @brief Construct a solver over a full-model environment
   * @throws std::invalid_argument if the configuration is out of range
   */
  explicit PolicyIteration(const Environment &env, const DPConfig &config = DPConfig());

  /**
   * @brief Policy iteration with evaluation run to convergence
   *
   * @param rng Random source for the initial policy
   * @return values, stable policy and one snapshot per evaluation phase
   *         (plus the initial zero table)
   * @throws DidNotConverge if an evaluation phase exceeds config.max_sweeps
   *         or the policy is not stable after config.max_policy_iterations
   */
  PlanningResult solve(std::mt19937 &rng);

  /**
   * @brief Truncated policy iteration (config.truncation sweeps per evaluation)
   *
   * @param rng Random source for the initial policy
   * @throws DidNotConverge if the policy is not stable after
   *         config.max_policy_iterations
   */
  PlanningResult solve_truncated(std::mt19937 &rng);

  // Metrics captured from the last solve()/solve_truncated()
  int last_policy_improvements() const { return last_policy_improvements_; }
  long long last_eval_sweeps_total() const { return last_eval_sweeps_total_; }
  int last_eval_sweeps_max() const { return last_eval_sweeps_max_; }

private:
  enum class Evaluation { UntilConverged, Truncated };

  const Environment &env_;
  DPConfig config_;
  std::vector<State> states_;  ///< Non-terminal states

  PlanningResult run(Evaluation mode, std::mt19937 &rng);

  Policy random_policy(std::mt19937 &rng) const;

  /**
   * @brief In-place evaluation of a fixed policy until delta < theta
   * @return Number of sweeps performed
   */
  int policy_evaluation_inplace(const Policy &policy, Vector &V);

  /**
   * @brief config.truncation synchronous evaluation sweeps
   * @return Number of sweeps performed
   */
  int policy_evaluation_truncated(const Policy &policy, Vector &V);

  /**
   * @brief Greedy improvement with tie stabilization
   *
   * A state keeps its current action unless the greedy action beats it by
   * more than config.tie_tolerance.
   *
   * @return true if no action changed (policy stable)
   */
  bool policy_improvement(const Vector &V, Policy &policy);

  int last_policy_improvements_ = 0;
  long long last_eval_sweeps_total_ = 0;
  int last_eval_sweeps_max_ = 0;
};

#endif //DYNAMIC_PROGRAMMING_POLICY_ITERATION_H
