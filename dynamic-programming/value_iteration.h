/**
 * @file value_iteration.h
 * @brief Value iteration solver for grid-world MDPs
 */

#ifndef DYNAMIC_PROGRAMMING_VALUE_ITERATION_H
#define DYNAMIC_PROGRAMMING_VALUE_ITERATION_H

#include "planning.h"

/**
 * @class ValueIteration
 * @brief Synchronous Bellman-optimality sweeps until the value table settles
 *
 * Every sweep computes
 * \f[
 *   V_{k+1}(s) = \max_a \bigl[ r(s,a) + \gamma V_k(s') \bigr]
 * \f]
 * for all non-terminal states, reading only V_k (the table as it stood at the
 * start of the sweep). Values written earlier in the same sweep are never
 * read back. The goal keeps V = 0 and has no action.
 *
 * @note The environment is held by reference and must outlive the solver.
 */
class ValueIteration {
public:
  /**
   * @brief Construct a solver over a full-model environment
   * @throws std::invalid_argument if the configuration is out of range
   */
  explicit ValueIteration(const Environment &env, const DPConfig &config = DPConfig());

  /**
   * @brief Sweep until the max absolute change in a sweep is below theta
   *
   * @return values, greedy policy and one snapshot per sweep (plus the
   *         initial zero table)
   * @throws DidNotConverge after config.max_sweeps sweeps
   */
  PlanningResult solve();

  // Metrics captured from the last solve()
  int last_sweeps() const { return last_sweeps_; }
  double last_delta() const { return last_delta_; }

private:
  const Environment &env_;
  DPConfig config_;
  std::vector<State> states_;  ///< Non-terminal states swept each iteration

  int last_sweeps_ = 0;
  double last_delta_ = 0.0;
};

#endif //DYNAMIC_PROGRAMMING_VALUE_ITERATION_H
