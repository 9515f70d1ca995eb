/**
 * @file value_iteration.cc
 * @brief Implementation of the synchronous value iteration solver
 */

#include "value_iteration.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace std;

ValueIteration::ValueIteration(const Environment &env, const DPConfig &config)
  : env_(env), config_(config), states_(sweep_states(env)) {
  validate_config(config_);
}

PlanningResult ValueIteration::solve() {
  cout << "Starting value iteration on " << env_.name() << " (" << states_.size()
       << " non-terminal states)..." << endl;

  PlanningResult result;
  result.values.assign(env_.num_states(), 0.0);
  result.policy.assign(env_.num_states(), kNoAction);
  result.history.push_back(result.values);

  Vector &V = result.values;
  for (int sweep = 0; sweep < config_.max_sweeps; ++sweep) {
    // Snapshot of V_k; the whole sweep reads from it
    const Vector V_prev = V;
    double delta = 0.0;

    for (State s : states_) {
      double best_q = 0.0;
      Action best_a = greedy_action(env_, s, V_prev, config_.gamma, &best_q);
      result.policy[s] = best_a;
      V[s] = best_q;
      delta = max(delta, fabs(V_prev[s] - V[s]));
    }

    result.history.push_back(V);
    last_sweeps_ = sweep + 1;
    last_delta_ = delta;

    if (delta < config_.theta) {
      cout << "Converged after " << last_sweeps_ << " iterations." << endl;
      return result;
    }
  }

  cerr << "[Warn] Value iteration reached " << config_.max_sweeps
       << " sweeps with delta " << last_delta_ << endl;
  throw DidNotConverge("Value iteration", config_.max_sweeps);
}
