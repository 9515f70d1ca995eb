/**
 * @file policy_iteration.cc
 * @brief Implementation of policy iteration and truncated policy iteration
 */

#include "policy_iteration.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace std;

PolicyIteration::PolicyIteration(const Environment &env, const DPConfig &config)
  : env_(env), config_(config), states_(sweep_states(env)) {
  validate_config(config_);
}

PlanningResult PolicyIteration::solve(mt19937 &rng) {
  cout << "Starting policy iteration on " << env_.name() << "..." << endl;
  return run(Evaluation::UntilConverged, rng);
}

PlanningResult PolicyIteration::solve_truncated(mt19937 &rng) {
  cout << "Starting truncated policy iteration on " << env_.name()
       << " (" << config_.truncation << " evaluation sweeps)..." << endl;
  return run(Evaluation::Truncated, rng);
}

PlanningResult PolicyIteration::run(Evaluation mode, mt19937 &rng) {
  PlanningResult result;
  result.policy = random_policy(rng);
  result.values.assign(env_.num_states(), 0.0);
  result.history.push_back(result.values);

  int policy_improvements = 0;
  long long eval_sweeps_total = 0;
  int eval_sweeps_max = 0;

  for (int iter = 0; iter < config_.max_policy_iterations; ++iter) {
    // STEP 1: Policy Evaluation (warm-started from the previous V)
    int sweeps = (mode == Evaluation::UntilConverged)
                   ? policy_evaluation_inplace(result.policy, result.values)
                   : policy_evaluation_truncated(result.policy, result.values);
    eval_sweeps_total += sweeps;
    eval_sweeps_max = max(eval_sweeps_max, sweeps);
    result.history.push_back(result.values);

    // STEP 2: Policy Improvement
    bool stable = policy_improvement(result.values, result.policy);
    ++policy_improvements;

    // STEP 3: Convergence Check
    if (stable) {
      last_policy_improvements_ = policy_improvements;
      last_eval_sweeps_total_ = eval_sweeps_total;
      last_eval_sweeps_max_ = eval_sweeps_max;
      cout << "Converged after " << policy_improvements << " iterations." << endl;
      return result;
    }
  }

  last_policy_improvements_ = policy_improvements;
  last_eval_sweeps_total_ = eval_sweeps_total;
  last_eval_sweeps_max_ = eval_sweeps_max;
  cerr << "[Warn] Reached max policy iterations (" << config_.max_policy_iterations
       << ") without policy stability." << endl;
  throw DidNotConverge(mode == Evaluation::UntilConverged ? "Policy iteration" : "Truncated policy iteration",
                       config_.max_policy_iterations);
}

Policy PolicyIteration::random_policy(mt19937 &rng) const {
  const vector<Action> actions = env_.actions();
  uniform_int_distribution<size_t> pick(0, actions.size() - 1);

  Policy policy(env_.num_states(), kNoAction);
  for (State s : states_) {
    policy[s] = actions[pick(rng)];
  }
  return policy;
}

int PolicyIteration::policy_evaluation_inplace(const Policy &policy, Vector &V) {
  for (int sweep = 0; sweep < config_.max_sweeps; ++sweep) {
    double delta = 0.0;
    for (State s : states_) {
      double v_old = V[s];
      V[s] = compute_state_value(env_, s, policy[s], V, config_.gamma);
      delta = max(delta, fabs(v_old - V[s]));
    }
    if (delta < config_.theta) return sweep + 1;
  }
  cerr << "[Warn] Policy evaluation did not reach theta = " << config_.theta
       << " within " << config_.max_sweeps << " sweeps" << endl;
  throw DidNotConverge("Policy evaluation", config_.max_sweeps);
}

int PolicyIteration::policy_evaluation_truncated(const Policy &policy, Vector &V) {
  for (int sweep = 0; sweep < config_.truncation; ++sweep) {
    const Vector V_old = V;
    for (State s : states_) {
      V[s] = compute_state_value(env_, s, policy[s], V_old, config_.gamma);
    }
  }
  return config_.truncation;
}

bool PolicyIteration::policy_improvement(const Vector &V, Policy &policy) {
  int changes = 0;
  for (State s : states_) {
    Action a_curr = policy[s];
    double q_new = 0.0;
    Action a_new = greedy_action(env_, s, V, config_.gamma, &q_new);

    // Don't flip on a tie or on an improvement within the evaluation noise
    if (a_new != a_curr) {
      double q_curr = compute_state_value(env_, s, a_curr, V, config_.gamma);
      if (q_new <= q_curr + config_.tie_tolerance) a_new = a_curr;
    }
    if (a_new != a_curr) {
      policy[s] = a_new;
      ++changes;
    }
  }
  return changes == 0;
}
