#ifndef TD_LEARNING_TD_CONTROL_H
#define TD_LEARNING_TD_CONTROL_H

#include "environment.h"
#include "q_table.h"
#include <functional>
#include <random>
#include <vector>

// Called once per finished episode with (episode index, total reward, epsilon used).
// Side channel only: it cannot influence the learner.
using EpisodeCallback = std::function<void(int, double, double)>;

struct TDConfig {
  int episodes = 500;
  double alpha = 0.1;              // Learning rate
  double gamma = 0.9;              // Discount factor
  double epsilon = 0.1;            // Exploration rate
  double epsilon_decay = 1.0;      // Multiplied into epsilon after every episode (1.0: constant)
  double min_epsilon = 0.0;        // Floor for the decayed epsilon
  int n = 5;                       // Lookahead horizon (n-step SARSA)
  int max_steps_per_episode = 1000;  // Step cap (n-step SARSA)
  EpisodeCallback on_episode;
};

struct TDResult {
  QTable q;
  Policy policy;                   // Greedy w.r.t. q; kNoAction for the goal and unvisited states
  std::vector<double> history;     // Total reward per episode
};

// Throws std::invalid_argument if any parameter is out of range.
void validate_config(const TDConfig &config);

// First maximal action of every visited non-terminal state.
Policy derive_policy(const Environment &env, const QTable &q);

// Off-policy TD control: bootstraps on max_a' Q(s', a').
TDResult q_learning(const Environment &env, const TDConfig &config, std::mt19937 &rng);

// On-policy TD control: bootstraps on Q(s', a') for the a' that will be executed next.
TDResult sarsa(const Environment &env, const TDConfig &config, std::mt19937 &rng);

// Bootstraps on the expectation of Q(s', .) under the epsilon-greedy policy.
TDResult expected_sarsa(const Environment &env, const TDConfig &config, std::mt19937 &rng);

// n-step SARSA with a sliding trajectory buffer of config.n entries and a
// per-episode step cap. The buffer is drained at the end of every episode.
TDResult n_step_sarsa(const Environment &env, const TDConfig &config, std::mt19937 &rng);

#endif //TD_LEARNING_TD_CONTROL_H
