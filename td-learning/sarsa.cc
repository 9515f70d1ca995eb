#include "td_control.h"
#include "epsilon_greedy.h"
#include <algorithm>

TDResult sarsa(const Environment &env, const TDConfig &config, std::mt19937 &rng) {
  validate_config(config);

  TDResult result{QTable(env.num_actions()), {}, {}};
  QTable &q = result.q;
  result.history.reserve(config.episodes);
  double epsilon = config.epsilon;

  for (int episode = 0; episode < config.episodes; ++episode) {
    State state = env.start_state();
    Action action = choose_action_epsilon_greedy(q.row(state), epsilon, rng);
    double total_reward = 0.0;
    bool done = false;

    while (!done) {
      StepResult r = env.step(state, action);
      total_reward += r.reward;

      // The goal row is all zeros, so a terminal transition bootstraps on nothing
      // and no action is drawn for it.
      double td_target = r.reward;
      Action next_action = kNoAction;
      if (!r.done) {
        next_action = choose_action_epsilon_greedy(q.row(r.next_state), epsilon, rng);
        td_target += config.gamma * q.row(r.next_state)[next_action];
      }

      double &q_sa = q.row(state)[action];
      q_sa += config.alpha * (td_target - q_sa);

      state = r.next_state;
      action = next_action;
      done = r.done;
    }

    result.history.push_back(total_reward);
    if (config.on_episode) config.on_episode(episode, total_reward, epsilon);
    epsilon = std::max(config.min_epsilon, epsilon * config.epsilon_decay);
  }

  result.policy = derive_policy(env, q);
  return result;
}

TDResult expected_sarsa(const Environment &env, const TDConfig &config, std::mt19937 &rng) {
  validate_config(config);

  TDResult result{QTable(env.num_actions()), {}, {}};
  QTable &q = result.q;
  result.history.reserve(config.episodes);
  double epsilon = config.epsilon;

  for (int episode = 0; episode < config.episodes; ++episode) {
    State state = env.start_state();
    double total_reward = 0.0;
    bool done = false;

    while (!done) {
      Action action = choose_action_epsilon_greedy(q.row(state), epsilon, rng);
      StepResult r = env.step(state, action);
      total_reward += r.reward;

      // E[Q(s',A')] under the epsilon-greedy policy at s'
      const QTable::Row &next_q = q.row(r.next_state);
      std::vector<double> probs = epsilon_greedy_probabilities(next_q, epsilon);
      double expected_q = 0.0;
      for (size_t a = 0; a < next_q.size(); ++a) expected_q += probs[a] * next_q[a];

      double &q_sa = q.row(state)[action];
      q_sa += config.alpha * (r.reward + config.gamma * expected_q - q_sa);

      state = r.next_state;
      done = r.done;
    }

    result.history.push_back(total_reward);
    if (config.on_episode) config.on_episode(episode, total_reward, epsilon);
    epsilon = std::max(config.min_epsilon, epsilon * config.epsilon_decay);
  }

  result.policy = derive_policy(env, q);
  return result;
}
