#include "td_control.h"
#include "epsilon_greedy.h"
#include <algorithm>

TDResult q_learning(const Environment &env, const TDConfig &config, std::mt19937 &rng) {
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

      // Q(s,a) <- Q(s,a) + alpha * [r + gamma * max_a' Q(s',a') - Q(s,a)]
      double next_max = q.max_value(r.next_state);
      double &q_sa = q.row(state)[action];
      q_sa += config.alpha * (r.reward + config.gamma * next_max - q_sa);

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
