#include "td_control.h"
#include "epsilon_greedy.h"
#include <algorithm>
#include <deque>

namespace {

// One buffered (S_t, A_t, R_t+1) triple
struct TrajStep {
  State state;
  Action action;
  double reward;
};

// sum_i gamma^i * R_i over the whole buffer; *discount_out receives gamma^len
double discounted_return(const std::deque<TrajStep> &trajectory, double gamma, double *discount_out) {
  double G = 0.0;
  double discount = 1.0;
  for (const TrajStep &step : trajectory) {
    G += discount * step.reward;
    discount *= gamma;
  }
  if (discount_out) *discount_out = discount;
  return G;
}

void update_oldest(QTable &q, const std::deque<TrajStep> &trajectory, double G, double alpha) {
  const TrajStep &oldest = trajectory.front();
  double &q_sa = q.row(oldest.state)[oldest.action];
  q_sa += alpha * (G - q_sa);
}

}  // namespace

TDResult n_step_sarsa(const Environment &env, const TDConfig &config, std::mt19937 &rng) {
  validate_config(config);

  TDResult result{QTable(env.num_actions()), {}, {}};
  QTable &q = result.q;
  result.history.reserve(config.episodes);
  const size_t n = static_cast<size_t>(config.n);
  double epsilon = config.epsilon;

  for (int episode = 0; episode < config.episodes; ++episode) {
    State state = env.start_state();
    Action action = choose_action_epsilon_greedy(q.row(state), epsilon, rng);
    double total_reward = 0.0;
    bool done = false;
    std::deque<TrajStep> trajectory;

    for (int t = 0; !done && t < config.max_steps_per_episode; ++t) {
      StepResult r = env.step(state, action);
      total_reward += r.reward;
      trajectory.push_back({state, action, r.reward});

      Action next_action = kNoAction;
      if (!r.done) next_action = choose_action_epsilon_greedy(q.row(r.next_state), epsilon, rng);

      if (trajectory.size() >= n) {
        double discount = 1.0;
        double G = discounted_return(trajectory, config.gamma, &discount);
        // Bootstrap on Q(S_t+n, A_t+n) unless the episode just ended
        if (!r.done) G += discount * q.row(r.next_state)[next_action];
        update_oldest(q, trajectory, G, config.alpha);
        trajectory.pop_front();
      }

      state = r.next_state;
      action = next_action;
      done = r.done;
    }

    // Drain: the last (up to n-1) pairs only see the rewards left in the buffer
    while (!trajectory.empty()) {
      double G = discounted_return(trajectory, config.gamma, nullptr);
      update_oldest(q, trajectory, G, config.alpha);
      trajectory.pop_front();
    }

    result.history.push_back(total_reward);
    if (config.on_episode) config.on_episode(episode, total_reward, epsilon);
    epsilon = std::max(config.min_epsilon, epsilon * config.epsilon_decay);
  }

  result.policy = derive_policy(env, q);
  return result;
}
