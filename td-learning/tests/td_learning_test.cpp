#include "epsilon_greedy.h"
#include "grid_env.h"
#include "layouts.h"
#include "q_table.h"
#include "rollout.h"
#include "td_control.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <set>
#include <string>
#include <utility>

namespace {

// Forwards to a grid and remembers every (state, action) it was asked about
class RecordingEnv : public Environment {
public:
  explicit RecordingEnv(const GridEnv &inner) : inner_(inner) {}

  int num_states() const override { return inner_.num_states(); }
  std::vector<State> states() const override { return inner_.states(); }
  int num_actions() const override { return inner_.num_actions(); }
  std::vector<Action> actions() const override { return inner_.actions(); }
  State start_state() const override { return inner_.start_state(); }
  State goal_state() const override { return inner_.goal_state(); }
  std::string name() const override { return "recording"; }

  StepResult step(State s, Action a) const override {
    visited.insert({s, a});
    return inner_.step(s, a);
  }

  mutable std::set<std::pair<State, Action>> visited;

private:
  const GridEnv &inner_;
};

double mean_of_last(const std::vector<double> &history, size_t count) {
  count = std::min(count, history.size());
  return std::accumulate(history.end() - count, history.end(), 0.0) / count;
}

}  // namespace

class TDLearningTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Classic cliff walk setting
    cliff_config.episodes = 500;
    cliff_config.alpha = 0.5;
    cliff_config.gamma = 1.0;
    cliff_config.epsilon = 0.1;
  }

  TDConfig cliff_config;
};

TEST_F(TDLearningTest, GreedySelectionWithoutExploration) {
  std::mt19937 rng(3);
  std::vector<double> row = {1.0, 3.0, 3.0, 0.0};
  int count1 = 0, count2 = 0;
  for (int i = 0; i < 1000; ++i) {
    Action a = choose_action_epsilon_greedy(row, 0.0, rng);
    ASSERT_TRUE(a == 1 || a == 2);
    (a == 1 ? count1 : count2)++;
  }
  // Ties are broken at random
  EXPECT_GT(count1, 0);
  EXPECT_GT(count2, 0);
}

TEST_F(TDLearningTest, FullExplorationIsUniform) {
  std::mt19937 rng(11);
  std::vector<double> row = {0.0, 10.0, 0.0, 0.0};
  std::vector<int> counts(4, 0);
  for (int i = 0; i < 4000; ++i) counts[choose_action_epsilon_greedy(row, 1.0, rng)]++;
  for (int c : counts) {
    EXPECT_GT(c, 800);
    EXPECT_LT(c, 1200);
  }
}

TEST_F(TDLearningTest, GreedyActionAndProbabilities) {
  std::vector<double> row = {1.0, 3.0, 3.0, 0.0};
  EXPECT_EQ(greedy_action(row), 1);
  EXPECT_EQ(greedy_action({}), kNoAction);

  std::vector<double> probs = epsilon_greedy_probabilities(row, 0.2);
  ASSERT_EQ(probs.size(), 4u);
  EXPECT_DOUBLE_EQ(probs[1], 0.8 + 0.05);
  EXPECT_DOUBLE_EQ(probs[0], 0.05);
  EXPECT_DOUBLE_EQ(probs[2], 0.05);
  EXPECT_NEAR(std::accumulate(probs.begin(), probs.end(), 0.0), 1.0, 1e-12);

  std::mt19937 rng(1);
  EXPECT_THROW(choose_action_epsilon_greedy({}, 0.1, rng), std::invalid_argument);
}

TEST_F(TDLearningTest, QTableRowsStartAtZero) {
  QTable q(4);
  EXPECT_FALSE(q.contains(5));
  EXPECT_DOUBLE_EQ(q.value(5, 2), 0.0);
  EXPECT_EQ(q.find(5), nullptr);
  EXPECT_EQ(q.size(), 0u);

  QTable::Row &row = q.row(5);
  ASSERT_EQ(row.size(), 4u);
  for (double v : row) EXPECT_DOUBLE_EQ(v, 0.0);
  EXPECT_TRUE(q.contains(5));

  row[3] = -2.0;
  row[1] = -1.0;
  q.row(2)[0] = -4.0;
  EXPECT_DOUBLE_EQ(q.max_value(5), 0.0);
  EXPECT_DOUBLE_EQ(q.max_value(9), 0.0);
  EXPECT_EQ(q.visited_states(), (std::vector<State>{2, 5, 9}));

  Vector V = q.to_values(10);
  EXPECT_DOUBLE_EQ(V[2], 0.0);   // untouched actions are still 0
  EXPECT_DOUBLE_EQ(V[7], 0.0);

  EXPECT_THROW(QTable(0), std::invalid_argument);
}

TEST_F(TDLearningTest, ConfigValidation) {
  GridEnv env(open_maze_layout());
  std::mt19937 rng(1);
  TDConfig bad;
  bad.alpha = 0.0;
  EXPECT_THROW(q_learning(env, bad, rng), std::invalid_argument);

  bad = TDConfig();
  bad.n = 0;
  EXPECT_THROW(n_step_sarsa(env, bad, rng), std::invalid_argument);

  bad = TDConfig();
  bad.min_epsilon = 0.5;  // above epsilon
  EXPECT_THROW(sarsa(env, bad, rng), std::invalid_argument);

  bad = TDConfig();
  bad.epsilon = 1.5;
  EXPECT_THROW(expected_sarsa(env, bad, rng), std::invalid_argument);

  bad = TDConfig();
  bad.episodes = -1;
  EXPECT_THROW(validate_config(bad), std::invalid_argument);
}

TEST_F(TDLearningTest, ZeroEpisodesLearnNothing) {
  GridEnv env(open_maze_layout());
  std::mt19937 rng(1);
  TDConfig config;
  config.episodes = 0;
  TDResult result = q_learning(env, config, rng);
  EXPECT_TRUE(result.history.empty());
  EXPECT_EQ(result.q.size(), 0u);
  ASSERT_EQ(static_cast<int>(result.policy.size()), env.num_states());
  for (Action a : result.policy) EXPECT_EQ(a, kNoAction);
}

TEST_F(TDLearningTest, QLearningSolvesMaze) {
  GridEnv env(open_maze_layout());
  std::mt19937 rng(42);
  TDConfig config;  // defaults
  TDResult result = q_learning(env, config, rng);

  EXPECT_EQ(result.history.size(), 500u);
  EXPECT_EQ(result.policy[env.goal_state()], kNoAction);
  EXPECT_TRUE(reaches_goal(env, greedy_rollout(env, result.policy, 100)));
}

TEST_F(TDLearningTest, EveryLearnerReachesGoalOnMaze) {
  GridEnv env(open_maze_layout());
  TDConfig config = cliff_config;
  config.episodes = 500;
  // Exploration fades out, so the last episodes follow the greedy policy
  config.epsilon_decay = 0.98;
  config.min_epsilon = 0.0;

  for (unsigned seed = 0; seed < 5; ++seed) {
    std::mt19937 rng1(seed), rng2(seed), rng3(seed);
    TDResult s = sarsa(env, config, rng1);
    TDResult e = expected_sarsa(env, config, rng2);
    TDResult n = n_step_sarsa(env, config, rng3);

    EXPECT_TRUE(reaches_goal(env, greedy_rollout(env, s.policy, 100))) << "sarsa, seed " << seed;
    EXPECT_TRUE(reaches_goal(env, greedy_rollout(env, e.policy, 100))) << "expected sarsa, seed " << seed;
    EXPECT_TRUE(reaches_goal(env, greedy_rollout(env, n.policy, 100))) << "n-step sarsa, seed " << seed;
  }
}

TEST_F(TDLearningTest, GoalValueStaysZero) {
  GridEnv env(cliff_walk_layout());
  TDConfig config = cliff_config;
  config.episodes = 100;
  State goal = env.goal_state();

  std::mt19937 rng1(4), rng2(4), rng3(4), rng4(4);
  std::vector<std::pair<std::string, TDResult>> results;
  results.emplace_back("q_learning", q_learning(env, config, rng1));
  results.emplace_back("sarsa", sarsa(env, config, rng2));
  results.emplace_back("expected_sarsa", expected_sarsa(env, config, rng3));
  results.emplace_back("n_step_sarsa", n_step_sarsa(env, config, rng4));

  for (const auto &[name, result] : results) {
    for (Action a : env.actions()) {
      EXPECT_EQ(result.q.value(goal, a), 0.0) << name << " action " << a;
    }
    EXPECT_EQ(result.q.to_values(env.num_states())[goal], 0.0) << name;
    EXPECT_EQ(result.policy[goal], kNoAction) << name;
  }
}

TEST_F(TDLearningTest, CliffWalkQLearningTakesEdgePath) {
  GridEnv env(cliff_walk_layout());
  std::mt19937 rng(0);
  TDResult result = q_learning(env, cliff_config, rng);

  std::vector<State> path = greedy_rollout(env, result.policy, 100);
  EXPECT_TRUE(reaches_goal(env, path));
  EXPECT_EQ(path.size(), 14u);  // 13 moves
}

TEST_F(TDLearningTest, CliffWalkSarsaTakesSaferPath) {
  GridEnv env(cliff_walk_layout());
  std::mt19937 rng_q(0), rng_s(0), rng_e(0);
  TDResult q = q_learning(env, cliff_config, rng_q);
  TDResult s = sarsa(env, cliff_config, rng_s);
  TDResult e = expected_sarsa(env, cliff_config, rng_e);

  std::vector<State> sarsa_path = greedy_rollout(env, s.policy, 100);
  EXPECT_TRUE(reaches_goal(env, sarsa_path));
  EXPECT_GT(sarsa_path.size(), 14u);

  std::vector<State> expected_path = greedy_rollout(env, e.policy, 100);
  EXPECT_TRUE(reaches_goal(env, expected_path));
  EXPECT_GT(expected_path.size(), 14u);

  // Exploring next to the cliff costs Q-learning more while it learns
  EXPECT_GT(mean_of_last(s.history, 100), mean_of_last(q.history, 100));
  EXPECT_GT(mean_of_last(e.history, 100), mean_of_last(q.history, 100));
}

TEST_F(TDLearningTest, OneStepSarsaMatchesSarsaExactly) {
  GridEnv env(open_maze_layout());
  TDConfig config = cliff_config;
  config.episodes = 200;
  config.n = 1;
  config.max_steps_per_episode = 1000000;

  std::mt19937 rng1(99), rng2(99);
  TDResult one = sarsa(env, config, rng1);
  TDResult n1 = n_step_sarsa(env, config, rng2);

  EXPECT_EQ(one.history, n1.history);
  EXPECT_EQ(one.policy, n1.policy);
  ASSERT_EQ(one.q.visited_states(), n1.q.visited_states());
  for (State s : one.q.visited_states()) {
    EXPECT_EQ(*one.q.find(s), *n1.q.find(s)) << "state " << s;
  }
}

TEST_F(TDLearningTest, NStepDrainUpdatesEveryVisitedPair) {
  // Every reward is -1, including the one for entering the goal
  RewardConfig rewards;
  rewards.goal = -1.0;
  GridEnv grid(make_layout({{2, 0, 0, 0, 0, 3}}), rewards);

  for (int n : {3, 50}) {
    RecordingEnv env(grid);
    TDConfig config;
    config.episodes = 1;
    config.n = n;
    config.alpha = 0.5;
    config.gamma = 1.0;
    config.epsilon = 0.0;
    std::mt19937 rng(17);
    TDResult result = n_step_sarsa(env, config, rng);

    ASSERT_FALSE(env.visited.empty());
    for (const auto &[s, a] : env.visited) {
      EXPECT_LT(result.q.value(s, a), 0.0) << "n=" << n << " state " << s << " action " << a;
    }
  }
}

TEST_F(TDLearningTest, NStepStepCapEndsEpisode) {
  // The wall cuts the start off from the goal
  GridEnv env(make_layout({{2, 1, 3}}));
  TDConfig config;
  config.episodes = 3;
  config.max_steps_per_episode = 50;
  std::mt19937 rng(5);
  TDResult result = n_step_sarsa(env, config, rng);

  ASSERT_EQ(result.history.size(), 3u);
  for (double total : result.history) EXPECT_DOUBLE_EQ(total, -50.0);
  EXPECT_FALSE(reaches_goal(env, greedy_rollout(env, result.policy, 10)));
}

TEST_F(TDLearningTest, EpisodeCallbackSeesDecayedEpsilon) {
  GridEnv env(open_maze_layout());
  TDConfig config;
  config.episodes = 5;
  config.epsilon = 0.5;
  config.epsilon_decay = 0.5;
  config.min_epsilon = 0.1;

  std::vector<int> episodes;
  std::vector<double> rewards, epsilons;
  config.on_episode = [&](int episode, double total_reward, double epsilon) {
    episodes.push_back(episode);
    rewards.push_back(total_reward);
    epsilons.push_back(epsilon);
  };

  std::mt19937 rng(8);
  TDResult result = expected_sarsa(env, config, rng);

  EXPECT_EQ(episodes, (std::vector<int>{0, 1, 2, 3, 4}));
  EXPECT_EQ(rewards, result.history);
  ASSERT_EQ(epsilons.size(), 5u);
  EXPECT_DOUBLE_EQ(epsilons[0], 0.5);
  EXPECT_DOUBLE_EQ(epsilons[1], 0.25);
  EXPECT_DOUBLE_EQ(epsilons[2], 0.125);
  EXPECT_DOUBLE_EQ(epsilons[3], 0.1);
  EXPECT_DOUBLE_EQ(epsilons[4], 0.1);
}

TEST_F(TDLearningTest, DerivedPolicySkipsGoalAndUnvisitedStates) {
  GridEnv env(small_cliff_layout());
  QTable q(env.num_actions());
  q.row(env.start_state()) = {-3.0, -1.0, -1.0, -2.0};
  q.row(env.goal_state());

  Policy policy = derive_policy(env, q);
  EXPECT_EQ(policy[env.start_state()], South);
  EXPECT_EQ(policy[env.goal_state()], kNoAction);
  EXPECT_EQ(policy[env.to_state(1, 1)], kNoAction);
}
