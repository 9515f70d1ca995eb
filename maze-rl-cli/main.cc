/**
 * @file main.cc
 * @brief Command line driver: solve or learn a grid maze and write the results
 *
 * Command Line Usage:
 *   ./maze_rl --algo vi --layout cliff
 *   ./maze_rl --algo sarsa --layout my_maze.csv --episodes 1000 --out-json run.json
 *
 * The layout is either a built-in name or a CSV file. Planning algorithms
 * (vi, pi, tpi) use the full model; learning algorithms (qlearning, sarsa,
 * expected-sarsa, nstep-sarsa) only interact through step().
 */

#include <getopt.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>

#include "errors.h"
#include "grid_env.h"
#include "layouts.h"
#include "policy_iteration.h"
#include "reader.h"
#include "rollout.h"
#include "td_control.h"
#include "value_iteration.h"
#include "writer.h"

enum class Algo {
  ValueIteration, PolicyIteration, TruncatedPI, QLearning, Sarsa, ExpectedSarsa, NStepSarsa
};

static void die_usage(const char *prog) {
  std::cerr <<
            "Usage: " << prog << " [OPTIONS]\n\n"
                                 "PROBLEM\n"
                                 "  --algo vi|pi|tpi|qlearning|sarsa|expected-sarsa|nstep-sarsa  (default: vi)\n"
                                 "  --layout NAME|file.csv                 (default: cliff)\n"
                                 "      built-in: cliff, small-cliff, walled-cliff, maze-cliff, maze\n"
                                 "  --step-reward r                        (default: -1)\n"
                                 "  --goal-reward r                        (default: 0)\n"
                                 "  --hazard-reward r                      (default: -100)\n"
                                 "  --seed N                               (default: 42)\n"
                                 "\nPLANNING (vi, pi, tpi)\n"
                                 "  --gamma g   --theta t                  (default: 0.9, 1e-6)\n"
                                 "  --truncate k                           (evaluation sweeps for tpi, default 5)\n"
                                 "  --max-sweeps n                         (default: 100000)\n"
                                 "\nLEARNING (qlearning, sarsa, expected-sarsa, nstep-sarsa)\n"
                                 "  --episodes N                           (default: 500)\n"
                                 "  --alpha a   --gamma g  --epsilon e     (default: 0.5, 1.0, 0.1)\n"
                                 "  --epsilon-decay d --min-epsilon m      (default: 1.0, 0.0)\n"
                                 "  --n N                                  (n-step horizon, default 5)\n"
                                 "  --max-steps N                          (n-step episode cap, default 1000)\n"
                                 "  --progress K                           (report every K episodes, 0 = off)\n"
                                 "\nOUTPUT\n"
                                 "  --out-policy policy.csv                (default: policy.csv)\n"
                                 "  --out-value  value.csv                 (default: value.csv)\n"
                                 "  --out-history history.csv              (default: history.csv)\n"
                                 "  --out-combined combined.csv            (policy and values, default: none)\n"
                                 "  --out-q q.csv                          (learning only, default: none)\n"
                                 "  --out-json report.json                 (default: none)\n";
  std::exit(1);
}

static Algo parse_algo(const std::string &s) {
  if (s == "vi") return Algo::ValueIteration;
  if (s == "pi") return Algo::PolicyIteration;
  if (s == "tpi") return Algo::TruncatedPI;
  if (s == "qlearning") return Algo::QLearning;
  if (s == "sarsa") return Algo::Sarsa;
  if (s == "expected-sarsa") return Algo::ExpectedSarsa;
  if (s == "nstep-sarsa") return Algo::NStepSarsa;
  die_usage("maze_rl");
  return Algo::ValueIteration;
}

static bool is_planning(Algo algo) {
  return algo == Algo::ValueIteration || algo == Algo::PolicyIteration || algo == Algo::TruncatedPI;
}

static bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static TDResult run_learner(Algo algo, const GridEnv &env, const TDConfig &td, std::mt19937 &rng) {
  switch (algo) {
    case Algo::QLearning:
      return q_learning(env, td, rng);
    case Algo::Sarsa:
      return sarsa(env, td, rng);
    case Algo::ExpectedSarsa:
      return expected_sarsa(env, td, rng);
    default:
      return n_step_sarsa(env, td, rng);
  }
}

// Policy as a letter grid: walls '#', goal 'G', states without an action '.'
static void print_policy_grid(const GridEnv &env, const Policy &policy) {
  for (int r = 0; r < env.height(); ++r) {
    for (int c = 0; c < env.width(); ++c) {
      State s = env.to_state(r, c);
      if (env.cell(s) == CellKind::Wall) std::cout << '#';
      else if (s == env.goal_state()) std::cout << 'G';
      else if (policy[s] == kNoAction) std::cout << '.';
      else std::cout << GridEnv::action_name(policy[s]);
      std::cout << (c + 1 < env.width() ? " " : "\n");
    }
  }
}

int main(int argc, char *argv[]) {
  Algo algo = Algo::ValueIteration;
  std::string algo_name = "vi";
  std::string layout_arg = "cliff";
  RewardConfig rewards;
  unsigned seed = 42;

  DPConfig dp;
  TDConfig td;
  td.alpha = 0.5;
  td.gamma = 1.0;
  bool gamma_set = false;
  double gamma = 0.0;
  int progress_every = 0;

  std::string out_policy = "policy.csv";
  std::string out_value = "value.csv";
  std::string out_history = "history.csv";
  std::string out_q;
  std::string out_combined;
  std::string out_json;

  // CLI options
  struct option long_opts[] = {
      {"algo",          required_argument, nullptr, 'a'},
      {"layout",        required_argument, nullptr, 'l'},
      {"step-reward",   required_argument, nullptr, 1},
      {"goal-reward",   required_argument, nullptr, 2},
      {"hazard-reward", required_argument, nullptr, 3},
      {"seed",          required_argument, nullptr, 4},

      {"gamma",         required_argument, nullptr, 'g'},
      {"theta",         required_argument, nullptr, 't'},
      {"truncate",      required_argument, nullptr, 'k'},
      {"max-sweeps",    required_argument, nullptr, 5},

      {"episodes",      required_argument, nullptr, 'e'},
      {"alpha",         required_argument, nullptr, 6},
      {"epsilon",       required_argument, nullptr, 7},
      {"epsilon-decay", required_argument, nullptr, 8},
      {"min-epsilon",   required_argument, nullptr, 9},
      {"n",             required_argument, nullptr, 'n'},
      {"max-steps",     required_argument, nullptr, 10},
      {"progress",      required_argument, nullptr, 11},

      {"out-policy",    required_argument, nullptr, 'p'},
      {"out-value",     required_argument, nullptr, 'v'},
      {"out-history",   required_argument, nullptr, 12},
      {"out-q",         required_argument, nullptr, 13},
      {"out-json",      required_argument, nullptr, 14},
      {"out-combined",  required_argument, nullptr, 15},
      {"help",          no_argument,       nullptr, 'h'},
      {nullptr,         0,                 nullptr, 0}
  };

  try {
    int opt;
    while ((opt = getopt_long(argc, argv, "a:l:g:t:k:e:n:p:v:h", long_opts, nullptr)) != -1) {
      switch (opt) {
        case 'a':
          algo_name = optarg;
          algo = parse_algo(algo_name);
          break;
        case 'l':
          layout_arg = optarg;
          break;
        case 1:
          rewards.step = std::stod(optarg);
          break;
        case 2:
          rewards.goal = std::stod(optarg);
          break;
        case 3:
          rewards.hazard = std::stod(optarg);
          break;
        case 4:
          seed = (unsigned) std::stoul(optarg);
          break;
        case 'g':
          gamma = std::stod(optarg);
          gamma_set = true;
          break;
        case 't':
          dp.theta = std::stod(optarg);
          break;
        case 'k':
          dp.truncation = std::stoi(optarg);
          break;
        case 5:
          dp.max_sweeps = std::stoi(optarg);
          break;
        case 'e':
          td.episodes = std::stoi(optarg);
          break;
        case 6:
          td.alpha = std::stod(optarg);
          break;
        case 7:
          td.epsilon = std::stod(optarg);
          break;
        case 8:
          td.epsilon_decay = std::stod(optarg);
          break;
        case 9:
          td.min_epsilon = std::stod(optarg);
          break;
        case 'n':
          td.n = std::stoi(optarg);
          break;
        case 10:
          td.max_steps_per_episode = std::stoi(optarg);
          break;
        case 11:
          progress_every = std::stoi(optarg);
          break;
        case 'p':
          out_policy = optarg;
          break;
        case 'v':
          out_value = optarg;
          break;
        case 12:
          out_history = optarg;
          break;
        case 13:
          out_q = optarg;
          break;
        case 14:
          out_json = optarg;
          break;
        case 15:
          out_combined = optarg;
          break;
        default:
          die_usage(argv[0]);
      }
    }
    if (optind < argc) die_usage(argv[0]);
    if (gamma_set) {
      dp.gamma = gamma;
      td.gamma = gamma;
    }

    GridLayout layout = ends_with(layout_arg, ".csv") ? reader::read_layout_from_csv(layout_arg)
                                                      : builtin_layout(layout_arg);
    GridEnv env(layout, rewards, layout_arg);
    std::mt19937 rng(seed);

    std::cout << "Layout " << layout_arg << ": " << env.height() << "x" << env.width() << ", "
              << env.states().size() << " states, start " << env.start_state()
              << ", goal " << env.goal_state() << "\n";

    RunReport report;
    report.algorithm = algo_name;
    report.layout = layout_arg;
    report.parameters["seed"] = seed;
    report.parameters["step_reward"] = rewards.step;
    report.parameters["goal_reward"] = rewards.goal;
    report.parameters["hazard_reward"] = rewards.hazard;

    bool ok = true;
    auto start_time = std::chrono::high_resolution_clock::now();

    if (is_planning(algo)) {
      PlanningResult result;
      if (algo == Algo::ValueIteration) {
        ValueIteration solver(env, dp);
        result = solver.solve();
        report.iterations = solver.last_sweeps();
      } else {
        PolicyIteration solver(env, dp);
        result = (algo == Algo::PolicyIteration) ? solver.solve(rng) : solver.solve_truncated(rng);
        report.iterations = solver.last_policy_improvements();
        std::cout << "Evaluation sweeps (total/max): " << solver.last_eval_sweeps_total() << " / "
                  << solver.last_eval_sweeps_max() << "\n";
      }

      report.parameters["gamma"] = dp.gamma;
      report.parameters["theta"] = dp.theta;
      if (algo == Algo::TruncatedPI) report.parameters["truncation"] = dp.truncation;
      report.values = result.values;
      report.policy = result.policy;
      for (const Vector &V : result.history) report.history.push_back(V[env.start_state()]);

      ok &= writer::write_value_history_to_csv(env, result.history, out_history);
    } else {
      if (progress_every > 0) {
        td.on_episode = [progress_every](int episode, double total_reward, double epsilon) {
          if ((episode + 1) % progress_every == 0) {
            std::cout << "Episode " << (episode + 1) << ": total reward " << total_reward
                      << " (epsilon " << epsilon << ")\n";
          }
        };
      }

      std::cout << "Training " << algo_name << " for " << td.episodes << " episodes..." << std::endl;
      TDResult result = run_learner(algo, env, td, rng);

      report.parameters["alpha"] = td.alpha;
      report.parameters["gamma"] = td.gamma;
      report.parameters["epsilon"] = td.epsilon;
      report.parameters["epsilon_decay"] = td.epsilon_decay;
      report.parameters["min_epsilon"] = td.min_epsilon;
      if (algo == Algo::NStepSarsa) {
        report.parameters["n"] = td.n;
        report.parameters["max_steps_per_episode"] = td.max_steps_per_episode;
      }
      report.iterations = td.episodes;
      report.values = result.q.to_values(env.num_states());
      report.policy = result.policy;
      report.history = result.history;

      ok &= writer::write_reward_history_to_csv(result.history, out_history);
      if (!out_q.empty()) ok &= writer::write_q_table_to_csv(env, result.q, out_q);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time).count() / 1000.0;

    // Pure exploitation from the start state
    report.greedy_path = greedy_rollout(env, report.policy, env.num_states());
    bool solved = reaches_goal(env, report.greedy_path);

    std::cout << "\nGreedy policy:\n";
    print_policy_grid(env, report.policy);
    std::cout << "Start value: " << report.values[env.start_state()] << "\n";
    if (solved) {
      std::cout << "Greedy path reaches the goal in " << report.greedy_path.size() - 1 << " steps\n";
    } else {
      std::cerr << "[Warn] Greedy path does not reach the goal" << std::endl;
    }
    std::cout << "Computation time: " << elapsed_ms << " ms\n";

    ok &= writer::write_policy_to_csv(env, report.policy, out_policy);
    ok &= writer::write_values_to_csv(env, report.values, out_value);
    if (!out_combined.empty()) {
      ok &= writer::write_policy_and_values_to_csv(env, report.policy, report.values, out_combined);
    }
    if (!out_json.empty()) ok &= writer::write_report_json(env, report, out_json);

    return ok ? 0 : 1;
  } catch (const DidNotConverge &e) {
    std::cerr << "Error: " << e.what() << " (cap " << e.cap() << ")" << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
