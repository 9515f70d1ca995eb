/**
 * @file writer.cc
 * @brief Implementation of CSV and JSON result output
 *
 * Floating point values are written with 6 decimal places.
 */

#include "writer.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace std;

/**
 * @brief Write a deterministic policy, one row per non-wall cell
 *
 * Output Format:
 * state,row,col,action
 * 0,0,0,N
 * 1,0,1,E
 * ...
 *
 * Actions are written as compass letters; the goal and states without an
 * action get "-".
 *
 * @return false if the policy does not cover the grid or the file cannot be opened
 */
bool writer::write_policy_to_csv(const GridEnv &env, const Policy &policy, const string &filename) {
  if (static_cast<int>(policy.size()) != env.num_states()) {
    cerr << "Error: Policy has " << policy.size() << " entries, grid has " << env.num_states() << " cells" << endl;
    return false;
  }

  ofstream file(filename);
  if (!file.is_open()) {
    cerr << "Error: Could not open file " << filename << " for writing" << endl;
    return false;
  }

  file << "state,row,col,action\n";
  for (State s : env.states()) {
    file << s << "," << env.row_of(s) << "," << env.col_of(s) << "," << GridEnv::action_name(policy[s]) << "\n";
  }

  file.close();
  cout << "Successfully wrote policy to " << filename << endl;
  return true;
}

/**
 * @brief Write a value table with 6 decimal places
 *
 * Output Format:
 * state,row,col,value
 * 0,0,0,-7.175705
 * ...
 */
bool writer::write_values_to_csv(const GridEnv &env, const Vector &values, const string &filename) {
  if (static_cast<int>(values.size()) != env.num_states()) {
    cerr << "Error: Value table has " << values.size() << " entries, grid has " << env.num_states() << " cells"
         << endl;
    return false;
  }

  ofstream file(filename);
  if (!file.is_open()) {
    cerr << "Error: Could not open file " << filename << " for writing" << endl;
    return false;
  }

  file << "state,row,col,value\n";
  file << fixed << setprecision(6);
  for (State s : env.states()) {
    file << s << "," << env.row_of(s) << "," << env.col_of(s) << "," << values[s] << "\n";
  }

  file.close();
  cout << "Successfully wrote values to " << filename << endl;
  return true;
}

/**
 * @brief Write policy and values side by side
 *
 * Output Format:
 * state,row,col,action,value
 * 0,0,0,N,-7.175705
 * ...
 *
 * Validation: policy, values and grid must have the same number of cells.
 */
bool writer::write_policy_and_values_to_csv(const GridEnv &env, const Policy &policy, const Vector &values,
                                            const string &filename) {
  if (policy.size() != values.size() || static_cast<int>(values.size()) != env.num_states()) {
    cerr << "Error: Policy and values must both cover the " << env.num_states() << " grid cells" << endl;
    return false;
  }

  ofstream file(filename);
  if (!file.is_open()) {
    cerr << "Error: Could not open file " << filename << " for writing" << endl;
    return false;
  }

  file << "state,row,col,action,value\n";
  file << fixed << setprecision(6);
  for (State s : env.states()) {
    file << s << "," << env.row_of(s) << "," << env.col_of(s) << ","
         << GridEnv::action_name(policy[s]) << "," << values[s] << "\n";
  }

  file.close();
  cout << "Successfully wrote policy and values to " << filename << endl;
  return true;
}

/**
 * @brief Write one row of action values per visited state
 *
 * Output Format:
 * state,row,col,N,S,E,W
 * 36,3,0,-13.000000,-14.000000,-113.000000,-14.000000
 * ...
 */
bool writer::write_q_table_to_csv(const GridEnv &env, const QTable &q, const string &filename) {
  ofstream file(filename);
  if (!file.is_open()) {
    cerr << "Error: Could not open file " << filename << " for writing" << endl;
    return false;
  }

  file << "state,row,col";
  for (Action a : env.actions()) file << "," << GridEnv::action_name(a);
  file << "\n";

  file << fixed << setprecision(6);
  for (State s : q.visited_states()) {
    file << s << "," << env.row_of(s) << "," << env.col_of(s);
    for (double v : *q.find(s)) file << "," << v;
    file << "\n";
  }

  file.close();
  cout << "Successfully wrote Q table to " << filename << endl;
  return true;
}

/**
 * @brief Summarize every value snapshot of a planning run
 *
 * Output Format:
 * iteration,start_value,max_value
 * 0,0.000000,0.000000
 * 1,-1.000000,0.000000
 * ...
 *
 * Row 0 is the initial all-zero table.
 */
bool writer::write_value_history_to_csv(const GridEnv &env, const vector<Vector> &history,
                                        const string &filename) {
  ofstream file(filename);
  if (!file.is_open()) {
    cerr << "Error: Could not open file " << filename << " for writing" << endl;
    return false;
  }

  file << "iteration,start_value,max_value\n";
  file << fixed << setprecision(6);
  const State start = env.start_state();
  for (size_t i = 0; i < history.size(); ++i) {
    const Vector &V = history[i];
    double max_value = V.empty() ? 0.0 : *max_element(V.begin(), V.end());
    file << i << "," << V.at(start) << "," << max_value << "\n";
  }

  file.close();
  cout << "Successfully wrote value history to " << filename << endl;
  return true;
}

/**
 * @brief Write the total reward of every training episode
 *
 * Output Format:
 * episode,total_reward
 * 0,-1243.000000
 * ...
 */
bool writer::write_reward_history_to_csv(const vector<double> &history, const string &filename) {
  ofstream file(filename);
  if (!file.is_open()) {
    cerr << "Error: Could not open file " << filename << " for writing" << endl;
    return false;
  }

  file << "episode,total_reward\n";
  file << fixed << setprecision(6);
  for (size_t i = 0; i < history.size(); ++i) {
    file << i << "," << history[i] << "\n";
  }

  file.close();
  cout << "Successfully wrote reward history to " << filename << endl;
  return true;
}

// Serializes the report with nlohmann::json, pretty printed with 2-space indent.
bool writer::write_report_json(const GridEnv &env, const RunReport &report, const string &filename) {
  nlohmann::json j;
  j["algorithm"] = report.algorithm;
  j["layout"] = report.layout;

  nlohmann::json cells = nlohmann::json::array();
  for (int r = 0; r < env.height(); ++r) {
    vector<int> row;
    for (int c = 0; c < env.width(); ++c) row.push_back(static_cast<int>(env.cell(env.to_state(r, c))));
    cells.push_back(row);
  }
  j["grid"] = {
      {"height", env.height()},
      {"width",  env.width()},
      {"start",  env.start_state()},
      {"goal",   env.goal_state()},
      {"cells",  cells}
  };

  j["parameters"] = report.parameters;
  j["iterations"] = report.iterations;
  j["values"] = report.values;

  vector<string> actions;
  actions.reserve(report.policy.size());
  for (Action a : report.policy) actions.push_back(GridEnv::action_name(a));
  j["policy"] = actions;

  j["greedy_path"] = report.greedy_path;
  j["history"] = report.history;

  ofstream file(filename);
  if (!file.is_open()) {
    cerr << "Error: Could not open file " << filename << " for writing" << endl;
    return false;
  }
  file << j.dump(2) << "\n";

  file.close();
  cout << "Successfully wrote report to " << filename << endl;
  return true;
}
