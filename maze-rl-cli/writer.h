/**
 * @file writer.h
 * @brief CSV and JSON output for planning and learning results
 *
 * Output Formats Supported:
 * - Policy CSV: "state,row,col,action" with compass letters (N, S, E, W, "-" for none)
 * - Value CSV: "state,row,col,value"
 * - Combined CSV: "state,row,col,action,value"
 * - Q table CSV: "state,row,col,N,S,E,W" for visited states
 * - Value history CSV: "iteration,start_value,max_value" (planning)
 * - Reward history CSV: "episode,total_reward" (learning)
 * - Report JSON: run parameters, grid, values, policy, greedy path and history
 *
 * Only non-wall cells are written. All methods return false and log to
 * std::cerr when the output file cannot be opened.
 */

#ifndef MAZE_RL_CLI_WRITER_H
#define MAZE_RL_CLI_WRITER_H

#include "grid_env.h"
#include "q_table.h"
#include <map>
#include <string>
#include <vector>

/**
 * @brief Everything the JSON report needs about one run
 */
struct RunReport {
  std::string algorithm;
  std::string layout;
  std::map<std::string, double> parameters;
  int iterations = 0;                 ///< Sweeps / improvement rounds / episodes
  Vector values;
  Policy policy;
  std::vector<State> greedy_path;
  std::vector<double> history;        ///< V[start] per snapshot or reward per episode
};

class writer {
public:
  /**
   * @brief Write a deterministic policy, one row per non-wall cell
   *
   * state,row,col,action
   * 0,0,0,N
   * 1,0,1,E
   * ...
   */
  static bool write_policy_to_csv(const GridEnv &env, const Policy &policy, const std::string &filename);

  static bool write_values_to_csv(const GridEnv &env, const Vector &values, const std::string &filename);

  /**
   * @brief Policy and values side by side (policy and values must have equal size)
   */
  static bool write_policy_and_values_to_csv(const GridEnv &env, const Policy &policy, const Vector &values,
                                             const std::string &filename);

  static bool write_q_table_to_csv(const GridEnv &env, const QTable &q, const std::string &filename);

  /**
   * @brief One row per value snapshot: the start state's value and the table maximum
   */
  static bool write_value_history_to_csv(const GridEnv &env, const std::vector<Vector> &history,
                                         const std::string &filename);

  static bool write_reward_history_to_csv(const std::vector<double> &history, const std::string &filename);

  /**
   * @brief Write a JSON document describing the run (nlohmann::json)
   *
   * {
   *   "algorithm": "qlearning", "layout": "cliff",
   *   "grid": {"height": 4, "width": 12, "start": 36, "goal": 47, "cells": [[...], ...]},
   *   "parameters": {...}, "iterations": 500,
   *   "values": [...], "policy": ["E", ...], "greedy_path": [...], "history": [...]
   * }
   */
  static bool write_report_json(const GridEnv &env, const RunReport &report, const std::string &filename);
};

#endif //MAZE_RL_CLI_WRITER_H
