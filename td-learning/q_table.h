#ifndef TD_LEARNING_Q_TABLE_H
#define TD_LEARNING_Q_TABLE_H

#include "environment.h"
#include <unordered_map>
#include <vector>

/**
 * Sparse action-value table Q[state][action].
 *
 * Rows are created on first access with every action set to 0.0, so a row is
 * never partially initialized and lookups of unvisited states never fail.
 */
class QTable {
public:
  using Row = std::vector<double>;

  explicit QTable(int num_actions);

  // Get-or-initialize accessor
  Row &row(State s);

  // nullptr if the state was never touched
  const Row *find(State s) const;

  // 0.0 for a state that was never touched
  double value(State s, Action a) const;

  // max_a Q[s][a]; materializes the row
  double max_value(State s);

  bool contains(State s) const { return rows_.count(s) != 0; }
  size_t size() const { return rows_.size(); }
  int num_actions() const { return num_actions_; }

  // Touched states in ascending order
  std::vector<State> visited_states() const;

  // V[s] = max_a Q[s][a] for touched states, 0 elsewhere
  Vector to_values(int num_states) const;

private:
  int num_actions_;
  std::unordered_map<State, Row> rows_;
};

#endif //TD_LEARNING_Q_TABLE_H
