#ifndef GRID_WORLD_GRID_ENV_H
#define GRID_WORLD_GRID_ENV_H

#include "environment.h"
#include <array>
#include <string>
#include <vector>

// Layout legend: 0 path, 1 wall, 2 start, 3 goal, 4 hazard (cliff)
enum class CellKind : int { Path = 0, Wall = 1, Start = 2, Goal = 3, Hazard = 4 };
constexpr int kNumCellKinds = 5;

// Direction order is also the tie-break order of greedy action selection
enum Direction : int { North = 0, South = 1, East = 2, West = 3 };
constexpr int kNumDirections = 4;

// What happens when the agent tries to move into a cell of a given kind.
enum class Effect {
  Enter,          // move in
  Block,          // stay where you are
  ResetToStart,   // fall back to the start cell, episode continues
  Terminate       // move in, episode ends
};

struct CellOutcome {
  Effect effect{Effect::Enter};
  double reward{0.0};
};

using OutcomeTable = std::array<CellOutcome, kNumCellKinds>;

struct RewardConfig {
  double step   = -1.0;    // ordinary move, bump into a wall or the border
  double goal   = 0.0;     // entering the goal
  double hazard = -100.0;  // stepping onto a hazard cell
};

// Path/Start: Enter(step), Wall: Block(step), Hazard: ResetToStart(hazard), Goal: Terminate(goal)
OutcomeTable default_outcomes(const RewardConfig &rewards);

// Row-major cell grid. cells.size() == H * W.
struct GridLayout {
  int H = 0, W = 0;
  std::vector<CellKind> cells;
};

// Builds a layout from integer rows using the legend above.
// Throws std::invalid_argument for empty/ragged input or unknown cell codes.
GridLayout make_layout(const std::vector<std::vector<int>> &rows);

/**
 * GridEnv - deterministic grid world with a per-cell-kind outcome table.
 *
 * A plain maze and the cliff walk are the same type: they only differ in the
 * layout and in what the Hazard entry of the outcome table says. Moving off the
 * grid behaves like hitting a wall.
 */
class GridEnv : public Environment {
public:
  explicit GridEnv(const GridLayout &layout, const RewardConfig &rewards = RewardConfig(),
                   std::string name = "grid");
  GridEnv(const GridLayout &layout, const OutcomeTable &outcomes, std::string name = "grid");

  int num_states() const override { return H_ * W_; }
  std::vector<State> states() const override { return states_; }
  int num_actions() const override { return kNumDirections; }
  std::vector<Action> actions() const override { return {North, South, East, West}; }
  State start_state() const override { return start_; }
  State goal_state() const override { return goal_; }
  StepResult step(State s, Action a) const override;
  std::string name() const override { return name_; }

  int height() const { return H_; }
  int width() const { return W_; }
  CellKind cell(State s) const { return cells_.at(s); }
  const OutcomeTable &outcomes() const { return outcomes_; }

  State to_state(int row, int col) const { return row * W_ + col; }
  int row_of(State s) const { return s / W_; }
  int col_of(State s) const { return s % W_; }
  bool in_bounds(int row, int col) const { return 0 <= row && row < H_ && 0 <= col && col < W_; }

  // "N", "S", "E", "W"; "-" for kNoAction
  static const char *action_name(Action a);

private:
  int H_, W_;
  std::vector<CellKind> cells_;
  OutcomeTable outcomes_;
  State start_{0}, goal_{0};
  std::vector<State> states_;
  std::string name_;
};

#endif //GRID_WORLD_GRID_ENV_H
