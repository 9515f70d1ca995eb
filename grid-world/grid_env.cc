#include "grid_env.h"
#include "errors.h"
#include <stdexcept>
#include <utility>

namespace {

// Direction vectors: N, S, E, W
const int di[kNumDirections] = {-1, 1, 0, 0};
const int dj[kNumDirections] = {0, 0, 1, -1};

}  // namespace

OutcomeTable default_outcomes(const RewardConfig &rewards) {
  OutcomeTable table;
  table[static_cast<int>(CellKind::Path)]   = {Effect::Enter, rewards.step};
  table[static_cast<int>(CellKind::Wall)]   = {Effect::Block, rewards.step};
  table[static_cast<int>(CellKind::Start)]  = {Effect::Enter, rewards.step};
  table[static_cast<int>(CellKind::Goal)]   = {Effect::Terminate, rewards.goal};
  table[static_cast<int>(CellKind::Hazard)] = {Effect::ResetToStart, rewards.hazard};
  return table;
}

GridLayout make_layout(const std::vector<std::vector<int>> &rows) {
  if (rows.empty() || rows[0].empty()) {
    throw std::invalid_argument("Layout must have at least one row and one column");
  }
  GridLayout layout;
  layout.H = static_cast<int>(rows.size());
  layout.W = static_cast<int>(rows[0].size());
  layout.cells.reserve(static_cast<size_t>(layout.H) * layout.W);
  for (int i = 0; i < layout.H; ++i) {
    if (static_cast<int>(rows[i].size()) != layout.W) {
      throw std::invalid_argument("Layout row " + std::to_string(i) + " has " +
                                  std::to_string(rows[i].size()) + " cells, expected " +
                                  std::to_string(layout.W));
    }
    for (int code : rows[i]) {
      if (code < 0 || code >= kNumCellKinds) {
        throw std::invalid_argument("Unknown cell code " + std::to_string(code) +
                                    " in layout row " + std::to_string(i));
      }
      layout.cells.push_back(static_cast<CellKind>(code));
    }
  }
  return layout;
}

GridEnv::GridEnv(const GridLayout &layout, const RewardConfig &rewards, std::string name)
  : GridEnv(layout, default_outcomes(rewards), std::move(name)) {}

GridEnv::GridEnv(const GridLayout &layout, const OutcomeTable &outcomes, std::string name)
  : H_(layout.H), W_(layout.W), cells_(layout.cells), outcomes_(outcomes), name_(std::move(name)) {
  if (H_ <= 0 || W_ <= 0 || static_cast<int>(cells_.size()) != H_ * W_) {
    throw std::invalid_argument("Layout size does not match its " + std::to_string(H_) + "x" +
                                std::to_string(W_) + " dimensions");
  }
  // Walls must stay outside the state set and the goal must end the episode.
  if (outcomes_[static_cast<int>(CellKind::Wall)].effect != Effect::Block) {
    throw std::invalid_argument("Wall cells must block movement");
  }
  if (outcomes_[static_cast<int>(CellKind::Goal)].effect != Effect::Terminate) {
    throw std::invalid_argument("Goal cells must terminate the episode");
  }

  int starts = 0, goals = 0;
  for (State s = 0; s < H_ * W_; ++s) {
    switch (cells_[s]) {
      case CellKind::Start:
        start_ = s;
        ++starts;
        break;
      case CellKind::Goal:
        goal_ = s;
        ++goals;
        break;
      default:
        break;
    }
    if (cells_[s] != CellKind::Wall) states_.push_back(s);
  }
  if (starts != 1 || goals != 1) {
    throw std::invalid_argument("Layout needs exactly one start and one goal (found " +
                                std::to_string(starts) + " start, " + std::to_string(goals) + " goal)");
  }
}

StepResult GridEnv::step(State s, Action a) const {
  if (a < 0 || a >= kNumDirections) throw InvalidAction(a);
  if (s < 0 || s >= H_ * W_) {
    throw std::out_of_range("State " + std::to_string(s) + " is outside the " + std::to_string(H_) +
                            "x" + std::to_string(W_) + " grid");
  }

  // The goal is absorbing
  if (s == goal_) return {goal_, 0.0, true};

  int ni = row_of(s) + di[a], nj = col_of(s) + dj[a];
  if (!in_bounds(ni, nj)) {
    return {s, outcomes_[static_cast<int>(CellKind::Wall)].reward, false};
  }

  State target = to_state(ni, nj);
  const CellOutcome &outcome = outcomes_[static_cast<int>(cells_[target])];
  switch (outcome.effect) {
    case Effect::Enter:
      return {target, outcome.reward, false};
    case Effect::Block:
      return {s, outcome.reward, false};
    case Effect::ResetToStart:
      return {start_, outcome.reward, false};
    case Effect::Terminate:
      return {target, outcome.reward, true};
  }
  return {s, outcome.reward, false};
}

const char *GridEnv::action_name(Action a) {
  static const char *names[kNumDirections] = {"N", "S", "E", "W"};
  if (a < 0 || a >= kNumDirections) return "-";
  return names[a];
}
