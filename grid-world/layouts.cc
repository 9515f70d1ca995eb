#include "layouts.h"
#include <stdexcept>

GridLayout cliff_walk_layout() {
  return make_layout({
      {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
      {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
      {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
      {2, 4, 4, 4, 4, 4, 4, 4, 4, 4, 4, 3}});
}

GridLayout small_cliff_layout() {
  return make_layout({
      {2, 0, 4},
      {4, 0, 0},
      {0, 0, 3}});
}

GridLayout walled_cliff_layout() {
  return make_layout({
      {0, 0, 0, 0, 0},
      {0, 4, 1, 1, 0},
      {0, 4, 3, 1, 0},
      {0, 4, 0, 1, 0},
      {2, 4, 0, 0, 0}});
}

GridLayout maze_cliff_layout() {
  return make_layout({
      {0, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0},
      {0, 1, 0, 1, 0, 1, 0, 1, 0, 1, 0},
      {0, 1, 0, 0, 0, 1, 0, 0, 0, 1, 0},
      {2, 4, 4, 4, 4, 4, 4, 4, 4, 4, 3}});
}

GridLayout open_maze_layout() {
  return make_layout({
      {2, 0, 0, 1, 0},
      {1, 1, 0, 1, 0},
      {0, 0, 0, 0, 0},
      {0, 1, 1, 1, 0},
      {0, 0, 0, 1, 3}});
}

GridLayout builtin_layout(const std::string &name) {
  if (name == "cliff") return cliff_walk_layout();
  if (name == "small-cliff") return small_cliff_layout();
  if (name == "walled-cliff") return walled_cliff_layout();
  if (name == "maze-cliff") return maze_cliff_layout();
  if (name == "maze") return open_maze_layout();
  throw std::invalid_argument("Unknown layout: " + name);
}

std::vector<std::string> builtin_layout_names() {
  return {"cliff", "small-cliff", "walled-cliff", "maze-cliff", "maze"};
}
