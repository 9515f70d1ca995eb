#pragma once
#include "grid_env.h"
#include <string>
#include <vector>

// Classic 4x12 cliff walk (Sutton & Barto Example 6.6): the bottom row between
// start and goal is a hazard.
GridLayout cliff_walk_layout();

// Hand-crafted small cases
GridLayout small_cliff_layout();     // 3x3, two hazard cells
GridLayout walled_cliff_layout();    // 5x5, goal behind walls, hazard column
GridLayout maze_cliff_layout();      // 4x11 maze corridors above a hazard row
GridLayout open_maze_layout();       // 5x5 maze, walls only

// Looks a layout up by name ("cliff", "small-cliff", "walled-cliff", "maze-cliff", "maze").
// Throws std::invalid_argument for an unknown name.
GridLayout builtin_layout(const std::string &name);
std::vector<std::string> builtin_layout_names();
