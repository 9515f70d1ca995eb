#ifndef MAZE_RL_CLI_READER_H
#define MAZE_RL_CLI_READER_H

#include "grid_env.h"
#include <string>

namespace reader {
  // Parses layout CSV text: one grid row per line, comma separated cell codes
  // (0 path, 1 wall, 2 start, 3 goal, 4 hazard). Blank lines and lines starting
  // with '#' are skipped. Throws std::invalid_argument on malformed content.
  GridLayout parse_layout(const std::string &content);

  // Throws std::runtime_error if the file cannot be opened.
  GridLayout read_layout_from_csv(const std::string &filename);
}

#endif //MAZE_RL_CLI_READER_H
