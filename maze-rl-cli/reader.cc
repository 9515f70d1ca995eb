#include "reader.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace {

string trim(const string &str) {
  size_t first = str.find_first_not_of(" \t\r");
  if (first == string::npos) return "";
  size_t last = str.find_last_not_of(" \t\r");
  return str.substr(first, last - first + 1);
}

}  // namespace

GridLayout reader::parse_layout(const string &content) {
  vector<vector<int>> rows;
  istringstream in(content);
  string line;
  int line_no = 0;

  while (getline(in, line)) {
    ++line_no;
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;

    vector<int> row;
    stringstream ss(line);
    string cell;
    while (getline(ss, cell, ',')) {
      cell = trim(cell);
      size_t used = 0;
      int code = 0;
      try {
        code = stoi(cell, &used);
      } catch (const logic_error &) {
        used = 0;
      }
      if (cell.empty() || used != cell.size()) {
        throw invalid_argument("Layout line " + to_string(line_no) + ": bad cell '" + cell + "'");
      }
      row.push_back(code);
    }
    rows.push_back(row);
  }

  return make_layout(rows);
}

GridLayout reader::read_layout_from_csv(const string &filename) {
  ifstream file(filename);
  if (!file.is_open()) {
    throw runtime_error("Could not open layout file " + filename);
  }
  stringstream buffer;
  buffer << file.rdbuf();
  return parse_layout(buffer.str());
}
