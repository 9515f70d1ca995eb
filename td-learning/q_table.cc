#include "q_table.h"
#include <algorithm>
#include <stdexcept>
#include <string>

QTable::QTable(int num_actions) : num_actions_(num_actions) {
  if (num_actions_ < 1) {
    throw std::invalid_argument("QTable needs at least one action, got " + std::to_string(num_actions));
  }
}

QTable::Row &QTable::row(State s) {
  auto it = rows_.find(s);
  if (it == rows_.end()) {
    it = rows_.emplace(s, Row(num_actions_, 0.0)).first;
  }
  return it->second;
}

const QTable::Row *QTable::find(State s) const {
  auto it = rows_.find(s);
  return it == rows_.end() ? nullptr : &it->second;
}

double QTable::value(State s, Action a) const {
  const Row *r = find(s);
  return r ? r->at(a) : 0.0;
}

double QTable::max_value(State s) {
  const Row &r = row(s);
  return *std::max_element(r.begin(), r.end());
}

std::vector<State> QTable::visited_states() const {
  std::vector<State> out;
  out.reserve(rows_.size());
  for (const auto &kv : rows_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

Vector QTable::to_values(int num_states) const {
  Vector V(num_states, 0.0);
  for (const auto &[s, r] : rows_) {
    if (s >= 0 && s < num_states) V[s] = *std::max_element(r.begin(), r.end());
  }
  return V;
}
