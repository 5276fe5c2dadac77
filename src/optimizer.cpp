#include "tmbdd/optimizer.hpp"

#include <map>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>

namespace tmbdd {

namespace {

// Index of the first non-label part at or after `i`.
size_t NextInstruction(const std::vector<Part>& parts, size_t i) {
  while (i < parts.size() && std::holds_alternative<Label>(parts[i])) ++i;
  return i;
}

}  // namespace

std::vector<Part> ThreadGotos(const std::vector<Part>& input) {
  std::vector<Part> parts = input;
  bool changed = true;

  while (changed) {
    changed = false;

    std::map<std::string, size_t> target_index;
    for (size_t i = 0; i < parts.size(); ++i) {
      if (auto* label = std::get_if<Label>(&parts[i])) {
        target_index[label->name] = NextInstruction(parts, i);
      }
    }

    auto resolve = [&](std::string name) {
      std::set<std::string> seen;
      while (seen.insert(name).second) {
        auto it = target_index.find(name);
        if (it == target_index.end() || it->second >= parts.size()) break;
        auto* next = std::get_if<Goto>(&parts[it->second]);
        if (!next) break;
        name = next->name;
      }
      return name;
    };

    std::vector<Part> out;
    bool after_decrement = false;
    for (size_t i = 0; i < parts.size(); ++i) {
      if (auto* jump = std::get_if<Goto>(&parts[i])) {
        std::string target = resolve(jump->name);
        auto it = target_index.find(target);
        if (!after_decrement && it != target_index.end() &&
            it->second == NextInstruction(parts, i + 1)) {
          changed = true;
          continue;
        }
        if (target != jump->name) changed = true;
        out.push_back(Goto{target});
        after_decrement = false;
      } else if (auto* sub = std::get_if<SubroutinePtr>(&parts[i])) {
        after_decrement = (*sub)->is_decrement;
        out.push_back(parts[i]);
      } else {
        out.push_back(parts[i]);
      }
    }
    parts = std::move(out);
  }

  return parts;
}

std::vector<StateRef> Reachable(const StateGraph& graph, StateRef entry) {
  std::vector<StateRef> seen;
  std::vector<bool> visited(graph.size(), false);
  std::vector<StateRef> stack = {entry};

  while (!stack.empty()) {
    StateRef state = stack.back();
    stack.pop_back();
    if (state == kHalt || visited[state]) continue;
    visited[state] = true;
    seen.push_back(state);
    stack.push_back(graph.Get(state, 1).next);
    stack.push_back(graph.Get(state, 0).next);
  }

  return seen;
}

int Compress(StateGraph& graph, StateRef& entry) {
  using Key = std::tuple<StateRef, StateRef, int, int, Move, Move>;
  int rounds = 0;

  while (true) {
    std::map<Key, StateRef> unique;
    std::unordered_map<StateRef, StateRef> replacement;

    std::vector<StateRef> states = Reachable(graph, entry);
    for (StateRef state : states) {
      const Transition& t0 = graph.Get(state, 0);
      const Transition& t1 = graph.Get(state, 1);
      Key key{t0.next, t1.next, t0.write, t1.write, t0.move, t1.move};
      auto [it, inserted] = unique.emplace(key, state);
      if (!inserted) replacement[state] = it->second;
    }

    bool did_work = false;
    for (StateRef state : states) {
      for (int sym = 0; sym < 2; ++sym) {
        auto it = replacement.find(graph.Get(state, sym).next);
        if (it != replacement.end()) {
          graph.Retarget(state, sym, it->second);
          did_work = true;
        }
      }
    }

    auto it = replacement.find(entry);
    if (it != replacement.end()) {
      entry = it->second;
      did_work = true;
    }

    if (!did_work) break;
    ++rounds;
  }

  return rounds;
}

}  // namespace tmbdd
