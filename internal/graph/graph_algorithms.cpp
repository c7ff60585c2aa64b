#include "internal/graph/graph_algorithms.hpp"

#include <algorithm>
#include <bit>
#include <limits>
#include <utility>

namespace workgraph::graph {

DenseGraph DenseGraph::Build(const GraphSnapshot& snapshot, const std::function<bool(const model::WorkItem&)>& include) {
  DenseGraph graph;
  for (const auto& [id, item] : snapshot.Nodes()) {
    if (include && !include(item)) {
      continue;
    }
    graph.index.emplace(id, graph.ids.size());
    graph.ids.push_back(id);
    graph.items.push_back(&item);
  }

  graph.forward.resize(graph.ids.size());
  for (std::size_t v = 0; v < graph.ids.size(); ++v) {
    for (const auto& target : snapshot.Forward(graph.ids[v])) {
      auto it = graph.index.find(target);
      if (it != graph.index.end()) {
        graph.forward[v].push_back(it->second);
      }
    }
  }
  return graph;
}

// ------------------------------------------------------------
// Tarjan, iterative
// ------------------------------------------------------------

std::vector<std::vector<std::size_t>> StronglyConnectedComponents(const DenseGraph& graph) {
  constexpr std::size_t kUnvisited = std::numeric_limits<std::size_t>::max();

  const std::size_t        n = graph.Size();
  std::vector<std::size_t> order(n, kUnvisited);
  std::vector<std::size_t> low(n, 0);
  std::vector<bool>        on_stack(n, false);
  std::vector<std::size_t> stack;
  std::size_t              counter = 0;

  std::vector<std::vector<std::size_t>>            components;
  std::vector<std::pair<std::size_t, std::size_t>> frames; // (node, next edge)

  auto visit = [&](std::size_t v) {
    order[v] = low[v] = counter++;
    stack.push_back(v);
    on_stack[v] = true;
    frames.emplace_back(v, 0);
  };

  for (std::size_t root = 0; root < n; ++root) {
    if (order[root] != kUnvisited) {
      continue;
    }
    visit(root);

    while (!frames.empty()) {
      const std::size_t v = frames.back().first;
      std::size_t&      e = frames.back().second;

      if (e < graph.forward[v].size()) {
        const std::size_t w = graph.forward[v][e++];
        if (order[w] == kUnvisited) {
          visit(w);
        } else if (on_stack[w]) {
          low[v] = std::min(low[v], order[w]);
        }
        continue;
      }

      if (low[v] == order[v]) {
        std::vector<std::size_t> component;
        std::size_t              w = 0;
        do {
          w = stack.back();
          stack.pop_back();
          on_stack[w] = false;
          component.push_back(w);
        } while (w != v);
        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
      }

      frames.pop_back();
      if (!frames.empty()) {
        const std::size_t parent = frames.back().first;
        low[parent]              = std::min(low[parent], low[v]);
      }
    }
  }

  return components;
}

// ------------------------------------------------------------
// Cycles, Johnson
// ------------------------------------------------------------

std::vector<std::vector<std::string>> FindCycles(const DenseGraph& graph, const std::function<void()>& checkpoint) {
  const std::size_t n = graph.Size();

  std::vector<std::size_t> component_of(n, 0);
  const auto               components = StronglyConnectedComponents(graph);
  for (std::size_t c = 0; c < components.size(); ++c) {
    for (auto v : components[c]) {
      component_of[v] = c;
    }
  }

  std::vector<bool>                     blocked(n, false);
  std::vector<std::vector<std::size_t>> blocked_by(n);
  std::vector<std::size_t>              unblock_queue;

  auto unblock = [&](std::size_t u) {
    unblock_queue.assign(1, u);
    while (!unblock_queue.empty()) {
      const std::size_t x = unblock_queue.back();
      unblock_queue.pop_back();
      blocked[x] = false;
      for (auto w : blocked_by[x]) {
        if (blocked[w]) {
          unblock_queue.push_back(w);
        }
      }
      blocked_by[x].clear();
    }
  };

  struct Frame {
    std::size_t node;
    std::size_t next_edge;
    bool        closed;
  };

  std::vector<std::vector<std::string>> cycles;
  std::vector<Frame>                    frames;

  // Circuits through s use only nodes of s's component with a larger index,
  // so each one is found exactly once, from its smallest id.
  for (std::size_t s = 0; s < n; ++s) {
    if (checkpoint) {
      checkpoint();
    }

    const std::size_t component = component_of[s];
    auto              allowed   = [&](std::size_t w) { return w >= s && component_of[w] == component; };

    const bool self_loop = std::find(graph.forward[s].begin(), graph.forward[s].end(), s) != graph.forward[s].end();
    if (components[component].size() == 1 && !self_loop) {
      continue;
    }

    for (std::size_t v = s; v < n; ++v) {
      if (component_of[v] == component) {
        blocked[v] = false;
        blocked_by[v].clear();
      }
    }

    blocked[s] = true;
    frames.push_back({s, 0, false});

    while (!frames.empty()) {
      Frame&            top = frames.back();
      const std::size_t v   = top.node;

      if (top.next_edge < graph.forward[v].size()) {
        const std::size_t w = graph.forward[v][top.next_edge++];
        if (!allowed(w)) {
          continue;
        }
        if (w == s) {
          std::vector<std::string> cycle;
          cycle.reserve(frames.size());
          for (const auto& frame : frames) {
            cycle.push_back(graph.ids[frame.node]);
          }
          cycles.push_back(std::move(cycle));
          top.closed = true;
        } else if (!blocked[w]) {
          blocked[w] = true;
          frames.push_back({w, 0, false});
        }
        continue;
      }

      const bool closed = top.closed;
      if (closed) {
        unblock(v);
      } else {
        for (auto w : graph.forward[v]) {
          if (allowed(w) && std::find(blocked_by[w].begin(), blocked_by[w].end(), v) == blocked_by[w].end()) {
            blocked_by[w].push_back(v);
          }
        }
      }
      frames.pop_back();
      if (!frames.empty() && closed) {
        frames.back().closed = true;
      }
    }
  }

  std::sort(cycles.begin(), cycles.end());
  return cycles;
}

// ------------------------------------------------------------
// Bitset
// ------------------------------------------------------------

Bitset& Bitset::operator|=(const Bitset& other) {
  for (std::size_t i = 0; i < words_.size() && i < other.words_.size(); ++i) {
    words_[i] |= other.words_[i];
  }
  return *this;
}

std::size_t Bitset::Count() const {
  std::size_t count = 0;
  for (auto word : words_) {
    count += static_cast<std::size_t>(std::popcount(word));
  }
  return count;
}

void Bitset::ForEach(const std::function<void(std::size_t)>& fn) const {
  for (std::size_t w = 0; w < words_.size(); ++w) {
    uint64_t word = words_[w];
    while (word != 0) {
      const int bit = std::countr_zero(word);
      fn(w * 64 + static_cast<std::size_t>(bit));
      word &= word - 1;
    }
  }
}

// ------------------------------------------------------------
// Reachability
// ------------------------------------------------------------

Reachability::Reachability(const DenseGraph& graph, const std::function<void()>& checkpoint)
    : component_of_(graph.Size(), 0) {
  auto components = StronglyConnectedComponents(graph);

  for (std::size_t c = 0; c < components.size(); ++c) {
    for (auto v : components[c]) {
      component_of_[v] = c;
    }
  }

  // components arrive sinks first, so every successor is final before use
  reach_.reserve(components.size());
  for (std::size_t c = 0; c < components.size(); ++c) {
    if (checkpoint) {
      checkpoint();
    }

    Bitset reach(graph.Size());
    for (auto v : components[c]) {
      for (auto w : graph.forward[v]) {
        const auto target = component_of_[w];
        if (target != c) {
          reach.Set(w);
          reach |= reach_[target];
        }
      }
    }

    if (components[c].size() > 1) {
      for (auto v : components[c]) {
        reach.Set(v);
      }
    }
    reach_.push_back(std::move(reach));
  }
}

} // namespace workgraph::graph
