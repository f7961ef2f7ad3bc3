#include "graph.h"

#include "errors.h"

#include <algorithm>
#include <functional>
#include <queue>
#include <utility>

namespace strata {

std::size_t dependency_graph::add_node(std::string label) {
  labels_.push_back(std::move(label));
  deps_.emplace_back();
  rdeps_.emplace_back();
  return labels_.size() - 1;
}

bool dependency_graph::add_edge(std::size_t dependent, std::size_t dependency) {
  auto &out{ deps_[dependent] };
  if (std::ranges::find(out, dependency) != out.end()) { return false; }
  out.push_back(dependency);
  rdeps_[dependency].push_back(dependent);
  return true;
}

std::optional<std::vector<std::string>> dependency_graph::find_cycle() const {
  enum class color : unsigned char { unvisited, in_progress, done };

  std::vector<color> marks(labels_.size(), color::unvisited);
  std::vector<std::pair<std::size_t, std::size_t>> stack;  // node, next edge to explore

  for (std::size_t root{ 0 }; root < labels_.size(); ++root) {
    if (marks[root] != color::unvisited) { continue; }

    marks[root] = color::in_progress;
    stack.emplace_back(root, 0);

    while (!stack.empty()) {
      auto &[node, next]{ stack.back() };

      if (next == deps_[node].size()) {
        marks[node] = color::done;
        stack.pop_back();
        continue;
      }

      std::size_t const child{ deps_[node][next++] };

      if (marks[child] == color::in_progress) {
        auto const start{ std::ranges::find_if(stack, [child](auto const &frame) {
          return frame.first == child;
        }) };
        std::vector<std::string> path;
        for (auto it{ start }; it != stack.end(); ++it) { path.push_back(labels_[it->first]); }
        path.push_back(labels_[child]);
        return path;
      }

      if (marks[child] == color::unvisited) {
        marks[child] = color::in_progress;
        stack.emplace_back(child, 0);
      }
    }
  }

  return std::nullopt;
}

std::vector<std::size_t> dependency_graph::topo_order() const {
  std::vector<std::size_t> remaining(labels_.size());
  std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;

  for (std::size_t n{ 0 }; n < labels_.size(); ++n) {
    remaining[n] = deps_[n].size();
    if (remaining[n] == 0) { ready.push(n); }
  }

  std::vector<std::size_t> order;
  order.reserve(labels_.size());

  while (!ready.empty()) {
    std::size_t const n{ ready.top() };
    ready.pop();
    order.push_back(n);
    for (std::size_t const dependent : rdeps_[n]) {
      if (--remaining[dependent] == 0) { ready.push(dependent); }
    }
  }

  if (order.size() != labels_.size()) {
    if (auto cycle{ find_cycle() }) { throw cycle_error(std::move(*cycle)); }
    throw cycle_error(std::vector<std::string>{});
  }

  return order;
}

dependency_graph dependency_graph::reversed() const {
  dependency_graph result;
  result.labels_ = labels_;
  result.deps_ = rdeps_;
  result.rdeps_ = deps_;
  return result;
}

}  // namespace strata
