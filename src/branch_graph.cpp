#include "gitstack/branch_graph.hpp"

#include "gitstack/errors.hpp"

#include <algorithm>
#include <deque>

namespace gitstack {

BranchGraph::BranchGraph(BranchLoader &loader)
    : BranchGraph(loader.trunk(), loader.load_branches()) {}

BranchGraph::BranchGraph(std::string trunk, std::vector<LoadBranchItem> branches)
    : trunk_(std::move(trunk)), branches_(std::move(branches)) {
  for (std::size_t idx = 0; idx < branches_.size(); ++idx) {
    by_name_.emplace(branches_[idx].name, idx);
    by_base_[branches_[idx].base].push_back(idx);
  }
}

const LoadBranchItem *BranchGraph::lookup(std::string_view name) const {
  const auto it = by_name_.find(name);
  return it == by_name_.end() ? nullptr : &branches_[it->second];
}

const std::vector<std::size_t> &BranchGraph::above_indices(std::string_view branch) const {
  static const std::vector<std::size_t> none;
  const auto it = by_base_.find(branch);
  return it == by_base_.end() ? none : it->second;
}

std::vector<std::string> BranchGraph::aboves(std::string_view branch) const {
  std::vector<std::string> out;
  for (const auto idx : above_indices(branch)) {
    out.push_back(branches_[idx].name);
  }
  return out;
}

std::vector<std::string> BranchGraph::upstack(std::string_view branch) const {
  std::vector<std::string> out;
  std::deque<std::string> queue{std::string(branch)};
  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();
    for (const auto idx : above_indices(current)) {
      queue.push_back(branches_[idx].name);
    }
    out.push_back(std::move(current));
  }
  return out;
}

std::vector<std::string> BranchGraph::tops(std::string_view branch) const {
  std::vector<std::string> out;
  std::deque<std::string> remaining{std::string(branch)};
  while (!remaining.empty()) {
    auto current = std::move(remaining.front());
    remaining.pop_front();
    const auto &above = above_indices(current);
    if (above.empty()) {
      out.push_back(std::move(current));
      continue;
    }
    for (const auto idx : above) {
      remaining.push_back(branches_[idx].name);
    }
  }
  return out;
}

std::vector<std::string> BranchGraph::downstack(std::string_view branch) const {
  std::vector<std::string> out;
  std::string current(branch);
  while (current != trunk_) {
    const auto it = by_name_.find(current);
    if (it == by_name_.end()) {
      break;
    }
    out.push_back(current);
    current = branches_[it->second].base;
  }
  return out;
}

std::string BranchGraph::bottom(std::string_view branch) const {
  const auto down = downstack(branch);
  return down.empty() ? std::string{} : down.back();
}

std::vector<std::string> BranchGraph::stack(std::string_view branch) const {
  auto out = downstack(branch);
  if (!out.empty() && out.front() == branch) {
    out.erase(out.begin());
  }
  std::ranges::reverse(out);

  auto up = upstack(branch);
  out.insert(out.end(), std::make_move_iterator(up.begin()), std::make_move_iterator(up.end()));
  return out;
}

std::vector<std::string> BranchGraph::stack_linear(std::string_view branch) const {
  auto out = downstack(branch);
  if (!out.empty() && out.front() == branch) {
    out.erase(out.begin());
  }
  std::ranges::reverse(out);

  // Branches below `branch` must not fork either.
  for (const auto &below : out) {
    if (above_indices(below).size() > 1) {
      throw NonLinearStackError(below, aboves(below));
    }
  }

  std::string current(branch);
  out.push_back(current);
  for (;;) {
    const auto &above = above_indices(current);
    if (above.empty()) {
      break;
    }
    if (above.size() > 1) {
      throw NonLinearStackError(current, aboves(current));
    }
    current = branches_[above.front()].name;
    out.push_back(current);
  }
  return out;
}

} // namespace gitstack
