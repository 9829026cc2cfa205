#pragma once
#include "gitstack/forge.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gitstack {

// A tracked branch with everything known about it.
struct LoadBranchItem {
  std::string name;
  std::string head; // current commit of the branch
  std::string base;
  std::string base_hash; // last recorded head of base; may be stale
  std::shared_ptr<const forge::ChangeMetadata> change; // null if never published
  std::string upstream;
  std::vector<std::string> merged_downstack;
};

// Source of the branches that make up a BranchGraph.
class BranchLoader {
public:
  virtual ~BranchLoader() = default;
  [[nodiscard]] virtual std::string trunk() const = 0;
  // All tracked branches, sorted by name.
  virtual std::vector<LoadBranchItem> load_branches() = 0;
};

// Immutable snapshot of all tracked branches as a forest rooted at trunk.
//
// Queries accept any branch name; names unknown to the graph behave like
// branches with nothing above or below them. Trunk is accepted everywhere.
class BranchGraph {
public:
  explicit BranchGraph(BranchLoader &loader);
  BranchGraph(std::string trunk, std::vector<LoadBranchItem> branches);

  [[nodiscard]] const std::string &trunk() const { return trunk_; }

  // Number of tracked branches, trunk excluded.
  [[nodiscard]] std::size_t count() const { return branches_.size(); }
  [[nodiscard]] const std::vector<LoadBranchItem> &all() const { return branches_; }

  // nullptr for trunk and unknown names.
  [[nodiscard]] const LoadBranchItem *lookup(std::string_view name) const;

  // Branches based directly on `branch`.
  [[nodiscard]] std::vector<std::string> aboves(std::string_view branch) const;

  // `branch` followed by everything above it in level order. A branch never
  // appears before its base. On trunk this lists trunk and every tracked branch.
  [[nodiscard]] std::vector<std::string> upstack(std::string_view branch) const;

  // Branches in the upstack of `branch` with nothing above them.
  [[nodiscard]] std::vector<std::string> tops(std::string_view branch) const;

  // `branch`, its base, the base's base, and so on; trunk excluded.
  [[nodiscard]] std::vector<std::string> downstack(std::string_view branch) const;

  // Last branch of downstack(branch); empty for trunk.
  [[nodiscard]] std::string bottom(std::string_view branch) const;

  // Downstack (bottom first) followed by upstack.
  [[nodiscard]] std::vector<std::string> stack(std::string_view branch) const;

  // Like stack() but bottom to top along a single chain.
  // Throws NonLinearStackError if a branch on the chain has more than one branch above it.
  [[nodiscard]] std::vector<std::string> stack_linear(std::string_view branch) const;

private:
  [[nodiscard]] const std::vector<std::size_t> &above_indices(std::string_view branch) const;

  std::string trunk_;
  std::vector<LoadBranchItem> branches_;
  std::map<std::string, std::size_t, std::less<>> by_name_;
  std::map<std::string, std::vector<std::size_t>, std::less<>> by_base_;
};

} // namespace gitstack
