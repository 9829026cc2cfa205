#pragma once
#include "gitstack/git.hpp"
#include "gitstack/log.hpp"

#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gitstack {

// One branch to start tracking, with the base it was found on.
struct BranchToTrack {
  std::string name;
  std::string base;
  std::string base_hash;
};

// Picks which of the branches found at a commit becomes the base.
class BaseSelector {
public:
  virtual ~BaseSelector() = default;

  // `branch` needs a base; `candidates` are the untried branches at `commit`
  // (sorted); `selected` lists those already chained at this commit.
  // Returns the chosen candidate, or std::nullopt to skip the commit.
  virtual std::optional<std::string> select_base(std::string_view branch,
                                                 std::string_view commit,
                                                 const std::vector<std::string> &candidates,
                                                 const std::vector<std::string> &selected) = 0;
};

// Takes the only candidate; throws AmbiguousBaseError when there are several.
class NonInteractiveSelector : public BaseSelector {
public:
  std::optional<std::string> select_base(std::string_view branch, std::string_view commit,
                                         const std::vector<std::string> &candidates,
                                         const std::vector<std::string> &selected) override;
};

// Asks the user to pick a numbered candidate.
class PromptSelector : public BaseSelector {
public:
  PromptSelector(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

  std::optional<std::string> select_base(std::string_view branch, std::string_view commit,
                                         const std::vector<std::string> &candidates,
                                         const std::vector<std::string> &selected) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

// Infers bases for a branch and its untracked downstack from commit ancestry.
class DownstackDiscoverer {
public:
  // Snapshots the local branches. Throws NotExistError if trunk does not exist.
  DownstackDiscoverer(GitRepository &repo, std::string trunk,
                      std::set<std::string, std::less<>> tracked, BaseSelector &selector,
                      log::logger_t logger = nullptr);

  // Walks from `branch` toward trunk. The result starts with `branch` and
  // goes down; every entry's base is either the next entry, a tracked branch
  // or trunk.
  std::vector<BranchToTrack> discover(std::string_view branch);

private:
  std::vector<std::string> select_branches(std::vector<std::string> candidates,
                                           const std::string &branch, const std::string &commit);

  // Tracked branches and trunk end the chain.
  [[nodiscard]] bool should_stop(std::string_view name) const;

  GitRepository &repo_;
  BaseSelector &selector_;
  log::logger_t log_;

  std::string trunk_;
  std::string trunk_hash_;
  std::map<std::string, std::vector<std::string>, std::less<>> branches_by_hash_;
  std::map<std::string, std::string, std::less<>> branch_hashes_;
  std::set<std::string, std::less<>> tracked_;
};

} // namespace gitstack
