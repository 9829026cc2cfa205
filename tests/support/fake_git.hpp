#pragma once
// In-memory GitRepository for engine tests.

#include "gitstack/errors.hpp"
#include "gitstack/git.hpp"

#include <algorithm>
#include <cstdio>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitstack::testing {

class FakeGit : public GitRepository {
public:
  struct Commit {
    std::vector<std::string> parents;
    std::string message;
  };

  explicit FakeGit(std::string trunk = "main") {
    const auto root = make_commit({}, "initial");
    branches_[trunk] = root;
    current_ = std::move(trunk);
  }

  // Add a commit on top of `branch` and move the branch to it.
  std::string commit(const std::string &branch, const std::string &message) {
    const auto parent = branches_.at(branch);
    auto hash = make_commit({parent}, message);
    branches_[branch] = hash;
    return hash;
  }

  // Create `name` at the head of `from` (a branch or a commit).
  void branch(const std::string &name, const std::string &from) {
    branches_[name] = peel_to_commit(from);
  }

  void reset(const std::string &name, const std::string &commit) { branches_[name] = commit; }
  void remove(const std::string &name) { branches_.erase(name); }
  void checkout(const std::string &name) { current_ = name; }

  // The next rebase replaying a commit with this message stops on a conflict.
  void conflict_on(const std::string &message) { conflicts_.insert(message); }

  // The next rename is refused the way git refuses a bad ref name.
  void fail_next_rename() { fail_rename_ = true; }

  [[nodiscard]] std::string head(const std::string &name) const { return branches_.at(name); }
  [[nodiscard]] const Commit &info(const std::string &hash) const { return commits_.at(hash); }
  [[nodiscard]] bool rebase_in_progress() const { return pending_.has_value(); }

  std::vector<RebaseRequest> rebases;

  // GitRepository

  std::string peel_to_commit(std::string_view ref) override {
    if (const auto it = branches_.find(std::string(ref)); it != branches_.end()) {
      return it->second;
    }
    if (commits_.contains(std::string(ref))) {
      return std::string(ref);
    }
    throw NotExistError(std::string(ref));
  }

  bool is_ancestor(std::string_view ancestor, std::string_view descendant) override {
    if (!commits_.contains(std::string(ancestor))) {
      return false;
    }
    return ancestors(std::string(descendant)).contains(std::string(ancestor));
  }

  std::string merge_base(std::string_view a, std::string_view b) override {
    const auto left = ancestors(peel_to_commit(a));
    std::deque<std::string> queue{peel_to_commit(b)};
    while (!queue.empty()) {
      auto cur = queue.front();
      queue.pop_front();
      if (left.contains(cur)) {
        return cur;
      }
      for (const auto &p : commits_.at(cur).parents) {
        queue.push_back(p);
      }
    }
    throw GitError({"merge-base", std::string(a), std::string(b)}, 1, "no merge base");
  }

  std::string fork_point(std::string_view a, std::string_view b) override {
    if (fork_points_) {
      return *fork_points_;
    }
    return merge_base(a, b);
  }

  // Pretend the reflog remembers this fork point.
  void set_fork_point(std::string hash) { fork_points_ = std::move(hash); }

  std::unique_ptr<CommitIterator> list_commits(std::string_view start,
                                               std::string_view stop) override {
    ++list_calls;
    return std::make_unique<VectorIterator>(range(peel_to_commit(start), peel_to_commit(stop)));
  }
  int list_calls = 0;

  std::vector<LocalBranch> local_branches() override {
    std::vector<LocalBranch> out;
    for (const auto &[name, hash] : branches_) {
      out.push_back(LocalBranch{.name = name, .hash = hash});
    }
    return out;
  }

  std::string current_branch() override { return current_; }

  void rebase(const RebaseRequest &req) override {
    rebases.push_back(req);
    const auto head = peel_to_commit(req.branch);
    const auto onto = peel_to_commit(req.onto);

    // Already based on onto: nothing to replay.
    if (req.upstream == onto && is_ancestor(onto, head)) {
      return;
    }

    auto todo = range(head, peel_to_commit(req.upstream));
    std::ranges::reverse(todo); // oldest first
    pending_ = Pending{.branch = req.branch, .upstream = req.upstream, .onto = onto,
                       .tip = onto, .todo = {todo.begin(), todo.end()}};
    replay();
  }

  void rebase_continue() override {
    if (!pending_) {
      throw Error("no rebase in progress");
    }
    replay();
  }

  void rebase_abort() override {
    if (!pending_) {
      throw Error("no rebase in progress");
    }
    pending_.reset();
  }

  void rename_branch(std::string_view old_name, std::string_view new_name) override {
    const auto it = branches_.find(std::string(old_name));
    if (it == branches_.end()) {
      throw NotExistError(std::string(old_name));
    }
    if (std::exchange(fail_rename_, false)) {
      throw GitError({"branch", "--move", std::string(old_name), std::string(new_name)}, 128,
                     "'" + std::string(new_name) + "' is not a valid branch name");
    }
    if (branches_.contains(std::string(new_name))) {
      throw GitError({"branch", "--move", std::string(old_name), std::string(new_name)}, 128,
                     "a branch named '" + std::string(new_name) + "' already exists");
    }
    const auto hash = it->second;
    branches_.erase(it);
    branches_[std::string(new_name)] = hash;
    if (current_ == old_name) {
      current_ = new_name;
    }
  }

  void delete_branch(std::string_view name, bool /*force*/) override {
    if (branches_.erase(std::string(name)) == 0) {
      throw NotExistError(std::string(name));
    }
  }

private:
  struct Pending {
    std::string branch;
    std::string upstream;
    std::string onto;
    std::string tip;
    std::deque<std::string> todo;
  };

  class VectorIterator : public CommitIterator {
  public:
    explicit VectorIterator(std::vector<std::string> items) : items_(std::move(items)) {}
    std::optional<std::string> next() override {
      if (pos_ == items_.size()) {
        return std::nullopt;
      }
      return items_[pos_++];
    }

  private:
    std::vector<std::string> items_;
    std::size_t pos_ = 0;
  };

  std::string make_commit(std::vector<std::string> parents, std::string message) {
    char buf[41];
    std::snprintf(buf, sizeof buf, "%040x", ++counter_);
    commits_[buf] = Commit{.parents = std::move(parents), .message = std::move(message)};
    return buf;
  }

  [[nodiscard]] std::set<std::string> ancestors(const std::string &from) const {
    std::set<std::string> seen;
    std::deque<std::string> queue{from};
    while (!queue.empty()) {
      auto cur = queue.front();
      queue.pop_front();
      const auto it = commits_.find(cur);
      if (it == commits_.end() || !seen.insert(cur).second) {
        continue;
      }
      for (const auto &p : it->second.parents) {
        queue.push_back(p);
      }
    }
    return seen;
  }

  // Commits reachable from start but not from stop, newest first.
  [[nodiscard]] std::vector<std::string> range(const std::string &start,
                                               const std::string &stop) const {
    const auto excluded = ancestors(stop);
    std::vector<std::string> out;
    std::set<std::string> seen;
    std::deque<std::string> queue{start};
    while (!queue.empty()) {
      auto cur = queue.front();
      queue.pop_front();
      if (excluded.contains(cur) || !seen.insert(cur).second) {
        continue;
      }
      out.push_back(cur);
      for (const auto &p : commits_.at(cur).parents) {
        queue.push_back(p);
      }
    }
    return out;
  }

  void replay() {
    auto &p = *pending_;
    while (!p.todo.empty()) {
      const auto &message = commits_.at(p.todo.front()).message;
      if (conflicts_.erase(message) > 0) {
        throw RebaseInterruptedError(RebaseInterruptKind::conflict, p.branch, p.upstream, p.onto);
      }
      p.tip = make_commit({p.tip}, message);
      p.todo.pop_front();
    }
    branches_[p.branch] = p.tip;
    pending_.reset();
  }

  std::map<std::string, std::string> branches_;
  std::map<std::string, Commit> commits_;
  std::string current_;
  std::set<std::string> conflicts_;
  std::optional<Pending> pending_;
  std::optional<std::string> fork_points_;
  bool fail_rename_ = false;
  unsigned counter_ = 0;
};

} // namespace gitstack::testing
