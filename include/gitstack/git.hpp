#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitstack {

struct LocalBranch {
  std::string name;
  std::string hash; // commit at the head of the branch
};

struct RebaseRequest {
  std::string branch;   // branch to rebase
  std::string upstream; // commits upstream..branch are replayed
  std::string onto;     // new base commit
  bool autostash = false;
  bool quiet = false;
};

// Forward-only sequence of commit hashes produced on demand.
// next() returns std::nullopt once the sequence is exhausted.
class CommitIterator {
public:
  virtual ~CommitIterator() = default;
  virtual std::optional<std::string> next() = 0;
};

// Read/write access to the commit graph and branches of a repository.
//
// Lookups of missing refs throw NotExistError. rebase(), rebase_continue()
// throw RebaseInterruptedError when git stops and needs the user.
class GitRepository {
public:
  virtual ~GitRepository() = default;

  // Resolve a commit-ish to a full commit hash.
  virtual std::string peel_to_commit(std::string_view ref) = 0;

  // Whether `ancestor` is reachable from `descendant`. A commit is its own ancestor.
  // Never throws; an unknown commit is reported as "not an ancestor".
  virtual bool is_ancestor(std::string_view ancestor, std::string_view descendant) = 0;

  virtual std::string merge_base(std::string_view a, std::string_view b) = 0;

  // Commit at which branch `b` forked from branch `a`.
  virtual std::string fork_point(std::string_view a, std::string_view b) = 0;

  // Commits reachable from `start` but not from `stop`, newest first.
  virtual std::unique_ptr<CommitIterator> list_commits(std::string_view start,
                                                       std::string_view stop) = 0;

  virtual std::vector<LocalBranch> local_branches() = 0;
  virtual std::string current_branch() = 0;

  virtual void rebase(const RebaseRequest &req) = 0;
  virtual void rebase_continue() = 0;
  virtual void rebase_abort() = 0;

  virtual void rename_branch(std::string_view old_name, std::string_view new_name) = 0;
  virtual void delete_branch(std::string_view name, bool force) = 0;
};

} // namespace gitstack
