#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace gitstack {

// Base of every error raised by gitstack.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A ref, branch or commit-ish is not known to the repository.
class NotExistError : public Error {
public:
  explicit NotExistError(std::string ref)
      : Error("no such ref: " + ref), ref_(std::move(ref)) {}
  [[nodiscard]] const std::string &ref() const { return ref_; }

private:
  std::string ref_;
};

// The branch exists (or not) but the store has no record of it.
class NotTrackedError : public Error {
public:
  explicit NotTrackedError(std::string branch)
      : Error("branch " + branch + " is not tracked"), branch_(std::move(branch)) {}
  [[nodiscard]] const std::string &branch() const { return branch_; }

private:
  std::string branch_;
};

// A tracked branch whose ref was removed without going through gitstack.
// Carries the recorded base so that branches above it can be re-pointed.
class DeletedBranchError : public Error {
public:
  DeletedBranchError(std::string name, std::string base, std::string base_hash)
      : Error("tracked branch " + name + " was deleted out of band"), name_(std::move(name)),
        base_(std::move(base)), base_hash_(std::move(base_hash)) {}

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::string &base() const { return base_; }
  [[nodiscard]] const std::string &base_hash() const { return base_hash_; }

private:
  std::string name_;
  std::string base_;
  std::string base_hash_;
};

// The branch is not on top of its base's current head.
// base_hash() is the live commit of the base, not the recorded one.
class NeedsRestackError : public Error {
public:
  NeedsRestackError(std::string base, std::string base_hash)
      : Error("branch needs to be restacked on top of " + base), base_(std::move(base)),
        base_hash_(std::move(base_hash)) {}

  [[nodiscard]] const std::string &base() const { return base_; }
  [[nodiscard]] const std::string &base_hash() const { return base_hash_; }

private:
  std::string base_;
  std::string base_hash_;
};

// A branch on the stack has more than one branch above it.
class NonLinearStackError : public Error {
public:
  NonLinearStackError(std::string branch, std::vector<std::string> aboves)
      : Error(branch + " has " + std::to_string(aboves.size()) + " branches above it"),
        branch_(std::move(branch)), aboves_(std::move(aboves)) {}

  [[nodiscard]] const std::string &branch() const { return branch_; }
  [[nodiscard]] const std::vector<std::string> &aboves() const { return aboves_; }

private:
  std::string branch_;
  std::vector<std::string> aboves_;
};

enum class RebaseInterruptKind {
  conflict,   // git stopped because of a merge conflict
  deliberate, // git stopped on an 'edit' or 'break' instruction
};

// A rebase stopped and needs the user before it can be continued.
class RebaseInterruptedError : public Error {
public:
  RebaseInterruptedError(RebaseInterruptKind kind, std::string branch, std::string upstream = {},
                         std::string onto = {})
      : Error(kind == RebaseInterruptKind::conflict ? "rebase of " + branch +
                                                          " interrupted by a conflict"
                                                    : "rebase of " + branch + " paused"),
        kind_(kind), branch_(std::move(branch)), upstream_(std::move(upstream)),
        onto_(std::move(onto)) {}

  [[nodiscard]] RebaseInterruptKind kind() const { return kind_; }
  [[nodiscard]] const std::string &branch() const { return branch_; }
  [[nodiscard]] const std::string &upstream() const { return upstream_; }
  [[nodiscard]] const std::string &onto() const { return onto_; }

private:
  RebaseInterruptKind kind_;
  std::string branch_;
  std::string upstream_;
  std::string onto_;
};

// Adding branch -> base would introduce a cycle. path() reads branch -> ... -> branch.
class BranchCycleError : public Error {
public:
  explicit BranchCycleError(std::vector<std::string> path);
  [[nodiscard]] const std::vector<std::string> &path() const { return path_; }

private:
  std::vector<std::string> path_;
};

class UntrackedBaseError : public Error {
public:
  explicit UntrackedBaseError(std::string base)
      : Error("base branch " + base + " is not tracked"), base_(std::move(base)) {}
  [[nodiscard]] const std::string &base() const { return base_; }

private:
  std::string base_;
};

class TrunkError : public Error {
public:
  TrunkError() : Error("trunk branch is not allowed") {}
};

// Non-interactive discovery found several candidate bases at one commit.
class AmbiguousBaseError : public Error {
public:
  AmbiguousBaseError(std::string branch, std::string commit, std::vector<std::string> candidates);

  [[nodiscard]] const std::string &branch() const { return branch_; }
  [[nodiscard]] const std::string &commit() const { return commit_; }
  [[nodiscard]] const std::vector<std::string> &candidates() const { return candidates_; }

private:
  std::string branch_;
  std::string commit_;
  std::vector<std::string> candidates_;
};

// A git command exited unsuccessfully.
class GitError : public Error {
public:
  GitError(const std::vector<std::string> &args, int exit_code, std::string stderr_text);

  [[nodiscard]] int exit_code() const { return exit_code_; }
  [[nodiscard]] const std::string &stderr_text() const { return stderr_; }

private:
  int exit_code_;
  std::string stderr_;
};

// Reading or writing the on-disk store failed.
class StorageError : public Error {
public:
  using Error::Error;
};

class CancelledError : public Error {
public:
  CancelledError() : Error("operation cancelled") {}
};

class UninitializedError : public Error {
public:
  UninitializedError() : Error("store not initialized; run 'gitstack init'") {}
};

class StackEditAbortedError : public Error {
public:
  StackEditAbortedError() : Error("stack edit aborted") {}
};

} // namespace gitstack
