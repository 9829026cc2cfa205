#pragma once
#include "gitstack/git.hpp"
#include "gitstack/log.hpp"
#include "gitstack/process.hpp"

#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

namespace gitstack {

// GitRepository implemented by running the git executable.
class GitCli : public GitRepository {
public:
  // Open the repository containing `dir`. Throws GitError if `dir` is not inside one.
  static GitCli open(const std::filesystem::path &dir, log::logger_t logger = nullptr,
                     std::stop_token stop = {});

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const std::filesystem::path &git_dir() const { return git_dir_; }
  // Shared by all worktrees; gitstack keeps its state here.
  [[nodiscard]] const std::filesystem::path &common_dir() const { return common_dir_; }

  std::string peel_to_commit(std::string_view ref) override;
  bool is_ancestor(std::string_view ancestor, std::string_view descendant) override;
  std::string merge_base(std::string_view a, std::string_view b) override;
  std::string fork_point(std::string_view a, std::string_view b) override;
  std::unique_ptr<CommitIterator> list_commits(std::string_view start,
                                               std::string_view stop) override;
  std::vector<LocalBranch> local_branches() override;
  std::string current_branch() override;

  void rebase(const RebaseRequest &req) override;
  void rebase_continue() override;
  void rebase_abort() override;

  void rename_branch(std::string_view old_name, std::string_view new_name) override;
  void delete_branch(std::string_view name, bool force) override;

  // Run `git <args...>` in the work tree; throws GitError on a non-zero exit.
  std::string run(const std::vector<std::string> &args);

private:
  GitCli(std::filesystem::path root, std::filesystem::path git_dir,
         std::filesystem::path common_dir, log::logger_t logger, std::stop_token stop);

  proc::Result exec(const std::vector<std::string> &args);
  [[nodiscard]] proc::Options options() const;

  // Branch being rebased if a rebase is in progress.
  [[nodiscard]] std::optional<std::string> rebase_in_progress() const;

  // Shared tail of rebase() and rebase_continue().
  void finish_rebase(const proc::Result &res, const std::vector<std::string> &args,
                     const std::string &branch, const std::string &upstream,
                     const std::string &onto);

  std::filesystem::path root_;
  std::filesystem::path git_dir_;
  std::filesystem::path common_dir_;
  log::logger_t log_;
  std::stop_token stop_;
};

} // namespace gitstack
