#include "gitstack/git_cli.hpp"

#include "gitstack/consts.hpp"
#include "gitstack/errors.hpp"
#include "gitstack/fs.hpp"
#include "gitstack/util.hpp"

#include <utility>

namespace stdfs = std::filesystem;

namespace gitstack {

namespace {

std::vector<std::string> git_argv(const std::vector<std::string> &args) {
  std::vector<std::string> argv{"git"};
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

std::string first_line(const std::string &out) {
  std::string line = out.substr(0, out.find('\n'));
  strutil::rstrip_newlines(line);
  return line;
}

// Streams `git rev-list` output.
class RevListIterator : public CommitIterator {
public:
  RevListIterator(std::vector<std::string> argv, const proc::Options &opts)
      : argv_(std::move(argv)), reader_(argv_, opts) {}

  std::optional<std::string> next() override {
    if (done_) {
      return std::nullopt;
    }
    if (auto line = reader_.next_line()) {
      strutil::rstrip_newlines(*line);
      return line;
    }
    done_ = true;
    if (const int status = reader_.wait(); status != 0) {
      throw GitError(argv_, status, reader_.stderr_text());
    }
    return std::nullopt;
  }

private:
  std::vector<std::string> argv_;
  proc::LineReader reader_;
  bool done_ = false;
};

} // namespace

GitCli::GitCli(stdfs::path root, stdfs::path git_dir, stdfs::path common_dir,
               log::logger_t logger, std::stop_token stop)
    : root_(std::move(root)), git_dir_(std::move(git_dir)), common_dir_(std::move(common_dir)),
      log_(log::or_null(std::move(logger))), stop_(std::move(stop)) {}

GitCli GitCli::open(const stdfs::path &dir, log::logger_t logger, std::stop_token stop) {
  const std::vector<std::string> args{"rev-parse", "--show-toplevel", "--absolute-git-dir",
                                      "--git-common-dir"};
  const auto res = proc::run(git_argv(args), proc::Options{.cwd = dir, .env = {}, .stop = stop});
  if (res.exit_code != 0) {
    throw GitError(git_argv(args), res.exit_code, res.err);
  }
  const auto lines = strutil::split_lines(res.out);
  if (lines.size() < 3) {
    throw Error("unexpected rev-parse output: " + res.out);
  }
  // --git-common-dir is relative to the directory git ran in.
  stdfs::path common_dir = lines[2];
  if (common_dir.is_relative()) {
    common_dir = stdfs::weakly_canonical(stdfs::absolute(dir) / common_dir);
  }
  return GitCli{lines[0], lines[1], std::move(common_dir), std::move(logger), std::move(stop)};
}

proc::Options GitCli::options() const {
  return proc::Options{.cwd = root_, .env = {{"GIT_EDITOR", "true"}}, .stop = stop_};
}

proc::Result GitCli::exec(const std::vector<std::string> &args) {
  log_->debug("git {}", strutil::join(args, " "));
  return proc::run(git_argv(args), options());
}

std::string GitCli::run(const std::vector<std::string> &args) {
  auto res = exec(args);
  if (res.exit_code != 0) {
    throw GitError(git_argv(args), res.exit_code, res.err);
  }
  return std::move(res.out);
}

std::string GitCli::peel_to_commit(std::string_view ref) {
  const std::vector<std::string> args{"rev-parse", "--verify", "--quiet",
                                      std::string(ref) + "^{commit}"};
  const auto res = exec(args);
  if (res.exit_code == 1) {
    throw NotExistError(std::string(ref));
  }
  if (res.exit_code != 0) {
    throw GitError(git_argv(args), res.exit_code, res.err);
  }
  return first_line(res.out);
}

bool GitCli::is_ancestor(std::string_view ancestor, std::string_view descendant) {
  const auto res =
      exec({"merge-base", "--is-ancestor", std::string(ancestor), std::string(descendant)});
  if (res.exit_code == 0) {
    return true;
  }
  if (res.exit_code != 1) {
    log_->debug("is-ancestor {} {} failed: {}", ancestor, descendant, strutil::trim(res.err));
  }
  return false;
}

std::string GitCli::merge_base(std::string_view a, std::string_view b) {
  return first_line(run({"merge-base", std::string(a), std::string(b)}));
}

std::string GitCli::fork_point(std::string_view a, std::string_view b) {
  const auto res = exec({"merge-base", "--fork-point", std::string(a), std::string(b)});
  if (res.exit_code == 0) {
    return first_line(res.out);
  }
  // No reflog entry to recover the fork from.
  log_->debug("no fork point for {} from {}; using merge base", b, a);
  return merge_base(a, b);
}

std::unique_ptr<CommitIterator> GitCli::list_commits(std::string_view start,
                                                     std::string_view stop) {
  std::vector<std::string> args{"rev-list", std::string(start), "--not", std::string(stop)};
  log_->debug("git {}", strutil::join(args, " "));
  return std::make_unique<RevListIterator>(git_argv(args), options());
}

std::vector<LocalBranch> GitCli::local_branches() {
  const auto out =
      run({"for-each-ref", "--format=%(objectname) %(refname)", std::string(consts::kHeadsRefPrefix)});
  std::vector<LocalBranch> branches;
  for (const auto &line : strutil::split_lines(out)) {
    const auto space = line.find(' ');
    if (space == std::string::npos) {
      continue;
    }
    std::string ref = line.substr(space + 1);
    if (ref.rfind(consts::kHeadsRefPrefix, 0) == 0) {
      ref.erase(0, consts::kHeadsRefPrefix.size());
    }
    branches.push_back(LocalBranch{.name = std::move(ref), .hash = line.substr(0, space)});
  }
  return branches;
}

std::string GitCli::current_branch() {
  const auto res = exec({"symbolic-ref", "--quiet", "--short", "HEAD"});
  if (res.exit_code != 0) {
    throw NotExistError("HEAD (detached)");
  }
  return first_line(res.out);
}

std::optional<std::string> GitCli::rebase_in_progress() const {
  for (const auto dir : {consts::kRebaseApplyDir, consts::kRebaseMergeDir}) {
    const auto head = fs::read_text(git_dir_ / dir / consts::kRebaseHeadName);
    if (!head) {
      continue;
    }
    std::string branch = strutil::trim(*head);
    if (branch.rfind(consts::kHeadsRefPrefix, 0) == 0) {
      branch.erase(0, consts::kHeadsRefPrefix.size());
    }
    return branch;
  }
  return std::nullopt;
}

void GitCli::finish_rebase(const proc::Result &res, const std::vector<std::string> &args,
                           const std::string &branch, const std::string &upstream,
                           const std::string &onto) {
  const auto state = rebase_in_progress();
  if (res.exit_code != 0) {
    if (!state) {
      throw GitError(git_argv(args), res.exit_code, res.err);
    }
    throw RebaseInterruptedError(RebaseInterruptKind::conflict, branch.empty() ? *state : branch,
                                 upstream, onto);
  }
  // A clean exit with rebase state left behind is an 'edit' or 'break' stop.
  if (state) {
    throw RebaseInterruptedError(RebaseInterruptKind::deliberate,
                                 branch.empty() ? *state : branch, upstream, onto);
  }
}

void GitCli::rebase(const RebaseRequest &req) {
  std::vector<std::string> args{"rebase"};
  if (!req.onto.empty()) {
    args.emplace_back("--onto");
    args.push_back(req.onto);
  }
  if (req.autostash) {
    args.emplace_back("--autostash");
  }
  if (req.quiet) {
    args.emplace_back("--quiet");
  }
  if (!req.upstream.empty()) {
    args.push_back(req.upstream);
  }
  if (!req.branch.empty()) {
    args.push_back(req.branch);
  }
  const auto res = exec(args);
  finish_rebase(res, args, req.branch, req.upstream, req.onto);
}

void GitCli::rebase_continue() {
  const std::vector<std::string> args{"rebase", "--continue"};
  const auto res = exec(args);
  finish_rebase(res, args, {}, {}, {});
}

void GitCli::rebase_abort() { run({"rebase", "--abort"}); }

void GitCli::rename_branch(std::string_view old_name, std::string_view new_name) {
  run({"branch", "--move", std::string(old_name), std::string(new_name)});
}

void GitCli::delete_branch(std::string_view name, bool force) {
  run({"branch", force ? "-D" : "-d", std::string(name)});
}

} // namespace gitstack
