#include "gitstack/errors.hpp"

#include "gitstack/util.hpp"

namespace gitstack {

BranchCycleError::BranchCycleError(std::vector<std::string> path)
    : Error("would create a cycle: " + strutil::join(path, " -> ")), path_(std::move(path)) {}

AmbiguousBaseError::AmbiguousBaseError(std::string branch, std::string commit,
                                       std::vector<std::string> candidates)
    : Error(branch + ": multiple branches found at commit " + short_hash(commit) + ": " +
            strutil::join(candidates, ", ")),
      branch_(std::move(branch)), commit_(std::move(commit)), candidates_(std::move(candidates)) {}

GitError::GitError(const std::vector<std::string> &args, int exit_code, std::string stderr_text)
    : Error(strutil::join(args, " ") + ": exit status " + std::to_string(exit_code) +
            (stderr_text.empty() ? std::string{} : ": " + strutil::trim(stderr_text))),
      exit_code_(exit_code), stderr_(std::move(stderr_text)) {}

} // namespace gitstack
