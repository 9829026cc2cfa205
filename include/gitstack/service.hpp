#pragma once
#include "gitstack/branch_graph.hpp"
#include "gitstack/discover.hpp"
#include "gitstack/errors.hpp"
#include "gitstack/forge.hpp"
#include "gitstack/git.hpp"
#include "gitstack/log.hpp"
#include "gitstack/state.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitstack {

struct LookupBranchResponse {
  std::string base;
  std::string base_hash; // last recorded head of base; may be stale
  std::string head;
  std::string upstream;
  std::shared_ptr<const forge::ChangeMetadata> change; // null if none or unreadable
  std::vector<std::string> merged_downstack;
};

enum class RestackStatus {
  restacked,
  already_restacked,
};

struct RestackResponse {
  std::string branch;
  std::string base;
  RestackStatus status = RestackStatus::restacked;
};

struct BranchOntoRequest {
  std::string branch; // must not be trunk
  std::string onto;   // trunk or a tracked branch
  // Replaces the branch's merged downstack when set.
  std::optional<std::vector<std::string>> merged_downstack;
};

// Recorded so that `rebase-continue` can resume an interrupted command.
struct RebaseRescueRequest {
  std::vector<std::string> command; // empty: nothing to resume
  std::string branch;               // empty: the branch being rebased
  std::string message;              // state log message
};

// Stack operations over a repository and the branch state store.
//
// Every method that changes state commits exactly one store transaction.
// Rebase interruptions propagate as RebaseInterruptedError with the store
// left as it was before the interrupted rebase.
class Service : public BranchLoader {
public:
  Service(GitRepository &repo, state::Store &store, const forge::Registry &forges,
          log::logger_t logger = nullptr);

  [[nodiscard]] std::string trunk() const override { return store_.trunk(); }

  // Throws NotExistError, NotTrackedError or DeletedBranchError.
  LookupBranchResponse lookup_branch(std::string_view name);

  // Branches deleted out of band are dropped from the result and from the
  // store; branches above them move to the nearest surviving base.
  std::vector<LoadBranchItem> load_branches() override;

  BranchGraph branch_graph();

  std::vector<std::string> list_above(std::string_view base);
  std::vector<std::string> list_upstack(std::string_view start);
  std::vector<std::string> list_downstack(std::string_view start);
  std::vector<std::string> list_stack(std::string_view branch);

  // Stop tracking `name`. Branches above it move to its base.
  // Untracked names are ignored.
  void forget_branch(std::string_view name);

  void rename_branch(std::string_view old_name, std::string_view new_name);

  // Throws NeedsRestackError when `name` is not on top of its base's head.
  void verify_restacked(std::string_view name);

  RestackResponse restack(std::string_view name);

  // Restack `name` and everything above it, bases first.
  std::vector<RestackResponse> restack_upstack(std::string_view name);

  // Move the commits of a branch onto another base. Branches above are not touched.
  void branch_onto(const BranchOntoRequest &req);

  // Re-stack the branches of a linear stack in `new_order` (bottom first),
  // starting on the base of `stack.front()`. Returns the new order.
  std::vector<std::string> stack_edit(const std::vector<std::string> &stack,
                                      const std::vector<std::string> &new_order);

  // Track `name` on `base`, or on a guessed base when `base` is empty.
  // Returns the base used.
  std::string track_branch(std::string_view name, std::string_view base);

  // Track `name` and its untracked downstack in one transaction.
  // Returns the branches added, bottom first.
  std::vector<BranchToTrack> track_downstack(std::string_view name, BaseSelector &selector);

  // Explain how to resume and record the continuation, if any.
  void rebase_rescue(const RebaseInterruptedError &err, const RebaseRescueRequest &req);

  // Finish the rebase in progress and hand back the recorded continuations.
  std::vector<state::Continuation> rebase_continue();

  // Abort the rebase in progress and drop recorded continuations.
  void rebase_abort();

private:
  std::string guess_base(std::string_view name);

  GitRepository &repo_;
  state::Store &store_;
  const forge::Registry &forges_;
  log::logger_t log_;
};

} // namespace gitstack
