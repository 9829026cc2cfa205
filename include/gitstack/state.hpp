#pragma once
#include "gitstack/log.hpp"
#include "gitstack/state_backend.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gitstack::state {

// Serialized forge metadata of a published change.
struct ChangeState {
  std::string forge;   // forge id, e.g. "github"
  std::string payload; // forge-specific single line
};

// Persisted fields of a tracked branch.
struct LookupResponse {
  std::string base;
  std::string base_hash; // last known head of base; may be stale
  std::string upstream;  // empty when the branch was never pushed
  std::optional<ChangeState> change;
  // Branches below this one that were merged into trunk, in merge order.
  std::vector<std::string> merged_downstack;
};

// Partial update of a branch. Unset fields keep their current value.
struct UpsertRequest {
  std::string name;
  std::string base;      // required for new branches
  std::string base_hash;
  std::optional<ChangeState> change;
  std::optional<std::string> upstream; // "" clears
  std::optional<std::vector<std::string>> merged_downstack;
};

// Operation to re-run once an interrupted rebase is continued.
struct Continuation {
  std::vector<std::string> command; // gitstack arguments, without argv[0]
  std::string branch;               // checked out before running
};

std::string encode_branch(const LookupResponse &branch);
LookupResponse decode_branch(std::string_view text);

class BranchTx;

// Tracked branches and repository-wide state layered over a Backend.
class Store {
public:
  struct InitRequest {
    std::shared_ptr<Backend> backend;
    std::string trunk;  // required
    std::string remote; // empty: no remote
    bool reset = false; // forget every tracked branch
    log::logger_t log;
  };

  // Initialize or re-initialize. Re-initializing keeps tracked branches;
  // branches based on a previous trunk move to the new one.
  static Store init(InitRequest req);

  // Throws UninitializedError when init() never ran on this backend.
  static Store open(std::shared_ptr<Backend> backend, log::logger_t logger = nullptr);

  [[nodiscard]] const std::string &trunk() const { return trunk_; }
  [[nodiscard]] const std::string &remote() const { return remote_; }

  // Throws NotTrackedError.
  [[nodiscard]] LookupResponse lookup_branch(std::string_view name) const;

  // Sorted names of all tracked branches.
  [[nodiscard]] std::vector<std::string> list_branches() const;

  [[nodiscard]] BranchTx begin_branch_tx();

  void append_continuations(std::string_view message, const std::vector<Continuation> &conts);

  // Remove and return every recorded continuation, oldest first.
  std::vector<Continuation> take_continuations(std::string_view message);

  // Messages of all state changes, newest first.
  [[nodiscard]] std::vector<std::string> history() const { return backend_->history(); }

private:
  friend class BranchTx;

  Store(std::shared_ptr<Backend> backend, std::string trunk, std::string remote,
        log::logger_t logger)
      : backend_(std::move(backend)), trunk_(std::move(trunk)), remote_(std::move(remote)),
        log_(log::or_null(std::move(logger))) {}

  [[nodiscard]] std::optional<LookupResponse> find_branch(std::string_view name) const;
  void write_continuations(std::string_view message, const std::vector<Continuation> &conts);
  [[nodiscard]] std::vector<Continuation> read_continuations() const;

  std::shared_ptr<Backend> backend_;
  std::string trunk_;
  std::string remote_;
  log::logger_t log_;
};

// Staged changes to the branch graph. Nothing is persisted until commit().
// Staged changes are visible to later calls on the same transaction.
class BranchTx {
public:
  // Throws TrunkError, UntrackedBaseError, BranchCycleError or Error.
  void upsert(const UpsertRequest &req);

  // Throws NotTrackedError, or Error when other branches are based on `name`.
  void remove(std::string_view name);

  // Persist everything staged as one update. No-op when nothing is staged.
  void commit(std::string_view message);

private:
  friend class Store;
  explicit BranchTx(Store &store) : store_(&store) {}

  // nullptr when `name` is not tracked (or staged for deletion).
  LookupResponse *state(std::string_view name);
  std::vector<std::string> list_branches() const;
  std::vector<std::string> aboves(std::string_view name);
  // base-chain from `from` to `to`, inclusive; empty when there is none.
  std::vector<std::string> path(std::string_view from, std::string_view to);

  Store *store_;
  std::map<std::string, LookupResponse, std::less<>> states_;
  std::set<std::string, std::less<>> sets_;
  std::set<std::string, std::less<>> dels_;
};

} // namespace gitstack::state
