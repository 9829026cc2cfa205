#include "gitstack/state.hpp"

#include "gitstack/consts.hpp"
#include "gitstack/errors.hpp"
#include "gitstack/util.hpp"

#include <algorithm>

namespace gitstack::state {

namespace {

// Record field names
constexpr std::string_view kBase = "base";
constexpr std::string_view kBaseHash = "base-hash";
constexpr std::string_view kUpstream = "upstream";
constexpr std::string_view kChange = "change";
constexpr std::string_view kMerged = "merged";
constexpr std::string_view kTrunk = "trunk";
constexpr std::string_view kRemote = "remote";
constexpr std::string_view kBranch = "branch";
constexpr std::string_view kArg = "arg";

std::string branch_key(std::string_view name) {
  return std::string(consts::kBranchesDir) + "/" + std::string(name);
}

void put(std::string &out, std::string_view key, std::string_view value) {
  out.append(key);
  out.push_back(consts::kSpace);
  out.append(value);
  out.push_back(consts::kLF);
}

// "key value" -> {key, value}. A line without a space has an empty value.
std::pair<std::string_view, std::string_view> field(std::string_view line) {
  const auto sp = line.find(consts::kSpace);
  if (sp == std::string_view::npos) {
    return {line, {}};
  }
  return {line.substr(0, sp), line.substr(sp + 1)};
}

struct RepoInfo {
  std::string trunk;
  std::string remote;
};

std::string encode_repo(const RepoInfo &info) {
  std::string out;
  put(out, kTrunk, info.trunk);
  if (!info.remote.empty()) {
    put(out, kRemote, info.remote);
  }
  return out;
}

RepoInfo decode_repo(std::string_view text) {
  RepoInfo info;
  for (const auto &line : strutil::split_lines(text)) {
    const auto [key, value] = field(line);
    if (key == kTrunk) {
      info.trunk = value;
    } else if (key == kRemote) {
      info.remote = value;
    }
  }
  if (info.trunk.empty()) {
    throw Error("corrupt state: trunk branch name is empty");
  }
  return info;
}

} // namespace

std::string encode_branch(const LookupResponse &branch) {
  std::string out;
  put(out, kBase, branch.base);
  if (!branch.base_hash.empty()) {
    put(out, kBaseHash, branch.base_hash);
  }
  if (!branch.upstream.empty()) {
    put(out, kUpstream, branch.upstream);
  }
  if (branch.change) {
    put(out, kChange, branch.change->forge + " " + branch.change->payload);
  }
  for (const auto &m : branch.merged_downstack) {
    put(out, kMerged, m);
  }
  return out;
}

LookupResponse decode_branch(std::string_view text) {
  LookupResponse res;
  for (const auto &line : strutil::split_lines(text)) {
    if (line.empty()) continue;
    const auto [key, value] = field(line);
    if (key == kBase) {
      res.base = value;
    } else if (key == kBaseHash) {
      res.base_hash = value;
    } else if (key == kUpstream) {
      res.upstream = value;
    } else if (key == kChange) {
      const auto [forge, payload] = field(value);
      if (forge.empty()) {
        throw Error("corrupt branch record: change without forge");
      }
      res.change = ChangeState{.forge = std::string(forge), .payload = std::string(payload)};
    } else if (key == kMerged) {
      res.merged_downstack.emplace_back(value);
    }
    // Unknown fields are ignored so that newer records stay readable.
  }
  if (res.base.empty()) {
    throw Error("corrupt branch record: no base");
  }
  return res;
}

// Store

Store Store::init(InitRequest req) {
  if (req.trunk.empty()) {
    throw Error("trunk branch name is required");
  }

  Store store{req.backend, req.trunk, req.remote, std::move(req.log)};
  auto &db = *store.backend_;

  if (const auto old = db.get(consts::kRepoKey)) {
    if (req.reset) {
      db.clear("reset store");
    } else {
      if (store.find_branch(req.trunk)) {
        throw Error("trunk branch (" + req.trunk + ") is tracked; use --reset to clear");
      }

      // Branches based on the old trunk move to the new one.
      const auto old_info = decode_repo(*old);
      if (old_info.trunk != req.trunk) {
        UpdateRequest update{.message = "update trunk branch from " + old_info.trunk + " to " +
                                        req.trunk};
        for (const auto &name : db.keys(consts::kBranchesDir)) {
          auto branch = store.find_branch(name);
          if (branch && branch->base == old_info.trunk) {
            branch->base = req.trunk;
            update.sets.emplace_back(branch_key(name), encode_branch(*branch));
          }
        }
        if (!update.sets.empty()) {
          store.log_->debug("moving {} branches from {} to {}", update.sets.size(),
                            old_info.trunk, req.trunk);
          db.update(update);
        }
      }
    }
  }

  db.update(UpdateRequest{
      .sets = {{std::string(consts::kRepoKey),
                encode_repo(RepoInfo{.trunk = req.trunk, .remote = req.remote})}},
      .message = "initialize store",
  });
  return store;
}

Store Store::open(std::shared_ptr<Backend> backend, log::logger_t logger) {
  const auto text = backend->get(consts::kRepoKey);
  if (!text) {
    throw UninitializedError();
  }
  auto info = decode_repo(*text);
  return Store{std::move(backend), std::move(info.trunk), std::move(info.remote),
               std::move(logger)};
}

std::optional<LookupResponse> Store::find_branch(std::string_view name) const {
  const auto text = backend_->get(branch_key(name));
  if (!text) {
    return std::nullopt;
  }
  try {
    return decode_branch(*text);
  } catch (const Error &e) {
    throw Error("load branch " + std::string(name) + ": " + e.what());
  }
}

LookupResponse Store::lookup_branch(std::string_view name) const {
  auto res = find_branch(name);
  if (!res) {
    throw NotTrackedError(std::string(name));
  }
  return std::move(*res);
}

std::vector<std::string> Store::list_branches() const {
  auto names = backend_->keys(consts::kBranchesDir);
  std::ranges::sort(names);
  return names;
}

BranchTx Store::begin_branch_tx() { return BranchTx{*this}; }

std::vector<Continuation> Store::read_continuations() const {
  std::vector<Continuation> out;
  const auto text = backend_->get(consts::kContinuationsKey);
  if (!text) {
    return out;
  }
  for (const auto &line : strutil::split_lines(*text)) {
    const auto [key, value] = field(line);
    if (key == kBranch) {
      out.push_back(Continuation{.branch = std::string(value)});
    } else if (key == kArg) {
      if (out.empty()) {
        throw Error("corrupt continuation: argument before branch");
      }
      out.back().command.emplace_back(value);
    }
  }
  return out;
}

void Store::write_continuations(std::string_view message, const std::vector<Continuation> &conts) {
  UpdateRequest req{.message = std::string(message)};
  if (conts.empty()) {
    req.deletes.emplace_back(consts::kContinuationsKey);
  } else {
    std::string text;
    for (const auto &c : conts) {
      put(text, kBranch, c.branch);
      for (const auto &arg : c.command) {
        put(text, kArg, arg);
      }
    }
    req.sets.emplace_back(std::string(consts::kContinuationsKey), std::move(text));
  }
  backend_->update(req);
}

void Store::append_continuations(std::string_view message,
                                 const std::vector<Continuation> &conts) {
  if (conts.empty()) {
    return;
  }
  for (const auto &c : conts) {
    if (c.branch.empty() || c.command.empty()) {
      throw Error("continuation needs a branch and a command");
    }
  }
  auto all = read_continuations();
  all.insert(all.end(), conts.begin(), conts.end());
  write_continuations(message.empty() ? "set rebase continuation" : message, all);
}

std::vector<Continuation> Store::take_continuations(std::string_view message) {
  auto all = read_continuations();
  if (!all.empty()) {
    write_continuations(message.empty() ? "take rebase continuations" : message, {});
  }
  return all;
}

// BranchTx

LookupResponse *BranchTx::state(std::string_view name) {
  if (dels_.contains(name)) {
    return nullptr;
  }
  if (const auto it = states_.find(name); it != states_.end()) {
    return &it->second;
  }
  auto loaded = store_->find_branch(name);
  if (!loaded) {
    return nullptr;
  }
  return &states_.emplace(std::string(name), std::move(*loaded)).first->second;
}

std::vector<std::string> BranchTx::list_branches() const {
  std::set<std::string, std::less<>> names(sets_.begin(), sets_.end());
  for (auto &name : store_->list_branches()) {
    if (!dels_.contains(name)) {
      names.insert(std::move(name));
    }
  }
  return {names.begin(), names.end()};
}

std::vector<std::string> BranchTx::aboves(std::string_view name) {
  std::vector<std::string> out;
  for (const auto &branch : list_branches()) {
    const auto *st = state(branch);
    if (st != nullptr && st->base == name) {
      out.push_back(branch);
    }
  }
  return out;
}

std::vector<std::string> BranchTx::path(std::string_view from, std::string_view to) {
  std::set<std::string, std::less<>> seen;
  std::vector<std::string> p;
  for (std::string cur(from); cur != to;) {
    if (cur == store_->trunk()) {
      // Nothing is reachable from trunk.
      return {};
    }
    if (!seen.insert(cur).second) {
      p.push_back(cur);
      throw Error("corrupt state: cycle in branch graph: " + strutil::join(p, " -> "));
    }
    const auto *st = state(cur);
    if (st == nullptr) {
      throw Error("corrupt state: branch " + cur + " is based on an untracked branch");
    }
    p.push_back(cur);
    cur = st->base;
  }
  p.emplace_back(to);
  return p;
}

void BranchTx::upsert(const UpsertRequest &req) {
  if (req.name.empty()) {
    throw Error("branch name is required");
  }
  if (req.name == store_->trunk()) {
    throw TrunkError();
  }

  LookupResponse next;
  if (const auto *cur = state(req.name)) {
    next = *cur;
  } else if (req.base.empty()) {
    throw Error("new branch " + req.name + " must have a base");
  }

  if (!req.base.empty()) {
    if (req.base != store_->trunk()) {
      if (state(req.base) == nullptr) {
        throw UntrackedBaseError(req.base);
      }
      // name -> base is acyclic only if base cannot already reach name.
      if (auto p = path(req.base, req.name); !p.empty()) {
        std::ranges::reverse(p); // name -> ... -> base
        p.push_back(req.name);
        throw BranchCycleError(std::move(p));
      }
    }
    next.base = req.base;
  }
  if (!req.base_hash.empty()) {
    next.base_hash = req.base_hash;
  }
  if (req.change) {
    next.change = req.change;
  }
  if (req.upstream) {
    next.upstream = *req.upstream;
  }
  if (req.merged_downstack) {
    next.merged_downstack = *req.merged_downstack;
  }

  states_.insert_or_assign(req.name, std::move(next));
  sets_.insert(req.name);
  if (const auto it = dels_.find(req.name); it != dels_.end()) {
    dels_.erase(it);
  }
}

void BranchTx::remove(std::string_view name) {
  if (name.empty()) {
    throw Error("branch name is required");
  }
  if (name == store_->trunk()) {
    throw TrunkError();
  }
  if (state(name) == nullptr) {
    throw NotTrackedError(std::string(name));
  }
  if (const auto above = aboves(name); !above.empty()) {
    throw Error("branch " + std::string(name) + " is needed by " + strutil::join(above, ", "));
  }

  dels_.emplace(name);
  if (const auto it = sets_.find(name); it != sets_.end()) {
    sets_.erase(it);
  }
  if (const auto it = states_.find(name); it != states_.end()) {
    states_.erase(it);
  }
}

void BranchTx::commit(std::string_view message) {
  if (sets_.empty() && dels_.empty()) {
    return;
  }

  UpdateRequest req{.message = message.empty() ? std::string("update branches")
                                               : std::string(message)};
  for (const auto &name : sets_) {
    req.sets.emplace_back(branch_key(name), encode_branch(states_.at(name)));
  }
  for (const auto &name : dels_) {
    req.deletes.push_back(branch_key(name));
  }
  store_->log_->debug("state: {}", req.message);
  store_->backend_->update(req);

  sets_.clear();
  dels_.clear();
  states_.clear();
}

} // namespace gitstack::state
