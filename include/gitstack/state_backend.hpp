#pragma once
#include "gitstack/object_store.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitstack::state {

// One atomic change to the key/value space.
struct UpdateRequest {
  std::vector<std::pair<std::string, std::string>> sets;
  std::vector<std::string> deletes;
  std::string message; // recorded in the history
};

// Versioned key/value storage underneath state::Store.
// Keys are '/'-separated paths such as "branches/feature".
class Backend {
public:
  virtual ~Backend() = default;

  [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) = 0;

  // Keys under `dir` with the "dir/" prefix removed. Sorted.
  // Nested keys are included: "branches/user/fix" lists as "user/fix".
  [[nodiscard]] virtual std::vector<std::string> keys(std::string_view dir) = 0;

  virtual void update(const UpdateRequest &req) = 0;

  // Remove every key.
  virtual void clear(std::string_view message) = 0;

  // Messages of all updates, newest first.
  [[nodiscard]] virtual std::vector<std::string> history() = 0;
};

class MemoryBackend : public Backend {
public:
  std::optional<std::string> get(std::string_view key) override;
  std::vector<std::string> keys(std::string_view dir) override;
  void update(const UpdateRequest &req) override;
  void clear(std::string_view message) override;
  std::vector<std::string> history() override;

private:
  std::map<std::string, std::string, std::less<>> values_;
  std::vector<std::string> log_;
};

// Backend persisted as a small object database:
//
//   <root>/objects/aa/bbbb...   zlib-compressed blobs, trees and commits
//   <root>/DATA                 40-hex id of the latest commit
//
// Each update writes one flat tree (entry name = full key) and one commit
// pointing at it and at the previous commit.
class ObjectBackend : public Backend {
public:
  explicit ObjectBackend(std::filesystem::path root);

  // <git-dir>/gitstack
  static std::filesystem::path root_for(const std::filesystem::path &git_dir);

  std::optional<std::string> get(std::string_view key) override;
  std::vector<std::string> keys(std::string_view dir) override;
  void update(const UpdateRequest &req) override;
  void clear(std::string_view message) override;
  std::vector<std::string> history() override;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  struct CommitInfo {
    std::string tree_hex;
    std::string parent_hex; // empty for the first commit
    std::string date;
    std::string message;
  };

  using Tree = std::map<std::string, oid, std::less<>>; // key -> blob id

  [[nodiscard]] std::optional<std::string> head() const;
  [[nodiscard]] CommitInfo read_commit(std::string_view hex) const;
  [[nodiscard]] Tree read_tree(std::string_view hex) const;
  [[nodiscard]] Tree current_tree() const;

  std::string write_tree(const Tree &tree) const;
  void write_commit(const Tree &tree, std::string_view message) const;

  std::filesystem::path root_;
  ObjectStore objects_;
};

} // namespace gitstack::state
