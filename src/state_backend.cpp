#include "gitstack/state_backend.hpp"

#include "gitstack/consts.hpp"
#include "gitstack/errors.hpp"
#include "gitstack/fs.hpp"
#include "gitstack/time.hpp"
#include "gitstack/util.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace gitstack::state {

namespace {

std::string dir_prefix(std::string_view dir) {
  std::string prefix(dir);
  if (!prefix.empty() && prefix.back() != '/') {
    prefix.push_back('/');
  }
  return prefix;
}

template <typename Map> std::vector<std::string> keys_under(const Map &m, std::string_view dir) {
  const std::string prefix = dir_prefix(dir);
  std::vector<std::string> out;
  for (auto it = m.lower_bound(prefix); it != m.end(); ++it) {
    if (it->first.rfind(prefix, 0) != 0) {
      break;
    }
    out.push_back(it->first.substr(prefix.size()));
  }
  return out;
}

std::string mode_to_ascii_octal(std::uint32_t mode) {
  char buf[16];
  std::snprintf(buf, sizeof buf, "%o", mode);
  return buf;
}

} // namespace

// MemoryBackend

std::optional<std::string> MemoryBackend::get(std::string_view key) {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> MemoryBackend::keys(std::string_view dir) {
  return keys_under(values_, dir);
}

void MemoryBackend::update(const UpdateRequest &req) {
  for (const auto &[key, value] : req.sets) {
    values_[key] = value;
  }
  for (const auto &key : req.deletes) {
    if (const auto it = values_.find(key); it != values_.end()) {
      values_.erase(it);
    }
  }
  log_.push_back(req.message);
}

void MemoryBackend::clear(std::string_view message) {
  values_.clear();
  log_.emplace_back(message);
}

std::vector<std::string> MemoryBackend::history() {
  return {log_.rbegin(), log_.rend()};
}

// ObjectBackend

ObjectBackend::ObjectBackend(std::filesystem::path root)
    : root_(std::move(root)), objects_(root_ / consts::kObjectsDir) {}

std::filesystem::path ObjectBackend::root_for(const std::filesystem::path &git_dir) {
  return git_dir / consts::kStoreDir;
}

std::optional<std::string> ObjectBackend::head() const {
  auto text = fs::read_text(root_ / consts::kDataFile);
  if (!text) {
    return std::nullopt;
  }
  strutil::rstrip_newlines(*text);
  if (!looks_hex40(*text)) {
    throw Error("state: corrupt " + std::string(consts::kDataFile) + " pointer: " + *text);
  }
  return text;
}

auto ObjectBackend::read_commit(std::string_view hex) const -> CommitInfo {
  const auto obj = objects_.read(hex);
  if (obj.type != consts::kTypeCommit) {
    throw Error("state: object " + std::string(hex) + " is not a commit");
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;
  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.rfind(consts::kTreePrefix, 0) == 0) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.rfind(consts::kParentPrefix, 0) == 0) {
      info.parent_hex = line.substr(consts::kParentPrefix.size(), consts::kOidHexLen);
    } else if (line.rfind(consts::kDatePrefix, 0) == 0) {
      info.date = line.substr(consts::kDatePrefix.size());
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }
  return info;
}

auto ObjectBackend::read_tree(std::string_view hex) const -> Tree {
  const auto [type, data] = objects_.read(hex);
  if (type != consts::kTypeTree) {
    throw Error("state: object " + std::string(hex) + " is not a tree");
  }

  Tree out;
  auto p = data.begin();
  const auto end = data.end();
  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw Error("state: tree parse: expected space");
    }
    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw Error("state: tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw Error("state: tree parse: truncated oid");
    }
    oid id{};
    std::memcpy(id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.emplace(std::move(name), id);
  }
  return out;
}

auto ObjectBackend::current_tree() const -> Tree {
  const auto commit = head();
  if (!commit) {
    return {};
  }
  return read_tree(read_commit(*commit).tree_hex);
}

std::string ObjectBackend::write_tree(const Tree &tree) const {
  // std::map keeps entries sorted by name
  std::string data;
  const std::string mode = mode_to_ascii_octal(consts::kModeFile);
  for (const auto &[name, id] : tree) {
    data.append(mode);
    data.push_back(consts::kSpace);
    data.append(name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char *>(id.data()), consts::kOidRawLen);
  }
  return objects_.write(consts::kTypeTree, std::string_view{data});
}

void ObjectBackend::write_commit(const Tree &tree, std::string_view message) const {
  const std::string tree_hex = write_tree(tree);

  std::string txt;
  txt += consts::kTreePrefix;
  txt += tree_hex;
  txt += consts::kLF;
  if (const auto parent = head()) {
    txt += consts::kParentPrefix;
    txt += *parent;
    txt += consts::kLF;
  }
  txt += consts::kDatePrefix;
  txt += timeutil::make_timestamp(std::time(nullptr));
  txt += "\n\n";
  txt += message;

  const std::string commit_hex = objects_.write(consts::kTypeCommit, std::string_view{txt});
  fs::write_text_atomic(root_ / consts::kDataFile, commit_hex + "\n");
}

std::optional<std::string> ObjectBackend::get(std::string_view key) {
  const auto tree = current_tree();
  const auto it = tree.find(key);
  if (it == tree.end()) {
    return std::nullopt;
  }
  const auto obj = objects_.read(to_hex(it->second));
  if (obj.type != consts::kTypeBlob) {
    throw Error("state: value of " + std::string(key) + " is not a blob");
  }
  return std::string(obj.data.begin(), obj.data.end());
}

std::vector<std::string> ObjectBackend::keys(std::string_view dir) {
  return keys_under(current_tree(), dir);
}

void ObjectBackend::update(const UpdateRequest &req) {
  auto tree = current_tree();
  for (const auto &[key, value] : req.sets) {
    const std::string hex = objects_.write(consts::kTypeBlob, std::string_view{value});
    oid id{};
    if (!from_hex(hex, id)) {
      throw Error("state: bad blob id " + hex);
    }
    tree[key] = id;
  }
  for (const auto &key : req.deletes) {
    if (const auto it = tree.find(key); it != tree.end()) {
      tree.erase(it);
    }
  }
  write_commit(tree, req.message);
}

void ObjectBackend::clear(std::string_view message) {
  write_commit(Tree{}, message);
}

std::vector<std::string> ObjectBackend::history() {
  std::vector<std::string> out;
  auto cur = head();
  while (cur) {
    auto info = read_commit(*cur);
    out.push_back(std::move(info.message));
    if (info.parent_hex.empty()) {
      break;
    }
    cur = std::move(info.parent_hex);
  }
  return out;
}

} // namespace gitstack::state
