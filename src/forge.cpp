#include "gitstack/forge.hpp"

#include "gitstack/errors.hpp"

#include <charconv>

namespace gitstack::forge {

namespace {

std::int64_t parse_number(std::string_view forge, std::string_view key, std::string_view text) {
  std::int64_t value = 0;
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || value <= 0) {
    throw Error(std::string(forge) + ": bad " + std::string(key) + " '" + std::string(text) + "'");
  }
  return value;
}

} // namespace

Registry Registry::with_builtin() {
  Registry r;
  r.add(github());
  r.add(gitlab());
  return r;
}

void Registry::add(std::shared_ptr<const Forge> forge) {
  auto id = forge->id();
  forges_[std::move(id)] = std::move(forge);
}

void Registry::remove(std::string_view id) {
  if (const auto it = forges_.find(id); it != forges_.end()) {
    forges_.erase(it);
  }
}

const Forge *Registry::lookup(std::string_view id) const {
  const auto it = forges_.find(id);
  return it == forges_.end() ? nullptr : it->second.get();
}

std::vector<std::string> Registry::ids() const {
  std::vector<std::string> out;
  out.reserve(forges_.size());
  for (const auto &[id, f] : forges_) {
    out.push_back(id);
  }
  return out;
}

std::string NumberedChangeForge::marshal_change_metadata(const ChangeMetadata &md) const {
  const auto *change = dynamic_cast<const NumberedChange *>(&md);
  if (change == nullptr || change->forge != id_) {
    throw Error(id_ + ": cannot serialize metadata owned by " + md.forge_id());
  }
  std::string out = key_ + "=" + std::to_string(change->number);
  if (change->comment) {
    out += ",comment=" + std::to_string(*change->comment);
  }
  return out;
}

std::unique_ptr<ChangeMetadata>
NumberedChangeForge::unmarshal_change_metadata(std::string_view payload) const {
  auto md = std::make_unique<NumberedChange>();
  md->forge = id_;
  md->sigil = sigil_;

  bool have_number = false;
  while (!payload.empty()) {
    const auto comma = payload.find(',');
    const auto field = payload.substr(0, comma);
    payload = comma == std::string_view::npos ? std::string_view{} : payload.substr(comma + 1);

    const auto eq = field.find('=');
    if (eq == std::string_view::npos) {
      throw Error(id_ + ": malformed change field '" + std::string(field) + "'");
    }
    const auto key = field.substr(0, eq);
    const auto value = field.substr(eq + 1);
    if (key == key_) {
      md->number = parse_number(id_, key, value);
      have_number = true;
    } else if (key == "comment") {
      md->comment = parse_number(id_, key, value);
    }
    // Unknown keys are left for newer versions.
  }
  if (!have_number) {
    throw Error(id_ + ": change metadata has no " + key_);
  }
  return md;
}

std::unique_ptr<NumberedChange> NumberedChangeForge::make_change(std::int64_t number) const {
  auto md = std::make_unique<NumberedChange>();
  md->forge = id_;
  md->sigil = sigil_;
  md->number = number;
  return md;
}

std::shared_ptr<const NumberedChangeForge> github() {
  static const auto forge = std::make_shared<const NumberedChangeForge>("github", "pr", "#");
  return forge;
}

std::shared_ptr<const NumberedChangeForge> gitlab() {
  static const auto forge = std::make_shared<const NumberedChangeForge>("gitlab", "mr", "!");
  return forge;
}

} // namespace gitstack::forge
