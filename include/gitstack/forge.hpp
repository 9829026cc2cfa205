#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitstack::forge {

// Forge-specific information about a published change (pull/merge request).
class ChangeMetadata {
public:
  virtual ~ChangeMetadata() = default;

  // Identifier of the forge that owns this metadata, e.g. "github".
  [[nodiscard]] virtual std::string forge_id() const = 0;

  // Human readable change reference, e.g. "#42".
  [[nodiscard]] virtual std::string change_id() const = 0;
};

// Serialization capability of one forge.
class Forge {
public:
  virtual ~Forge() = default;

  [[nodiscard]] virtual std::string id() const = 0;

  // Payload is a single line of text.
  [[nodiscard]] virtual std::string marshal_change_metadata(const ChangeMetadata &md) const = 0;

  // Throws gitstack::Error on a malformed payload.
  [[nodiscard]] virtual std::unique_ptr<ChangeMetadata>
  unmarshal_change_metadata(std::string_view payload) const = 0;
};

// Forges known to this process, keyed by id.
class Registry {
public:
  // Registry with the github and gitlab codecs.
  static Registry with_builtin();

  void add(std::shared_ptr<const Forge> forge);
  void remove(std::string_view id);

  // nullptr if no forge is registered under `id`.
  [[nodiscard]] const Forge *lookup(std::string_view id) const;

  // Sorted
  [[nodiscard]] std::vector<std::string> ids() const;

private:
  std::map<std::string, std::shared_ptr<const Forge>, std::less<>> forges_;
};

// Pull/merge request identified by a number, plus the optional id of the
// stack navigation comment posted on it.
struct NumberedChange : ChangeMetadata {
  std::string forge;
  std::string sigil; // "#" for pull requests, "!" for merge requests
  std::int64_t number = 0;
  std::optional<std::int64_t> comment;

  [[nodiscard]] std::string forge_id() const override { return forge; }
  [[nodiscard]] std::string change_id() const override { return sigil + std::to_string(number); }
};

// Codec for NumberedChange: "<key>=<number>[,comment=<id>]".
class NumberedChangeForge : public Forge {
public:
  NumberedChangeForge(std::string id, std::string key, std::string sigil)
      : id_(std::move(id)), key_(std::move(key)), sigil_(std::move(sigil)) {}

  [[nodiscard]] std::string id() const override { return id_; }
  [[nodiscard]] std::string marshal_change_metadata(const ChangeMetadata &md) const override;
  [[nodiscard]] std::unique_ptr<ChangeMetadata>
  unmarshal_change_metadata(std::string_view payload) const override;

  // Metadata owned by this forge.
  [[nodiscard]] std::unique_ptr<NumberedChange> make_change(std::int64_t number) const;

private:
  std::string id_;
  std::string key_;
  std::string sigil_;
};

std::shared_ptr<const NumberedChangeForge> github();
std::shared_ptr<const NumberedChangeForge> gitlab();

} // namespace gitstack::forge
