#ifndef HAMMER_FLAGS_USAGE_DECODER_H_
#define HAMMER_FLAGS_USAGE_DECODER_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "hammer/flags/decoder.h"
#include "hammer/flags/flag_configuration.h"
#include "hammer/flags/log.h"

namespace hammer {

struct FieldUsage {
  std::string         canonical;
  std::optional<char> alias;
  bool                optional = false;

  friend bool operator==(const FieldUsage&, const FieldUsage&) = default;
};

// Usage pass: walks the same fields as FlagDecoder but records one FieldUsage
// per field instead of reading tokens. Every read yields a default value.
class UsageDecoder final : public Decoder {
 public:
  explicit UsageDecoder(FlagConfiguration config) : config_(std::move(config)) {}

  const std::vector<FieldUsage>& fields() const {
    return fields_;
  }

  const FlagConfiguration& config() const {
    return config_;
  }

  // Presence flags are always optional.
  bool ReadBool(bool& value) override {
    MarkOptional();
    Finish();
    value = false;
    return true;
  }

  bool ReadString(std::string& value) override {
    Finish();
    value.clear();
    return true;
  }

  bool ReadInt(std::int64_t& value) override {
    Finish();
    value = 0;
    return true;
  }

  bool ReadUint(std::uint64_t& value) override {
    Finish();
    value = 0;
    return true;
  }

  bool ReadDouble(double& value) override {
    Finish();
    value = 0;
    return true;
  }

  bool ReadChar(char& value) override {
    Finish();
    value = '\0';
    return true;
  }

  bool ReadOption(const OptionCallback& f) override {
    MarkOptional();
    return f(*this, true);
  }

  // Only reached outside of a field by the nested pass swallowing the rest
  // field, which describes no elements.
  bool ReadSeq(const SeqCallback& f) override {
    if (current_) {
      return Fail(DecodeError::Kind::kUnsupportedShape,
                  fmt::format("{} is a sequence but only the rest field `{}` can be one",
                              current_->canonical, config_.rest_field()));
    }
    return f(*this, 0);
  }

  bool ReadSeqElt(std::size_t, const Callback& f) override {
    return f(*this);
  }

  bool ReadStruct(std::string_view name, std::size_t len, const Callback& f) override {
    if (in_struct_) return Unsupported(fmt::format("nested record {}", name));
    log::Get()->debug("describing {} field(s) of {}", len, name);
    in_struct_    = true;
    const bool ok = f(*this);
    in_struct_    = false;
    return ok;
  }

  bool ReadStructField(std::string_view name, std::size_t, const Callback& f) override {
    current_ = FieldUsage{.canonical = CanonicalFieldName(name), .alias = config_.ShortFor(name)};
    if (name != config_.rest_field()) return f(*this);

    // The rest field has no usage line of its own.
    current_.reset();
    UsageDecoder swallow{FlagConfiguration()};
    if (!f(swallow)) return Fail(swallow.error().kind, swallow.error().message);
    return true;
  }

 private:
  void MarkOptional() {
    if (current_) current_->optional = true;
  }

  void Finish() {
    if (!current_) return;
    fields_.push_back(std::move(*current_));
    current_.reset();
  }

  FlagConfiguration         config_;
  std::optional<FieldUsage> current_;
  std::vector<FieldUsage>   fields_;
  bool                      in_struct_ = false;
};

// One line per field, mandatory fields first, optional ones in brackets. When
// any field has an alias (or force_indent is set) lines without one are
// indented to line up with the `-a, ` prefix.
inline std::string RenderUsage(const std::vector<FieldUsage>& fields, bool force_indent) {
  const bool        shorthands = std::any_of(fields.begin(), fields.end(),
                                             [](const FieldUsage& f) { return f.alias.has_value(); });
  const std::string indent     = force_indent || shorthands ? "    " : "";

  std::vector<FieldUsage> ordered = fields;
  std::stable_partition(ordered.begin(), ordered.end(), [](const FieldUsage& f) { return !f.optional; });

  std::string out;
  for (const auto& field : ordered) {
    const std::string shorthand = field.alias ? fmt::format("-{}, ", *field.alias) : indent;
    if (field.optional) {
      fmt::format_to(std::back_inserter(out), "{}[{}]\n", shorthand, field.canonical);
    } else {
      fmt::format_to(std::back_inserter(out), "{}{}\n", shorthand, field.canonical);
    }
  }
  return out;
}

}  // namespace hammer

#endif  // HAMMER_FLAGS_USAGE_DECODER_H_
