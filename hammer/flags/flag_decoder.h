#ifndef HAMMER_FLAGS_FLAG_DECODER_H_
#define HAMMER_FLAGS_FLAG_DECODER_H_

#include <cstddef>
#include <cstdint>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "hammer/flags/decoder.h"
#include "hammer/flags/flag_configuration.h"
#include "hammer/flags/log.h"

namespace hammer {

// Value pass: claims `--field-name value`, `-a value` and boolean `--field-name`
// tokens for each visited field, and hands whatever is left to the rest field.
//
// Tokens are never erased; claimed positions are marked as consumed, so the
// live sequence only ever shrinks.
class FlagDecoder final : public Decoder {
 public:
  FlagDecoder(std::vector<std::string> args, FlagConfiguration config)
      : source_(std::move(args)), consumed_(source_.size(), false), config_(std::move(config)) {}

  // Tokens not claimed by a named field, in the order they were given. Tokens read
  // by the rest field are still listed.
  std::vector<std::string> remaining() const {
    std::vector<std::string> live;
    for (std::size_t pos = 0; pos < source_.size(); ++pos) {
      if (!consumed_[pos]) live.push_back(source_[pos]);
    }
    return live;
  }

  bool ReadBool(bool& value) override {
    if (IsCapturingRest()) return Unsupported("boolean sequence element");
    const auto pos = FieldPos();
    value          = pos.has_value();
    if (value) Consume(*pos, 1);
    return true;
  }

  bool ReadString(std::string& value) override {
    if (!PeekOperand("string", value)) return false;
    Claim();
    return true;
  }

  bool ReadInt(std::int64_t& value) override {
    std::string token;
    if (!PeekOperand("integer", token)) return false;
    if (!ParseValue(token, value)) return ConversionFailure(token, "an integer");
    Claim();
    return true;
  }

  bool ReadUint(std::uint64_t& value) override {
    std::string token;
    if (!PeekOperand("unsigned integer", token)) return false;
    // istream accepts "-1" for unsigned types and wraps it.
    if (token.starts_with('-') || !ParseValue(token, value)) {
      return ConversionFailure(token, "an unsigned integer");
    }
    Claim();
    return true;
  }

  bool ReadDouble(double& value) override {
    std::string token;
    if (!PeekOperand("float", token)) return false;
    if (!ParseValue(token, value)) return ConversionFailure(token, "a float");
    Claim();
    return true;
  }

  bool ReadChar(char& value) override {
    std::string token;
    if (!PeekOperand("character", token)) return false;
    if (token.size() != 1) {
      return Fail(DecodeError::Kind::kInvalidCharacterLiteral,
                  fmt::format("{} is not a single character", token));
    }
    value = token[0];
    Claim();
    return true;
  }

  bool ReadOption(const OptionCallback& f) override {
    return f(*this, IsCapturingRest() || FieldPos().has_value());
  }

  bool ReadSeq(const SeqCallback& f) override {
    if (current_field_ != config_.rest_field()) {
      return Fail(DecodeError::Kind::kUnsupportedShape,
                  fmt::format("{} is a sequence but only the rest field `{}` can be one",
                              CanonicalFieldName(current_field_), config_.rest_field()));
    }
    frozen_ = remaining();
    state_  = CapturingRest{};
    log::Get()->debug("capturing {} remaining token(s) into `{}`", frozen_.size(), current_field_);
    const bool ok = f(*this, frozen_.size());
    state_        = Processing{};
    done_         = true;
    return ok;
  }

  bool ReadSeqElt(std::size_t index, const Callback& f) override {
    auto* rest = std::get_if<CapturingRest>(&state_);
    if (rest == nullptr) return Unsupported("sequence element outside of the rest field");
    ++rest->index;
    log::Get()->trace("rest element {} (index {})", index, rest->index);
    return f(*this);
  }

  bool ReadStruct(std::string_view name, std::size_t len, const Callback& f) override {
    if (in_struct_) return Unsupported(fmt::format("nested record {}", name));
    log::Get()->debug("decoding {} field(s) of {} from {} token(s)", len, name, source_.size());
    in_struct_    = true;
    const bool ok = f(*this);
    in_struct_    = false;
    return ok;
  }

  bool ReadStructField(std::string_view name, std::size_t index, const Callback& f) override {
    current_field_ = std::string(name);
    if (done_) {
      return Fail(DecodeError::Kind::kUnsupportedShape,
                  fmt::format("{} is declared after the rest field `{}`",
                              CanonicalFieldName(name), config_.rest_field()));
    }
    log::Get()->trace("field #{} `{}`", index, name);
    return f(*this);
  }

 private:
  struct Processing {};
  struct CapturingRest {
    std::ptrdiff_t index = -1;
  };
  using State = std::variant<Processing, CapturingRest>;

  // The whole token must parse; leading or trailing whitespace is rejected.
  template <typename T>
  static bool ParseValue(const std::string& arg, T& value) {
    std::istringstream stream(arg);
    stream >> std::noskipws >> value;
    return !stream.fail() && stream.eof();
  }

  bool IsCapturingRest() const {
    return std::holds_alternative<CapturingRest>(state_);
  }

  // Position of the current field's long form, or of its alias when the long
  // form is absent.
  std::optional<std::size_t> FieldPos() const {
    if (auto pos = Find(CanonicalFieldName(current_field_))) return pos;
    if (auto alias = config_.ShortFor(current_field_)) return Find(std::string{'-', *alias});
    return std::nullopt;
  }

  std::optional<std::size_t> Find(std::string_view token) const {
    for (std::size_t pos = 0; pos < source_.size(); ++pos) {
      if (!consumed_[pos] && source_[pos] == token) return pos;
    }
    return std::nullopt;
  }

  std::optional<std::size_t> NextLive(std::size_t pos) const {
    while (++pos < source_.size()) {
      if (!consumed_[pos]) return pos;
    }
    return std::nullopt;
  }

  // Marks `count` live tokens starting at `pos` as claimed.
  void Consume(std::size_t pos, int count) {
    log::Get()->debug("{} claimed {} token(s)", CanonicalFieldName(current_field_), count);
    for (std::optional<std::size_t> at = pos; at && count > 0; at = NextLive(*at), --count) {
      consumed_[*at] = true;
    }
  }

  // Finds the operand of the current field without claiming anything; Claim()
  // takes the flag and operand once the caller has converted it. In rest mode
  // the operand is the current element of the frozen snapshot.
  bool PeekOperand(std::string_view kind, std::string& token) {
    pending_.reset();
    if (auto* rest = std::get_if<CapturingRest>(&state_)) {
      token = frozen_.at(static_cast<std::size_t>(rest->index));
      return true;
    }
    const auto pos = FieldPos();
    if (!pos) {
      return Fail(DecodeError::Kind::kMissingRequiredField,
                  fmt::format("{} is required", CanonicalFieldName(current_field_)));
    }
    const auto operand = NextLive(*pos);
    if (!operand) {
      return Fail(DecodeError::Kind::kMissingValue,
                  fmt::format("{} is missing a following {}", CanonicalFieldName(current_field_), kind));
    }
    token    = source_[*operand];
    pending_ = pos;
    return true;
  }

  void Claim() {
    if (pending_) Consume(*pending_, 2);
    pending_.reset();
  }

  bool ConversionFailure(const std::string& token, std::string_view kind) {
    return Fail(DecodeError::Kind::kConversionFailure,
                fmt::format("could not convert {} to {}", token, kind));
  }

  std::vector<std::string> source_;
  std::vector<bool>        consumed_;
  std::vector<std::string> frozen_;
  FlagConfiguration        config_;
  std::string              current_field_;
  State                    state_;
  std::optional<std::size_t> pending_;
  bool                     done_      = false;
  bool                     in_struct_ = false;
};

}  // namespace hammer

#endif  // HAMMER_FLAGS_FLAG_DECODER_H_
