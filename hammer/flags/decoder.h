#ifndef HAMMER_FLAGS_DECODER_H_
#define HAMMER_FLAGS_DECODER_H_

#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "hammer/flags/log.h"

namespace hammer {

struct DecodeError {
  enum class Kind {
    kNone,
    kMissingRequiredField,
    kMissingValue,
    kConversionFailure,
    kInvalidCharacterLiteral,
    kUnsupportedShape,
  };

  Kind        kind = Kind::kNone;
  std::string message;

  operator bool() const {
    return kind != Kind::kNone;
  }

  friend bool operator==(const DecodeError&, const DecodeError&) = default;

  friend std::ostream& operator<<(std::ostream& os, const DecodeError& error) {
    return os << error.message;
  }
};

// `--` followed by the field name, with underscores turned into hyphens.
inline std::string CanonicalFieldName(std::string_view field) {
  std::string canonical = "--";
  for (char c : field) canonical.push_back(c == '_' ? '-' : c);
  return canonical;
}

// Traversal protocol shared by the value and usage passes. A record visits its
// fields in declaration order through ReadStruct/ReadStructField, and each field
// type reads itself through one of the shape methods (see Decodable<T>).
//
// Every read returns false on failure; the first failure is kept in error().
class Decoder {
 public:
  using Callback       = std::function<bool(Decoder&)>;
  using OptionCallback = std::function<bool(Decoder&, bool)>;
  using SeqCallback    = std::function<bool(Decoder&, std::size_t)>;

  virtual ~Decoder() = default;

  virtual bool ReadBool(bool& value)            = 0;
  virtual bool ReadString(std::string& value)   = 0;
  virtual bool ReadInt(std::int64_t& value)     = 0;
  virtual bool ReadUint(std::uint64_t& value)   = 0;
  virtual bool ReadDouble(double& value)        = 0;
  virtual bool ReadChar(char& value)            = 0;
  virtual bool ReadOption(const OptionCallback& f) = 0;
  virtual bool ReadSeq(const SeqCallback& f)       = 0;
  virtual bool ReadSeqElt(std::size_t index, const Callback& f) = 0;
  virtual bool ReadStruct(std::string_view name, std::size_t len, const Callback& f) = 0;
  virtual bool ReadStructField(std::string_view name, std::size_t index, const Callback& f) = 0;

  // Shapes no flag maps onto.
  virtual bool ReadEnum(std::string_view name) {
    return Unsupported(fmt::format("enum {}", name));
  }
  virtual bool ReadTuple(std::size_t len) {
    return Unsupported(fmt::format("tuple of {} elements", len));
  }
  virtual bool ReadMap() {
    return Unsupported("map");
  }

  const DecodeError& error() const {
    return error_;
  }

 protected:
  // Records the first failure and returns false so reads can `return Fail(...)`.
  bool Fail(DecodeError::Kind kind, std::string message) {
    if (kind == DecodeError::Kind::kUnsupportedShape) {
      log::Get()->error("{}", message);
    } else {
      log::Get()->debug("{}", message);
    }
    if (!error_) error_ = {.kind = kind, .message = std::move(message)};
    return false;
  }

  bool Unsupported(std::string_view shape) {
    return Fail(DecodeError::Kind::kUnsupportedShape,
                fmt::format("{} fields are not supported", shape));
  }

 private:
  DecodeError error_;
};

// Decodable<T>::Decode(decoder, value) reads one value of type T through the
// decoder. Records get theirs from Flags<T> (see flags.h).
template <typename T>
struct Decodable;

template <>
struct Decodable<bool> {
  static bool Decode(Decoder& decoder, bool& value) {
    return decoder.ReadBool(value);
  }
};

template <>
struct Decodable<std::string> {
  static bool Decode(Decoder& decoder, std::string& value) {
    return decoder.ReadString(value);
  }
};

template <>
struct Decodable<char> {
  static bool Decode(Decoder& decoder, char& value) {
    return decoder.ReadChar(value);
  }
};

template <typename T>
concept SignedField = std::signed_integral<T> && !std::same_as<T, char>;

template <typename T>
concept UnsignedField = std::unsigned_integral<T> && !std::same_as<T, bool> && !std::same_as<T, char>;

// Integers are read at 64 bits; narrower fields truncate without signaling
// overflow.
template <SignedField T>
struct Decodable<T> {
  static bool Decode(Decoder& decoder, T& value) {
    std::int64_t wide = 0;
    if (!decoder.ReadInt(wide)) return false;
    value = static_cast<T>(wide);
    return true;
  }
};

template <UnsignedField T>
struct Decodable<T> {
  static bool Decode(Decoder& decoder, T& value) {
    std::uint64_t wide = 0;
    if (!decoder.ReadUint(wide)) return false;
    value = static_cast<T>(wide);
    return true;
  }
};

// Finite values beyond the range of a narrower field saturate to infinity.
template <std::floating_point T>
struct Decodable<T> {
  static bool Decode(Decoder& decoder, T& value) {
    double wide = 0;
    if (!decoder.ReadDouble(wide)) return false;
    if constexpr (std::numeric_limits<T>::max_exponent < std::numeric_limits<double>::max_exponent) {
      if (std::isfinite(wide) && std::fabs(wide) > static_cast<double>(std::numeric_limits<T>::max())) {
        value = wide < 0 ? -std::numeric_limits<T>::infinity() : std::numeric_limits<T>::infinity();
        return true;
      }
    }
    value = static_cast<T>(wide);
    return true;
  }
};

template <typename T>
struct Decodable<std::optional<T>> {
  static bool Decode(Decoder& decoder, std::optional<T>& value) {
    return decoder.ReadOption([&value](Decoder& d, bool present) {
      if (!present) {
        value.reset();
        return true;
      }
      return Decodable<T>::Decode(d, value.emplace());
    });
  }
};

template <typename T, typename A>
struct Decodable<std::vector<T, A>> {
  static bool Decode(Decoder& decoder, std::vector<T, A>& value) {
    return decoder.ReadSeq([&value](Decoder& d, std::size_t len) {
      value.clear();
      value.reserve(len);
      for (std::size_t i = 0; i < len; ++i) {
        auto& element = value.emplace_back();
        if (!d.ReadSeqElt(i, [&element](Decoder& e) { return Decodable<T>::Decode(e, element); })) {
          return false;
        }
      }
      return true;
    });
  }
};

// Elements are proxies, so each one is read into a local first.
template <typename A>
struct Decodable<std::vector<bool, A>> {
  static bool Decode(Decoder& decoder, std::vector<bool, A>& value) {
    return decoder.ReadSeq([&value](Decoder& d, std::size_t len) {
      value.clear();
      value.reserve(len);
      for (std::size_t i = 0; i < len; ++i) {
        bool element = false;
        if (!d.ReadSeqElt(i, [&element](Decoder& e) { return Decodable<bool>::Decode(e, element); })) {
          return false;
        }
        value.push_back(element);
      }
      return true;
    });
  }
};

template <typename T>
  requires std::is_enum_v<T>
struct Decodable<T> {
  static bool Decode(Decoder& decoder, T&) {
    return decoder.ReadEnum(typeid(T).name());
  }
};

template <typename... Ts>
struct Decodable<std::variant<Ts...>> {
  static bool Decode(Decoder& decoder, std::variant<Ts...>&) {
    return decoder.ReadEnum(typeid(std::variant<Ts...>).name());
  }
};

template <typename... Ts>
struct Decodable<std::tuple<Ts...>> {
  static bool Decode(Decoder& decoder, std::tuple<Ts...>&) {
    return decoder.ReadTuple(sizeof...(Ts));
  }
};

template <typename T, typename U>
struct Decodable<std::pair<T, U>> {
  static bool Decode(Decoder& decoder, std::pair<T, U>&) {
    return decoder.ReadTuple(2);
  }
};

template <typename K, typename V, typename C, typename A>
struct Decodable<std::map<K, V, C, A>> {
  static bool Decode(Decoder& decoder, std::map<K, V, C, A>&) {
    return decoder.ReadMap();
  }
};

template <typename K, typename V, typename H, typename E, typename A>
struct Decodable<std::unordered_map<K, V, H, E, A>> {
  static bool Decode(Decoder& decoder, std::unordered_map<K, V, H, E, A>&) {
    return decoder.ReadMap();
  }
};

}  // namespace hammer

#endif  // HAMMER_FLAGS_DECODER_H_
