#ifndef HAMMER_FLAGS_FLAGS_H_
#define HAMMER_FLAGS_FLAGS_H_

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <typeinfo>
#include <utility>
#include <vector>

#include "hammer/flags/decoder.h"
#include "hammer/flags/flag_configuration.h"
#include "hammer/flags/flag_decoder.h"
#include "hammer/flags/log.h"
#include "hammer/flags/usage_decoder.h"

namespace hammer {

struct FieldInfo {
  template <size_t N>
  struct Name {
    constexpr Name(const char (&str)[N]) {  // N > 0 guaranteed
      std::copy_n(str, N, array.data());
    }
    std::array<char, N> array;

    // A non-empty identifier: letters, digits and underscores, not starting
    // with a digit.
    constexpr bool IsValid() const {
      if (N == 1 || (array[0] >= '0' && array[0] <= '9')) return false;
      for (size_t i = 0; i + 1 < N; ++i) {
        const char c = array[i];
        if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) {
          return false;
        }
      }
      return true;
    }
  };

  // For introspection
  std::string_view      name;
  const std::type_info* type = nullptr;

  // For decoding
  std::size_t size = 0;
  bool (*decode)(FieldInfo&, Decoder&) = nullptr;
};

// One field of a record. The record's fields must all be Flags; they are
// visited in declaration order.
//
//   struct Options : hammer::Flags<Options> {
//     Flag<"line_count", int>                       line_count;
//     Flag<"color", std::optional<std::string>>     color;
//     Flag<"verbose", bool>                         verbose;
//     Flag<"rest", std::vector<std::string>>        rest;
//   };
template <FieldInfo::Name N, typename T>
class Flag final : private FieldInfo {
  static_assert(N.IsValid(), "must be a non-empty identifier");

 public:
  template <typename... Args>
    requires std::constructible_from<T, Args...>
  Flag(Args&&... args) : value(std::forward<Args>(args)...) {
    name   = kName;
    type   = &typeid(T);
    size   = sizeof(*this);
    decode = [](FieldInfo& info, Decoder& decoder) {
      return Decodable<T>::Decode(decoder, static_cast<Flag&>(info).value);
    };
  }

  operator const T&() const {
    return value;
  }
  const T* operator->() const {
    return &value;
  }

  T value;

 private:
  static constexpr std::string_view kName{N.array.data(), N.array.size() - 1};
};

// Base of a record type T whose members are Flags.
//
//   auto [options, remaining, error] = Options::Decode(argc, argv, configs.For<Options>());
//   auto [description, text, error] = Options::Usage(configs.For<Options>());
template <typename T>
class Flags {
 public:
  // Lets records declare their fields as plain `Flag<...>` outside of namespace hammer.
  template <FieldInfo::Name N, typename U>
  using Flag = ::hammer::Flag<N, U>;

  static auto Decode(std::vector<std::string> args, const FlagConfiguration& config) {
    T           t;
    FlagDecoder decoder(std::move(args), config);
    if (!Decodable<T>::Decode(decoder, t)) {
      log::Get()->debug("decoding {} failed: {}", typeid(T).name(), decoder.error().message);
    }
    return std::make_tuple(std::move(t), decoder.remaining(), decoder.error());
  }

  // argv[0] is the program name and is not decoded.
  static auto Decode(int argc, char** argv, const FlagConfiguration& config) {
    return Decode(std::vector<std::string>(argv + std::min(argc, 1), argv + argc), config);
  }

  // Returns the configured description and one usage line per field.
  static auto Usage(const FlagConfiguration& config, bool force_indent = false) {
    T            t;
    UsageDecoder decoder(config);
    if (!Decodable<T>::Decode(decoder, t)) {
      log::Get()->debug("describing {} failed: {}", typeid(T).name(), decoder.error().message);
    }
    return std::make_tuple(decoder.config().description(), RenderUsage(decoder.fields(), force_indent),
                           decoder.error());
  }

  std::vector<const FieldInfo*> FieldInfos() const {
    const char* t_begin = reinterpret_cast<const char*>(this);
    const char* t_end   = reinterpret_cast<const char*>(this) + sizeof(T);

    std::vector<const FieldInfo*> infos;
    for (const char* pt = t_begin; pt < t_end; pt += infos.back()->size) {
      infos.push_back(reinterpret_cast<const FieldInfo*>(pt));
    }
    return infos;
  }

  // The record read: visits every field once, in declaration order.
  static bool DecodeRecord(Decoder& decoder, T& t) {
    static_assert(sizeof(Flags<T>) == 1);
    static_assert(sizeof(T) > 1, "a record needs at least one Flag");

    std::vector<FieldInfo*> infos;
    char* t_begin = reinterpret_cast<char*>(&t);
    char* t_end   = reinterpret_cast<char*>(&t) + sizeof(T);
    for (char* pt = t_begin; pt < t_end; pt += infos.back()->size) {
      infos.push_back(reinterpret_cast<FieldInfo*>(pt));
    }

    return decoder.ReadStruct(typeid(T).name(), infos.size(), [&infos](Decoder& d) {
      for (std::size_t i = 0; i < infos.size(); ++i) {
        FieldInfo* info = infos[i];
        if (!d.ReadStructField(info->name, i, [info](Decoder& f) { return info->decode(*info, f); })) {
          return false;
        }
      }
      return true;
    });
  }
};

template <typename T>
  requires std::derived_from<T, Flags<T>>
struct Decodable<T> {
  static bool Decode(Decoder& decoder, T& t) {
    return Flags<T>::DecodeRecord(decoder, t);
  }
};

}  // namespace hammer

#endif  // HAMMER_FLAGS_FLAGS_H_
