#ifndef HAMMER_FLAGS_FLAG_CONFIGURATION_H_
#define HAMMER_FLAGS_FLAG_CONFIGURATION_H_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

#include "hammer/flags/log.h"

namespace hammer {

// Static metadata of a record type: short aliases, description and the name of
// the field receiving leftover tokens.
//
//   auto config = FlagConfiguration().Short("verbose", 'v').Desc("Prints lines.");
class FlagConfiguration {
 public:
  static constexpr std::string_view kDefaultRestField = "rest";

  FlagConfiguration& Short(std::string_view name, char alias) {
    short_aliases_.insert_or_assign(std::string(name), alias);
    return *this;
  }

  FlagConfiguration& Desc(std::string_view text) {
    description_ = std::string(text);
    return *this;
  }

  FlagConfiguration& RestField(std::string_view name) {
    rest_field_ = std::string(name);
    return *this;
  }

  std::optional<char> ShortFor(std::string_view name) const {
    const auto it = short_aliases_.find(name);
    if (it == short_aliases_.end()) return std::nullopt;
    return it->second;
  }

  const std::optional<std::string>& description() const {
    return description_;
  }

  const std::string& rest_field() const {
    return rest_field_;
  }

  friend bool operator==(const FlagConfiguration&, const FlagConfiguration&) = default;

 private:
  std::map<std::string, char, std::less<>> short_aliases_;
  std::optional<std::string>              description_;
  std::string                             rest_field_{kDefaultRestField};
};

// Configurations keyed by record type. Owned by the caller and filled once at
// start-up; decoders receive the configuration they need explicitly.
//
//   FlagConfigurations configs;
//   configs.Register<Options>([](FlagConfiguration c) { return c.Short("verbose", 'v'); });
//   auto [options, remaining, error] = Options::Decode(argc, argv, configs.For<Options>());
class FlagConfigurations {
 public:
  using Builder = std::function<FlagConfiguration(FlagConfiguration)>;

  template <typename T>
  FlagConfigurations& Register(const Builder& build) {
    log::Get()->debug("registering flag configuration for {}", typeid(T).name());
    configs_.insert_or_assign(std::type_index(typeid(T)), build(FlagConfiguration()));
    return *this;
  }

  // Unregistered types get an empty configuration.
  template <typename T>
  const FlagConfiguration& For() const {
    static const FlagConfiguration kEmpty;
    const auto it = configs_.find(std::type_index(typeid(T)));
    return it == configs_.end() ? kEmpty : it->second;
  }

 private:
  std::unordered_map<std::type_index, FlagConfiguration> configs_;
};

}  // namespace hammer

#endif  // HAMMER_FLAGS_FLAG_CONFIGURATION_H_
