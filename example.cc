#include <spdlog/cfg/env.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "hammer/flags/flags.h"

namespace {
struct Options : hammer::Flags<Options> {
  Flag<"color", std::optional<std::string>> color;
  Flag<"line_count", int>                   line_count;
  Flag<"verbose", bool>                     verbose;
  Flag<"help", bool>                        help;
  Flag<"rest", std::vector<std::string>>    rest;
};
}  // namespace

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();  // e.g. SPDLOG_LEVEL=hammer=debug

  hammer::FlagConfigurations configs;
  configs.Register<Options>([](hammer::FlagConfiguration c) {
    return c.Short("verbose", 'v').Short("help", 'h').Desc("Prints the first lines of the given files.");
  });
  const auto& config = configs.For<Options>();

  auto [options, remaining, error] = Options::Decode(argc, argv, config);
  if (options.help || error) {
    auto [description, usage, usage_error] = Options::Usage(config);
    if (usage_error) {
      std::cerr << "Invalid options: " << usage_error << '\n';
      return EXIT_FAILURE;
    }
    if (error) std::cerr << error << "\n\n";
    if (description) std::cout << *description << "\n\n";
    std::cout << (argc > 0 ? argv[0] : "hammer_example") << " [options] files...\n" << usage;
    return error ? EXIT_FAILURE : EXIT_SUCCESS;
  }

  if (options.verbose) std::cout << "color: " << options.color->value_or("none") << '\n';
  for (const auto& file : options.rest.value) {
    std::cout << file << ": first " << options.line_count.value << " line(s)\n";
  }

  return EXIT_SUCCESS;
}
