#ifndef HAMMER_FLAGS_LOG_H_
#define HAMMER_FLAGS_LOG_H_

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace hammer::log {

inline constexpr char kLoggerName[] = "hammer";

// Returns the library logger, creating it on first use. It is registered with
// spdlog under kLoggerName so applications can set its level by name
// (e.g. SPDLOG_LEVEL=hammer=debug with spdlog::cfg::load_env_levels()).
inline std::shared_ptr<spdlog::logger> Get() {
  if (auto logger = spdlog::get(kLoggerName)) return logger;
  return spdlog::stderr_color_mt(kLoggerName);
}

}  // namespace hammer::log

#endif  // HAMMER_FLAGS_LOG_H_
