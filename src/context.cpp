#include <engram/context.hpp>

#include <engram/internal.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace engram {

uint64_t RealClock::NowMicros() const { return internal::NowMicros(); }

uint64_t RealClock::WallClockMicros() const {
  return internal::WallClockMicros();
}

std::shared_ptr<spdlog::logger> DefaultLogger() {
  static std::mutex mu;
  std::lock_guard<std::mutex> lock(mu);
  auto logger = spdlog::get("engram");
  if (!logger) {
    logger = spdlog::stderr_color_mt("engram");
  }
  return logger;
}

Context Context::Default() {
  Context ctx;
  ctx.clock = std::make_shared<RealClock>();
  ctx.logger = DefaultLogger();
  return ctx;
}

Context Context::WithDefaults() const {
  Context ctx = *this;
  if (!ctx.clock) ctx.clock = std::make_shared<RealClock>();
  if (!ctx.logger) ctx.logger = DefaultLogger();
  return ctx;
}

}  // namespace engram
