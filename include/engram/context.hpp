#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include <engram/status.hpp>

namespace engram {

/**
 * Injectable time source. Production code uses RealClock; tests inject a
 * FakeClock (see test_utils.hpp) to drive TTL, retention and ordering.
 */
class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t NowMicros() const = 0;        // Monotonic (for latency)
  virtual uint64_t WallClockMicros() const = 0;  // Wall clock (for TTL)
};

class RealClock : public Clock {
 public:
  uint64_t NowMicros() const override;
  uint64_t WallClockMicros() const override;
};

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, cache hits, degraded writes). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, sizes in bytes). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., cache fill ratio). */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(const Status& status) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

/**
 * Process-level collaborators shared by every component.
 *
 * Passed explicitly to each constructor instead of living in globals, so a
 * component can be exercised in isolation with a fake clock and a private
 * logger.
 */
struct Context {
  std::shared_ptr<Clock> clock;
  std::shared_ptr<spdlog::logger> logger;

  // Observability hooks (optional)
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;

  /** Real clock and the shared "engram" stderr logger. */
  static Context Default();

  /** Fill unset members with the defaults above. */
  Context WithDefaults() const;

  uint64_t Now() const { return clock->WallClockMicros(); }
  uint64_t Monotonic() const { return clock->NowMicros(); }

  void EmitCounter(std::string_view name, uint64_t delta = 1) const {
    if (metrics) metrics->Counter(name, delta);
  }
  void EmitHistogram(std::string_view name, uint64_t value) const {
    if (metrics) metrics->Histogram(name, value);
  }
  void EmitGauge(std::string_view name, double value) const {
    if (metrics) metrics->Gauge(name, value);
  }
  std::unique_ptr<TraceSpan> StartSpan(std::string_view name) const {
    return tracer ? tracer->StartSpan(name) : nullptr;
  }
};

// Returns the shared "engram" logger, creating it on first use.
std::shared_ptr<spdlog::logger> DefaultLogger();

}  // namespace engram
