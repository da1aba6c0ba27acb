//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_CLOCK_HPP
#define IMGIO_CLOCK_HPP

#include <imgio/int_types.hpp>
#include <imgio/metrics.hpp>

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imgio {

/** \brief Accumulated statistics for all spans with a given name.
 */
struct SpanMetrics {
  /** \brief Elapsed time and number of completed spans.
   */
  LatencyMetric latency;

  /** \brief Total bytes attributed to the spans.
   */
  CountMetric<i64> bytes{0};

  u64 count() const
  {
    return this->latency.count.load();
  }

  double elapsed_seconds() const
  {
    return static_cast<double>(this->latency.total_usec.load()) / 1e6;
  }
};

/** \brief A timed, named phase of an operation ("read", "write", "sync", ...).
 *
 * The span starts when it is created by Clock::run and ends when it goes out of scope.  A
 * default-constructed span (as returned by NullClock) records nothing.
 */
class ClockSpan
{
 public:
  ClockSpan() noexcept = default;

  explicit ClockSpan(SpanMetrics& metrics) noexcept;

  ClockSpan(const ClockSpan&) = delete;
  ClockSpan& operator=(const ClockSpan&) = delete;

  ~ClockSpan() noexcept;

  void add_bytes(i64 n) noexcept
  {
    this->bytes_ += n;
  }

  i64 bytes() const noexcept
  {
    return this->bytes_;
  }

 private:
  SpanMetrics* metrics_ = nullptr;
  i64 bytes_ = 0;
  std::optional<LatencyTimer> timer_;
};

/** \brief Receives named timed spans from operations.
 */
class Clock
{
 public:
  Clock(const Clock&) = delete;
  Clock& operator=(const Clock&) = delete;

  virtual ~Clock() = default;

  /** \brief Starts a span named `name`; it ends when the returned object is destroyed.
   */
  virtual ClockSpan run(std::string_view name) = 0;

 protected:
  Clock() = default;
};

/** \brief A Clock that records nothing; the default for all operations.
 */
class NullClock : public Clock
{
 public:
  static NullClock& instance();

  NullClock() = default;

  ClockSpan run(std::string_view /*name*/) override
  {
    return ClockSpan{};
  }
};

/** \brief A Clock that keeps per-name latency, span count, and byte totals.
 *
 * Not thread-safe; use one MetricsClock per operation (or per worker).
 */
class MetricsClock : public Clock
{
 public:
  MetricsClock() = default;

  ClockSpan run(std::string_view name) override;

  /** \brief Returns the metrics for `name`, or nullptr if no span with that name has been started.
   */
  const SpanMetrics* get(std::string_view name) const;

  /** \brief Returns the names of all spans, in order of first use.
   */
  std::vector<std::string> names() const;

 private:
  SpanMetrics* find(std::string_view name) const;

  std::vector<std::pair<std::string, std::unique_ptr<SpanMetrics>>> spans_;
};

// Prints one `[name N ops, S s, B bytes, R bytes/s]` entry per span name.
//
std::ostream& operator<<(std::ostream& out, const MetricsClock& t);

}  // namespace imgio

#endif  // IMGIO_CLOCK_HPP
