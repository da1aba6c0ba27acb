//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <imgio/clock.hpp>
//

#include <batteries/finally.hpp>

#include <iomanip>
#include <ios>

namespace imgio {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ ClockSpan::ClockSpan(SpanMetrics& metrics) noexcept : metrics_{&metrics}
{
  this->timer_.emplace(metrics.latency);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
ClockSpan::~ClockSpan() noexcept
{
  if (this->metrics_ != nullptr) {
    this->timer_.reset();
    this->metrics_->bytes.add(this->bytes_);
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ NullClock& NullClock::instance()
{
  static NullClock instance_;
  return instance_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
SpanMetrics* MetricsClock::find(std::string_view name) const
{
  for (const auto& [span_name, metrics] : this->spans_) {
    if (span_name == name) {
      return metrics.get();
    }
  }
  return nullptr;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
ClockSpan MetricsClock::run(std::string_view name) /*override*/
{
  SpanMetrics* metrics = this->find(name);
  if (metrics == nullptr) {
    this->spans_.emplace_back(std::string{name}, std::make_unique<SpanMetrics>());
    metrics = this->spans_.back().second.get();
  }
  return ClockSpan{*metrics};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
const SpanMetrics* MetricsClock::get(std::string_view name) const
{
  return this->find(name);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::vector<std::string> MetricsClock::names() const
{
  std::vector<std::string> result;
  for (const auto& entry : this->spans_) {
    result.emplace_back(entry.first);
  }
  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const MetricsClock& t)
{
  const std::ios_base::fmtflags saved_flags = out.flags();
  const std::streamsize saved_precision = out.precision();
  auto on_scope_exit = batt::finally([&] {
    out.flags(saved_flags);
    out.precision(saved_precision);
  });

  bool first = true;
  for (const std::string& name : t.names()) {
    const SpanMetrics& metrics = *t.get(name);
    const double seconds = metrics.elapsed_seconds();
    const i64 bytes = metrics.bytes.load();

    if (!first) {
      out << " ";
    }
    first = false;

    out << "[" << name << " " << metrics.count() << " ops, " << std::fixed << std::setprecision(6)
        << seconds << " s";
    if (bytes != 0) {
      out << ", " << bytes << " bytes";
      if (seconds > 0) {
        out << ", " << std::setprecision(1) << (bytes / seconds) << " bytes/s";
      }
    }
    out << "]";
  }
  return out;
}

}  // namespace imgio
