//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the imgio Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef IMGIO_METRICS_HPP
#define IMGIO_METRICS_HPP

#include <batteries/metrics/metric_collectors.hpp>

namespace imgio {

using ::batt::CountMetric;
using ::batt::LatencyMetric;
using ::batt::LatencyTimer;

}  // namespace imgio

#endif  // IMGIO_METRICS_HPP
