// Converts parsed metrics into prometheus-cpp MetricFamily values
#pragma once
#include <promparse/promparse.hpp>

#include <prometheus/metric_family.h>

#include <vector>

namespace promparse::backend {

// One family per Metric, one ClientMetric per Sample (labels in sample order).
// Counter and gauge keep their type. Untyped, histogram and summary metrics hold
// flat samples, so they are exported as untyped families.
// ClientMetric uses 0 for "no timestamp": an explicit timestamp of 0 is exported
// as absent and TextSerializer omits it.
std::vector<prometheus::MetricFamily> ToMetricFamilies(const std::vector<Metric>& metrics);

} // namespace promparse::backend
