// prometheus-cpp bridge: Metric -> MetricFamily, and text serialization
#include "FamilyBridge.hpp"

#include <prometheus/client_metric.h>
#include <prometheus/metric_family.h>
#include <prometheus/metric_type.h>
#include <prometheus/text_serializer.h>

#include <string>
#include <utility>
#include <vector>

namespace promparse::backend {

namespace {

static prometheus::MetricType FamilyType(MetricType type) {
  switch (type) {
    case MetricType::Counter: return prometheus::MetricType::Counter;
    case MetricType::Gauge: return prometheus::MetricType::Gauge;
    case MetricType::Untyped:
    case MetricType::Histogram:
    case MetricType::Summary: break;
  }
  return prometheus::MetricType::Untyped;
}

static prometheus::ClientMetric ToClientMetric(const Sample& s, prometheus::MetricType ty) {
  prometheus::ClientMetric m;
  m.label.reserve(s.labels.size());
  for (const auto& l : s.labels) m.label.push_back({l.name, l.value});
  switch (ty) {
    case prometheus::MetricType::Counter: m.counter.value = s.value; break;
    case prometheus::MetricType::Gauge: m.gauge.value = s.value; break;
    default: m.untyped.value = s.value; break;
  }
  m.timestamp_ms = s.timestamp_ms.value_or(0); // 0 = not serialized
  return m;
}

} // namespace

std::vector<prometheus::MetricFamily> ToMetricFamilies(const std::vector<Metric>& metrics) {
  std::vector<prometheus::MetricFamily> fams;
  fams.reserve(metrics.size());
  for (const auto& metric : metrics) {
    prometheus::MetricFamily f;
    f.name = metric.name;
    f.help = metric.help.value_or(std::string{});
    f.type = FamilyType(metric.data_type);
    f.metric.reserve(metric.samples.size());
    for (const auto& s : metric.samples) f.metric.push_back(ToClientMetric(s, f.type));
    fams.push_back(std::move(f));
  }
  return fams;
}

} // namespace promparse::backend

namespace promparse {

std::string SerializeText(const std::vector<Metric>& metrics) {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(backend::ToMetricFamilies(metrics));
}

} // namespace promparse
