#include <promparse/promparse.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace promparse {

std::string_view ToString(MetricType type) {
  switch (type) {
    case MetricType::Counter: return "counter";
    case MetricType::Gauge: return "gauge";
    case MetricType::Histogram: return "histogram";
    case MetricType::Summary: return "summary";
    case MetricType::Untyped: break;
  }
  return "untyped";
}

std::optional<MetricType> MetricTypeFromString(std::string_view word) {
  if (word == "counter") return MetricType::Counter;
  if (word == "gauge") return MetricType::Gauge;
  if (word == "histogram") return MetricType::Histogram;
  if (word == "untyped") return MetricType::Untyped;
  if (word == "summary") return MetricType::Summary;
  return std::nullopt;
}

std::optional<std::string> Sample::FindLabel(std::string_view name) const {
  for (const auto& l : labels) {
    if (l.name == name) return l.value;
  }
  return std::nullopt;
}

std::string ParseError::Message() const {
  std::string near = remainder.substr(0, remainder.find('\n'));
  constexpr std::size_t kMaxNear = 80;
  if (near.size() > kMaxNear) near = near.substr(0, kMaxNear) + "...";
  std::string msg = "line " + std::to_string(line) + ", column " + std::to_string(column) +
                    ": expected " + rule;
  if (remainder.empty()) return msg + " at end of input";
  return msg + " near '" + near + "'";
}

} // namespace promparse
