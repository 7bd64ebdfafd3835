#pragma once
// promparse public API
// - Parses Prometheus text exposition into one record per metric name
// - All-or-nothing: the first malformed line fails the whole call
// - prometheus-cpp types stay out of public headers (see SerializeText)

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promparse {

enum class MetricType { Untyped, Counter, Gauge, Histogram, Summary };

std::string_view ToString(MetricType type);
// Accepts exactly: counter, gauge, histogram, untyped, summary.
std::optional<MetricType> MetricTypeFromString(std::string_view word);

struct Label {
  std::string name;
  std::string value;
  bool operator==(const Label&) const = default;
};

struct Sample {
  std::vector<Label> labels;        // first-seen order, names unique
  double value = 0.0;               // may be NaN or +/-Inf
  std::optional<std::int64_t> timestamp_ms; // absent = unspecified, not zero

  std::optional<std::string> FindLabel(std::string_view name) const;
};

struct Metric {
  std::string name;
  MetricType data_type = MetricType::Untyped;
  std::vector<Sample> samples;      // input order
  std::optional<std::string> help;  // only set when ParseOptions::capture_help
};

struct ParseError {
  std::string rule;       // grammar rule that rejected the input
  std::string remainder;  // unconsumed input at the rejection point
  std::size_t line = 0;   // 1-based, filled by the line reader
  std::size_t column = 0; // 1-based

  // "line 3, column 12: expected <rule> near '<first line of remainder>'"
  std::string Message() const;
};

struct ParseOptions {
  bool capture_help = false; // route "# HELP name text" into Metric::help
};

// Parse a complete exposition buffer. On success `out` holds one Metric per
// distinct name, ordered by name. On failure returns false, clears `out` and
// fills `err`.
bool ParseComplete(std::string_view text,
                   std::vector<Metric>& out,
                   ParseError& err,
                   const ParseOptions& opts = {});

// Render metrics back to exposition text via prometheus-cpp's TextSerializer.
std::string SerializeText(const std::vector<Metric>& metrics);

} // namespace promparse
