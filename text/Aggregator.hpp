// Folds classified lines into one Metric per name.
#pragma once
#include "Grammar.hpp"
#include "LineReader.hpp"

#include <promparse/promparse.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promparse::text {

class Aggregator {
 public:
  explicit Aggregator(const ParseOptions& opts = {}) : opts_(opts) {}

  void Add(Line&& line);

  // Last declaration wins; existing samples are kept.
  void AddType(const std::string& name, MetricType type);
  // "name free text"; ignored unless ParseOptions::capture_help is set.
  void AddHelp(std::string_view text);
  void AddSample(SampleLine&& sample);

  std::size_t Size() const { return metrics_.size(); }

  // Hand over all metrics ordered by name. The aggregator is empty afterwards.
  std::vector<Metric> Finish();

 private:
  Metric& GetOrCreate(const std::string& name, MetricType type, bool& created);

  ParseOptions opts_;
  std::unordered_map<std::string, Metric> metrics_;
};

// Total order by name (byte-wise); map iteration order never leaks out.
std::vector<Metric> SortByName(std::unordered_map<std::string, Metric>&& by_name);

} // namespace promparse::text
