#include "Aggregator.hpp"

#include "core/Logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace promparse::text {

namespace {

[[noreturn]] static void NameMismatch(std::string_view metric, std::string_view line) {
  Log()->critical("merging line for '{}' into metric '{}'", line, metric);
  Log()->flush();
  std::abort();
}

static void AppendSample(Metric& m, SampleLine&& s) {
  if (m.name != s.name) NameMismatch(m.name, s.name);
  Sample sample;
  sample.labels = std::move(s.labels);
  sample.value = s.value;
  sample.timestamp_ms = s.timestamp_ms;
  m.samples.push_back(std::move(sample));
}

static void ApplyType(Metric& m, const std::string& name, MetricType type) {
  if (m.name != name) NameMismatch(m.name, name);
  if (m.data_type != type) {
    Log()->debug("metric '{}' retyped {} -> {}", name, ToString(m.data_type), ToString(type));
  }
  m.data_type = type;
}

} // namespace

Metric& Aggregator::GetOrCreate(const std::string& name, MetricType type, bool& created) {
  auto [it, inserted] = metrics_.try_emplace(name);
  created = inserted;
  if (inserted) {
    it->second.name = name;
    it->second.data_type = type;
    Log()->debug("new metric '{}' ({})", name, ToString(type));
  }
  return it->second;
}

void Aggregator::Add(Line&& line) {
  switch (line.kind) {
    case LineKind::Sample:
      AddSample(std::move(line.sample));
      break;
    case LineKind::Comment:
      if (line.comment.kind == CommentKind::Type) {
        AddType(line.comment.name, line.comment.type);
      } else if (line.comment.kind == CommentKind::Help) {
        AddHelp(line.comment.text);
      }
      break;
    case LineKind::Empty:
      break;
  }
}

void Aggregator::AddType(const std::string& name, MetricType type) {
  bool created = false;
  auto& m = GetOrCreate(name, type, created);
  if (!created) ApplyType(m, name, type);
}

void Aggregator::AddHelp(std::string_view text) {
  if (!opts_.capture_help) return;

  auto rest = text;
  std::string name;
  Failure failure;
  if (!ParseToken(rest, name, failure) || (!rest.empty() && !IsHorizontalSpace(rest.front()))) {
    Log()->debug("HELP line without a metric name ignored: '{}'", text);
    return;
  }
  while (!rest.empty() && IsHorizontalSpace(rest.front())) rest.remove_prefix(1);

  bool created = false;
  auto& m = GetOrCreate(name, MetricType::Untyped, created);
  m.help = std::string(rest);
}

void Aggregator::AddSample(SampleLine&& sample) {
  bool created = false;
  auto& m = GetOrCreate(sample.name, MetricType::Untyped, created);
  AppendSample(m, std::move(sample));
}

std::vector<Metric> Aggregator::Finish() {
  auto by_name = std::move(metrics_);
  metrics_.clear();
  return SortByName(std::move(by_name));
}

std::vector<Metric> SortByName(std::unordered_map<std::string, Metric>&& by_name) {
  std::vector<Metric> out;
  out.reserve(by_name.size());
  for (auto& kv : by_name) out.push_back(std::move(kv.second));
  by_name.clear();
  std::sort(out.begin(), out.end(), [](const Metric& a, const Metric& b) { return a.name < b.name; });
  return out;
}

} // namespace promparse::text
