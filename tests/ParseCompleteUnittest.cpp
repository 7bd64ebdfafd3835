#include <gtest/gtest.h>

#include <promparse/promparse.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace promparse {

namespace {

std::vector<Metric> MustParse(const std::string& text, const ParseOptions& opts = {}) {
  std::vector<Metric> out;
  ParseError err;
  EXPECT_TRUE(ParseComplete(text, out, err, opts)) << err.Message();
  return out;
}

} // namespace

TEST(ParseCompleteUnittest, TestSummaryDeclarationsMerge) {
  auto res = MustParse(R"(
# TYPE chain_account_commits summary
chain_account_commits {quantile="0.5"} 0

# TYPE chain_account_commits summary
chain_account_commits {quantile="0.75"} 123

# TYPE chain_account_commits summary
chain_account_commits {quantile="0.95"} 50
)");
  ASSERT_EQ(1u, res.size());
  const auto& m = res[0];
  EXPECT_EQ("chain_account_commits", m.name);
  EXPECT_EQ(MetricType::Summary, m.data_type);
  ASSERT_EQ(3u, m.samples.size());
  EXPECT_EQ("0.5", m.samples[0].FindLabel("quantile"));
  EXPECT_DOUBLE_EQ(0, m.samples[0].value);
  EXPECT_EQ("0.75", m.samples[1].FindLabel("quantile"));
  EXPECT_DOUBLE_EQ(123, m.samples[1].value);
  EXPECT_EQ("0.95", m.samples[2].FindLabel("quantile"));
  EXPECT_DOUBLE_EQ(50, m.samples[2].value);
  for (const auto& s : m.samples) {
    EXPECT_EQ(1u, s.labels.size());
    EXPECT_FALSE(s.timestamp_ms.has_value());
  }
}

TEST(ParseCompleteUnittest, TestCounterAndUntypedMetrics) {
  auto res = MustParse(R"(
# HELP http_requests_total The total number of HTTP requests.
# TYPE http_requests_total counter
http_requests_total{method="post",code="200"} 1027 1395066363000
http_requests_total{method="post",code="400"} 1028 1395066363000

rpc_duration_seconds_count 2693
)");
  ASSERT_EQ(2u, res.size());

  const auto& http = res[0];
  EXPECT_EQ("http_requests_total", http.name);
  EXPECT_EQ(MetricType::Counter, http.data_type);
  EXPECT_FALSE(http.help.has_value());
  ASSERT_EQ(2u, http.samples.size());
  EXPECT_EQ((std::vector<Label>{{"method", "post"}, {"code", "200"}}), http.samples[0].labels);
  EXPECT_DOUBLE_EQ(1027, http.samples[0].value);
  EXPECT_EQ(1395066363000, http.samples[0].timestamp_ms);
  EXPECT_EQ((std::vector<Label>{{"method", "post"}, {"code", "400"}}), http.samples[1].labels);
  EXPECT_DOUBLE_EQ(1028, http.samples[1].value);
  EXPECT_EQ(1395066363000, http.samples[1].timestamp_ms);

  const auto& rpc = res[1];
  EXPECT_EQ("rpc_duration_seconds_count", rpc.name);
  EXPECT_EQ(MetricType::Untyped, rpc.data_type);
  ASSERT_EQ(1u, rpc.samples.size());
  EXPECT_TRUE(rpc.samples[0].labels.empty());
  EXPECT_DOUBLE_EQ(2693, rpc.samples[0].value);
  EXPECT_FALSE(rpc.samples[0].timestamp_ms.has_value());
}

TEST(ParseCompleteUnittest, TestOutputOrderedByName) {
  auto res = MustParse("b 1\n# TYPE a gauge\nc 3\na 2\nb 4\n");
  ASSERT_EQ(3u, res.size());
  EXPECT_EQ("a", res[0].name);
  EXPECT_EQ("b", res[1].name);
  EXPECT_EQ("c", res[2].name);
  EXPECT_EQ(MetricType::Gauge, res[0].data_type);
  EXPECT_EQ(2u, res[1].samples.size());
}

TEST(ParseCompleteUnittest, TestEmptyAndBlankInput) {
  EXPECT_TRUE(MustParse("").empty());
  EXPECT_TRUE(MustParse("\n\n  \t\n").empty());
  EXPECT_TRUE(MustParse("# just a comment\n# HELP x text\n").empty());
}

TEST(ParseCompleteUnittest, TestSpecialValues) {
  auto res = MustParse("a NaN\nb +Inf\nc -Inf -1\n");
  ASSERT_EQ(3u, res.size());
  EXPECT_TRUE(std::isnan(res[0].samples[0].value));
  EXPECT_TRUE(std::isinf(res[1].samples[0].value));
  EXPECT_GT(res[1].samples[0].value, 0);
  EXPECT_TRUE(std::isinf(res[2].samples[0].value));
  EXPECT_LT(res[2].samples[0].value, 0);
  EXPECT_EQ(-1, res[2].samples[0].timestamp_ms);
}

TEST(ParseCompleteUnittest, TestCrlfInput) {
  auto res = MustParse("# TYPE x counter\r\nx{a=\"1\"} 2 3\r\n\r\n# comment\r\n");
  ASSERT_EQ(1u, res.size());
  EXPECT_EQ(MetricType::Counter, res[0].data_type);
  EXPECT_EQ(3, res[0].samples[0].timestamp_ms);
}

TEST(ParseCompleteUnittest, TestBareNameFailsWholeCall) {
  std::vector<Metric> out;
  ParseError err;
  const std::string text = "good 1\nmetric_without_timestamp_and_labels\n";
  EXPECT_FALSE(ParseComplete(text, out, err));
  EXPECT_TRUE(out.empty());
  EXPECT_EQ("whitespace before value", err.rule);
  EXPECT_EQ("\n", err.remainder);
  EXPECT_EQ(2u, err.line);
}

TEST(ParseCompleteUnittest, TestUnknownTypeKeywordFails) {
  std::vector<Metric> out;
  ParseError err;
  EXPECT_FALSE(ParseComplete("x 1\n# TYPE x sometype\nx 2\n", out, err));
  EXPECT_TRUE(out.empty());
  EXPECT_EQ("type keyword", err.rule);
}

TEST(ParseCompleteUnittest, TestTypeLineWithoutNameIsComment) {
  std::vector<Metric> out;
  ParseError err;
  ASSERT_TRUE(ParseComplete("# TYPE 9x counter\n# TYPE \n# TYPE {weird} note\nx 1\n", out, err))
      << err.Message();
  ASSERT_EQ(1u, out.size());
  EXPECT_EQ("x", out[0].name);
  EXPECT_EQ(MetricType::Untyped, out[0].data_type);

  EXPECT_FALSE(ParseComplete("# TYPE x{ counter\n", out, err));
  EXPECT_EQ("type declaration line end", err.rule);
}

TEST(ParseCompleteUnittest, TestFailureClearsPreviousOutput) {
  std::vector<Metric> out(2);
  ParseError err;
  EXPECT_FALSE(ParseComplete("x 1", out, err));
  EXPECT_TRUE(out.empty());
  EXPECT_EQ("line end", err.rule);
}

// HELP routing is opt-in; both behaviors are pinned here.
TEST(ParseCompleteUnittest, TestHelpDiscardedByDefault) {
  auto res = MustParse("# HELP up Whether the target is up.\n# TYPE up gauge\nup 1\n");
  ASSERT_EQ(1u, res.size());
  EXPECT_FALSE(res[0].help.has_value());
}

TEST(ParseCompleteUnittest, TestHelpCapturedWhenRequested) {
  ParseOptions opts;
  opts.capture_help = true;
  auto res = MustParse(
      "# HELP up Whether the target is up.\n"
      "# TYPE up gauge\n"
      "up 1\n"
      "# HELP up Replaced text.\n"
      "# HELP described_only Nothing else mentions me.\n",
      opts);
  ASSERT_EQ(2u, res.size());
  EXPECT_EQ("described_only", res[0].name);
  EXPECT_EQ("Nothing else mentions me.", res[0].help);
  EXPECT_TRUE(res[0].samples.empty());
  EXPECT_EQ("up", res[1].name);
  EXPECT_EQ(MetricType::Gauge, res[1].data_type);
  EXPECT_EQ("Replaced text.", res[1].help);
}

TEST(ParseCompleteUnittest, TestMetricTypeNames) {
  for (auto t : {MetricType::Untyped, MetricType::Counter, MetricType::Gauge, MetricType::Histogram,
                 MetricType::Summary}) {
    EXPECT_EQ(t, MetricTypeFromString(ToString(t)));
  }
  EXPECT_FALSE(MetricTypeFromString("Counter").has_value());
  EXPECT_FALSE(MetricTypeFromString("").has_value());
}

} // namespace promparse
