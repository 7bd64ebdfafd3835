// Recognizers for the Prometheus text exposition grammar.
// Each one consumes a prefix of `in` on success. On failure `in` is left
// untouched and `err` names the rule and the input it stopped at.
// Failures point into the caller's buffer; LineReader turns them into ParseError.
#pragma once
#include <promparse/promparse.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promparse::text {

struct SampleLine {
  std::string name;
  std::vector<Label> labels;
  double value = 0.0;
  std::optional<std::int64_t> timestamp_ms;
};

struct Failure {
  std::string_view rule;
  std::string_view at;     // suffix of the input where the rule gave up
  bool committed = false;  // line shape is certain, do not try the next one
};

enum class CommentKind { Type, Help, Other };

struct CommentLine {
  CommentKind kind = CommentKind::Other;
  std::string name;                         // Type only
  MetricType type = MetricType::Untyped;    // Type only
  std::string text;                         // Help only: everything after "HELP "
};

inline bool IsHorizontalSpace(char c) { return c == ' ' || c == '\t'; }

// [A-Za-z_:][A-Za-z0-9_:]*
bool ParseToken(std::string_view& in, std::string& out, Failure& err);

// NaN | +Inf | -Inf | float literal up to the next whitespace or line break.
bool ParseValue(std::string_view& in, double& out, Failure& err);

// Signed decimal milliseconds up to the next whitespace or line break.
bool ParseTimestamp(std::string_view& in, std::int64_t& out, Failure& err);

// Double-quoted string; only \n, \" and \\ are escapes.
bool ParseLabelValue(std::string_view& in, std::string& out, Failure& err);

// Optional {name="value",...} block. Absent block yields no labels.
bool ParseLabels(std::string_view& in, std::vector<Label>& out, Failure& err);

// \n or \r\n
bool ParseLineEnd(std::string_view& in, Failure& err);

bool ParseSample(std::string_view& in, SampleLine& out, Failure& err);

// "# TYPE ...", "# HELP ..." or any other "#..." line, tried in that order.
bool ParseComment(std::string_view& in, CommentLine& out, Failure& err);

// Horizontal whitespace only, then a line terminator.
bool ParseEmptyLine(std::string_view& in, Failure& err);

} // namespace promparse::text
