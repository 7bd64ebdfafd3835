#include "Grammar.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace promparse::text {

namespace {

static inline bool IsTokenHead(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':';
}

static inline bool IsTokenTail(char c) { return IsTokenHead(c) || (c >= '0' && c <= '9'); }

static inline bool Fail(std::string_view at, std::string_view rule, Failure& err) {
  err.rule = rule;
  err.at = at;
  err.committed = false;
  return false;
}

static inline bool FailCommitted(std::string_view at, std::string_view rule, Failure& err) {
  Fail(at, rule, err);
  err.committed = true;
  return false;
}

static inline std::string_view SkipHorizontalSpace(std::string_view sv) {
  std::size_t i = 0;
  while (i < sv.size() && IsHorizontalSpace(sv[i])) ++i;
  return sv.substr(i);
}

static inline bool AtLineEnd(std::string_view sv) {
  return sv.starts_with('\n') || sv.starts_with("\r\n");
}

// Length of the run of characters up to whitespace or a line break.
static inline std::size_t WordLength(std::string_view sv) {
  auto n = sv.find_first_of(" \t\r\n");
  return n == std::string_view::npos ? sv.size() : n;
}

// std::from_chars has no notion of an explicit '+'.
static inline std::string_view StripPlus(std::string_view word) {
  if (word.size() > 1 && word[0] == '+' && word[1] != '+' && word[1] != '-') word.remove_prefix(1);
  return word;
}

// `digits` is a complete float literal that std::from_chars found out of
// range. strtod saturates it: overflow to +-HUGE_VAL, underflow towards zero.
static double Saturate(std::string_view digits) {
  const std::string literal(digits);
  return std::strtod(literal.c_str(), nullptr);
}

static void Upsert(std::vector<Label>& labels, std::string name, std::string value) {
  for (auto& l : labels) {
    if (l.name == name) { l.value = std::move(value); return; }
  }
  labels.push_back({std::move(name), std::move(value)});
}

// "#" WS+ keyword WS+
static bool ConsumeDirective(std::string_view& in, std::string_view keyword) {
  if (!in.starts_with('#')) return false;
  auto rest = in.substr(1);
  auto after = SkipHorizontalSpace(rest);
  if (after.size() == rest.size() || !after.starts_with(keyword)) return false;
  after.remove_prefix(keyword.size());
  auto body = SkipHorizontalSpace(after);
  if (body.size() == after.size()) return false;
  in = body;
  return true;
}

static bool ParseTypeDecl(std::string_view& in, CommentLine& out, Failure& err) {
  auto cur = in;
  if (!ConsumeDirective(cur, "TYPE")) return Fail(in, "type declaration", err);

  // A line without a metric name is an ordinary comment.
  std::string name;
  if (!ParseToken(cur, name, err)) return Fail(err.at, "type declaration metric name", err);

  // From here on the line can only be a type declaration.
  auto type = MetricType::Untyped;
  auto after = SkipHorizontalSpace(cur);
  if (after.size() != cur.size() && !after.empty() && !AtLineEnd(after)) {
    auto word = after.substr(0, WordLength(after));
    auto kw = MetricTypeFromString(word);
    if (!kw) return FailCommitted(after, "type keyword", err);
    type = *kw;
    cur = after.substr(word.size());
  }
  cur = SkipHorizontalSpace(cur);
  if (!ParseLineEnd(cur, err)) return FailCommitted(err.at, "type declaration line end", err);

  out.kind = CommentKind::Type;
  out.name = std::move(name);
  out.type = type;
  out.text.clear();
  in = cur;
  return true;
}

static bool ParseHelpDecl(std::string_view& in, CommentLine& out, Failure& err) {
  auto cur = in;
  if (!ConsumeDirective(cur, "HELP")) return Fail(in, "help declaration", err);
  auto text = cur.substr(0, cur.find_first_of("\r\n"));
  cur.remove_prefix(text.size());
  if (!ParseLineEnd(cur, err)) return Fail(err.at, "help declaration line end", err);

  out.kind = CommentKind::Help;
  out.name.clear();
  out.type = MetricType::Untyped;
  out.text = std::string(text);
  in = cur;
  return true;
}

static bool ParseOtherComment(std::string_view& in, CommentLine& out, Failure& err) {
  if (!in.starts_with('#')) return Fail(in, "comment", err);
  auto nl = in.find('\n');
  if (nl == std::string_view::npos) return Fail(in.substr(in.size()), "comment line end", err);
  out = CommentLine{};
  in.remove_prefix(nl + 1);
  return true;
}

} // namespace

bool ParseToken(std::string_view& in, std::string& out, Failure& err) {
  if (in.empty() || !IsTokenHead(in.front())) return Fail(in, "token", err);
  std::size_t i = 1;
  while (i < in.size() && IsTokenTail(in[i])) ++i;
  out.assign(in.substr(0, i));
  in.remove_prefix(i);
  return true;
}

bool ParseValue(std::string_view& in, double& out, Failure& err) {
  if (in.starts_with("NaN")) {
    out = std::numeric_limits<double>::quiet_NaN();
    in.remove_prefix(3);
    return true;
  }
  if (in.starts_with("+Inf")) {
    out = std::numeric_limits<double>::infinity();
    in.remove_prefix(4);
    return true;
  }
  if (in.starts_with("-Inf")) {
    out = -std::numeric_limits<double>::infinity();
    in.remove_prefix(4);
    return true;
  }

  auto word = in.substr(0, WordLength(in));
  if (word.empty()) return Fail(in, "value", err);
  auto digits = StripPlus(word);
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
  if (ptr != digits.data() + digits.size()) return Fail(in, "value", err);
  if (ec == std::errc::result_out_of_range) {
    v = Saturate(digits);
  } else if (ec != std::errc()) {
    return Fail(in, "value", err);
  }
  out = v;
  in.remove_prefix(word.size());
  return true;
}

bool ParseTimestamp(std::string_view& in, std::int64_t& out, Failure& err) {
  auto word = in.substr(0, WordLength(in));
  if (word.empty()) return Fail(in, "timestamp", err);
  auto digits = StripPlus(word);
  std::int64_t v = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) return Fail(in, "timestamp", err);
  out = v;
  in.remove_prefix(word.size());
  return true;
}

bool ParseLabelValue(std::string_view& in, std::string& out, Failure& err) {
  if (!in.starts_with('"')) return Fail(in, "label value", err);
  std::string value;
  std::size_t i = 1;
  while (i < in.size()) {
    char c = in[i];
    if (c == '"') {
      out = std::move(value);
      in.remove_prefix(i + 1);
      return true;
    }
    if (c == '\n') return Fail(in.substr(i), "label value", err);
    if (c == '\\') {
      if (i + 1 >= in.size()) return Fail(in.substr(i), "label value escape", err);
      switch (in[i + 1]) {
        case 'n': value.push_back('\n'); break;
        case '"': value.push_back('"'); break;
        case '\\': value.push_back('\\'); break;
        default: return Fail(in.substr(i), "label value escape", err);
      }
      i += 2;
      continue;
    }
    value.push_back(c);
    ++i;
  }
  return Fail(in.substr(i), "label value", err); // unterminated
}

bool ParseLabels(std::string_view& in, std::vector<Label>& out, Failure& err) {
  // format: {k="v",k2="v2"} or {k="v",}
  if (!in.starts_with('{')) {
    out.clear();
    return true;
  }
  auto cur = in.substr(1);
  std::vector<Label> labels;
  while (!cur.starts_with('}')) {
    std::string name, value;
    if (!ParseToken(cur, name, err)) return Fail(err.at, "label name", err);
    if (!cur.starts_with('=')) return Fail(cur, "label '='", err);
    cur.remove_prefix(1);
    if (!ParseLabelValue(cur, value, err)) return false;
    Upsert(labels, std::move(name), std::move(value));
    if (!cur.starts_with(',')) break;
    cur.remove_prefix(1);
  }
  if (!cur.starts_with('}')) return Fail(cur, "label set '}'", err);
  cur.remove_prefix(1);
  out = std::move(labels);
  in = cur;
  return true;
}

bool ParseLineEnd(std::string_view& in, Failure& err) {
  if (in.starts_with('\n')) {
    in.remove_prefix(1);
    return true;
  }
  if (in.starts_with("\r\n")) {
    in.remove_prefix(2);
    return true;
  }
  return Fail(in, "line end", err);
}

bool ParseSample(std::string_view& in, SampleLine& out, Failure& err) {
  // name[ ][labels] value [timestamp]
  auto cur = in;
  SampleLine line;
  if (!ParseToken(cur, line.name, err)) return Fail(err.at, "metric name", err);

  if (auto brace = SkipHorizontalSpace(cur); brace.starts_with('{')) cur = brace;
  if (!ParseLabels(cur, line.labels, err)) return false;

  auto value_at = SkipHorizontalSpace(cur);
  if (value_at.size() == cur.size()) return Fail(cur, "whitespace before value", err);
  cur = value_at;
  if (!ParseValue(cur, line.value, err)) return false;

  auto ts_at = SkipHorizontalSpace(cur);
  if (ts_at.size() != cur.size() && !ts_at.empty() && !AtLineEnd(ts_at)) {
    std::int64_t ts = 0;
    if (!ParseTimestamp(ts_at, ts, err)) return false;
    line.timestamp_ms = ts;
    cur = ts_at;
  }
  if (!ParseLineEnd(cur, err)) return false;

  out = std::move(line);
  in = cur;
  return true;
}

bool ParseComment(std::string_view& in, CommentLine& out, Failure& err) {
  if (!in.starts_with('#')) return Fail(in, "comment", err);
  if (ParseTypeDecl(in, out, err)) return true;
  if (err.committed) return false;
  if (ParseHelpDecl(in, out, err)) return true;
  return ParseOtherComment(in, out, err);
}

bool ParseEmptyLine(std::string_view& in, Failure& err) {
  auto cur = SkipHorizontalSpace(in);
  if (!ParseLineEnd(cur, err)) return Fail(err.at, "empty line", err);
  in = cur;
  return true;
}

} // namespace promparse::text
