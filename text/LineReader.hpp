// Line classifier and input driver: walks a buffer one exposition line at a time.
#pragma once
#include "Grammar.hpp"

#include <promparse/promparse.hpp>

#include <cstddef>
#include <string_view>

namespace promparse::text {

enum class LineKind { Empty, Sample, Comment };

struct Line {
  LineKind kind = LineKind::Empty;
  SampleLine sample;    // kind == Sample
  CommentLine comment;  // kind == Comment
};

class LineReader {
 public:
  explicit LineReader(std::string_view text) : text_(text), rest_(text) {}

  bool Done() const { return rest_.empty(); }

  // Classify the next line as Comment, Sample or Empty (first match wins) and
  // advance past it. Returns false and fills `err` when no shape matches; the
  // reader does not advance after a failure.
  bool Next(Line& line, ParseError& err);

  // 1-based number of the line Next() will read.
  std::size_t LineNumber() const { return line_no_; }

 private:
  void FillError(const Failure& failure, ParseError& err) const;

  std::string_view text_;
  std::string_view rest_;
  std::size_t line_no_ = 1;
};

} // namespace promparse::text
