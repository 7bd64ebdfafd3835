#include "LineReader.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace promparse::text {

bool LineReader::Next(Line& line, ParseError& err) {
  line = Line{};
  auto cur = rest_;
  Failure failure;

  if (ParseComment(cur, line.comment, failure)) {
    line.kind = LineKind::Comment;
  } else if (failure.committed) {
    FillError(failure, err);
    return false;
  } else {
    // Report whichever alternative got furthest into the line.
    Failure best = failure;
    if (ParseSample(cur, line.sample, failure)) {
      line.kind = LineKind::Sample;
    } else {
      if (failure.at.size() < best.at.size()) best = failure;
      if (ParseEmptyLine(cur, failure)) {
        line.kind = LineKind::Empty;
      } else {
        if (failure.at.size() < best.at.size()) best = failure;
        FillError(best, err);
        return false;
      }
    }
  }

  rest_ = cur;
  ++line_no_;
  return true;
}

void LineReader::FillError(const Failure& failure, ParseError& err) const {
  const std::size_t offset = text_.size() - failure.at.size();
  const auto consumed = text_.substr(0, offset);
  const auto last_nl = consumed.rfind('\n');

  err.rule = std::string(failure.rule);
  err.remainder = std::string(failure.at);
  err.line = static_cast<std::size_t>(std::count(consumed.begin(), consumed.end(), '\n')) + 1;
  err.column = last_nl == std::string_view::npos ? offset + 1 : offset - last_nl;
}

} // namespace promparse::text
