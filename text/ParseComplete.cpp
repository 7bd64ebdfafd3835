// Entry point: line reader -> aggregator -> name-ordered result.
#include <promparse/promparse.hpp>

#include "Aggregator.hpp"
#include "LineReader.hpp"
#include "core/Logging.hpp"

#include <string_view>
#include <utility>
#include <vector>

namespace promparse {

bool ParseComplete(std::string_view text,
                   std::vector<Metric>& out,
                   ParseError& err,
                   const ParseOptions& opts) {
  out.clear();
  text::LineReader reader(text);
  text::Aggregator agg(opts);
  text::Line line;

  while (!reader.Done()) {
    if (!reader.Next(line, err)) {
      Log()->debug("exposition rejected: {}", err.Message());
      return false;
    }
    agg.Add(std::move(line));
  }

  out = agg.Finish();
  Log()->debug("parsed {} metrics from {} lines", out.size(), reader.LineNumber() - 1);
  return true;
}

} // namespace promparse
