// Reads an exposition file, parses it and prints a per-metric summary plus the
// re-serialized text. Optional TOML config sets the log level and HELP capture.
#include <promparse/promparse.hpp>
#include "core/Config.hpp"
#include "core/Logging.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static bool ReadFile(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  out = ss.str();
  return true;
}

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "Usage: " << argv[0] << " <metrics.prom> [config.toml]" << std::endl;
    return 2;
  }
  const std::string input_path = argv[1];

  promparse::FileConfig fcfg;
  std::string err;
  if (argc == 3) {
    if (!promparse::ParseConfigToml(argv[2], fcfg, err)) {
      promparse::Log()->error("config: {}", err);
      return 1;
    }
  }
  if (!promparse::ApplyLogging(fcfg, err)) {
    promparse::Log()->error("config: {}", err);
    return 1;
  }

  std::string text;
  if (!ReadFile(input_path, text)) {
    promparse::Log()->error("cannot read {}", input_path);
    return 1;
  }

  std::vector<promparse::Metric> metrics;
  promparse::ParseError perr;
  if (!promparse::ParseComplete(text, metrics, perr, promparse::ToParseOptions(fcfg))) {
    promparse::Log()->error("{}: {}", input_path, perr.Message());
    return 1;
  }
  promparse::Log()->info("{}: {} metrics", input_path, metrics.size());

  for (const auto& m : metrics) {
    std::cout << m.name << " " << promparse::ToString(m.data_type) << " samples=" << m.samples.size();
    if (m.help) std::cout << " help=\"" << *m.help << "\"";
    std::cout << "\n";
  }
  std::cout << "\n" << promparse::SerializeText(metrics);
  return 0;
}
