#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "iolat/core/error.hpp"
#include "iolat/histogram/histogram.hpp"

namespace {

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    out.push_back(line);
  }
  return out;
}

size_t count_of(const std::string& haystack, const std::string& needle) {
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

bool test_text_layout() {
  iolat::LatencyHistogram h;
  for (int i = 0; i < 10; ++i) {
    h.record(uint64_t{20});
  }
  std::ostringstream os;
  iolat::render_text(os, h);
  const auto lines = lines_of(os.str());

  // rule + every second edge + "+inf" + rule
  const size_t want = 1 + iolat::kBucketEdgeCount / 2 + 1 + 1;
  if (lines.size() != want) {
    std::cerr << std::format("expected {} lines, got {}\n", want, lines.size());
    return false;
  }
  if (lines.front().find("-----") == std::string::npos || lines.back() != lines.front()) {
    std::cerr << std::format("rule lines missing\n");
    return false;
  }
  const std::string full_bar(100, '.');
  if (lines[1].find("32µs") == std::string::npos || lines[1].find(full_bar) == std::string::npos ||
      !lines[1].ends_with(" 10")) {
    std::cerr << std::format("first bucket row unexpected: '{}'\n", lines[1]);
    return false;
  }
  for (size_t i = 2; i + 1 < lines.size(); ++i) {
    if (lines[i].find('.') != std::string::npos && lines[i].find("ms") == std::string::npos) {
      std::cerr << std::format("unexpected bar in row {}: '{}'\n", i, lines[i]);
      return false;
    }
    if (!lines[i].ends_with(" 0")) {
      std::cerr << std::format("expected zero count in row {}: '{}'\n", i, lines[i]);
      return false;
    }
  }
  return true;
}

bool test_text_deltas_cover_skipped_edges() {
  iolat::LatencyHistogram h;
  h.record(uint64_t{40});        // slot 1, folded into the 64µs row
  h.record(uint64_t{50});        // slot 2, the 64µs row
  h.record(uint64_t{1'000'000}); // overflow
  h.record(uint64_t{2'000'000}); // overflow

  std::ostringstream os;
  iolat::render_text(os, h);
  const auto lines = lines_of(os.str());

  if (lines[1].find("32µs") == std::string::npos || !lines[1].ends_with(" 0")) {
    std::cerr << std::format("32µs row unexpected: '{}'\n", lines[1]);
    return false;
  }
  const std::string half_bar(50, '.');
  if (lines[2].find("64µs") == std::string::npos || !lines[2].ends_with(" 2") ||
      lines[2].find(half_bar) == std::string::npos) {
    std::cerr << std::format("64µs row unexpected: '{}'\n", lines[2]);
    return false;
  }
  const auto& inf = lines[lines.size() - 2];
  if (inf.find("+inf") == std::string::npos || !inf.ends_with(" 2")) {
    std::cerr << std::format("+inf row unexpected: '{}'\n", inf);
    return false;
  }
  return true;
}

bool test_text_empty_histogram() {
  iolat::LatencyHistogram h;
  std::ostringstream os;
  iolat::render_text(os, h);
  if (os.str().find('.') != std::string::npos) {
    std::cerr << std::format("empty histogram rendered bars\n");
    return false;
  }
  return true;
}

bool test_svg_chart() {
  const std::filesystem::path dir = "./iolat_test_chart_out";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  iolat::LatencyHistogram h;
  for (int i = 0; i < 3; ++i) {
    h.record(uint64_t{100});
  }
  h.record(uint64_t{5000});

  std::filesystem::path path;
  try {
    path = iolat::render_svg_chart(dir, "write-qps-10", h);
  } catch (const iolat::Error& e) {
    std::cerr << std::format("render_svg_chart failed: {}\n", e.what());
    return false;
  }
  if (path != dir / "write-qps-10.svg" || !std::filesystem::exists(path)) {
    std::cerr << std::format("chart not written at expected path: {}\n", path.string());
    return false;
  }

  std::ifstream in(path);
  std::ostringstream body;
  body << in.rdbuf();
  const std::string svg = body.str();

  if (svg.rfind("<svg", 0) != 0 || svg.find("</svg>") == std::string::npos) {
    std::cerr << std::format("chart is not an svg document\n");
    return false;
  }
  if (svg.find(">write-qps-10<") == std::string::npos) {
    std::cerr << std::format("chart caption missing\n");
    return false;
  }
  if (svg.find(">+inf<") == std::string::npos || svg.find(">32.00µs<") == std::string::npos) {
    std::cerr << std::format("chart axis labels missing\n");
    return false;
  }
  if (count_of(svg, "fill=\"red\"") != 2) {
    std::cerr << std::format("expected 2 bars, got {}\n", count_of(svg, "fill=\"red\""));
    return false;
  }

  std::filesystem::remove_all(dir, ec);
  return true;
}

bool test_svg_chart_bad_dir() {
  const std::filesystem::path blocker = "./iolat_test_chart_blocker";
  std::error_code ec;
  std::filesystem::remove_all(blocker, ec);
  { std::ofstream(blocker) << "x"; }

  bool rejected = false;
  try {
    static_cast<void>(iolat::render_svg_chart(blocker / "sub", "read-qps-1", iolat::LatencyHistogram{}));
  } catch (const iolat::Error& e) {
    rejected = (e.code() == iolat::ErrorCode::IoError);
  }
  std::filesystem::remove_all(blocker, ec);
  if (!rejected) {
    std::cerr << std::format("expected io error for unusable chart directory\n");
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_text_layout()) {
    return 1;
  }
  if (!test_text_deltas_cover_skipped_edges()) {
    return 1;
  }
  if (!test_text_empty_histogram()) {
    return 1;
  }
  if (!test_svg_chart()) {
    return 1;
  }
  if (!test_svg_chart_bad_dir()) {
    return 1;
  }
  return 0;
}
