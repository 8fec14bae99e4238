#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <vector>

#include "iolat/core/error.hpp"
#include "iolat/histogram/histogram.hpp"

namespace iolat {
namespace {

constexpr int kWidth = (128 + 64) * 10;
constexpr int kHeight = 960;
constexpr int kMargin = 64;
constexpr int kCaptionHeight = 64;
constexpr int kXLabelArea = 128;
constexpr int kYLabelArea = 64 + 32;

// Bar heights live on a 0..10000 axis; the tallest bar is drawn at 8000.
constexpr uint64_t kAxisMax = 10000;
constexpr uint64_t kTallestBar = 8000;
constexpr uint64_t kAxisStep = 1000;

struct PlotArea {
  double left{};
  double right{};
  double top{};
  double bottom{};

  double y_for(uint64_t v) const {
    return bottom - (bottom - top) * static_cast<double>(v) / static_cast<double>(kAxisMax);
  }
};

// Per-slot share of the total in 1/10000 units, then rescaled so the tallest
// slot reaches kTallestBar. Returns the unscaled maximum through `max_share`.
std::vector<uint64_t> bar_heights(const LatencyHistogram& h, uint64_t& max_share) {
  const uint64_t sum = h.count();
  std::vector<uint64_t> heights(kBucketSlotCount, 0);
  max_share = 0;
  if (sum == 0) {
    return heights;
  }
  for (size_t i = 0; i < kBucketSlotCount; ++i) {
    heights[i] = (h.delta(i) * kAxisMax + sum - 1) / sum;
    max_share = std::max(max_share, heights[i]);
  }
  for (auto& v : heights) {
    v = v * kTallestBar / max_share;
  }
  return heights;
}

}  // namespace

std::filesystem::path render_svg_chart(const std::filesystem::path& dir,
                                       const std::string& name,
                                       const LatencyHistogram& h) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw Error{ErrorCode::IoError,
                std::format("create directory failed: {}: {}", dir.string(), ec.message())};
  }

  const auto path = dir / (name + ".svg");
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw Error{ErrorCode::IoError, std::format("failed to open chart output: {}", path.string())};
  }

  uint64_t max_share = 0;
  const auto heights = bar_heights(h, max_share);

  const PlotArea plot{
      static_cast<double>(kMargin + kYLabelArea),
      static_cast<double>(kWidth - kMargin),
      static_cast<double>(kMargin + kCaptionHeight),
      static_cast<double>(kHeight - kMargin - kXLabelArea),
  };
  const double slot_w = (plot.right - plot.left) / static_cast<double>(kBucketSlotCount);

  out << std::format(
      "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"{}\" height=\"{}\" "
      "viewBox=\"0 0 {} {}\">\n",
      kWidth, kHeight, kWidth, kHeight);
  out << "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
  out << std::format(
      "<text x=\"{}\" y=\"{}\" font-family=\"sans-serif\" font-size=\"48\" "
      "text-anchor=\"middle\">{}</text>\n",
      kWidth / 2, kMargin + 32, name);

  // Horizontal mesh and y labels.
  for (uint64_t v = 0; v <= kAxisMax; v += kAxisStep) {
    const double y = plot.y_for(v);
    const double pct = max_share == 0 ? 0.0
                                      : static_cast<double>(v * max_share) /
                                            static_cast<double>(kTallestBar) / 100.0;
    out << std::format(
        "<line x1=\"{:.1f}\" y1=\"{:.1f}\" x2=\"{:.1f}\" y2=\"{:.1f}\" stroke=\"#e0e0e0\"/>\n",
        plot.left, y, plot.right, y);
    out << std::format(
        "<text x=\"{:.1f}\" y=\"{:.1f}\" font-family=\"sans-serif\" font-size=\"24\" "
        "text-anchor=\"end\" dominant-baseline=\"middle\">{:.2f}%</text>\n",
        plot.left - 8, y, pct);
  }

  for (size_t i = 0; i < kBucketSlotCount; ++i) {
    const double x = plot.left + slot_w * static_cast<double>(i);
    const double top = plot.y_for(heights[i]);
    if (heights[i] > 0) {
      out << std::format(
          "<rect x=\"{:.1f}\" y=\"{:.1f}\" width=\"{:.1f}\" height=\"{:.1f}\" "
          "fill=\"red\" fill-opacity=\"0.5\"/>\n",
          x + 1, top, slot_w - 2, plot.bottom - top);
    }
    const double cx = x + slot_w / 2;
    const double ly = plot.bottom + 8;
    out << std::format(
        "<text x=\"{:.1f}\" y=\"{:.1f}\" font-family=\"sans-serif\" font-size=\"24\" "
        "dominant-baseline=\"middle\" transform=\"rotate(90 {:.1f} {:.1f})\">{}</text>\n",
        cx, ly, cx, ly, bucket_name(i));
  }

  out << std::format(
      "<line x1=\"{:.1f}\" y1=\"{:.1f}\" x2=\"{:.1f}\" y2=\"{:.1f}\" stroke=\"black\"/>\n",
      plot.left, plot.bottom, plot.right, plot.bottom);
  out << std::format(
      "<line x1=\"{:.1f}\" y1=\"{:.1f}\" x2=\"{:.1f}\" y2=\"{:.1f}\" stroke=\"black\"/>\n",
      plot.left, plot.top, plot.left, plot.bottom);
  out << std::format(
      "<text x=\"{:.1f}\" y=\"{}\" font-family=\"sans-serif\" font-size=\"32\" "
      "text-anchor=\"middle\">bucket</text>\n",
      (plot.left + plot.right) / 2, kHeight - kMargin / 2);
  out << std::format(
      "<text x=\"{}\" y=\"{:.1f}\" font-family=\"sans-serif\" font-size=\"32\" "
      "text-anchor=\"middle\" transform=\"rotate(-90 {} {:.1f})\">percent</text>\n",
      kMargin / 2, (plot.top + plot.bottom) / 2, kMargin / 2, (plot.top + plot.bottom) / 2);
  out << "</svg>\n";

  out.flush();
  if (!out) {
    throw Error{ErrorCode::IoError, std::format("failed to write chart: {}", path.string())};
  }
  return path;
}

}  // namespace iolat
