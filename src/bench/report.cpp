#include "iolat/bench/report.hpp"

#include <format>
#include <iostream>

#include "iolat/core/error.hpp"
#include "iolat/histogram/histogram.hpp"
#include "app/math_utils.hpp"

namespace iolat {
namespace {

std::string upper(const char* s) {
  std::string out(s);
  for (auto& c : out) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return out;
}

}  // namespace

std::string chart_name(OpKind op, uint32_t rate) {
  return std::format("{}-qps-{}", op_kind_name(op), rate);
}

void print_campaign_header(std::ostream& os, uint32_t rate, std::chrono::seconds duration,
                           uint64_t scheduled) {
  os << "TEST:\n";
  os << std::format("  QPS:           {}\n", rate);
  os << std::format("  TEST TIME (s): {}\n", duration.count());
  os << std::format("  SCHEDULED:     {}\n", scheduled);
  os.flush();
}

void print_campaign(std::ostream& os, const CampaignResult& r, const ReportOptions& opts) {
  const double wall_sec = static_cast<double>(r.wall.count()) / 1e6;
  os << std::format("  DURATION TIME: {:.3f}s\n", wall_sec);
  os << std::format("  MISSED SLEEP:  {} ({:.2f}%)\n", r.missed,
                    app::percent_of(r.missed, r.scheduled));

  const std::string rule(10 + 1 + 100 + 1 + 10, '-');
  for (const auto op : kAllOpKinds) {
    os << std::format("  {} HISTOGRAM:\n", upper(op_kind_name(op)));
    render_text(os, r.histogram(op));
    if (!opts.charts) {
      continue;
    }
    const auto name = chart_name(op, r.rate);
    try {
      const auto path = render_svg_chart(opts.chart_dir, name, r.histogram(op));
      os << std::format("    See also: {}\n", path.string());
      os << "    " << rule << "\n";
    } catch (const Error& e) {
      std::cerr << std::format("[warn] chart {} not written: {}\n", name, e.what());
    }
  }
  os.flush();
}

void print_summary(std::ostream& os, std::span<const CampaignResult> results) {
  os << "\n=== Summary (latency us, mean/median/p95) ===\n";
  os << std::format("{:>8} {:>10} {:>10} {:>26} {:>26} {:>26}\n", "qps", "wall_sec", "missed",
                    "write", "read", "delete");
  for (const auto& r : results) {
    const auto cell = [&](OpKind op) {
      const auto& s = r.stat(op);
      return std::format("{:.0f}/{:.0f}/{:.0f}", s.mean, s.median, s.p95);
    };
    os << std::format("{:>8} {:>10.3f} {:>10} {:>26} {:>26} {:>26}\n", r.rate,
                      static_cast<double>(r.wall.count()) / 1e6, r.missed, cell(OpKind::Write),
                      cell(OpKind::Read), cell(OpKind::Delete));
  }
}

}  // namespace iolat
