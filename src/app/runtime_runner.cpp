#include "app/runtime_runner.hpp"

#include <cstdint>
#include <exception>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include "app/math_utils.hpp"
#include "iolat/bench/report.hpp"
#include "iolat/core/error.hpp"
#include "iolat/store/store.hpp"
#include "sink/digest.hpp"

namespace {

using iolat::CampaignResult;
using iolat::Error;
using iolat::ErrorCode;
using iolat::OpKind;
using iolat::StoreKind;
using iolat::app::Config;

template <typename T>
using Result = iolat::Expected<T>;

std::string store_kind_to_string(StoreKind kind) {
  switch (kind) {
    case StoreKind::LocalFs:
      return "localfs";
  }
  return "unknown";
}

bool has_help_flag(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return true;
    }
  }
  return false;
}

void print_cli_help(const std::string& exe_path) {
  const std::string exe = exe_path.empty() ? "iolat" : exe_path;
  std::cout << "Usage:\n"
            << "  " << exe << " [options]\n\n"
            << "Workload:\n"
            << "  --rates <u32...>                Target rates in ops/sec, run in order\n"
            << "                                  (default: 10 20 50 100 200 500 1000)\n"
            << "  --duration-sec <u32>            Duration of each campaign (default: 30)\n"
            << "  --payload-size <bytes>          Payload written by every sequence (default: 4096)\n"
            << "  --seed <u64>                    Payload seed (default: 1)\n\n"
            << "Backend:\n"
            << "  --store <localfs>               Storage backend (default: localfs)\n"
            << "  --store-dir <path>              Backend root directory (default: /tmp)\n\n"
            << "Output:\n"
            << "  --chart-dir <path>              Histogram chart directory (default: /tmp/images)\n"
            << "  --no-charts                     Do not write histogram charts\n"
            << "  --json <path>                   Write JSON summary to file\n\n"
            << "Help:\n"
            << "  -h, --help                      Show this help and exit\n\n"
            << "Examples:\n"
            << "  " << exe << " --rates 10 100 --duration-sec 5\n"
            << "  " << exe << " --store-dir /mnt/nvme --payload-size 65536 --json ./result.json\n";
}

std::string stats_json(const iolat::LatencyStats& s) {
  return std::format(
      "{{\"count\":{},\"mean_us\":{:.3f},\"median_us\":{:.3f},\"p95_us\":{:.3f},"
      "\"min_us\":{:.3f},\"max_us\":{:.3f}}}",
      s.count, s.mean, s.median, s.p95, s.min, s.max);
}

Result<int> run_campaigns(const Config& cfg) {
  try {
    std::shared_ptr<iolat::IStoreClient> store = iolat::make_store(cfg.store);
    std::cout << "INIT CLIENT\n";
    std::cout << std::format("  STORE:         {}\n", store->describe());

    iolat::RateDriver driver(store, cfg.driver);
    std::cout << std::format("  PAYLOAD:       {}\n",
                             iolat::app::describe_payload(driver.payload()));
    std::cout << "TRY WRITE-READ-DELETE OPS\n";

    const iolat::ReportOptions report{cfg.charts, cfg.chart_dir};
    iolat::CampaignObserver observer;
    observer.on_start = [&](uint32_t rate, uint64_t scheduled) {
      iolat::print_campaign_header(std::cout, rate, cfg.driver.campaign_duration, scheduled);
    };
    observer.on_finish = [&](const CampaignResult& r) {
      iolat::print_campaign(std::cout, r, report);
    };

    const auto results = driver.run(observer);

    iolat::print_summary(std::cout, results);
    auto json = iolat::app::write_json_summary(cfg, results);
    if (!json) {
      return iolat::make_unexpected(json.error());
    }
  } catch (const Error& e) {
    return iolat::make_unexpected(e);
  }
  return 0;
}

}  // namespace

namespace iolat::app {

Result<StoreKind> parse_store_kind(const std::string& s) {
  if (s == "localfs") {
    return StoreKind::LocalFs;
  }
  return iolat::make_unexpected(Error{ErrorCode::InvalidArgument, "invalid --store: " + s});
}

Result<Config> parse_args(const std::vector<std::string>& args) {
  Config cfg{};
  if (!args.empty()) {
    cfg.executable_path = args.front();
  }

  const DriverConfig defaults{};

  argparse::ArgumentParser program("iolat");
  program.add_argument("--rates")
      .nargs(argparse::nargs_pattern::at_least_one)
      .scan<'u', uint32_t>()
      .default_value(defaults.rates);
  program.add_argument("--duration-sec")
      .scan<'u', uint32_t>()
      .default_value(static_cast<uint32_t>(defaults.campaign_duration.count()));
  program.add_argument("--payload-size")
      .scan<'u', size_t>()
      .default_value(defaults.payload_size);
  program.add_argument("--seed").scan<'u', uint64_t>().default_value(defaults.seed);
  program.add_argument("--store").default_value(std::string("localfs"));
  program.add_argument("--store-dir").default_value(cfg.store.root_dir);
  program.add_argument("--chart-dir").default_value(cfg.chart_dir.string());
  program.add_argument("--no-charts").default_value(false).implicit_value(true);
  program.add_argument("--json").default_value(std::string(""));

  try {
    program.parse_args(args);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return iolat::make_unexpected(Error{ErrorCode::InvalidArgument, "argument parsing failed"});
  }

  auto kind = parse_store_kind(program.get<std::string>("--store"));
  if (!kind) {
    return iolat::make_unexpected(kind.error());
  }
  cfg.store.kind = *kind;
  cfg.store.root_dir = program.get<std::string>("--store-dir");

  cfg.driver.rates = program.get<std::vector<uint32_t>>("--rates");
  cfg.driver.campaign_duration = std::chrono::seconds(program.get<uint32_t>("--duration-sec"));
  cfg.driver.payload_size = program.get<size_t>("--payload-size");
  cfg.driver.seed = program.get<uint64_t>("--seed");

  cfg.chart_dir = program.get<std::string>("--chart-dir");
  cfg.charts = !program.get<bool>("--no-charts");
  const auto json = program.get<std::string>("--json");
  if (!json.empty()) {
    cfg.json_output = std::filesystem::path(json);
  }

  if (cfg.driver.rates.empty()) {
    return iolat::make_unexpected(Error{ErrorCode::InvalidArgument, "--rates needs at least one value"});
  }
  for (const auto rate : cfg.driver.rates) {
    if (rate == 0) {
      return iolat::make_unexpected(Error{ErrorCode::InvalidArgument, "--rates values must be > 0"});
    }
  }
  if (cfg.driver.campaign_duration.count() == 0 || cfg.driver.payload_size == 0) {
    return iolat::make_unexpected(Error{ErrorCode::InvalidArgument, "invalid zero-valued core options"});
  }
  if (cfg.store.root_dir.empty()) {
    return iolat::make_unexpected(Error{ErrorCode::InvalidArgument, "--store-dir must not be empty"});
  }
  return cfg;
}

Result<void> write_json_summary(const Config& cfg, std::span<const CampaignResult> results) {
  if (!cfg.json_output.has_value()) {
    return {};
  }
  std::ofstream out(*cfg.json_output, std::ios::trunc);
  if (!out.is_open()) {
    return iolat::make_unexpected(Error{ErrorCode::IoError, "failed to open JSON output path: " +
                                                           cfg.json_output->string()});
  }

  out << "{\n";
  out << std::format(
      "  \"config\": {{\"store\": \"{}\", \"payload_size\": {}, \"duration_sec\": {}, "
      "\"seed\": {}}},\n",
      store_kind_to_string(cfg.store.kind), cfg.driver.payload_size,
      cfg.driver.campaign_duration.count(), cfg.driver.seed);
  out << "  \"campaigns\": [\n";
  for (size_t i = 0; i < results.size(); ++i) {
    const auto& r = results[i];
    out << std::format(
        "    {{\"qps\": {}, \"duration_sec\": {}, \"scheduled\": {}, \"wall_sec\": {:.6f}, "
        "\"missed\": {}, \"missed_pct\": {:.4f}, \"write\": {}, \"read\": {}, \"delete\": {}}}",
        r.rate, r.duration.count(), r.scheduled, static_cast<double>(r.wall.count()) / 1e6,
        r.missed, percent_of(r.missed, r.scheduled), stats_json(r.stat(OpKind::Write)),
        stats_json(r.stat(OpKind::Read)), stats_json(r.stat(OpKind::Delete)));
    out << (i + 1 < results.size() ? ",\n" : "\n");
  }
  out << "  ]\n";
  out << "}\n";

  out.flush();
  if (!out) {
    return iolat::make_unexpected(Error{ErrorCode::IoError, "failed to write JSON summary"});
  }
  return {};
}

}  // namespace iolat::app

int run_cli_impl(int argc, char** argv) {
  if (has_help_flag(argc, argv)) {
    print_cli_help(argc > 0 ? std::string(argv[0]) : std::string("iolat"));
    return 0;
  }

  const std::vector<std::string> args(argv, argv + argc);
  auto cfg = iolat::app::parse_args(args);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().what() << "\n";
    return 2;
  }

  auto run = run_campaigns(*cfg);
  if (!run) {
    std::cerr << std::format("run error [{}]: {}\n", iolat::error_code_name(run.error().code()),
                             run.error().what());
    return 1;
  }
  return *run;
}
