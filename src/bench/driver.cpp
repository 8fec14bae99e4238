#include "iolat/bench/driver.hpp"

#include <format>
#include <utility>

#include "iolat/bench/pacer.hpp"
#include "iolat/core/error.hpp"
#include "iolat/scheduler/dispatcher.hpp"
#include "app/math_utils.hpp"
#include "generator/payload_generator.hpp"
#include "sink/digest.hpp"

namespace iolat {
namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::duration_cast;
using std::chrono::microseconds;

void validate(const std::shared_ptr<IStoreClient>& client, const DriverConfig& cfg) {
  if (!client) {
    throw Error{ErrorCode::InvalidArgument, "store client must not be null"};
  }
  if (cfg.campaign_duration.count() <= 0) {
    throw Error{ErrorCode::InvalidArgument, "campaign duration must be > 0"};
  }
}

void expect_value(const std::string& key, std::string_view expected, const std::string& actual) {
  if (actual == expected) {
    return;
  }
  throw Error{ErrorCode::CorrectnessViolation,
              std::format("read {}: value mismatch (expected {}, got {})", key,
                          app::describe_payload(expected), app::describe_payload(actual))};
}

void expect_absent(const IStoreHandler& handler, const std::string& key) {
  try {
    static_cast<void>(handler.read(key));
  } catch (const BackendError&) {
    return;
  }
  throw Error{ErrorCode::CorrectnessViolation,
              std::format("read {}: succeeded after delete", key)};
}

}  // namespace

SequenceResult run_sequence(const IStoreHandler& handler, const std::string& key,
                            std::string_view payload) {
  SequenceResult out{};

  auto start = Clock::now();
  handler.write(key, payload);
  auto end = Clock::now();
  out.latency[op_index(OpKind::Write)] = duration_cast<microseconds>(end - start);

  start = Clock::now();
  const std::string value = handler.read(key);
  end = Clock::now();
  out.latency[op_index(OpKind::Read)] = duration_cast<microseconds>(end - start);
  expect_value(key, payload, value);

  start = Clock::now();
  handler.remove(key);
  end = Clock::now();
  out.latency[op_index(OpKind::Delete)] = duration_cast<microseconds>(end - start);

  expect_absent(handler, key);
  return out;
}

RateDriver::RateDriver(std::shared_ptr<IStoreClient> client, DriverConfig cfg)
    : client_(std::move(client)), cfg_(std::move(cfg)) {
  validate(client_, cfg_);
  if (cfg_.payload_size == 0) {
    throw Error{ErrorCode::InvalidArgument, "payload size must be > 0"};
  }
  payload_ = std::make_shared<const std::string>(
      app::PayloadGenerator(cfg_.seed).generate(cfg_.payload_size));
}

RateDriver::RateDriver(std::shared_ptr<IStoreClient> client, DriverConfig cfg,
                       std::string payload)
    : client_(std::move(client)), cfg_(std::move(cfg)) {
  validate(client_, cfg_);
  cfg_.payload_size = payload.size();
  payload_ = std::make_shared<const std::string>(std::move(payload));
}

std::string RateDriver::next_key() {
  std::scoped_lock lock(client_mu_);
  return client_->gen_unique_key();
}

std::vector<CampaignResult> RateDriver::run(const CampaignObserver& observer) {
  if (cfg_.rates.empty()) {
    throw Error{ErrorCode::InvalidArgument, "at least one target rate is required"};
  }
  for (const auto rate : cfg_.rates) {
    if (rate == 0) {
      throw Error{ErrorCode::InvalidArgument, "target rates must be > 0"};
    }
  }

  {
    std::scoped_lock lock(client_mu_);
    client_->init();
  }
  smoke_test();

  std::vector<CampaignResult> results;
  results.reserve(cfg_.rates.size());
  for (const auto rate : cfg_.rates) {
    if (observer.on_start) {
      observer.on_start(rate,
                        static_cast<uint64_t>(rate) *
                            static_cast<uint64_t>(cfg_.campaign_duration.count()));
    }
    results.push_back(run_campaign(rate));
    if (observer.on_finish) {
      observer.on_finish(results.back());
    }
  }
  return results;
}

void RateDriver::smoke_test() {
  const std::string key = next_key();
  std::shared_ptr<const IStoreHandler> handler;
  {
    std::scoped_lock lock(client_mu_);
    handler = client_->handler();
  }

  handler->write(key, kSmokeTestValue);
  expect_value(key, kSmokeTestValue, handler->read(key));
  handler->remove(key);
  expect_absent(*handler, key);
}

CampaignResult RateDriver::run_campaign(uint32_t rate) {
  if (rate == 0) {
    throw Error{ErrorCode::InvalidArgument, "rate must be > 0"};
  }

  CampaignResult out{};
  out.rate = rate;
  out.duration = cfg_.campaign_duration;
  out.scheduled =
      static_cast<uint64_t>(rate) * static_cast<uint64_t>(cfg_.campaign_duration.count());

  std::shared_ptr<const IStoreHandler> handler;
  {
    std::scoped_lock lock(client_mu_);
    handler = client_->handler();
  }

  // Declared before the dispatcher so in-flight tasks never outlive their slot.
  std::vector<SequenceResult> results(out.scheduled);
  auto dispatcher = make_thread_per_task_dispatcher();

  const auto begin = Clock::now();
  RatePacer pacer(begin, rate);
  for (uint64_t i = 0; i < out.scheduled; ++i) {
    const uint64_t slot = pacer.pace();
    dispatcher->submit(
        [handler, payload = payload_, key = next_key(), result = &results[slot]]() {
          *result = run_sequence(*handler, key, *payload);
        });
  }
  dispatcher->drain();
  const auto end = Clock::now();

  out.wall = duration_cast<microseconds>(end - begin);
  out.missed = pacer.missed();

  std::array<std::vector<double>, kOpKindCount> samples;
  for (auto& s : samples) {
    s.reserve(results.size());
  }
  for (const auto& r : results) {
    for (const auto op : kAllOpKinds) {
      const auto us = r.latency[op_index(op)];
      out.histograms[op_index(op)].record(us);
      samples[op_index(op)].push_back(static_cast<double>(us.count()));
    }
  }
  for (const auto op : kAllOpKinds) {
    out.stats[op_index(op)] = app::calc_stats(std::move(samples[op_index(op)]));
  }
  return out;
}

}  // namespace iolat
