// bench_queue.cpp

#include "bench_utils.hpp"

#include "simqueue/app/api/job_json.hpp"
#include "simqueue/config/config.hpp"
#include "simqueue/storage/memory_job_store.hpp"

#include <benchmark/benchmark.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace simqueue {
namespace {

auto open_store(storage::MemoryJobStore &store, benchmark::State &state)
    -> bool {
  boost::asio::io_context io;
  if (!bench::run_on_io(io, store.open())) {
    state.SkipWithError("open failed");
    return false;
  }
  return true;
}

void BM_MemoryStoreEnqueue(benchmark::State &state) {
  const auto n = static_cast<int>(state.range(0));
  for (auto _ : state) {
    state.PauseTiming();
    storage::MemoryJobStore store;
    if (!open_store(store, state)) {
      return;
    }
    state.ResumeTiming();
    for (int i = 0; i < n; ++i) {
      auto job = store.enqueue_now(bench::make_bench_input(i));
      benchmark::DoNotOptimize(job);
    }
  }
  state.SetItemsProcessed(state.iterations() * n);
}

void BM_MemoryStoreDrain(benchmark::State &state) {
  const auto n = static_cast<int>(state.range(0));
  for (auto _ : state) {
    state.PauseTiming();
    storage::MemoryJobStore store;
    if (!open_store(store, state)) {
      return;
    }
    for (int i = 0; i < n; ++i) {
      if (!store.enqueue_now(bench::make_bench_input(i))) {
        state.SkipWithError("enqueue failed");
        return;
      }
    }
    state.ResumeTiming();
    while (true) {
      auto job = store.claim_now();
      if (!job || !job->has_value()) {
        break;
      }
      auto done = store.finish_now((*job)->id, JobStatus::Completed, "{}");
      benchmark::DoNotOptimize(done);
    }
  }
  state.SetItemsProcessed(state.iterations() * n);
}

void BM_MemoryStoreContendedClaim(benchmark::State &state) {
  const auto threads = static_cast<int>(state.range(0));
  constexpr int kJobs = bench::kMediumSize * 4;
  for (auto _ : state) {
    state.PauseTiming();
    storage::MemoryJobStore store;
    if (!open_store(store, state)) {
      return;
    }
    for (int i = 0; i < kJobs; ++i) {
      if (!store.enqueue_now(bench::make_bench_input(i))) {
        state.SkipWithError("enqueue failed");
        return;
      }
    }
    std::atomic<int> claimed{0};
    state.ResumeTiming();
    {
      std::vector<std::jthread> workers;
      for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
          while (true) {
            auto job = store.claim_now();
            if (!job || !job->has_value()) {
              return;
            }
            claimed.fetch_add(1, std::memory_order_relaxed);
          }
        });
      }
    }
    if (claimed.load() != kJobs) {
      state.SkipWithError("lost or duplicated claims");
      return;
    }
  }
  state.SetItemsProcessed(state.iterations() * kJobs);
}

void BM_MemoryStoreListPage(benchmark::State &state) {
  const auto n = static_cast<int>(state.range(0));
  storage::MemoryJobStore store;
  if (!open_store(store, state)) {
    return;
  }
  for (int i = 0; i < n; ++i) {
    if (!store.enqueue_now(bench::make_bench_input(i))) {
      state.SkipWithError("enqueue failed");
      return;
    }
  }
  boost::asio::io_context io;
  for (auto _ : state) {
    auto page = bench::run_on_io(
        io, store.list_jobs({.user_id = 3, .status = std::nullopt},
                            kDefaultPageLimit, 0));
    benchmark::DoNotOptimize(page);
  }
}

void BM_JobPageJson(benchmark::State &state) {
  const auto n = static_cast<int>(state.range(0));
  JobPage page;
  const auto now = util::now_millis();
  for (int i = 0; i < n; ++i) {
    auto input = validate_enqueue(bench::make_bench_input(i));
    if (!input) {
      state.SkipWithError("invalid input");
      return;
    }
    page.jobs.push_back(make_pending_job(i + 1, std::move(*input), now));
  }
  page.total = n;

  for (auto _ : state) {
    auto json = api::job_page_json(page);
    benchmark::DoNotOptimize(json);
  }
}

void BM_ParseEnqueueRequest(benchmark::State &state) {
  const std::string body = R"({
    "service_id": "checkout",
    "llm_provider": "local",
    "current_config": {"replicas": 2, "cpu": "500m", "env": {"A": "1"}},
    "proposed_config": {"replicas": 4, "cpu": "750m", "env": {"A": "2"}},
    "context": {"incident": null},
    "priority": 75
  })";
  for (auto _ : state) {
    auto req = api::parse_enqueue_request(body);
    benchmark::DoNotOptimize(req);
  }
}

void BM_ConfigParse(benchmark::State &state) {
  const std::string toml = R"(
[database]
host = "127.0.0.1"
port = 3306

[worker]
poll_interval_ms = 5000
delegate_url = "http://127.0.0.1:8082"

[api]
port = 8080
)";
  for (auto _ : state) {
    auto cfg = ConfigLoader::load_from_string(toml);
    benchmark::DoNotOptimize(cfg);
  }
}

BENCHMARK(BM_MemoryStoreEnqueue)
    ->Arg(bench::kSmallSize)
    ->Arg(bench::kMediumSize)
    ->Arg(bench::kLargeSize);
BENCHMARK(BM_MemoryStoreDrain)
    ->Arg(bench::kSmallSize)
    ->Arg(bench::kMediumSize)
    ->Arg(bench::kLargeSize);
BENCHMARK(BM_MemoryStoreContendedClaim)->Arg(1)->Arg(4)->Arg(8)->UseRealTime();
BENCHMARK(BM_MemoryStoreListPage)
    ->Arg(bench::kMediumSize)
    ->Arg(bench::kLargeSize);
BENCHMARK(BM_JobPageJson)->Arg(20)->Arg(bench::kSmallSize);
BENCHMARK(BM_ParseEnqueueRequest);
BENCHMARK(BM_ConfigParse);

} // namespace
} // namespace simqueue
