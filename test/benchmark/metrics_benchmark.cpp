#include <benchmark/benchmark.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "f1metrics/cache/fingerprint.h"
#include "f1metrics/cache/metric_cache.h"
#include "f1metrics/common/logger.h"
#include "f1metrics/core/config.h"
#include "f1metrics/data/table_store.h"
#include "f1metrics/data/view_builder.h"
#include "f1metrics/metrics/metric_service.h"
#include "f1metrics/metrics/registry.h"

namespace fs = std::filesystem;
using namespace f1metrics;

namespace {

constexpr int kRoundsPerSeason = 20;
constexpr int kConstructors = 10;

fs::path BenchmarkDir(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return fs::temp_directory_path() / ("f1metrics_bench_" + name + "_" + std::to_string(stamp));
}

void WriteFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

// Synthetic grid: two cars per constructor, every car finishes in grid order
void WriteDataset(const fs::path& dir, int seasons) {
    fs::create_directories(dir);

    std::ostringstream races;
    std::ostringstream results;
    races << "raceId,year,round,circuitId,name,date\n";
    results << "resultId,raceId,driverId,constructorId,number,grid,position,positionText,"
               "positionOrder,points,laps,statusId\n";

    static const int kPoints[] = {25, 18, 15, 12, 10, 8, 6, 4, 2, 1};
    int race_id = 0;
    int result_id = 0;
    for (int season = 0; season < seasons; ++season) {
        for (int round = 1; round <= kRoundsPerSeason; ++round) {
            ++race_id;
            races << race_id << "," << (2011 + season) << "," << round << ",1,Grand Prix " << round
                  << "," << (2011 + season) << "-03-01\n";
            int drivers = kConstructors * 2;
            for (int slot = 0; slot < drivers; ++slot) {
                int driver = (slot + race_id) % drivers + 1;
                int constructor = (driver - 1) / 2 + 1;
                int position = slot + 1;
                int points = position <= 10 ? kPoints[position - 1] : 0;
                results << ++result_id << "," << race_id << "," << driver << "," << constructor << ","
                        << driver << "," << position << "," << position << "," << position << ","
                        << position << "," << points << ",57,1\n";
            }
        }
    }
    WriteFile(dir / "races.csv", races.str());
    WriteFile(dir / "results.csv", results.str());

    std::ostringstream drivers;
    drivers << "driverId,driverRef,forename,surname\n";
    for (int driver = 1; driver <= kConstructors * 2; ++driver) {
        drivers << driver << ",driver" << driver << ",Driver," << driver << "\n";
    }
    WriteFile(dir / "drivers.csv", drivers.str());

    std::ostringstream constructors;
    constructors << "constructorId,constructorRef,name\n";
    for (int constructor = 1; constructor <= kConstructors; ++constructor) {
        constructors << constructor << ",team" << constructor << ",Team " << constructor << "\n";
    }
    WriteFile(dir / "constructors.csv", constructors.str());
}

} // namespace

class MetricsBenchmark : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        common::Logger::SetLevel(spdlog::level::off);
        data_dir_ = BenchmarkDir("data");
        cache_dir_ = BenchmarkDir("cache");
        WriteDataset(data_dir_, static_cast<int>(state.range(0)));

        core::DataConfig data_config = core::DataConfig::Default();
        data_config.dataset_dir = data_dir_.string();
        core::CacheConfig cache_config = core::CacheConfig::Default();
        cache_config.cache_dir = cache_dir_.string();

        store_ = std::make_unique<data::TableStore>(data_config.dataset_dir);
        views_ = std::make_unique<data::ViewBuilder>(*store_, data_config);
        cache_ = std::make_unique<cache::MetricCache>(cache_config);
        metrics::RegisterBuiltinMetrics(registry_);
        service_ = std::make_unique<metrics::MetricService>(registry_, *store_, *views_, *cache_);
    }

    void TearDown(const ::benchmark::State&) override {
        service_.reset();
        cache_.reset();
        views_.reset();
        store_.reset();
        std::error_code ec;
        fs::remove_all(data_dir_, ec);
        fs::remove_all(cache_dir_, ec);
    }

protected:
    fs::path data_dir_;
    fs::path cache_dir_;
    metrics::MetricRegistry registry_;
    std::unique_ptr<data::TableStore> store_;
    std::unique_ptr<data::ViewBuilder> views_;
    std::unique_ptr<cache::MetricCache> cache_;
    std::unique_ptr<metrics::MetricService> service_;
};

// Cold table load and CSV parse on every iteration
BENCHMARK_DEFINE_F(MetricsBenchmark, LoadResultsTable)(benchmark::State& state) {
    for (auto _ : state) {
        store_->Clear();
        auto table = store_->Load("results.csv");
        benchmark::DoNotOptimize(table);
    }
}

BENCHMARK_DEFINE_F(MetricsBenchmark, ConstructorPointsByRace)(benchmark::State& state) {
    data::ViewQuery query;
    query.constructor_id = 3;
    for (auto _ : state) {
        auto rows = views_->ConstructorPointsByRace(query);
        benchmark::DoNotOptimize(rows);
    }
}

BENCHMARK_DEFINE_F(MetricsBenchmark, TeammatePairs)(benchmark::State& state) {
    data::ViewQuery query;
    query.driver_id = 5;
    for (auto _ : state) {
        auto pairs = views_->TeammatePairs(query);
        benchmark::DoNotOptimize(pairs);
    }
}

BENCHMARK_DEFINE_F(MetricsBenchmark, CalculateUncached)(benchmark::State& state) {
    model::MetricParams params;
    params.constructor_id = 3;
    for (auto _ : state) {
        service_->ClearCache();
        auto result = service_->Calculate("constructor_points_per_race", params);
        benchmark::DoNotOptimize(result);
    }
}

BENCHMARK_DEFINE_F(MetricsBenchmark, CalculateCached)(benchmark::State& state) {
    model::MetricParams params;
    params.constructor_id = 3;
    service_->Calculate("constructor_points_per_race", params);
    for (auto _ : state) {
        auto result = service_->Calculate("constructor_points_per_race", params);
        benchmark::DoNotOptimize(result);
    }
}

static void BM_Fingerprint(benchmark::State& state) {
    model::MetricParams params;
    params.driver_id = 44;
    params.season = 2020;
    params.race_ids = std::vector<core::RaceId>{1030, 1031, 1032, 1033, 1034};
    for (auto _ : state) {
        auto fingerprint = cache::Fingerprint("teammate_race_comparison", params);
        benchmark::DoNotOptimize(fingerprint);
    }
}

// Range is the number of seasons
BENCHMARK_REGISTER_F(MetricsBenchmark, LoadResultsTable)->Arg(1)->Arg(5)->Arg(10);
BENCHMARK_REGISTER_F(MetricsBenchmark, ConstructorPointsByRace)->Arg(1)->Arg(5)->Arg(10);
BENCHMARK_REGISTER_F(MetricsBenchmark, TeammatePairs)->Arg(1)->Arg(5)->Arg(10);
BENCHMARK_REGISTER_F(MetricsBenchmark, CalculateUncached)->Arg(5);
BENCHMARK_REGISTER_F(MetricsBenchmark, CalculateCached)->Arg(5);
BENCHMARK(BM_Fingerprint);

BENCHMARK_MAIN();
