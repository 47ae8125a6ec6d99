#pragma once
#include "reference_fixture.h"

#include "HealthAQ/chat_service.h"

#include <benchmark/benchmark.h>
#include <string>

const std::string scenario_text = "What if PM2.5 drops by 20% in Thailand in 2030?";
const std::string ranking_text = "Which Southeast Asian countries have the highest PM2.5 in 2028?";

const haq::ChatService &bench_service() {
    static const auto service = haq::ChatService{haq::testing::test_reference_data()};
    return service;
}

static void BM_ParseQuery(benchmark::State &state) {
    const auto &parser = bench_service().parser();
    for (auto _ : state) {
        benchmark::DoNotOptimize(parser.parse(scenario_text));
    }
}
BENCHMARK(BM_ParseQuery);

static void BM_DispatchIntent(benchmark::State &state) {
    const auto &service = bench_service();
    auto query = service.parser().parse(ranking_text);
    for (auto _ : state) {
        benchmark::DoNotOptimize(service.dispatcher().dispatch(query, ranking_text));
    }
}
BENCHMARK(BM_DispatchIntent);

static void BM_ForecastYear(benchmark::State &state) {
    const auto &service = bench_service();
    auto year = static_cast<int>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(service.predict("Thailand", year));
    }
}
BENCHMARK(BM_ForecastYear)->Arg(2020)->Arg(2030)->Arg(2050);

static void BM_RankPM25(benchmark::State &state) {
    const auto &service = bench_service();
    auto scope = haq::AnalysisScope{.label = "Global", .countries = service.list_countries()};
    for (auto _ : state) {
        benchmark::DoNotOptimize(service.analytics().rank_pm25(scope, 2030));
    }
}
BENCHMARK(BM_RankPM25);

static void BM_HandleMessage(benchmark::State &state) {
    const auto &service = bench_service();
    for (auto _ : state) {
        benchmark::DoNotOptimize(service.handle(scenario_text));
    }
}
BENCHMARK(BM_HandleMessage);
