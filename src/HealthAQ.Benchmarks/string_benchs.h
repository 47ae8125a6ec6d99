#pragma once
#include "HealthAQ.Core/string_util.h"

#include <benchmark/benchmark.h>
#include <string>
#include <vector>

const std::string query_text = "What will PM2.5 be in Thailnd in 2027 for elderly people?";

static void BM_ContainsWord(benchmark::State &state) {
    auto lowered = haq::core::to_lower(query_text);
    for (auto _ : state) {
        benchmark::DoNotOptimize(haq::core::contains_word(lowered, "elderly"));
    }
}
BENCHMARK(BM_ContainsWord);

static void BM_LevenshteinDistance(benchmark::State &state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(haq::core::levenshtein_distance("thailnd", "thailand"));
    }
}
BENCHMARK(BM_LevenshteinDistance);

static void BM_CaseInsensitiveEquals(benchmark::State &state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(haq::core::case_insensitive::equals("Viet Nam", "viet nam"));
    }
}
BENCHMARK(BM_CaseInsensitiveEquals);
