/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>

#include "histsample/io/HistogramReader.hpp"
#include "histsample/process/RNG.hpp"
#include "histsample/stats/HistogramSampler.hpp"

//-------------------------------------------------------------------------

using namespace histsample;

//-------------------------------------------------------------------------

static const fs::path kTestDataPath{
    fs::path{__FILE__}.parent_path().parent_path() / "test" / "cpp-tests" / "data"};

//-------------------------------------------------------------------------

static std::vector<stats::Bin> makeGeometricBins(int64_t binCount)
{
    std::vector<stats::Bin> bins;
    Count count = 1ull << 40;
    for (int64_t i = 0; i < binCount; ++i) {
        bins.push_back(stats::Bin{.label = static_cast<Label>(i) * 10, .count = count});
        count = count / 2 + 1;
    }
    return bins;
}

//-------------------------------------------------------------------------

static void BM_SampleVotesPerStory(benchmark::State& state)
{
    const auto sampler = stats::HistogramSampler::fromBins(
        io::HistogramReader::readFile(kTestDataPath / "votes_per_story.dat"), 10);
    process::RNG rng{42};

    for (auto _ : state) {
        benchmark::DoNotOptimize(sampler.sample(rng));
    }
}

BENCHMARK(BM_SampleVotesPerStory);

//-------------------------------------------------------------------------

static void BM_SampleByBinCount(benchmark::State& state)
{
    const auto sampler = stats::HistogramSampler::fromBins(makeGeometricBins(state.range(0)), 10);
    process::RNG rng{42};

    for (auto _ : state) {
        benchmark::DoNotOptimize(sampler.sample(rng));
    }
    state.SetComplexityN(state.range(0));
}

BENCHMARK(BM_SampleByBinCount)->RangeMultiplier(4)->Range(4, 4096)->Complexity();

//-------------------------------------------------------------------------

static void BM_Construct(benchmark::State& state)
{
    const auto bins = makeGeometricBins(state.range(0));

    for (auto _ : state) {
        benchmark::DoNotOptimize(stats::HistogramSampler::fromBins(bins, 10));
    }
}

BENCHMARK(BM_Construct)->RangeMultiplier(8)->Range(8, 4096);

//-------------------------------------------------------------------------

BENCHMARK_MAIN();

//-------------------------------------------------------------------------
