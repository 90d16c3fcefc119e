/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/process/RNG.hpp"
#include "histsample/process/UrbgRandomSource.hpp"
#include "histsample/stats/HistogramSampler.hpp"
#include "histsample/util/InvalidInput.hpp"
#include "MockRandomSource.hpp"
#include "formatting.hpp"

#include <fmt/ranges.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <numeric>
#include <thread>

//-------------------------------------------------------------------------

using namespace histsample;
using namespace histsample::stats;

using namespace testing;

//-------------------------------------------------------------------------

static const std::vector<Bin> s_smallBins{{0, 100}, {10, 80}, {20, 40}, {30, 30}};
static constexpr uint64_t s_smallWidth = 10;

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, StoresSortedBins)
{
    const auto sampler = HistogramSampler::fromBins({{20, 40}, {0, 100}, {30, 30}, {10, 80}}, 10);

    EXPECT_THAT(sampler.bins(), ElementsAreArray(s_smallBins));
    EXPECT_EQ(sampler.binWidth(), 10);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, TotalWeightIsSumOfCounts)
{
    const auto sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);

    const uint64_t sum = std::accumulate(
        s_smallBins.begin(), s_smallBins.end(), uint64_t{},
        [](uint64_t acc, const Bin& bin) { return acc + bin.count; });

    EXPECT_EQ(sampler.totalWeight(), 250);
    EXPECT_EQ(sampler.totalWeight(), sum);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, BinDrawSpansTotalWeight)
{
    const auto sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);
    MockRandomSource source;

    InSequence seq;
    EXPECT_CALL(source, uniformBelow(250)).WillOnce(Return(0));
    EXPECT_CALL(source, uniformBelow(5)).WillOnce(Return(0));

    EXPECT_EQ(sampler.sample(source), 0);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, TwoDrawsPerSample)
{
    const auto sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);
    MockRandomSource source;

    EXPECT_CALL(source, uniformBelow(_)).Times(2 * 3).WillRepeatedly(Return(1));

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(sampler.sample(source), 1);
    }
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, EmptyBinsAreNeverSelected)
{
    const auto sampler = HistogramSampler::fromBins({{0, 0}, {10, 5}, {20, 0}, {30, 5}}, 10);
    MockRandomSource source;

    InSequence seq;
    EXPECT_CALL(source, uniformBelow(10)).WillOnce(Return(0));
    EXPECT_CALL(source, uniformBelow(10)).WillOnce(Return(0));
    EXPECT_CALL(source, uniformBelow(10)).WillOnce(Return(4));
    EXPECT_CALL(source, uniformBelow(10)).WillOnce(Return(0));
    EXPECT_CALL(source, uniformBelow(10)).WillOnce(Return(5));
    EXPECT_CALL(source, uniformBelow(10)).WillOnce(Return(0));
    EXPECT_CALL(source, uniformBelow(10)).WillOnce(Return(9));
    EXPECT_CALL(source, uniformBelow(10)).WillOnce(Return(9));

    EXPECT_EQ(sampler.sample(source), 5);
    EXPECT_EQ(sampler.sample(source), 5);
    EXPECT_EQ(sampler.sample(source), 25);
    EXPECT_EQ(sampler.sample(source), 34);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, OddWidthZeroBinIsTruncated)
{
    const auto sampler = HistogramSampler::fromBins({{0, 2}, {5, 3}}, 5);
    MockRandomSource source;

    InSequence seq;
    EXPECT_CALL(source, uniformBelow(5)).WillOnce(Return(1));
    EXPECT_CALL(source, uniformBelow(2)).WillOnce(Return(1));
    EXPECT_CALL(source, uniformBelow(5)).WillOnce(Return(2));
    EXPECT_CALL(source, uniformBelow(5)).WillOnce(Return(0));
    EXPECT_CALL(source, uniformBelow(5)).WillOnce(Return(4));
    EXPECT_CALL(source, uniformBelow(5)).WillOnce(Return(4));

    EXPECT_EQ(sampler.sample(source), 1);
    EXPECT_EQ(sampler.sample(source), 2);
    EXPECT_EQ(sampler.sample(source), 6);
    EXPECT_EQ(sampler.upperBound(), 7);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, UnitWidthAcceptsEmptyZeroBin)
{
    const auto sampler = HistogramSampler::fromBins({{0, 0}, {1, 3}, {2, 1}}, 1);
    MockRandomSource source;

    InSequence seq;
    EXPECT_CALL(source, uniformBelow(4)).WillOnce(Return(0));
    EXPECT_CALL(source, uniformBelow(1)).WillOnce(Return(0));
    EXPECT_CALL(source, uniformBelow(4)).WillOnce(Return(3));
    EXPECT_CALL(source, uniformBelow(1)).WillOnce(Return(0));

    EXPECT_EQ(sampler.sample(source), 0);
    EXPECT_EQ(sampler.sample(source), 1);
    EXPECT_EQ(sampler.upperBound(), 2);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, SourceFailurePropagates)
{
    const auto sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);
    MockRandomSource source;

    EXPECT_CALL(source, uniformBelow(_)).WillOnce(Throw(std::runtime_error{"exhausted"}));

    EXPECT_THROW((void)sampler.sample(source), std::runtime_error);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, UpperBound)
{
    EXPECT_EQ(HistogramSampler::fromBins(s_smallBins, s_smallWidth).upperBound(), 35);
    EXPECT_EQ(HistogramSampler::fromBins({{0, 3}, {10, 0}, {20, 0}}, 10).upperBound(), 5);
    EXPECT_EQ(HistogramSampler::fromBins({{0, 0}, {40, 2}}, 20).upperBound(), 50);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, Probability)
{
    const auto sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);

    EXPECT_DOUBLE_EQ(sampler.probability(0), 0.4);
    EXPECT_DOUBLE_EQ(sampler.probability(10), 0.32);
    EXPECT_DOUBLE_EQ(sampler.probability(30), 0.12);
    EXPECT_DOUBLE_EQ(sampler.probability(5), 0.0);
    EXPECT_DOUBLE_EQ(sampler.probability(40), 0.0);
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, SameSeedSameSequence)
{
    const auto sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);

    process::RNG rng1{42}, rng2{42}, rng3{43};
    std::vector<uint64_t> seq1, seq2, seq3;
    for (int i = 0; i < 1000; ++i) {
        seq1.push_back(sampler.sample(rng1));
        seq2.push_back(sampler.sample(rng2));
        seq3.push_back(sampler.sample(rng3));
    }

    EXPECT_EQ(seq1, seq2);
    EXPECT_NE(seq1, seq3);
    EXPECT_EQ(rng1.callCount(), rng2.callCount());
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, AcceptsStandardGenerators)
{
    const auto sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);

    std::mt19937 rng32{7};
    std::mt19937_64 rng64{7};
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(sampler.sample(rng32), sampler.upperBound());
        EXPECT_LT(sampler.sample(rng64), sampler.upperBound());
    }
}

//-------------------------------------------------------------------------

TEST(HistogramSamplerTest, SharedAcrossThreads)
{
    static constexpr int kThreadCount = 4;
    static constexpr int kSampleCount = 10'000;
    static constexpr uint64_t kSeed = 1337;

    const auto sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);

    auto draw = [&sampler] {
        process::RNG rng{kSeed};
        std::vector<uint64_t> values;
        values.reserve(kSampleCount);
        for (int i = 0; i < kSampleCount; ++i) {
            values.push_back(sampler.sample(rng));
        }
        return values;
    };

    const auto reference = draw();

    std::vector<std::vector<uint64_t>> results(kThreadCount);
    {
        std::vector<std::jthread> threads;
        for (auto& result : results) {
            threads.emplace_back([&result, &draw] { result = draw(); });
        }
    }

    for (const auto& result : results) {
        EXPECT_EQ(result, reference);
    }
}

//-------------------------------------------------------------------------

// Forwards to a seeded generator and remembers the draws of the last sample.
class RecordingSource : public RandomSource
{
public:
    explicit RecordingSource(uint64_t seed) : m_rng{seed}, m_source{m_rng} {}

    virtual uint64_t uniformBelow(uint64_t bound) override
    {
        if (m_draws.size() == 2) {
            m_draws.clear();
        }
        m_draws.push_back(m_source.uniformBelow(bound));
        return m_draws.back();
    }

    [[nodiscard]] uint64_t binDraw() const { return m_draws.at(0); }

private:
    process::RNG m_rng;
    process::UrbgRandomSource<process::RNG> m_source;
    std::vector<uint64_t> m_draws;
};

TEST(HistogramSamplerTest, ValuesStayInSelectedBin)
{
    const auto sampler = HistogramSampler::fromBins(
        {{0, 16724}, {10, 16393}, {20, 4601}, {30, 1707}, {40, 680}, {60, 0}, {70, 60}}, 10);
    RecordingSource source{2024};

    for (int i = 0; i < 100'000; ++i) {
        const uint64_t value = sampler.sample(source);

        // Reference bin choice by linear scan over running counts.
        uint64_t running = 0;
        const Bin* selected = nullptr;
        for (const Bin& bin : sampler.bins()) {
            running += bin.count;
            if (running > source.binDraw()) {
                selected = &bin;
                break;
            }
        }
        ASSERT_NE(selected, nullptr);
        ASSERT_GT(selected->count, 0);
        ASSERT_TRUE(sampler.rangeOf(*selected).contains(value))
            << fmt::format("{} drawn from bin {}", value, *selected);
        ASSERT_LT(value, sampler.upperBound());
    }
}

//-------------------------------------------------------------------------

struct ScriptedDrawParams
{
    uint64_t binDraw;
    uint64_t valueBound;
    uint64_t valueDraw;
    uint64_t expected;
};

void PrintTo(const ScriptedDrawParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.binDraw = {}, .valueBound = {}, .valueDraw = {}, .expected = {}}}",
        params.binDraw, params.valueBound, params.valueDraw, params.expected);
}

//-------------------------------------------------------------------------

struct ScriptedDrawTest : TestWithParam<ScriptedDrawParams>
{
    HistogramSampler sampler = HistogramSampler::fromBins(s_smallBins, s_smallWidth);
    MockRandomSource source;
};

TEST_P(ScriptedDrawTest, ReturnsExpectedValue)
{
    const auto [binDraw, valueBound, valueDraw, expected] = GetParam();

    InSequence seq;
    EXPECT_CALL(source, uniformBelow(250)).WillOnce(Return(binDraw));
    EXPECT_CALL(source, uniformBelow(valueBound)).WillOnce(Return(valueDraw));

    EXPECT_EQ(sampler.sample(source), expected);
}

INSTANTIATE_TEST_SUITE_P(
    HistogramSamplerTests,
    ScriptedDrawTest,
    Values(
        ScriptedDrawParams{.binDraw = 0, .valueBound = 5, .valueDraw = 3, .expected = 3},
        ScriptedDrawParams{.binDraw = 99, .valueBound = 5, .valueDraw = 4, .expected = 4},
        ScriptedDrawParams{.binDraw = 100, .valueBound = 10, .valueDraw = 0, .expected = 5},
        ScriptedDrawParams{.binDraw = 179, .valueBound = 10, .valueDraw = 9, .expected = 14},
        ScriptedDrawParams{.binDraw = 180, .valueBound = 10, .valueDraw = 7, .expected = 22},
        ScriptedDrawParams{.binDraw = 219, .valueBound = 10, .valueDraw = 0, .expected = 15},
        ScriptedDrawParams{.binDraw = 220, .valueBound = 10, .valueDraw = 4, .expected = 29},
        ScriptedDrawParams{.binDraw = 249, .valueBound = 10, .valueDraw = 9, .expected = 34}));

//-------------------------------------------------------------------------

struct RejectedInputParams
{
    std::string_view name;
    std::vector<Bin> bins;
    uint64_t binWidth;
};

void PrintTo(const RejectedInputParams& params, std::ostream* os)
{
    *os << fmt::format("{}: {} with binWidth {}", params.name, params.bins, params.binWidth);
}

//-------------------------------------------------------------------------

struct RejectedInputTest : TestWithParam<RejectedInputParams> {};

TEST_P(RejectedInputTest, ThrowsInvalidInput)
{
    const auto& [name, bins, binWidth] = GetParam();

    EXPECT_THROW((void)HistogramSampler::fromBins(bins, binWidth), InvalidInput);
}

INSTANTIATE_TEST_SUITE_P(
    HistogramSamplerTests,
    RejectedInputTest,
    Values(
        RejectedInputParams{
            .name = "zero width", .bins = {{0, 1}, {10, 2}}, .binWidth = 0
        },
        RejectedInputParams{
            .name = "no bins", .bins = {}, .binWidth = 10
        },
        RejectedInputParams{
            .name = "all empty", .bins = {{0, 0}, {10, 0}, {20, 0}}, .binWidth = 10
        },
        RejectedInputParams{
            .name = "duplicate label", .bins = {{0, 1}, {10, 2}, {10, 3}}, .binWidth = 10
        },
        RejectedInputParams{
            .name = "misaligned label", .bins = {{0, 1}, {15, 2}}, .binWidth = 10
        },
        RejectedInputParams{
            .name = "count overflow",
            .bins = {{0, std::numeric_limits<uint64_t>::max()}, {10, 1}},
            .binWidth = 10
        },
        RejectedInputParams{
            .name = "count on empty zero bin", .bins = {{0, 1}, {1, 2}}, .binWidth = 1
        },
        RejectedInputParams{
            .name = "label at domain end",
            .bins = {{0, 1}, {std::numeric_limits<uint64_t>::max() / 2 * 2, 1}},
            .binWidth = 2
        }));

TEST(HistogramSamplerTest, InvalidInputIsInvalidArgument)
{
    EXPECT_THROW((void)HistogramSampler::fromBins({}, 10), std::invalid_argument);
}

//-------------------------------------------------------------------------
