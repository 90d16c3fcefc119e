/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/io/HistogramReader.hpp"
#include "histsample/process/RNG.hpp"
#include "histsample/stats/HistogramComparison.hpp"
#include "histsample/stats/HistogramSampler.hpp"
#include "histsample/util/InvalidInput.hpp"
#include "histsample/util/log.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <CLI/CLI.hpp>
#include <magic_enum.hpp>

#include <map>

namespace bacc = boost::accumulators;

using namespace histsample;

//-------------------------------------------------------------------------

enum class OutputFormat : uint32_t
{
    plain,
    csv
};

//-------------------------------------------------------------------------

static void printSamples(
    const stats::HistogramSampler& sampler,
    process::RNG& rng,
    uint64_t count,
    OutputFormat format)
{
    if (format == OutputFormat::csv) {
        fmt::print("index,value\n");
    }
    for (uint64_t i = 0; count == 0 || i < count; ++i) {
        const uint64_t value = sampler.sample(rng);
        if (format == OutputFormat::csv) {
            fmt::print("{},{}\n", i, value);
        } else {
            fmt::print("{}\n", value);
        }
    }
}

//-------------------------------------------------------------------------

static void printReport(
    const stats::HistogramSampler& sampler, process::RNG& rng, uint64_t count)
{
    stats::EmpiricalHistogram observed{sampler.binWidth()};
    bacc::accumulator_set<double, bacc::stats<bacc::tag::mean, bacc::tag::variance>> acc;

    for (uint64_t i = 0; i < count; ++i) {
        const uint64_t value = sampler.sample(rng);
        observed.record(value);
        acc(static_cast<double>(value));
    }

    const auto rows = stats::compare(sampler, observed);
    fmt::print("{}", stats::formatComparison(rows));
    fmt::print(
        "samples: {}, mean: {:.3f}, variance: {:.3f}, values in [0, {})\n",
        count, bacc::mean(acc), bacc::variance(acc), sampler.upperBound());
}

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"histsample: sample values from a rounded histogram"};

    CLI::Option_group* inputGroup = app.add_option_group("Input");

    fs::path config;
    inputGroup->add_option("-f,--config-file", config, "XML histogram config")
        ->check(CLI::ExistingFile);

    fs::path dataFile;
    auto optDataFile = inputGroup->add_option(
        "-d,--data-file", dataFile, "Histogram data file with '<label> <count>' lines")
        ->check(CLI::ExistingFile);

    inputGroup->require_option(1);

    uint64_t binWidth{};
    app.add_option("-w,--bin-width", binWidth, "Bin width of the data file")
        ->needs(optDataFile);

    uint64_t count{10};
    app.add_option("-n,--count", count, "Number of samples, 0 for an endless stream")
        ->capture_default_str();

    uint64_t seed{std::mt19937_64::default_seed};
    app.add_option("-s,--seed", seed, "Generator seed")
        ->capture_default_str();

    std::map<std::string, OutputFormat> formats;
    for (auto [value, name] : magic_enum::enum_entries<OutputFormat>()) {
        formats.emplace(name, value);
    }
    OutputFormat format{OutputFormat::plain};
    app.add_option("--format", format, "Output format of sampled values")
        ->transform(CLI::CheckedTransformer(formats, CLI::ignore_case));

    bool report{};
    app.add_flag(
        "--report", report, "Print observed against expected bin proportions instead of values");

    bool verbose{};
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    fs::path logFile;
    app.add_option("--log-file", logFile, "Write logs to this file instead of stderr");

    CLI11_PARSE(app, argc, argv);

    try {
        if (!logFile.empty()) {
            log::redirectToFile(logFile);
        }
        log::setLevel(verbose ? spdlog::level::debug : spdlog::level::info);

        stats::HistogramSamplerDesc desc;
        if (!config.empty()) {
            desc = io::HistogramReader::loadConfig(config);
        }
        else {
            if (binWidth == 0) {
                throw InvalidInput{"--bin-width is required with --data-file and must be > 0"};
            }
            desc = stats::HistogramSamplerDesc{
                .bins = io::HistogramReader::readFile(dataFile),
                .binWidth = binWidth
            };
        }
        const stats::HistogramSampler sampler{std::move(desc)};

        log::logger().info(
            "Sampling {} values with seed {}",
            count == 0 ? std::string{"unbounded"} : std::to_string(count), seed);

        process::RNG rng{seed};
        if (report) {
            if (count == 0) {
                throw InvalidInput{"--report needs a finite --count"};
            }
            printReport(sampler, rng, count);
        }
        else {
            printSamples(sampler, rng, count, format);
        }
    }
    catch (const std::exception& e) {
        log::logger().error("{}", e.what());
        return 1;
    }

    return 0;
}

//-------------------------------------------------------------------------
