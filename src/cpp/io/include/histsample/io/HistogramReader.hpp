/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "histsample/stats/HistogramSampler.hpp"

#include <pugixml.hpp>

#include <istream>

//-------------------------------------------------------------------------

namespace histsample::io
{

//-------------------------------------------------------------------------

/**
 * Loads histograms from
 *  - `.dat` text, one `<label> <count>` pair per line (blank lines and
 *    lines starting with '#' are ignored);
 *  - XML, a `Histogram` node with a required `binWidth` attribute and the
 *    bins either inline as `<Bin label=".." count=".."/>` children or in a
 *    `.dat` file named by the `file` attribute.
 *
 * Malformed content raises InvalidInput, unreadable files raise
 * std::runtime_error.
 */
class HistogramReader
{
public:
    [[nodiscard]] static std::vector<stats::Bin> parse(std::istream& is, std::string_view name);
    [[nodiscard]] static std::vector<stats::Bin> readFile(const fs::path& path);

    // Relative `file` attributes are resolved against baseDir.
    [[nodiscard]] static stats::HistogramSamplerDesc fromXML(
        pugi::xml_node node, const fs::path& baseDir = {});

    // Reads the `Histogram` node at the root of an XML config file.
    [[nodiscard]] static stats::HistogramSamplerDesc loadConfig(const fs::path& path);
};

//-------------------------------------------------------------------------

}  // namespace histsample::io

//-------------------------------------------------------------------------
