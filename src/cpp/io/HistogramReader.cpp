/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "histsample/io/HistogramReader.hpp"

#include "histsample/util/InvalidInput.hpp"
#include "histsample/util/log.hpp"
#include "histsample/util/util.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <fstream>

//-------------------------------------------------------------------------

namespace histsample::io
{

//-------------------------------------------------------------------------

namespace
{

uint64_t requireUnsignedAttribute(
    pugi::xml_node node, const char* name, const char* ctx)
{
    pugi::xml_attribute attr = node.attribute(name);
    if (!attr) {
        throw InvalidInput{fmt::format(
            "{}: <{}> is missing required attribute '{}'", ctx, node.name(), name)};
    }
    if (auto value = util::parseUnsigned(attr.as_string())) {
        return *value;
    }
    throw InvalidInput{fmt::format(
        "{}: attribute '{}' of <{}> should be a non-negative integer, was '{}'",
        ctx, name, node.name(), attr.as_string())};
}

}  // namespace

//-------------------------------------------------------------------------

std::vector<stats::Bin> HistogramReader::parse(std::istream& is, std::string_view name)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::vector<stats::Bin> bins;
    std::string line;
    for (size_t lineNumber = 1; std::getline(is, line); ++lineNumber) {
        const auto tokens = util::tokenize(line);
        if (tokens.empty() || boost::starts_with(tokens.front(), "#")) {
            continue;
        }
        std::optional<uint64_t> label, count;
        if (tokens.size() == 2) {
            label = util::parseUnsigned(tokens[0]);
            count = util::parseUnsigned(tokens[1]);
        }
        if (!label || !count) {
            throw InvalidInput{fmt::format(
                "{}: {}:{}: expected '<label> <count>', got '{}'", ctx, name, lineNumber, line)};
        }
        bins.push_back(stats::Bin{.label = *label, .count = *count});
    }
    if (is.bad()) {
        throw std::runtime_error{fmt::format("{}: error while reading {}", ctx, name)};
    }

    log::logger().debug("Read {} bins from {}", bins.size(), name);

    return bins;
}

//-------------------------------------------------------------------------

std::vector<stats::Bin> HistogramReader::readFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::ifstream file{path};
    if (!file) {
        throw std::runtime_error{fmt::format("{}: cannot open {}", ctx, path.string())};
    }
    return parse(file, path.string());
}

//-------------------------------------------------------------------------

stats::HistogramSamplerDesc HistogramReader::fromXML(pugi::xml_node node, const fs::path& baseDir)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    stats::HistogramSamplerDesc desc{
        .binWidth = requireUnsignedAttribute(node, "binWidth", ctx)
    };

    const bool hasInlineBins = static_cast<bool>(node.child("Bin"));

    if (pugi::xml_attribute file = node.attribute("file")) {
        if (hasInlineBins) {
            throw InvalidInput{fmt::format(
                "{}: <{}> has both a 'file' attribute and <Bin> children", ctx, node.name())};
        }
        fs::path path{file.as_string()};
        if (path.is_relative()) {
            path = baseDir / path;
        }
        desc.bins = readFile(path);
    }
    else {
        for (pugi::xml_node binNode : node.children("Bin")) {
            desc.bins.push_back(stats::Bin{
                .label = requireUnsignedAttribute(binNode, "label", ctx),
                .count = requireUnsignedAttribute(binNode, "count", ctx)
            });
        }
    }

    return desc;
}

//-------------------------------------------------------------------------

stats::HistogramSamplerDesc HistogramReader::loadConfig(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result parseResult = doc.load_file(path.c_str());
    if (!parseResult) {
        throw std::runtime_error{fmt::format(
            "{}: failed to parse {} at offset {}: {}",
            ctx, path.string(), parseResult.offset, parseResult.description())};
    }

    pugi::xml_node node = doc.child("Histogram");
    if (!node) {
        throw InvalidInput{fmt::format(
            "{}: {} has no <Histogram> root node", ctx, path.string())};
    }

    return fromXML(node, path.parent_path());
}

//-------------------------------------------------------------------------

}  // namespace histsample::io

//-------------------------------------------------------------------------
