/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/engine/execution_options.hpp"

#include <stdexcept>
#include <utility>

#include "boost/property_tree/info_parser.hpp"
#include "boost/property_tree/ptree.hpp"

#include "cdl/error.hpp"


namespace cdl
{
namespace engine
{


namespace
{
    void ParseExecutionNode(
        const boost::property_tree::ptree& node,
        ExecutionOptions& options)
    {
        for (const auto& entry : node) {
            if (entry.first == "allowNonFiniteValues") {
                options.allowNonFiniteValues = entry.second.get_value<bool>();
            } else if (entry.first == "historyDepth") {
                const auto depth = entry.second.get_value<int>();
                if (depth < 0) {
                    throw std::runtime_error(
                        "Invalid history depth: " + entry.second.data());
                }
                options.historyDepth = static_cast<std::size_t>(depth);
            } else {
                throw std::runtime_error(
                    "Unknown entry in 'execution' section: " + entry.first);
            }
        }
    }


    void ParseLogNode(
        const boost::property_tree::ptree& node,
        EngineConfig& config)
    {
        for (const auto& entry : node) {
            if (entry.first == "level") {
                try {
                    config.logLevel = cdl::log::ParseLevel(entry.second.data());
                } catch (const std::invalid_argument& e) {
                    throw std::runtime_error(e.what());
                }
            } else {
                throw std::runtime_error(
                    "Unknown entry in 'log' section: " + entry.first);
            }
        }
    }


    EngineConfig ParseEngineConfigTree(const boost::property_tree::ptree& tree)
    {
        EngineConfig config;
        try {
            for (const auto& section : tree) {
                if (section.first == "execution") {
                    ParseExecutionNode(section.second, config.execution);
                } else if (section.first == "log") {
                    ParseLogNode(section.second, config);
                } else {
                    throw std::runtime_error(
                        "Unknown configuration section: " + section.first);
                }
            }
        } catch (const boost::property_tree::ptree_error& e) {
            throw std::runtime_error(
                std::string("Invalid engine configuration: ") + e.what());
        }
        return config;
    }
}


EngineConfig ParseEngineConfig(std::istream& stream)
{
    boost::property_tree::ptree tree;
    try {
        boost::property_tree::read_info(stream, tree);
    } catch (const boost::property_tree::ptree_error& e) {
        throw std::runtime_error(
            std::string("Error parsing engine configuration: ") + e.what());
    }
    return ParseEngineConfigTree(tree);
}


EngineConfig ParseEngineConfigFile(const std::string& path)
{
    boost::property_tree::ptree tree;
    try {
        boost::property_tree::read_info(path, tree);
    } catch (const boost::property_tree::ptree_error& e) {
        throw std::runtime_error(
            "Error reading engine configuration file '" + path + "': " + e.what());
    }
    return ParseEngineConfigTree(tree);
}


void AddLogSink(const EngineConfig& config, std::shared_ptr<std::ostream> stream)
{
    CDL_INPUT_CHECK(stream != nullptr);
    cdl::log::AddSink(std::move(stream), config.logLevel);
}


}} // namespace
