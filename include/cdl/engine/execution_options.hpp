/**
\file
\brief  Defines the cdl::engine::ExecutionOptions class and engine
        configuration files.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_EXECUTION_OPTIONS_HPP
#define CDL_ENGINE_EXECUTION_OPTIONS_HPP

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "cdl/log.hpp"


namespace cdl
{
namespace engine
{


/// Options that control how an ExecutionContext runs a model.
struct ExecutionOptions
{
    /**
    \brief  Whether blocks may produce NaN or infinite real values.

    If this is `false` (the default), such a value causes the step to fail
    with cdl::error::exec_error::non_finite_value.
    */
    bool allowNonFiniteValues = false;

    /**
    \brief  The number of values to keep in the history of each signal.

    If this is zero (the default), no history is kept.
    */
    std::size_t historyDepth = 0;
};


/// The contents of an engine configuration file.
struct EngineConfig
{
    /// Options for execution contexts.
    ExecutionOptions execution;

    /// The minimum level of messages to log.  Applied by AddLogSink().
    cdl::log::Level logLevel = cdl::log::warning;
};


/**
\brief  Reads engine configuration from a stream in the Boost INFO format.

The file may contain the following (all entries are optional):
~~~
execution
{
    allowNonFiniteValues false
    historyDepth 0
}
log
{
    level warning
}
~~~

\throws std::runtime_error
    If the input cannot be parsed, contains unknown entries, or contains
    invalid values.
*/
EngineConfig ParseEngineConfig(std::istream& stream);


/**
\brief  Reads engine configuration from a file.
\see ParseEngineConfig()
*/
EngineConfig ParseEngineConfigFile(const std::string& path);


/**
\brief  Adds a log sink which filters messages according to `config`.

This is cdl::log::AddSink() with the level given by `config.logLevel`, and
it replaces the default sink in the same way.
*/
void AddLogSink(const EngineConfig& config, std::shared_ptr<std::ostream> stream);


}} // namespace
#endif // header guard
