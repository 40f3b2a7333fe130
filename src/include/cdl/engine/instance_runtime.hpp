/**
\file
\brief  Defines the cdl::engine::InstanceRuntime class.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_INSTANCE_RUNTIME_HPP
#define CDL_ENGINE_INSTANCE_RUNTIME_HPP

#include <memory>
#include <string>

#include "boost/noncopyable.hpp"

#include "cdl/engine/execution_options.hpp"
#include "cdl/engine/registry.hpp"
#include "cdl/model.hpp"


namespace cdl
{
namespace engine
{

class ContextCore;


/**
\brief  Binds the parameters of a single block instance to values, and
        evaluates it.

An elementary instance is evaluated by an Implementation object obtained
from the registry.  A composite instance is evaluated by running one step of
a nested ContextCore, whose root inputs and outputs are the instance's
inputs and outputs.
*/
class InstanceRuntime : boost::noncopyable
{
public:
    /**
    \brief  Creates and initialises the runtime of an instance.

    For elementary blocks, this creates the implementation and calls its
    Initialize() function with the bound parameters.  For composite blocks,
    this creates and initialises the nested context.

    \throws std::invalid_argument
        If a parameter has no value.
    \throws std::out_of_range
        If an elementary block type is not registered.
    */
    InstanceRuntime(
        const std::string& path,
        std::shared_ptr<const cdl::model::BlockDescription> type,
        const cdl::model::ValueMap& overrides,
        std::shared_ptr<const ImplementationRegistry> registry,
        const ExecutionOptions& options);

    ~InstanceRuntime();

    /// The qualified path of the instance.
    const std::string& Path() const;

    /// The block type.
    const cdl::model::BlockDescription& Type() const;

    /// The bound parameter values.
    const cdl::model::ValueMap& Parameters() const;

    /**
    \brief  Computes the outputs of the instance from its inputs.

    For composite instances, output values that the nested context does not
    have are left out of `outputs`.
    */
    void Evaluate(const cdl::model::ValueMap& inputs, cdl::model::ValueMap& outputs);

    /// The implementation of an elementary instance, or null.
    cdl::engine::Implementation* Implementation() const;

    /// The nested context of a composite instance, or null.
    ContextCore* Nested() const;

private:
    std::string m_path;
    std::shared_ptr<const cdl::model::BlockDescription> m_type;
    cdl::model::ValueMap m_parameters;
    std::unique_ptr<cdl::engine::Implementation> m_implementation;
    std::unique_ptr<ContextCore> m_nested;
};


/**
\brief  Binds every parameter of `type` to its override or default value.

\throws std::invalid_argument
    If a parameter has neither, or if a value has the wrong type.
*/
cdl::model::ValueMap BindParameters(
    const std::string& path,
    const cdl::model::BlockDescription& type,
    const cdl::model::ValueMap& overrides);


}} // namespace
#endif // header guard
