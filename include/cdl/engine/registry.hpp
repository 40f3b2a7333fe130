/**
\file
\brief  Defines the elementary block implementation interface and registry.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_REGISTRY_HPP
#define CDL_ENGINE_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cdl/model.hpp"


namespace cdl
{
namespace engine
{


/**
\brief  An interface for the behaviour of elementary blocks.

One object is created for each instance of an elementary block when an
execution context is initialised, and it lives as long as the context does.
Objects which carry state between steps (e.g. integrators, delays) should
override SaveState() and RestoreState() so that they can be included in
snapshots.
*/
class Implementation
{
public:
    /**
    \brief  Called once, when the owning execution context is initialised.

    `parameters` contains the bound value of every parameter of the block.
    The default implementation does nothing.
    */
    virtual void Initialize(const cdl::model::ValueMap& parameters);

    /**
    \brief  Computes the block's outputs from its inputs.

    `inputs` contains a value for every input of the block.  The function
    should insert a value into `outputs` for each of the block's outputs.

    Any exception thrown by this function will cause the execution context
    to enter the faulted state, and it will then be propagated unchanged to
    the caller of cdl::engine::ExecutionContext::Step().
    */
    virtual void Evaluate(
        const cdl::model::ValueMap& parameters,
        const cdl::model::ValueMap& inputs,
        cdl::model::ValueMap& outputs) = 0;

    /**
    \brief  Returns the internal state of the block.

    The default implementation returns an empty map.
    */
    virtual cdl::model::ValueMap SaveState() const;

    /**
    \brief  Restores state previously returned by SaveState().

    The default implementation does nothing.
    */
    virtual void RestoreState(const cdl::model::ValueMap& state);

    virtual ~Implementation() = default;
};


/// A function that creates a new Implementation object.
typedef std::function<std::unique_ptr<Implementation>()> ImplementationFactory;


/// A function that computes the outputs of a stateless block.
typedef std::function<void(
        const cdl::model::ValueMap& parameters,
        const cdl::model::ValueMap& inputs,
        cdl::model::ValueMap& outputs)>
    EvaluationFunction;


/**
\brief  Maps elementary block type names to implementations.

The registry is an explicit value which is passed to the validator and to
every execution context.  It is not modified by them, so the same registry
may be used by several contexts at once.
*/
class ImplementationRegistry
{
public:
    /**
    \brief  Registers a factory for the given block type name.

    \throws std::invalid_argument
        If `typeName` is empty, `factory` is empty, or a factory has already
        been registered under `typeName`.
    */
    void Register(const std::string& typeName, ImplementationFactory factory);

    /**
    \brief  Registers a stateless block whose behaviour is given by a
            single function.

    \throws std::invalid_argument
        Under the same circumstances as Register().
    */
    void RegisterFunction(const std::string& typeName, EvaluationFunction function);

    /// Returns whether there is an implementation for the given type name.
    bool Contains(const std::string& typeName) const CDL_NOEXCEPT;

    /// Returns the names of all registered types, in lexicographical order.
    std::vector<std::string> TypeNames() const;

    /**
    \brief  Creates a new implementation object for the given type name.

    \throws std::out_of_range
        If there is no implementation registered under `typeName`.
    \throws std::logic_error
        If the factory returned a null pointer.
    */
    std::unique_ptr<Implementation> Create(const std::string& typeName) const;

private:
    std::map<std::string, ImplementationFactory> m_factories;
};


}} // namespace
#endif // header guard
