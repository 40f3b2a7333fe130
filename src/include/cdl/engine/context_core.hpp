/**
\file
\brief  Defines the cdl::engine::ContextCore class.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_CONTEXT_CORE_HPP
#define CDL_ENGINE_CONTEXT_CORE_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"

#include "cdl/engine/execution.hpp"
#include "cdl/engine/execution_options.hpp"
#include "cdl/engine/instance_runtime.hpp"
#include "cdl/engine/registry.hpp"
#include "cdl/engine/signal_table.hpp"
#include "cdl/model.hpp"

#ifdef _MSC_VER
#   pragma warning(push, 0)
#endif
#include <state.pb.h>
#ifdef _MSC_VER
#   pragma warning(pop)
#endif


namespace cdl
{
namespace engine
{


/**
\brief  The runtime of one level of a block hierarchy.

This class does the actual work of an ExecutionContext, without validation.
The root context of a model has the empty base path; a nested context,
which runs a composite child, has the path of that child.

The context holds the signals of its own block's connectors and of its
children's connectors.  The signals inside a composite child are held by the
child's nested context, and all functions that take a path delegate to the
nested context where appropriate.
*/
class ContextCore : boost::noncopyable
{
public:
    ContextCore(
        std::shared_ptr<const cdl::model::BlockDescription> block,
        std::shared_ptr<const ImplementationRegistry> registry,
        const ExecutionOptions& options,
        const std::string& basePath);

    ~ContextCore();

    const cdl::model::BlockDescription& Block() const CDL_NOEXCEPT;
    const std::string& BasePath() const CDL_NOEXCEPT;
    ContextState State() const CDL_NOEXCEPT;
    cdl::model::StepCount StepCount() const CDL_NOEXCEPT;
    int EventDepth() const CDL_NOEXCEPT;
    const boost::optional<FaultInfo>& Fault() const CDL_NOEXCEPT;

    /// The paths of the instances of this level, in evaluation order.
    std::vector<std::string> EvaluationOrder() const;

    /**
    \brief  Computes the evaluation order, creates the instance runtimes and
            seeds start values.

    The block is assumed to be valid.
    */
    void Initialize();

    /// Evaluates every instance once.  See ExecutionContext::Step().
    void Step();

    /// Discards all runtime state.
    void Reset();

    /**
    \brief  Sets an input of this level's block, with no checks except that
            the value is converted to the input's data type.
    */
    void SetBoundaryInput(
        const std::string& connector,
        const cdl::model::ScalarValue& value,
        cdl::model::StepCount step);

    /// See ExecutionContext::SetInput().
    void SetExternalInput(
        const std::string& path,
        const std::string& connector,
        const cdl::model::ScalarValue& value);

    /**
    \brief  Returns the description of a connector anywhere in the hierarchy.
    \throws std::out_of_range if there is no such instance or connector.
    */
    const cdl::model::ConnectorDescription& FindConnector(
        const std::string& path,
        const std::string& connector) const;

    /// Returns whether `path` refers to an elementary instance in the hierarchy.
    bool IsElementaryInstance(const std::string& path) const;

    /// Returns the value of a signal anywhere in the hierarchy, or null.
    const cdl::model::ScalarValue* FindValue(
        const std::string& path,
        const std::string& connector) const;

    /// Returns the history of a signal anywhere in the hierarchy.
    std::vector<HistoryEntry> History(
        const std::string& path,
        const std::string& connector) const;

    /// Adds the signals and block states of the whole hierarchy to `target`.
    void SaveSnapshot(cdlproto::state::Snapshot& target) const;

    /**
    \brief  Replaces the signals, step counters and block states of the whole
            hierarchy with the ones in `source`.

    Entries for paths that are not found are ignored, so the caller should
    check them first.
    */
    void LoadSnapshot(const cdlproto::state::Snapshot& source);

private:
    // Where the value of an input (or a composite output) comes from.
    struct Binding
    {
        std::string connector;
        SignalTable::Key source;
        cdl::model::DataType dataType;
    };

    static const std::size_t NO_INSTANCE = static_cast<std::size_t>(-1);

    // Returns the index of the child with the given path, or NO_INSTANCE.
    std::size_t DirectChildIndex(const std::string& path) const;

    // If `path` lies inside a composite child, returns its nested context.
    ContextCore* DescendantOwner(const std::string& path) const;

    void SeedStartValues();
    void EvaluateInstance(std::size_t index, cdl::model::StepCount step);
    void PropagateOutputs(cdl::model::StepCount step);
    void EnterFaultedState(
        std::size_t current,
        cdl::model::StepCount step,
        const std::string& message,
        const std::string* errorPath);

    std::shared_ptr<const cdl::model::BlockDescription> m_block;
    std::shared_ptr<const ImplementationRegistry> m_registry;
    ExecutionOptions m_options;
    std::string m_basePath;

    ContextState m_state;
    cdl::model::StepCount m_stepCount;
    int m_eventDepth;
    boost::optional<FaultInfo> m_fault;
    SignalTable m_signals;

    std::vector<std::unique_ptr<InstanceRuntime>> m_instances;
    std::map<std::string, std::size_t> m_childIndexes;
    std::vector<std::size_t> m_order;
    std::vector<std::vector<Binding>> m_inputBindings;
    std::vector<Binding> m_outputBindings;
};


}} // namespace
#endif // header guard
