/**
\file
\brief  Defines the cdl::engine::ExecutionContext class and related
        functionality.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_EXECUTION_HPP
#define CDL_ENGINE_EXECUTION_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "boost/optional.hpp"

#include "cdl/config.h"
#include "cdl/engine/execution_options.hpp"
#include "cdl/engine/registry.hpp"
#include "cdl/engine/validation.hpp"
#include "cdl/model.hpp"


namespace cdl
{
namespace engine
{


/// The states of an execution context.
enum class ContextState
{
    /// Not yet initialised (or reset).
    unvalidated,

    /// Initialised, but no steps have been performed.
    initialized,

    /// At least one step has been performed successfully.
    stepping,

    /// A step failed.  Only Reset() and the accessors are allowed.
    faulted,
};


/// A value recorded in the history of a signal.
struct HistoryEntry
{
    /**
    \brief  When the value was written.

    This is the number of the step during which the value was written,
    counting from 1, or, for values written between steps, the number of the
    last completed step.
    */
    cdl::model::StepCount step;

    /// The value.
    cdl::model::ScalarValue value;
};


/// Information about the failure that put a context in the faulted state.
struct FaultInfo
{
    /// The qualified path of the innermost instance that failed.
    std::string instancePath;

    /// The number of the step that failed, counting from 1.
    cdl::model::StepCount step;

    /// The error message.
    std::string message;
};


/// Exception thrown by ExecutionContext::Restore() for an unusable snapshot.
class SnapshotError : public std::runtime_error
{
public:
    explicit SnapshotError(const std::string& whatArg)
        : std::runtime_error(whatArg) { }
};


/**
\brief  Runs one instantiation of a block.

The context owns the values of all signals in the block hierarchy, the
internal state of every instance, the evaluation order of each composite
(which is computed once, by Initialize()), a step counter and an event-scope
counter.  A composite child is run by a nested context of its own, owned by
this one.

The basic usage is:
~~~{.cpp}
cdl::engine::ExecutionContext context(block, registry);
context.Initialize();
context.SetInput("u", 2.0);
context.Step();
const auto y = context.GetOutput("y");
~~~

Stepping is synchronous and single-threaded.  A context must not be used
from several threads at once, but independent contexts may run in separate
threads, also when they share block descriptions and registries.
*/
class ExecutionContext
{
public:
    /**
    \brief  Constructor.

    This does not validate or initialise anything; the context starts out
    in the `unvalidated` state.  The registry is copied.

    \throws std::invalid_argument if `block` is null.
    */
    ExecutionContext(
        std::shared_ptr<const cdl::model::BlockDescription> block,
        const ImplementationRegistry& registry,
        const ExecutionOptions& options = ExecutionOptions());

    ~ExecutionContext() CDL_NOEXCEPT;

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    ExecutionContext(ExecutionContext&&) CDL_NOEXCEPT;
    ExecutionContext& operator=(ExecutionContext&&) CDL_NOEXCEPT;

    /**
    \brief  Validates and initialises the context.

    Unless a report is already cached (see Revalidate()), the block is
    validated first.  Warnings are logged.  Then the evaluation order of
    every composite is computed, implementations are created, parameters are
    bound, and signals are seeded with start values.

    \throws ValidationError
        If the validation report contains errors.  The context then remains
        unvalidated.
    \throws cdl::error::PreconditionViolation
        If the context is not in the `unvalidated` state.
    */
    void Initialize();

    /**
    \brief  Performs one evaluation step.

    Every instance is evaluated once, in dependency order, and the outputs of
    the block are updated.  On success, the step counter is incremented and
    the context is in the `stepping` state.

    On failure, the context enters the `faulted` state, the step counter is
    left unchanged, and the exception is propagated.  Errors detected by the
    engine are reported as cdl::error::ExecutionError; exceptions thrown by
    block implementations are propagated unchanged.  Signal values written
    before the failure remain visible.

    \throws cdl::error::PreconditionViolation
        If the context is not `initialized` or `stepping`, or if it is called
        while a step of the same context is already in progress.
    */
    void Step();

    /**
    \brief  Discards all runtime state and returns to the `unvalidated` state.

    The cached validation report is kept, so the next Initialize() does not
    validate the block again.

    \throws cdl::error::PreconditionViolation if a step is in progress.
    */
    void Reset();

    /**
    \brief  Validates the block again, replacing the cached report.

    This does not affect the runtime state.

    \throws cdl::error::PreconditionViolation if a step is in progress.
    */
    const ValidationReport& Revalidate();

    /**
    \brief  Sets the value of an input.

    Only inputs which are not driven by a connection, i.e. the root block's
    inputs, can be set.  Integer values are converted when the input is
    real.  A value outside the input's declared bounds is accepted, but a
    warning is logged.

    \throws std::out_of_range
        If there is no such instance or connector.
    \throws std::invalid_argument
        If the connector is not an input, or if it is driven by a connection.
    \throws cdl::error::ExecutionError
        With code `type_mismatch` if the value has the wrong type.
    \throws cdl::error::PreconditionViolation
        If the context is not `initialized` or `stepping`.
    */
    void SetInput(
        const std::string& instancePath,
        const std::string& connector,
        const cdl::model::ScalarValue& value);

    /// Sets the value of an input of the root block.
    void SetInput(const std::string& connector, const cdl::model::ScalarValue& value);

    /**
    \brief  Returns the current value of an output.

    \throws std::out_of_range
        If there is no such instance or connector, or it has no value.
    \throws std::invalid_argument
        If the connector is not an output.
    \throws cdl::error::PreconditionViolation
        If the context is `unvalidated`.
    */
    const cdl::model::ScalarValue& GetOutput(
        const std::string& instancePath,
        const std::string& connector) const;

    /// Returns the current value of an output of the root block.
    const cdl::model::ScalarValue& GetOutput(const std::string& connector) const;

    /**
    \brief  Returns the current value of any connector's signal.

    \throws std::out_of_range
        If there is no such instance or connector, or it has no value.
    \throws cdl::error::PreconditionViolation
        If the context is `unvalidated`.
    */
    const cdl::model::ScalarValue& GetValue(
        const std::string& instancePath,
        const std::string& connector) const;

    /**
    \brief  Returns whether a connector's signal has a value.
    \throws std::out_of_range if there is no such instance or connector.
    */
    bool HasValue(const std::string& instancePath, const std::string& connector) const;

    /**
    \brief  Returns the recorded values of a signal, oldest first.

    At most ExecutionOptions::historyDepth values are kept.  The history is
    cleared by Reset() and is not part of snapshots.

    \throws std::out_of_range if there is no such instance or connector.
    */
    std::vector<HistoryEntry> GetHistory(
        const std::string& instancePath,
        const std::string& connector) const;

    /**
    \brief  Captures the signal values, step counter and block state.

    \returns an opaque byte string which may be passed to Restore().
    \throws cdl::error::PreconditionViolation
        If the context is not `initialized` or `stepping`.
    */
    std::string Snapshot() const;

    /**
    \brief  Creates an initialised context whose state is read from a
            snapshot.

    The block is validated and initialised as by Initialize(), after which
    the signal values, step counters and block states are replaced by the
    ones in the snapshot.

    \throws SnapshotError
        If the snapshot cannot be parsed, was taken from a different block
        type, refers to instances or connectors which do not exist, or holds
        a value whose type does not fit its connector.
    \throws ValidationError
        If the block is invalid.
    */
    static ExecutionContext Restore(
        std::shared_ptr<const cdl::model::BlockDescription> block,
        const ImplementationRegistry& registry,
        const std::string& snapshot,
        const ExecutionOptions& options = ExecutionOptions());

    /// The current state.
    ContextState State() const CDL_NOEXCEPT;

    /// The number of successfully completed steps.
    cdl::model::StepCount StepCount() const CDL_NOEXCEPT;

    /**
    \brief  The number of steps of this context currently in progress.

    This is 1 while Step() is running and 0 otherwise.
    */
    int EventDepth() const CDL_NOEXCEPT;

    /**
    \brief  The qualified paths of the root block's children, in the order
            in which they are evaluated.

    For an elementary root block, this contains the empty (root) path.
    \throws cdl::error::PreconditionViolation if the context is `unvalidated`.
    */
    std::vector<std::string> EvaluationOrder() const;

    /// The cached validation report (empty if the block has not been validated).
    const ValidationReport& Report() const CDL_NOEXCEPT;

    /// Information about the last failure, if the context is faulted.
    const boost::optional<FaultInfo>& Fault() const CDL_NOEXCEPT;

    /// The root block.
    const cdl::model::BlockDescription& Block() const CDL_NOEXCEPT;

private:
    class Private;
    std::unique_ptr<Private> m_private;
};


}} // namespace
#endif // header guard
