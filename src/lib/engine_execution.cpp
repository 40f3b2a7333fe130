/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/engine/execution.hpp"

#include <sstream>
#include <utility>

#include "boost/format.hpp"

#include "cdl/engine/context_core.hpp"
#include "cdl/error.hpp"
#include "cdl/log.hpp"
#include "cdl/protobuf.hpp"
#include "cdl/protocol/glue.hpp"


namespace cdl
{
namespace engine
{


class ExecutionContext::Private
{
public:
    Private(
        std::shared_ptr<const cdl::model::BlockDescription> block,
        const ImplementationRegistry& registry,
        const ExecutionOptions& options)
        : m_registry(std::make_shared<const ImplementationRegistry>(registry)),
          m_core(block, m_registry, options, std::string()),
          m_validated(false)
    { }

    ContextCore& Core() { return m_core; }
    const ContextCore& Core() const { return m_core; }

    const ValidationReport& Report() const { return m_report; }

    const ValidationReport& Revalidate()
    {
        m_report = Validate(m_core.Block(), *m_registry);
        m_validated = true;
        for (const auto& issue : m_report.Issues()) {
            CDL_LOG_DEBUG(boost::format("%s") % issue);
        }
        return m_report;
    }

    void Initialize()
    {
        CDL_PRECONDITION_CHECK(m_core.State() == ContextState::unvalidated);
        if (!m_validated) Revalidate();
        if (m_report.HasErrors()) {
            cdl::log::Log(cdl::log::error,
                boost::format("Block '%s' is invalid:\n%s")
                    % m_core.Block().TypeName() % m_report.ToString());
            throw ValidationError(m_report);
        }
        for (const auto& issue : m_report.Issues()) {
            std::ostringstream s;
            s << issue;
            cdl::log::Log(cdl::log::warning, s.str());
        }
        m_core.Initialize();
        cdl::log::Log(cdl::log::info,
            boost::format("Initialized execution context for block '%s'")
                % m_core.Block().TypeName());
    }

private:
    std::shared_ptr<const ImplementationRegistry> m_registry;
    ContextCore m_core;
    ValidationReport m_report;
    bool m_validated;
};


ExecutionContext::ExecutionContext(
    std::shared_ptr<const cdl::model::BlockDescription> block,
    const ImplementationRegistry& registry,
    const ExecutionOptions& options)
{
    CDL_INPUT_CHECK(block != nullptr);
    m_private = std::make_unique<Private>(std::move(block), registry, options);
}


ExecutionContext::~ExecutionContext() CDL_NOEXCEPT
{
}


ExecutionContext::ExecutionContext(ExecutionContext&& other) CDL_NOEXCEPT
    : m_private(std::move(other.m_private))
{
}


ExecutionContext& ExecutionContext::operator=(ExecutionContext&& other) CDL_NOEXCEPT
{
    m_private = std::move(other.m_private);
    return *this;
}


void ExecutionContext::Initialize()
{
    m_private->Initialize();
}


void ExecutionContext::Step()
{
    m_private->Core().Step();
}


void ExecutionContext::Reset()
{
    m_private->Core().Reset();
    cdl::log::Log(cdl::log::info,
        boost::format("Reset execution context for block '%s'")
            % m_private->Core().Block().TypeName());
}


const ValidationReport& ExecutionContext::Revalidate()
{
    CDL_PRECONDITION_CHECK(EventDepth() == 0);
    return m_private->Revalidate();
}


void ExecutionContext::SetInput(
    const std::string& instancePath,
    const std::string& connector,
    const cdl::model::ScalarValue& value)
{
    m_private->Core().SetExternalInput(instancePath, connector, value);
}


void ExecutionContext::SetInput(
    const std::string& connector,
    const cdl::model::ScalarValue& value)
{
    SetInput(std::string(), connector, value);
}


const cdl::model::ScalarValue& ExecutionContext::GetOutput(
    const std::string& instancePath,
    const std::string& connector) const
{
    CDL_PRECONDITION_CHECK(State() != ContextState::unvalidated);
    const auto& c = m_private->Core().FindConnector(instancePath, connector);
    if (c.Causality() != cdl::model::OUTPUT_CAUSALITY) {
        throw std::invalid_argument("Not an output: "
            + cdl::model::QualifiedConnectorName(instancePath, connector));
    }
    return GetValue(instancePath, connector);
}


const cdl::model::ScalarValue& ExecutionContext::GetOutput(
    const std::string& connector) const
{
    return GetOutput(std::string(), connector);
}


const cdl::model::ScalarValue& ExecutionContext::GetValue(
    const std::string& instancePath,
    const std::string& connector) const
{
    CDL_PRECONDITION_CHECK(State() != ContextState::unvalidated);
    m_private->Core().FindConnector(instancePath, connector);
    const auto value = m_private->Core().FindValue(instancePath, connector);
    if (!value) {
        throw std::out_of_range("No value for "
            + cdl::model::QualifiedConnectorName(instancePath, connector));
    }
    return *value;
}


bool ExecutionContext::HasValue(
    const std::string& instancePath,
    const std::string& connector) const
{
    if (State() == ContextState::unvalidated) return false;
    m_private->Core().FindConnector(instancePath, connector);
    return m_private->Core().FindValue(instancePath, connector) != nullptr;
}


std::vector<HistoryEntry> ExecutionContext::GetHistory(
    const std::string& instancePath,
    const std::string& connector) const
{
    if (State() == ContextState::unvalidated) return std::vector<HistoryEntry>();
    m_private->Core().FindConnector(instancePath, connector);
    return m_private->Core().History(instancePath, connector);
}


std::string ExecutionContext::Snapshot() const
{
    CDL_PRECONDITION_CHECK(
        State() == ContextState::initialized || State() == ContextState::stepping);
    const auto& core = m_private->Core();
    cdlproto::state::Snapshot snapshot;
    snapshot.set_block_type(core.Block().TypeName());
    snapshot.set_step_count(core.StepCount());
    core.SaveSnapshot(snapshot);

    std::string blob;
    cdl::protobuf::SerializeToString(snapshot, blob);
    return blob;
}


ExecutionContext ExecutionContext::Restore(
    std::shared_ptr<const cdl::model::BlockDescription> block,
    const ImplementationRegistry& registry,
    const std::string& snapshot,
    const ExecutionOptions& options)
{
    CDL_INPUT_CHECK(block != nullptr);
    cdlproto::state::Snapshot pbSnapshot;
    try {
        cdl::protobuf::ParseFromString(snapshot, pbSnapshot);
    } catch (const cdl::protobuf::SerializationException& e) {
        throw SnapshotError(std::string("Invalid snapshot: ") + e.what());
    }
    if (pbSnapshot.block_type() != block->TypeName()) {
        throw SnapshotError(
            "Snapshot was taken from block type '" + pbSnapshot.block_type()
            + "', not '" + block->TypeName() + "'");
    }

    ExecutionContext context(std::move(block), registry, options);
    context.Initialize();
    auto& core = context.m_private->Core();
    try {
        for (const auto& signal : pbSnapshot.signal()) {
            const auto& c = core.FindConnector(signal.instance_path(), signal.connector());
            const auto value = cdl::protocol::FromProto(signal.value());
            const auto name = cdl::model::QualifiedConnectorName(
                signal.instance_path(), signal.connector());
            if (!cdl::model::IsAssignable(cdl::model::DataTypeOf(value), c.DataType())) {
                throw SnapshotError(boost::str(
                    boost::format("Snapshot value for '%s' has type %s, expected %s")
                        % name
                        % cdl::model::DataTypeName(cdl::model::DataTypeOf(value))
                        % cdl::model::DataTypeName(c.DataType())));
            }
            if (c.DataType() == cdl::model::ENUMERATION_DATATYPE
                    && !cdl::model::IsWithinBounds(value, c.Attributes())) {
                throw SnapshotError(
                    "Snapshot value for '" + name + "' is not a literal of its enumeration");
            }
        }
        for (const auto& state : pbSnapshot.instance_state()) {
            if (!core.IsElementaryInstance(state.instance_path())) {
                throw std::out_of_range(
                    "Not an elementary instance: " + state.instance_path());
            }
        }
        core.LoadSnapshot(pbSnapshot);
    } catch (const SnapshotError&) {
        throw;
    } catch (const std::out_of_range& e) {
        throw SnapshotError(std::string("Snapshot does not match block: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw SnapshotError(std::string("Invalid snapshot: ") + e.what());
    }
    cdl::log::Log(cdl::log::info,
        boost::format("Restored execution context for block '%s' at step %d")
            % context.Block().TypeName() % context.StepCount());
    return context;
}


ContextState ExecutionContext::State() const CDL_NOEXCEPT
{
    return m_private->Core().State();
}


cdl::model::StepCount ExecutionContext::StepCount() const CDL_NOEXCEPT
{
    return m_private->Core().StepCount();
}


int ExecutionContext::EventDepth() const CDL_NOEXCEPT
{
    return m_private->Core().EventDepth();
}


std::vector<std::string> ExecutionContext::EvaluationOrder() const
{
    CDL_PRECONDITION_CHECK(State() != ContextState::unvalidated);
    return m_private->Core().EvaluationOrder();
}


const ValidationReport& ExecutionContext::Report() const CDL_NOEXCEPT
{
    return m_private->Report();
}


const boost::optional<FaultInfo>& ExecutionContext::Fault() const CDL_NOEXCEPT
{
    return m_private->Core().Fault();
}


const cdl::model::BlockDescription& ExecutionContext::Block() const CDL_NOEXCEPT
{
    return m_private->Core().Block();
}


}} // namespace
