/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/engine/context_core.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "boost/format.hpp"

#include "cdl/engine/graph.hpp"
#include "cdl/error.hpp"
#include "cdl/log.hpp"
#include "cdl/protocol/glue.hpp"
#include "cdl/util.hpp"


namespace cdl
{
namespace engine
{


const std::size_t ContextCore::NO_INSTANCE;


namespace
{
    // Returns the data type of the named connector of `block`.
    cdl::model::DataType ConnectorType(
        const cdl::model::BlockDescription& block,
        const std::string& connector)
    {
        const auto c = block.FindConnector(connector);
        if (!c) {
            throw std::invalid_argument(
                "Block type '" + block.TypeName() + "' has no connector named '"
                + connector + "'");
        }
        return c->DataType();
    }


    std::string KeyString(const SignalTable::Key& key)
    {
        return cdl::model::QualifiedConnectorName(key.first, key.second);
    }


    bool IsNonFinite(const cdl::model::ScalarValue& value)
    {
        const auto real = boost::get<double>(&value);
        return real && !std::isfinite(*real);
    }
}


ContextCore::ContextCore(
    std::shared_ptr<const cdl::model::BlockDescription> block,
    std::shared_ptr<const ImplementationRegistry> registry,
    const ExecutionOptions& options,
    const std::string& basePath)
    : m_block(std::move(block)),
      m_registry(std::move(registry)),
      m_options(options),
      m_basePath(basePath),
      m_state(ContextState::unvalidated),
      m_stepCount(0),
      m_eventDepth(0),
      m_signals(options.historyDepth)
{
    CDL_INPUT_CHECK(m_block != nullptr);
    CDL_INPUT_CHECK(m_registry != nullptr);
}


ContextCore::~ContextCore()
{
}


const cdl::model::BlockDescription& ContextCore::Block() const CDL_NOEXCEPT
{
    return *m_block;
}


const std::string& ContextCore::BasePath() const CDL_NOEXCEPT
{
    return m_basePath;
}


ContextState ContextCore::State() const CDL_NOEXCEPT
{
    return m_state;
}


cdl::model::StepCount ContextCore::StepCount() const CDL_NOEXCEPT
{
    return m_stepCount;
}


int ContextCore::EventDepth() const CDL_NOEXCEPT
{
    return m_eventDepth;
}


const boost::optional<FaultInfo>& ContextCore::Fault() const CDL_NOEXCEPT
{
    return m_fault;
}


std::vector<std::string> ContextCore::EvaluationOrder() const
{
    std::vector<std::string> paths;
    for (const auto index : m_order) paths.push_back(m_instances[index]->Path());
    return paths;
}


// =============================================================================
// Initialisation
// =============================================================================


void ContextCore::Initialize()
{
    CDL_PRECONDITION_CHECK(State() == ContextState::unvalidated);

    std::vector<std::unique_ptr<InstanceRuntime>> instances;
    std::map<std::string, std::size_t> childIndexes;
    std::vector<std::size_t> order;
    std::vector<std::vector<Binding>> inputBindings;
    std::vector<Binding> outputBindings;

    if (m_block->Kind() == cdl::model::ELEMENTARY_BLOCK) {
        // An elementary root block is its own (only) instance, and reads
        // its inputs directly from its boundary signals.
        instances.push_back(std::make_unique<InstanceRuntime>(
            m_basePath, m_block, cdl::model::ValueMap(), m_registry, m_options));
        order.push_back(0);
        inputBindings.emplace_back();
        for (const auto& c : m_block->Connectors()) {
            if (c.Causality() != cdl::model::INPUT_CAUSALITY) continue;
            inputBindings.front().push_back(
                Binding{c.Name(), SignalTable::Key(m_basePath, c.Name()), c.DataType()});
        }
    } else {
        const auto graph = BuildDependencyGraph(*m_block);
        order = Schedule(graph);

        const auto& children = m_block->Children();
        for (std::size_t i = 0; i < children.size(); ++i) {
            const auto& child = children[i];
            childIndexes.insert(std::make_pair(child.Name(), i));
            instances.push_back(std::make_unique<InstanceRuntime>(
                cdl::model::JoinInstancePath(m_basePath, child.Name()),
                child.TypePtr(),
                child.Overrides(),
                m_registry,
                m_options));
        }
        inputBindings.resize(children.size());

        for (const auto& conn : m_block->Connections()) {
            const auto& src = conn.Source();
            const auto& dst = conn.Destination();
            const auto source = src.IsBoundary()
                ? SignalTable::Key(m_basePath, src.Connector())
                : SignalTable::Key(
                    cdl::model::JoinInstancePath(m_basePath, src.Instance()),
                    src.Connector());
            if (dst.IsBoundary()) {
                outputBindings.push_back(Binding{
                    dst.Connector(), source, ConnectorType(*m_block, dst.Connector())});
            } else {
                const auto index = childIndexes.at(dst.Instance());
                inputBindings[index].push_back(Binding{
                    dst.Connector(),
                    source,
                    ConnectorType(children[index].Type(), dst.Connector())});
            }
        }
    }

    m_instances = std::move(instances);
    m_childIndexes = std::move(childIndexes);
    m_order = std::move(order);
    m_inputBindings = std::move(inputBindings);
    m_outputBindings = std::move(outputBindings);
    m_signals.Clear();
    m_stepCount = 0;
    m_fault = boost::none;
    SeedStartValues();
    m_state = ContextState::initialized;
}


void ContextCore::SeedStartValues()
{
    for (const auto& c : m_block->Connectors()) {
        if (c.Start()) {
            m_signals.Set(m_basePath, c.Name(),
                cdl::model::ConvertValue(*c.Start(), c.DataType()), 0);
        }
    }
    for (const auto& child : m_block->Children()) {
        const auto path = cdl::model::JoinInstancePath(m_basePath, child.Name());
        for (const auto& c : child.Type().Connectors()) {
            if (c.Start()) {
                m_signals.Set(path, c.Name(),
                    cdl::model::ConvertValue(*c.Start(), c.DataType()), 0);
            }
        }
    }
}


void ContextCore::Reset()
{
    CDL_PRECONDITION_CHECK(EventDepth() == 0);
    m_instances.clear();
    m_childIndexes.clear();
    m_order.clear();
    m_inputBindings.clear();
    m_outputBindings.clear();
    m_signals.Clear();
    m_stepCount = 0;
    m_fault = boost::none;
    m_state = ContextState::unvalidated;
}


// =============================================================================
// Stepping
// =============================================================================


void ContextCore::Step()
{
    CDL_PRECONDITION_CHECK(EventDepth() == 0);
    CDL_PRECONDITION_CHECK(
        State() == ContextState::initialized || State() == ContextState::stepping);

    ++m_eventDepth;
    const auto eventScope = util::OnScopeExit([this] () { --m_eventDepth; });

    const auto step = m_stepCount + 1;
    std::size_t current = NO_INSTANCE;
    try {
        for (const auto index : m_order) {
            current = index;
            EvaluateInstance(index, step);
        }
        current = NO_INSTANCE;
        PropagateOutputs(step);
    } catch (const cdl::error::ExecutionError& e) {
        EnterFaultedState(current, step, e.what(), &e.InstancePath());
        throw;
    } catch (const std::exception& e) {
        EnterFaultedState(current, step, e.what(), nullptr);
        throw;
    } catch (...) {
        EnterFaultedState(current, step, "Unknown exception", nullptr);
        throw;
    }
    m_stepCount = step;
    m_state = ContextState::stepping;
}


void ContextCore::EvaluateInstance(std::size_t index, cdl::model::StepCount step)
{
    auto& instance = *m_instances[index];
    const auto& path = instance.Path();

    cdl::model::ValueMap inputs;
    for (const auto& binding : m_inputBindings[index]) {
        const auto value = m_signals.Find(binding.source.first, binding.source.second);
        if (!value) {
            throw cdl::error::ExecutionError(
                cdl::error::exec_error::missing_input_value, path, step,
                "input '" + binding.connector + "' (source: "
                + KeyString(binding.source) + ")");
        }
        if (!cdl::model::IsAssignable(cdl::model::DataTypeOf(*value), binding.dataType)) {
            throw cdl::error::ExecutionError(
                cdl::error::exec_error::type_mismatch, path, step,
                boost::str(boost::format("input '%s' expects %s, source %s has %s")
                    % binding.connector
                    % cdl::model::DataTypeName(binding.dataType)
                    % KeyString(binding.source)
                    % cdl::model::DataTypeName(cdl::model::DataTypeOf(*value))));
        }
        auto converted = cdl::model::ConvertValue(*value, binding.dataType);
        if (binding.source != SignalTable::Key(path, binding.connector)) {
            m_signals.Set(path, binding.connector, converted, step);
        }
        inputs[binding.connector] = std::move(converted);
    }

    cdl::model::ValueMap outputs;
    instance.Evaluate(inputs, outputs);

    for (const auto& output : outputs) {
        const auto c = instance.Type().FindConnector(output.first);
        if (!c || c->Causality() != cdl::model::OUTPUT_CAUSALITY) {
            throw cdl::error::ExecutionError(
                cdl::error::exec_error::undeclared_output, path, step,
                "block type '" + instance.Type().TypeName()
                + "' has no output named '" + output.first + "'");
        }
        const auto valueType = cdl::model::DataTypeOf(output.second);
        if (!cdl::model::IsAssignable(valueType, c->DataType())) {
            throw cdl::error::ExecutionError(
                cdl::error::exec_error::type_mismatch, path, step,
                boost::str(boost::format("output '%s' expects %s, got %s")
                    % output.first
                    % cdl::model::DataTypeName(c->DataType())
                    % cdl::model::DataTypeName(valueType)));
        }
        const auto value = cdl::model::ConvertValue(output.second, c->DataType());
        if (!m_options.allowNonFiniteValues && IsNonFinite(value)) {
            throw cdl::error::ExecutionError(
                cdl::error::exec_error::non_finite_value, path, step,
                "output '" + output.first + "'");
        }
        m_signals.Set(path, output.first, value, step);
    }
}


void ContextCore::PropagateOutputs(cdl::model::StepCount step)
{
    for (const auto& binding : m_outputBindings) {
        const auto value = m_signals.Find(binding.source.first, binding.source.second);
        if (!value) {
            throw cdl::error::ExecutionError(
                cdl::error::exec_error::missing_input_value, m_basePath, step,
                "source of output '" + binding.connector + "' ("
                + KeyString(binding.source) + ") has no value");
        }
        m_signals.Set(m_basePath, binding.connector,
            cdl::model::ConvertValue(*value, binding.dataType), step);
    }
}


void ContextCore::EnterFaultedState(
    std::size_t current,
    cdl::model::StepCount step,
    const std::string& message,
    const std::string* errorPath)
{
    FaultInfo fault;
    if (errorPath) {
        fault.instancePath = *errorPath;
    } else if (current != NO_INSTANCE) {
        const auto nested = m_instances[current]->Nested();
        fault.instancePath = (nested && nested->Fault())
            ? nested->Fault()->instancePath
            : m_instances[current]->Path();
    } else {
        fault.instancePath = m_basePath;
    }
    fault.step = step;
    fault.message = message;
    m_fault = fault;
    m_state = ContextState::faulted;

    if (m_basePath.empty()) {
        cdl::log::Log(cdl::log::error,
            boost::format("Step %d failed in instance '%s': %s")
                % step % fault.instancePath % message);
    }
}


// =============================================================================
// Signal access
// =============================================================================


std::size_t ContextCore::DirectChildIndex(const std::string& path) const
{
    std::string relative;
    if (m_basePath.empty()) {
        relative = path;
    } else if (path.size() > m_basePath.size() + 1
            && path.compare(0, m_basePath.size(), m_basePath) == 0
            && path[m_basePath.size()] == '.') {
        relative = path.substr(m_basePath.size() + 1);
    } else {
        return NO_INSTANCE;
    }
    const auto it = m_childIndexes.find(relative);
    return it == m_childIndexes.end() ? NO_INSTANCE : it->second;
}


ContextCore* ContextCore::DescendantOwner(const std::string& path) const
{
    for (const auto& entry : m_childIndexes) {
        const auto& instance = *m_instances[entry.second];
        const auto& childPath = instance.Path();
        if (instance.Nested()
                && path.size() > childPath.size() + 1
                && path.compare(0, childPath.size(), childPath) == 0
                && path[childPath.size()] == '.') {
            return instance.Nested();
        }
    }
    return nullptr;
}


const cdl::model::ConnectorDescription& ContextCore::FindConnector(
    const std::string& path,
    const std::string& connector) const
{
    const cdl::model::ConnectorDescription* c = nullptr;
    if (path == m_basePath) {
        c = m_block->FindConnector(connector);
    } else if (const auto owner = DescendantOwner(path)) {
        return owner->FindConnector(path, connector);
    } else {
        const auto index = DirectChildIndex(path);
        if (index == NO_INSTANCE) {
            throw std::out_of_range("Unknown instance: " + path);
        }
        c = m_instances[index]->Type().FindConnector(connector);
    }
    if (!c) {
        throw std::out_of_range(
            "Unknown connector: " + cdl::model::QualifiedConnectorName(path, connector));
    }
    return *c;
}


bool ContextCore::IsElementaryInstance(const std::string& path) const
{
    if (path == m_basePath) {
        return m_block->Kind() == cdl::model::ELEMENTARY_BLOCK;
    }
    if (const auto owner = DescendantOwner(path)) {
        return owner->IsElementaryInstance(path);
    }
    const auto index = DirectChildIndex(path);
    return index != NO_INSTANCE && m_instances[index]->Implementation() != nullptr;
}


const cdl::model::ScalarValue* ContextCore::FindValue(
    const std::string& path,
    const std::string& connector) const
{
    if (const auto owner = DescendantOwner(path)) {
        return owner->FindValue(path, connector);
    }
    return m_signals.Find(path, connector);
}


std::vector<HistoryEntry> ContextCore::History(
    const std::string& path,
    const std::string& connector) const
{
    if (const auto owner = DescendantOwner(path)) {
        return owner->History(path, connector);
    }
    return m_signals.History(path, connector);
}


void ContextCore::SetBoundaryInput(
    const std::string& connector,
    const cdl::model::ScalarValue& value,
    cdl::model::StepCount step)
{
    m_signals.Set(m_basePath, connector,
        cdl::model::ConvertValue(value, ConnectorType(*m_block, connector)),
        step);
}


void ContextCore::SetExternalInput(
    const std::string& path,
    const std::string& connector,
    const cdl::model::ScalarValue& value)
{
    CDL_PRECONDITION_CHECK(
        State() == ContextState::initialized || State() == ContextState::stepping);
    const auto& c = FindConnector(path, connector);
    const auto name = cdl::model::QualifiedConnectorName(path, connector);
    if (c.Causality() != cdl::model::INPUT_CAUSALITY) {
        throw std::invalid_argument("Not an input: " + name);
    }
    if (path != m_basePath) {
        throw std::invalid_argument(
            "Input is driven by a connection and cannot be set directly: " + name);
    }
    const auto valueType = cdl::model::DataTypeOf(value);
    if (!cdl::model::IsAssignable(valueType, c.DataType())) {
        throw cdl::error::ExecutionError(
            cdl::error::exec_error::type_mismatch, path, m_stepCount,
            boost::str(boost::format("input '%s' expects %s, got %s")
                % connector
                % cdl::model::DataTypeName(c.DataType())
                % cdl::model::DataTypeName(valueType)));
    }
    const auto converted = cdl::model::ConvertValue(value, c.DataType());
    if (!cdl::model::IsWithinBounds(converted, c.Attributes())) {
        std::ostringstream s;
        s << "Value " << converted << " for input '" << name
          << "' is outside its declared range";
        cdl::log::Log(cdl::log::warning, s.str());
    }
    SetBoundaryInput(connector, converted, m_stepCount);
}


// =============================================================================
// Snapshots
// =============================================================================


void ContextCore::SaveSnapshot(cdlproto::state::Snapshot& target) const
{
    m_signals.ForEach([&target] (
        const std::string& path,
        const std::string& connector,
        const cdl::model::ScalarValue& value)
    {
        auto signal = target.add_signal();
        signal->set_instance_path(path);
        signal->set_connector(connector);
        cdl::protocol::ConvertToProto(value, *signal->mutable_value());
    });
    for (const auto& instance : m_instances) {
        if (const auto nested = instance->Nested()) {
            nested->SaveSnapshot(target);
        } else {
            const auto state = instance->Implementation()->SaveState();
            if (state.empty()) continue;
            auto instanceState = target.add_instance_state();
            instanceState->set_instance_path(instance->Path());
            cdl::protocol::ConvertToProto(state, *instanceState->mutable_value());
        }
    }
}


void ContextCore::LoadSnapshot(const cdlproto::state::Snapshot& source)
{
    CDL_PRECONDITION_CHECK(State() != ContextState::unvalidated);
    CDL_PRECONDITION_CHECK(EventDepth() == 0);

    m_signals.Clear();
    m_stepCount = source.step_count();
    for (const auto& signal : source.signal()) {
        const auto& path = signal.instance_path();
        if (path == m_basePath || DirectChildIndex(path) != NO_INSTANCE) {
            const auto& c = FindConnector(path, signal.connector());
            m_signals.Load(path, signal.connector(), cdl::model::ConvertValue(
                cdl::protocol::FromProto(signal.value()), c.DataType()));
        }
    }
    for (const auto& instance : m_instances) {
        if (const auto nested = instance->Nested()) {
            nested->LoadSnapshot(source);
        }
    }
    for (const auto& instanceState : source.instance_state()) {
        const auto& path = instanceState.instance_path();
        std::size_t index = NO_INSTANCE;
        if (m_block->Kind() == cdl::model::ELEMENTARY_BLOCK) {
            if (path == m_basePath) index = 0;
        } else {
            index = DirectChildIndex(path);
        }
        if (index == NO_INSTANCE) continue;
        if (const auto impl = m_instances[index]->Implementation()) {
            impl->RestoreState(cdl::protocol::FromProto(instanceState.value()));
        }
    }
    m_fault = boost::none;
    m_state = m_stepCount > 0 ? ContextState::stepping : ContextState::initialized;
}


}} // namespace
