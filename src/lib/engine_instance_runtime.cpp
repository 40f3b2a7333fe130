/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/engine/instance_runtime.hpp"

#include <stdexcept>
#include <utility>

#include "cdl/engine/context_core.hpp"
#include "cdl/error.hpp"
#include "cdl/log.hpp"


namespace cdl
{
namespace engine
{


cdl::model::ValueMap BindParameters(
    const std::string& path,
    const cdl::model::BlockDescription& type,
    const cdl::model::ValueMap& overrides)
{
    cdl::model::ValueMap bound;
    for (const auto& param : type.Parameters()) {
        const auto ov = overrides.find(param.Name());
        const cdl::model::ScalarValue* value = nullptr;
        if (ov != overrides.end()
                && param.Variability() != cdl::model::CONSTANT_VARIABILITY) {
            value = &ov->second;
        } else if (param.Default()) {
            value = &*param.Default();
        } else {
            throw std::invalid_argument(
                "Parameter '" + cdl::model::QualifiedConnectorName(path, param.Name())
                + "' has no value");
        }
        bound[param.Name()] = cdl::model::ConvertValue(*value, param.DataType());
    }
    return bound;
}


InstanceRuntime::InstanceRuntime(
    const std::string& path,
    std::shared_ptr<const cdl::model::BlockDescription> type,
    const cdl::model::ValueMap& overrides,
    std::shared_ptr<const ImplementationRegistry> registry,
    const ExecutionOptions& options)
    : m_path(path),
      m_type(std::move(type)),
      m_parameters(BindParameters(path, *m_type, overrides))
{
    if (m_type->Kind() == cdl::model::ELEMENTARY_BLOCK) {
        m_implementation = registry->Create(m_type->TypeName());
        m_implementation->Initialize(m_parameters);
    } else {
        m_nested = std::make_unique<ContextCore>(m_type, registry, options, m_path);
        m_nested->Initialize();
    }
    CDL_LOG_TRACE(boost::format("Created runtime for instance '%s' of type '%s'")
        % m_path % m_type->TypeName());
}


InstanceRuntime::~InstanceRuntime()
{
}


const std::string& InstanceRuntime::Path() const
{
    return m_path;
}


const cdl::model::BlockDescription& InstanceRuntime::Type() const
{
    return *m_type;
}


const cdl::model::ValueMap& InstanceRuntime::Parameters() const
{
    return m_parameters;
}


void InstanceRuntime::Evaluate(
    const cdl::model::ValueMap& inputs,
    cdl::model::ValueMap& outputs)
{
    if (m_implementation) {
        m_implementation->Evaluate(m_parameters, inputs, outputs);
        return;
    }
    const auto step = m_nested->StepCount() + 1;
    for (const auto& input : inputs) {
        m_nested->SetBoundaryInput(input.first, input.second, step);
    }
    m_nested->Step();
    for (const auto& c : m_type->Connectors()) {
        if (c.Causality() != cdl::model::OUTPUT_CAUSALITY) continue;
        if (const auto value = m_nested->FindValue(m_path, c.Name())) {
            outputs[c.Name()] = *value;
        }
    }
}


cdl::engine::Implementation* InstanceRuntime::Implementation() const
{
    return m_implementation.get();
}


ContextCore* InstanceRuntime::Nested() const
{
    return m_nested.get();
}


}} // namespace
