/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/engine/registry.hpp"

#include <stdexcept>
#include <utility>

#include "cdl/error.hpp"


namespace cdl
{
namespace engine
{


// =============================================================================
// Implementation
// =============================================================================


void Implementation::Initialize(const cdl::model::ValueMap& /*parameters*/)
{
}


cdl::model::ValueMap Implementation::SaveState() const
{
    return cdl::model::ValueMap();
}


void Implementation::RestoreState(const cdl::model::ValueMap& /*state*/)
{
}


namespace
{
    class FunctionImplementation : public Implementation
    {
    public:
        explicit FunctionImplementation(EvaluationFunction function)
            : m_function(std::move(function))
        { }

        void Evaluate(
            const cdl::model::ValueMap& parameters,
            const cdl::model::ValueMap& inputs,
            cdl::model::ValueMap& outputs) override
        {
            m_function(parameters, inputs, outputs);
        }

    private:
        EvaluationFunction m_function;
    };
}


// =============================================================================
// ImplementationRegistry
// =============================================================================


void ImplementationRegistry::Register(
    const std::string& typeName,
    ImplementationFactory factory)
{
    CDL_INPUT_CHECK(!typeName.empty());
    CDL_INPUT_CHECK(factory);
    if (m_factories.count(typeName)) {
        throw std::invalid_argument(
            "An implementation is already registered for block type: " + typeName);
    }
    m_factories.insert(std::make_pair(typeName, std::move(factory)));
}


void ImplementationRegistry::RegisterFunction(
    const std::string& typeName,
    EvaluationFunction function)
{
    CDL_INPUT_CHECK(function);
    Register(typeName, [function] () {
        return std::unique_ptr<Implementation>(
            std::make_unique<FunctionImplementation>(function));
    });
}


bool ImplementationRegistry::Contains(const std::string& typeName) const CDL_NOEXCEPT
{
    return m_factories.count(typeName) > 0;
}


std::vector<std::string> ImplementationRegistry::TypeNames() const
{
    std::vector<std::string> names;
    for (const auto& entry : m_factories) names.push_back(entry.first);
    return names;
}


std::unique_ptr<Implementation> ImplementationRegistry::Create(
    const std::string& typeName) const
{
    const auto it = m_factories.find(typeName);
    if (it == m_factories.end()) {
        throw std::out_of_range("Unknown block type: " + typeName);
    }
    auto impl = it->second();
    if (!impl) {
        throw std::logic_error(
            "Implementation factory returned null for block type: " + typeName);
    }
    return impl;
}


}} // namespace
