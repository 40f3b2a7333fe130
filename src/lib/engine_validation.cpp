/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/engine/validation.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <sstream>

#include "boost/algorithm/string/join.hpp"
#include "boost/format.hpp"

#include "cdl/engine/graph.hpp"
#include "cdl/log.hpp"


namespace cdl
{
namespace engine
{


const char* RuleName(ValidationRule rule) CDL_NOEXCEPT
{
    switch (rule) {
        case ValidationRule::unconnected_input:     return "unconnected_input";
        case ValidationRule::multiple_sources:      return "multiple_sources";
        case ValidationRule::type_mismatch:         return "type_mismatch";
        case ValidationRule::algebraic_loop:        return "algebraic_loop";
        case ValidationRule::unknown_block_type:    return "unknown_block_type";
        case ValidationRule::missing_parameter:     return "missing_parameter";
        case ValidationRule::duplicate_name:        return "duplicate_name";
        case ValidationRule::invalid_name:          return "invalid_name";
        case ValidationRule::dangling_reference:    return "dangling_reference";
        case ValidationRule::illegal_connection:    return "illegal_connection";
        case ValidationRule::unconnected_output:    return "unconnected_output";
        case ValidationRule::constant_override:     return "constant_override";
        case ValidationRule::out_of_bounds:         return "out_of_bounds";
        case ValidationRule::unused_input:          return "unused_input";
        default:                                    return "unknown";
    }
}


// =============================================================================
// ValidationIssue
// =============================================================================


ValidationIssue::ValidationIssue(
    cdl::engine::Severity severity,
    ValidationRule rule,
    const std::string& location,
    const std::string& message)
    : m_severity(severity),
      m_rule(rule),
      m_location(location),
      m_message(message)
{
}


Severity ValidationIssue::Severity() const CDL_NOEXCEPT
{
    return m_severity;
}


ValidationRule ValidationIssue::Rule() const CDL_NOEXCEPT
{
    return m_rule;
}


const std::string& ValidationIssue::Location() const CDL_NOEXCEPT
{
    return m_location;
}


const std::string& ValidationIssue::Message() const CDL_NOEXCEPT
{
    return m_message;
}


std::ostream& operator<<(std::ostream& stream, const ValidationIssue& issue)
{
    stream
        << (issue.Severity() == Severity::error ? "error" : "warning")
        << " [" << RuleName(issue.Rule()) << "] "
        << (issue.Location().empty() ? "(root)" : issue.Location())
        << ": " << issue.Message();
    return stream;
}


// =============================================================================
// ValidationReport
// =============================================================================


void ValidationReport::Add(const ValidationIssue& issue)
{
    m_issues.push_back(issue);
}


const std::vector<ValidationIssue>& ValidationReport::Issues() const CDL_NOEXCEPT
{
    return m_issues;
}


bool ValidationReport::HasErrors() const CDL_NOEXCEPT
{
    return ErrorCount() > 0;
}


std::size_t ValidationReport::ErrorCount() const CDL_NOEXCEPT
{
    return std::count_if(m_issues.begin(), m_issues.end(),
        [] (const ValidationIssue& i) { return i.Severity() == Severity::error; });
}


std::size_t ValidationReport::WarningCount() const CDL_NOEXCEPT
{
    return m_issues.size() - ErrorCount();
}


std::vector<ValidationIssue> ValidationReport::IssuesFor(ValidationRule rule) const
{
    std::vector<ValidationIssue> result;
    std::copy_if(m_issues.begin(), m_issues.end(), std::back_inserter(result),
        [rule] (const ValidationIssue& i) { return i.Rule() == rule; });
    return result;
}


std::string ValidationReport::ToString() const
{
    std::ostringstream s;
    for (const auto& issue : m_issues) s << issue << '\n';
    return s.str();
}


// =============================================================================
// ValidationError
// =============================================================================


namespace
{
    std::string ValidationErrorMessage(const ValidationReport& report)
    {
        std::ostringstream s;
        s << "Block validation failed with " << report.ErrorCount() << " error(s)";
        for (const auto& issue : report.Issues()) {
            if (issue.Severity() == Severity::error) s << "\n  " << issue;
        }
        return s.str();
    }
}


ValidationError::ValidationError(const ValidationReport& report)
    : std::runtime_error(ValidationErrorMessage(report)),
      m_report(report)
{
}


const ValidationReport& ValidationError::Report() const CDL_NOEXCEPT
{
    return m_report;
}


// =============================================================================
// Validate()
// =============================================================================


namespace
{
    std::string RefString(const cdl::model::ConnectorRef& ref)
    {
        return cdl::model::QualifiedConnectorName(ref.Instance(), ref.Connector());
    }


    class Validator
    {
    public:
        Validator(const ImplementationRegistry& registry, ValidationReport& report)
            : m_registry(registry), m_report(report)
        { }

        // Validates one instance of `block` at the given path, including the
        // binding of its parameters, and recurses into its children.
        void ValidateInstance(
            const cdl::model::BlockDescription& block,
            const std::string& path,
            const cdl::model::ValueMap& overrides)
        {
            CheckDefinition(block, path);
            CheckParameterBinding(block, path, overrides);
            if (block.Kind() == cdl::model::ELEMENTARY_BLOCK) {
                if (!m_registry.Contains(block.TypeName())) {
                    Error(ValidationRule::unknown_block_type, path,
                        "No implementation registered for block type '"
                        + block.TypeName() + "'");
                }
            } else {
                CheckComposite(block, path);
            }
        }

    private:
        void Error(ValidationRule rule, const std::string& location, const std::string& message)
        {
            m_report.Add(ValidationIssue(Severity::error, rule, location, message));
        }

        void Warning(ValidationRule rule, const std::string& location, const std::string& message)
        {
            m_report.Add(ValidationIssue(Severity::warning, rule, location, message));
        }

        // Checks that `value` can be bound to something with the given type
        // and attributes.
        void CheckValue(
            const std::string& location,
            const std::string& what,
            const cdl::model::ScalarValue& value,
            cdl::model::DataType dataType,
            const cdl::model::ValueAttributes& attributes)
        {
            const auto valueType = cdl::model::DataTypeOf(value);
            if (!cdl::model::IsAssignable(valueType, dataType)) {
                Error(ValidationRule::type_mismatch, location,
                    boost::str(boost::format("%s has type %s, expected %s")
                        % what
                        % cdl::model::DataTypeName(valueType)
                        % cdl::model::DataTypeName(dataType)));
            } else if (!cdl::model::IsWithinBounds(
                    cdl::model::ConvertValue(value, dataType), attributes)) {
                std::ostringstream s;
                s << what << " (" << value << ") is outside the allowed range";
                Error(ValidationRule::out_of_bounds, location, s.str());
            }
        }

        // Checks the things that only depend on the block type.
        void CheckDefinition(const cdl::model::BlockDescription& block, const std::string& path)
        {
            std::set<std::string> connectorNames;
            for (const auto& c : block.Connectors()) {
                const auto location = cdl::model::QualifiedConnectorName(path, c.Name());
                if (!connectorNames.insert(c.Name()).second) {
                    Error(ValidationRule::duplicate_name, location,
                        "Duplicate connector name '" + c.Name() + "'");
                }
                if (c.Start()) {
                    CheckValue(location, "Start value", *c.Start(), c.DataType(), c.Attributes());
                }
            }

            std::set<std::string> parameterNames;
            for (const auto& p : block.Parameters()) {
                const auto location = cdl::model::QualifiedConnectorName(path, p.Name());
                if (!parameterNames.insert(p.Name()).second) {
                    Error(ValidationRule::duplicate_name, location,
                        "Duplicate parameter name '" + p.Name() + "'");
                }
                if (p.Default()) {
                    CheckValue(location, "Default value", *p.Default(), p.DataType(), p.Attributes());
                } else if (p.Variability() == cdl::model::CONSTANT_VARIABILITY) {
                    Error(ValidationRule::missing_parameter, location,
                        "Constant '" + p.Name() + "' has no value");
                }
            }
        }

        void CheckParameterBinding(
            const cdl::model::BlockDescription& block,
            const std::string& path,
            const cdl::model::ValueMap& overrides)
        {
            for (const auto& ov : overrides) {
                const auto location = cdl::model::QualifiedConnectorName(path, ov.first);
                const auto param = block.FindParameter(ov.first);
                if (!param) {
                    Error(ValidationRule::dangling_reference, location,
                        "Block type '" + block.TypeName() + "' has no parameter named '"
                        + ov.first + "'");
                } else if (param->Variability() == cdl::model::CONSTANT_VARIABILITY) {
                    Error(ValidationRule::constant_override, location,
                        "Constant '" + ov.first + "' cannot be overridden");
                } else {
                    CheckValue(location, "Parameter value", ov.second,
                        param->DataType(), param->Attributes());
                }
            }
            for (const auto& p : block.Parameters()) {
                if (!p.Default()
                        && p.Variability() != cdl::model::CONSTANT_VARIABILITY
                        && overrides.count(p.Name()) == 0) {
                    Error(ValidationRule::missing_parameter,
                        cdl::model::QualifiedConnectorName(path, p.Name()),
                        "Parameter '" + p.Name() + "' has neither a default value nor an override");
                }
            }
        }

        // Resolves one end of a connection, reporting dangling references.
        const cdl::model::ConnectorDescription* Resolve(
            const cdl::model::BlockDescription& block,
            const std::string& location,
            const cdl::model::ConnectorRef& ref)
        {
            if (ref.IsBoundary()) {
                const auto c = block.FindConnector(ref.Connector());
                if (!c) {
                    Error(ValidationRule::dangling_reference, location,
                        "Connection refers to unknown connector '" + ref.Connector()
                        + "' of block type '" + block.TypeName() + "'");
                }
                return c;
            }
            const auto child = block.FindChild(ref.Instance());
            if (!child) {
                Error(ValidationRule::dangling_reference, location,
                    "Connection refers to unknown instance '" + ref.Instance() + "'");
                return nullptr;
            }
            const auto c = child->Type().FindConnector(ref.Connector());
            if (!c) {
                Error(ValidationRule::dangling_reference, location,
                    "Connection refers to unknown connector '" + RefString(ref) + "'");
            }
            return c;
        }

        // Checks the shape of a connection whose ends have been resolved.
        bool CheckShape(
            const std::string& location,
            const cdl::model::Connection& conn,
            const cdl::model::ConnectorDescription& source,
            const cdl::model::ConnectorDescription& destination)
        {
            const auto& src = conn.Source();
            const auto& dst = conn.Destination();
            if (src.IsBoundary() && dst.IsBoundary()) {
                Error(ValidationRule::illegal_connection, location,
                    "Connection from '" + src.Connector() + "' to '" + dst.Connector()
                    + "' bypasses all child instances");
                return false;
            }
            const auto expectedSource = src.IsBoundary()
                ? cdl::model::INPUT_CAUSALITY
                : cdl::model::OUTPUT_CAUSALITY;
            if (source.Causality() != expectedSource) {
                Error(ValidationRule::illegal_connection, location,
                    "Connection source '" + RefString(src) + "' is not "
                    + (src.IsBoundary() ? "an input of the enclosing block"
                                        : "an output of a child instance"));
                return false;
            }
            const auto expectedDestination = dst.IsBoundary()
                ? cdl::model::OUTPUT_CAUSALITY
                : cdl::model::INPUT_CAUSALITY;
            if (destination.Causality() != expectedDestination) {
                Error(ValidationRule::illegal_connection, location,
                    "Connection destination '" + RefString(dst) + "' is not "
                    + (dst.IsBoundary() ? "an output of the enclosing block"
                                        : "an input of a child instance"));
                return false;
            }
            return true;
        }

        void CheckTypes(
            const std::string& location,
            const cdl::model::Connection& conn,
            const cdl::model::ConnectorDescription& source,
            const cdl::model::ConnectorDescription& destination)
        {
            if (!cdl::model::IsAssignable(source.DataType(), destination.DataType())) {
                Error(ValidationRule::type_mismatch, location,
                    boost::str(boost::format("Cannot connect %s (%s) to %s (%s)")
                        % RefString(conn.Source())
                        % cdl::model::DataTypeName(source.DataType())
                        % RefString(conn.Destination())
                        % cdl::model::DataTypeName(destination.DataType())));
            } else if (source.DataType() == cdl::model::ENUMERATION_DATATYPE
                    && source.Attributes().enumerationLiterals
                        != destination.Attributes().enumerationLiterals) {
                Error(ValidationRule::type_mismatch, location,
                    "Cannot connect " + RefString(conn.Source()) + " to "
                    + RefString(conn.Destination())
                    + ": the enumerations have different literals");
            }
        }

        void CheckComposite(const cdl::model::BlockDescription& block, const std::string& path)
        {
            // Children
            std::vector<std::string> nodeNames;
            std::map<std::string, DependencyGraph::NodeIndex> nodeIndexes;
            std::vector<const cdl::model::BlockInstance*> uniqueChildren;
            for (const auto& child : block.Children()) {
                const auto childPath = cdl::model::JoinInstancePath(path, child.Name());
                nodeNames.push_back(child.Name());
                if (!cdl::model::IsValidInstanceName(child.Name())) {
                    Error(ValidationRule::invalid_name, childPath,
                        "Invalid instance name '" + child.Name() + "'");
                }
                if (!nodeIndexes.insert(std::make_pair(child.Name(), nodeNames.size() - 1)).second) {
                    Error(ValidationRule::duplicate_name, childPath,
                        "Duplicate instance name '" + child.Name() + "'");
                    continue;
                }
                uniqueChildren.push_back(&child);
            }

            // Connections
            DependencyGraph graph(nodeNames);
            std::map<cdl::model::ConnectorRef, int> sourceCount;
            std::set<std::string> usedInputs;
            for (const auto& conn : block.Connections()) {
                const auto location = cdl::model::JoinInstancePath(
                    path, RefString(conn.Destination()));
                const auto source = Resolve(block, location, conn.Source());
                const auto destination = Resolve(block, location, conn.Destination());
                if (!source || !destination) continue;
                if (!CheckShape(location, conn, *source, *destination)) continue;
                CheckTypes(location, conn, *source, *destination);

                ++sourceCount[conn.Destination()];
                if (conn.Source().IsBoundary()) {
                    usedInputs.insert(conn.Source().Connector());
                } else if (!conn.Destination().IsBoundary()) {
                    graph.AddEdge(
                        nodeIndexes.at(conn.Source().Instance()),
                        nodeIndexes.at(conn.Destination().Instance()));
                }
            }

            const auto checkSources = [&] (
                const cdl::model::ConnectorRef& ref,
                ValidationRule missingRule,
                const std::string& what)
            {
                const auto location = cdl::model::JoinInstancePath(path, RefString(ref));
                const auto it = sourceCount.find(ref);
                const int count = it == sourceCount.end() ? 0 : it->second;
                if (count == 0) {
                    Error(missingRule, location, what + " '" + RefString(ref) + "' is not connected");
                } else if (count > 1) {
                    Error(ValidationRule::multiple_sources, location,
                        boost::str(boost::format("%s '%s' has %d sources")
                            % what % RefString(ref) % count));
                }
            };

            for (const auto child : uniqueChildren) {
                for (const auto& c : child->Type().Connectors()) {
                    if (c.Causality() != cdl::model::INPUT_CAUSALITY) continue;
                    checkSources(
                        cdl::model::ConnectorRef(child->Name(), c.Name()),
                        ValidationRule::unconnected_input,
                        "Input");
                }
            }
            for (const auto& c : block.Connectors()) {
                if (c.Causality() == cdl::model::OUTPUT_CAUSALITY) {
                    checkSources(
                        cdl::model::ConnectorRef(std::string(), c.Name()),
                        ValidationRule::unconnected_output,
                        "Output");
                } else if (usedInputs.count(c.Name()) == 0) {
                    Warning(ValidationRule::unused_input,
                        cdl::model::QualifiedConnectorName(path, c.Name()),
                        "Input '" + c.Name() + "' is not used by any instance");
                }
            }

            // Algebraic loops
            for (const auto& cycle : FindCycles(graph)) {
                std::vector<std::string> names;
                for (const auto node : cycle) names.push_back(graph.NodeName(node));
                names.push_back(names.front());
                Error(ValidationRule::algebraic_loop, path,
                    "Algebraic loop: " + boost::algorithm::join(names, " -> "));
            }

            // Children, recursively
            for (const auto child : uniqueChildren) {
                ValidateInstance(
                    child->Type(),
                    cdl::model::JoinInstancePath(path, child->Name()),
                    child->Overrides());
            }
        }

        const ImplementationRegistry& m_registry;
        ValidationReport& m_report;
    };
}


ValidationReport Validate(
    const cdl::model::BlockDescription& block,
    const ImplementationRegistry& registry)
{
    ValidationReport report;
    Validator(registry, report).ValidateInstance(
        block, std::string(), cdl::model::ValueMap());
    CDL_LOG_DEBUG(boost::format("Validated block '%s': %d error(s), %d warning(s)")
        % block.TypeName() % report.ErrorCount() % report.WarningCount());
    return report;
}


}} // namespace
