/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/model.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "cdl/error.hpp"


namespace cdl
{
namespace model
{


// =============================================================================
// EnumerationValue
// =============================================================================


EnumerationValue::EnumerationValue(const std::string& literal)
    : m_literal(literal)
{
}


const std::string& EnumerationValue::Literal() const CDL_NOEXCEPT
{
    return m_literal;
}


bool operator==(const EnumerationValue& a, const EnumerationValue& b)
{
    return a.Literal() == b.Literal();
}


bool operator!=(const EnumerationValue& a, const EnumerationValue& b)
{
    return !(a == b);
}


std::ostream& operator<<(std::ostream& stream, const EnumerationValue& value)
{
    return stream << value.Literal();
}


// =============================================================================
// ScalarValue utilities
// =============================================================================


namespace
{
    class DataTypeOfVisitor : public boost::static_visitor<DataType>
    {
    public:
        DataType operator()(double)      const CDL_NOEXCEPT { return REAL_DATATYPE; }
        DataType operator()(int)         const CDL_NOEXCEPT { return INTEGER_DATATYPE; }
        DataType operator()(bool)        const CDL_NOEXCEPT { return BOOLEAN_DATATYPE; }
        DataType operator()(const std::string&) const CDL_NOEXCEPT { return STRING_DATATYPE; }
        DataType operator()(const EnumerationValue&) const CDL_NOEXCEPT { return ENUMERATION_DATATYPE; }
    };
}


DataType DataTypeOf(const ScalarValue& v)
{
    return boost::apply_visitor(DataTypeOfVisitor{}, v);
}


const char* DataTypeName(DataType dataType) CDL_NOEXCEPT
{
    switch (dataType) {
        case REAL_DATATYPE:         return "real";
        case INTEGER_DATATYPE:      return "integer";
        case BOOLEAN_DATATYPE:      return "boolean";
        case STRING_DATATYPE:       return "string";
        case ENUMERATION_DATATYPE:  return "enumeration";
        default:                    return "unknown";
    }
}


bool IsAssignable(DataType source, DataType target) CDL_NOEXCEPT
{
    return source == target
        || (source == INTEGER_DATATYPE && target == REAL_DATATYPE);
}


ScalarValue ConvertValue(const ScalarValue& value, DataType target)
{
    const auto source = DataTypeOf(value);
    if (source == target) return value;
    if (source == INTEGER_DATATYPE && target == REAL_DATATYPE) {
        return static_cast<double>(boost::get<int>(value));
    }
    throw std::invalid_argument(
        std::string("Cannot convert a value of type ") + DataTypeName(source)
        + " to " + DataTypeName(target));
}


namespace
{
    class BoundsCheckVisitor : public boost::static_visitor<bool>
    {
    public:
        explicit BoundsCheckVisitor(const ValueAttributes& attributes)
            : m_attributes(attributes) { }

        bool operator()(double value) const { return InRange(value); }
        bool operator()(int value) const { return InRange(static_cast<double>(value)); }
        bool operator()(bool) const { return true; }
        bool operator()(const std::string&) const { return true; }

        bool operator()(const EnumerationValue& value) const
        {
            const auto& literals = m_attributes.enumerationLiterals;
            return literals.empty()
                || std::find(literals.begin(), literals.end(), value.Literal())
                    != literals.end();
        }

    private:
        bool InRange(double value) const
        {
            if (m_attributes.min && value < *m_attributes.min) return false;
            if (m_attributes.max && value > *m_attributes.max) return false;
            return true;
        }

        const ValueAttributes& m_attributes;
    };
}


bool IsWithinBounds(const ScalarValue& value, const ValueAttributes& attributes)
{
    return boost::apply_visitor(BoundsCheckVisitor(attributes), value);
}


// =============================================================================
// ConnectorDescription
// =============================================================================


ConnectorDescription::ConnectorDescription(
    const std::string& name,
    cdl::model::DataType dataType,
    cdl::model::Causality causality,
    const ValueAttributes& attributes,
    const boost::optional<ScalarValue>& start)
    : m_name(name),
      m_dataType(dataType),
      m_causality(causality),
      m_attributes(attributes),
      m_start(start)
{
}


const std::string& ConnectorDescription::Name() const
{
    return m_name;
}


cdl::model::DataType ConnectorDescription::DataType() const
{
    return m_dataType;
}


cdl::model::Causality ConnectorDescription::Causality() const
{
    return m_causality;
}


const boost::optional<ScalarValue>& ConnectorDescription::Start() const
{
    return m_start;
}


const ValueAttributes& ConnectorDescription::Attributes() const
{
    return m_attributes;
}


// =============================================================================
// ParameterDescription
// =============================================================================


ParameterDescription::ParameterDescription(
    const std::string& name,
    cdl::model::DataType dataType,
    const boost::optional<ScalarValue>& defaultValue,
    cdl::model::Variability variability,
    const ValueAttributes& attributes)
    : m_name(name),
      m_dataType(dataType),
      m_default(defaultValue),
      m_variability(variability),
      m_attributes(attributes)
{
}


const std::string& ParameterDescription::Name() const
{
    return m_name;
}


cdl::model::DataType ParameterDescription::DataType() const
{
    return m_dataType;
}


const boost::optional<ScalarValue>& ParameterDescription::Default() const
{
    return m_default;
}


cdl::model::Variability ParameterDescription::Variability() const
{
    return m_variability;
}


const ValueAttributes& ParameterDescription::Attributes() const
{
    return m_attributes;
}


// =============================================================================
// ConnectorRef
// =============================================================================


bool operator==(const ConnectorRef& a, const ConnectorRef& b)
{
    return a.Instance() == b.Instance() && a.Connector() == b.Connector();
}


bool operator!=(const ConnectorRef& a, const ConnectorRef& b)
{
    return !(a == b);
}


bool operator<(const ConnectorRef& a, const ConnectorRef& b)
{
    if (a.Instance() != b.Instance()) return a.Instance() < b.Instance();
    return a.Connector() < b.Connector();
}


std::ostream& operator<<(std::ostream& stream, const ConnectorRef& ref)
{
    return stream << QualifiedConnectorName(ref.Instance(), ref.Connector());
}


// =============================================================================
// BlockInstance
// =============================================================================


BlockInstance::BlockInstance(
    const std::string& name,
    std::shared_ptr<const BlockDescription> type,
    const ValueMap& overrides)
    : m_name(name),
      m_type(std::move(type)),
      m_overrides(overrides)
{
    CDL_INPUT_CHECK(m_type != nullptr);
}


const std::string& BlockInstance::Name() const
{
    return m_name;
}


const BlockDescription& BlockInstance::Type() const
{
    return *m_type;
}


const std::shared_ptr<const BlockDescription>& BlockInstance::TypePtr() const
{
    return m_type;
}


const ValueMap& BlockInstance::Overrides() const
{
    return m_overrides;
}


// =============================================================================
// BlockDescription
// =============================================================================


BlockDescription::BlockDescription(
    const std::string& typeName,
    const std::vector<ParameterDescription>& parameters,
    const std::vector<ConnectorDescription>& connectors,
    const std::string& description)
    : m_typeName(typeName),
      m_kind(ELEMENTARY_BLOCK),
      m_description(description),
      m_parameters(parameters),
      m_connectors(connectors)
{
    CDL_INPUT_CHECK(!typeName.empty());
}


BlockDescription::BlockDescription(
    const std::string& typeName,
    const std::vector<ParameterDescription>& parameters,
    const std::vector<ConnectorDescription>& connectors,
    const std::vector<BlockInstance>& children,
    const std::vector<Connection>& connections,
    const std::string& description)
    : m_typeName(typeName),
      m_kind(COMPOSITE_BLOCK),
      m_description(description),
      m_parameters(parameters),
      m_connectors(connectors),
      m_children(children),
      m_connections(connections)
{
    CDL_INPUT_CHECK(!typeName.empty());
}


const std::string& BlockDescription::TypeName() const
{
    return m_typeName;
}


BlockKind BlockDescription::Kind() const
{
    return m_kind;
}


const std::string& BlockDescription::Description() const
{
    return m_description;
}


const std::vector<ParameterDescription>& BlockDescription::Parameters() const
{
    return m_parameters;
}


const std::vector<ConnectorDescription>& BlockDescription::Connectors() const
{
    return m_connectors;
}


const std::vector<BlockInstance>& BlockDescription::Children() const
{
    return m_children;
}


const std::vector<Connection>& BlockDescription::Connections() const
{
    return m_connections;
}


namespace
{
    template<typename T>
    const T* FindByName(const std::vector<T>& items, const std::string& name)
    {
        const auto it = std::find_if(items.begin(), items.end(),
            [&name] (const T& item) { return item.Name() == name; });
        return it == items.end() ? nullptr : &*it;
    }
}


const ConnectorDescription* BlockDescription::FindConnector(const std::string& name) const
{
    return FindByName(m_connectors, name);
}


const ParameterDescription* BlockDescription::FindParameter(const std::string& name) const
{
    return FindByName(m_parameters, name);
}


const BlockInstance* BlockDescription::FindChild(const std::string& name) const
{
    return FindByName(m_children, name);
}


// =============================================================================
// Misc.
// =============================================================================


bool IsValidInstanceName(const std::string& s)
{
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s.front()))) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}


std::string JoinInstancePath(const std::string& parentPath, const std::string& child)
{
    if (parentPath.empty()) return child;
    return parentPath + '.' + child;
}


std::string QualifiedConnectorName(const std::string& path, const std::string& connector)
{
    return JoinInstancePath(path, connector);
}


}} // namespace
