/**
\file
\brief  Main module header for cdl::model.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_MODEL_HPP
#define CDL_MODEL_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <cdl/config.h>


namespace cdl
{
/// Types that describe the structure of block diagrams.
namespace model
{


/// A count of evaluation steps.
typedef std::uint64_t StepCount;


/// Connector and parameter data types.
enum DataType
{
    REAL_DATATYPE           = 1,
    INTEGER_DATATYPE        = 1 << 1,
    BOOLEAN_DATATYPE        = 1 << 2,
    STRING_DATATYPE         = 1 << 3,
    ENUMERATION_DATATYPE    = 1 << 4,
};


/// Connector causalities.
enum Causality
{
    INPUT_CAUSALITY     = 1,
    OUTPUT_CAUSALITY    = 1 << 1,
};


/// Parameter variabilities.
enum Variability
{
    /// The value is given by the block definition and cannot be overridden.
    CONSTANT_VARIABILITY    = 1,

    /// The value may be overridden when the block is instantiated.
    FIXED_VARIABILITY       = 1 << 1,
};


/// The two kinds of block.
enum BlockKind
{
    /// A block whose behaviour is provided by a registered implementation.
    ELEMENTARY_BLOCK,

    /// A block whose behaviour is defined by a network of child instances.
    COMPOSITE_BLOCK,
};


/// A literal of an enumeration type.
class EnumerationValue
{
public:
    explicit EnumerationValue(const std::string& literal = std::string());

    /// The name of the literal.
    const std::string& Literal() const CDL_NOEXCEPT;

private:
    std::string m_literal;
};

bool operator==(const EnumerationValue& a, const EnumerationValue& b);
bool operator!=(const EnumerationValue& a, const EnumerationValue& b);
std::ostream& operator<<(std::ostream& stream, const EnumerationValue& value);


/**
\brief  An algebraic type that can hold values of all supported data types.

Note that a string literal (`const char*`) converts to `bool` rather than
to `std::string`, so string values should be constructed from an explicit
`std::string`.
*/
typedef boost::variant<double, int, bool, std::string, EnumerationValue>
    ScalarValue;


/// A set of named values, e.g. the bound parameters or inputs of a block.
typedef std::map<std::string, ScalarValue> ValueMap;


/// Returns the type of data stored in the given ScalarValue.
DataType DataTypeOf(const ScalarValue& v);


/// Returns a human-readable name for a data type.
const char* DataTypeName(DataType dataType) CDL_NOEXCEPT;


/**
\brief  Returns whether a value of type `source` may be bound to a connector
        or parameter of type `target`.

This is the case if the types are identical, or if `source` is
`INTEGER_DATATYPE` and `target` is `REAL_DATATYPE`.  No other conversions
exist.
*/
bool IsAssignable(DataType source, DataType target) CDL_NOEXCEPT;


/**
\brief  Converts a value to the given data type.

\throws std::invalid_argument
    If `IsAssignable(DataTypeOf(value), target)` is false.
*/
ScalarValue ConvertValue(const ScalarValue& value, DataType target);


/**
\brief  Metadata which may be attached to connectors and parameters.

None of these fields affect how a model is evaluated.  `min`, `max` and
`enumerationLiterals` are used for validation only.
*/
struct ValueAttributes
{
    /// The physical quantity, e.g. "Temperature".
    std::string quantity;

    /// The unit of measurement, e.g. "K".
    std::string unit;

    /// A human-readable description.
    std::string description;

    /// Lower bound for numeric values.
    boost::optional<double> min;

    /// Upper bound for numeric values.
    boost::optional<double> max;

    /// Nominal value for numeric values.
    boost::optional<double> nominal;

    /// The allowed literals of an enumeration type.
    std::vector<std::string> enumerationLiterals;
};


/**
\brief  Returns whether a value lies within the bounds given by `attributes`.

Numeric values are checked against `min` and `max`, and enumeration values
against `enumerationLiterals` (if it is nonempty).  Values of other types are
always within bounds.
*/
bool IsWithinBounds(const ScalarValue& value, const ValueAttributes& attributes);


/// A description of a single connector of a block.
class ConnectorDescription
{
public:
    ConnectorDescription(
        const std::string& name,
        cdl::model::DataType dataType,
        cdl::model::Causality causality,
        const ValueAttributes& attributes = ValueAttributes(),
        const boost::optional<ScalarValue>& start = boost::none);

    /**
    \brief  The connector name.

    Inputs and outputs share a namespace, so the name is unique among all
    connectors of a block.
    */
    const std::string& Name() const;

    /// The connector's data type.
    cdl::model::DataType DataType() const;

    /// The connector's causality.
    cdl::model::Causality Causality() const;

    /// The value the connector's signal is seeded with on initialisation.
    const boost::optional<ScalarValue>& Start() const;

    /// Metadata.
    const ValueAttributes& Attributes() const;

private:
    std::string m_name;
    cdl::model::DataType m_dataType;
    cdl::model::Causality m_causality;
    ValueAttributes m_attributes;
    boost::optional<ScalarValue> m_start;
};


/// A description of a single parameter of a block.
class ParameterDescription
{
public:
    ParameterDescription(
        const std::string& name,
        cdl::model::DataType dataType,
        const boost::optional<ScalarValue>& defaultValue = boost::none,
        cdl::model::Variability variability = FIXED_VARIABILITY,
        const ValueAttributes& attributes = ValueAttributes());

    /// The parameter name.
    const std::string& Name() const;

    /// The parameter's data type.
    cdl::model::DataType DataType() const;

    /// The value used when an instance does not override it.
    const boost::optional<ScalarValue>& Default() const;

    /// Whether the parameter is a constant or may be overridden.
    cdl::model::Variability Variability() const;

    /// Metadata.
    const ValueAttributes& Attributes() const;

private:
    std::string m_name;
    cdl::model::DataType m_dataType;
    boost::optional<ScalarValue> m_default;
    cdl::model::Variability m_variability;
    ValueAttributes m_attributes;
};


/**
\brief  Refers to one connector at one end of a connection.

The instance name is the name of a child instance of the composite block
which owns the connection, or empty to refer to the composite block's own
connectors.
*/
class ConnectorRef
{
public:
    ConnectorRef(const std::string& instance, const std::string& connector)
        : m_instance(instance), m_connector(connector) { }

    /// The child instance name, or empty for the enclosing block.
    const std::string& Instance() const CDL_NOEXCEPT { return m_instance; }

    /// The connector name.
    const std::string& Connector() const CDL_NOEXCEPT { return m_connector; }

    /// Whether this refers to a connector of the enclosing block.
    bool IsBoundary() const CDL_NOEXCEPT { return m_instance.empty(); }

private:
    std::string m_instance;
    std::string m_connector;
};

bool operator==(const ConnectorRef& a, const ConnectorRef& b);
bool operator!=(const ConnectorRef& a, const ConnectorRef& b);
bool operator<(const ConnectorRef& a, const ConnectorRef& b);

/// Writes "instance.connector", or just "connector" for a boundary reference.
std::ostream& operator<<(std::ostream& stream, const ConnectorRef& ref);


/// A directed signal connection from an output to an input.
class Connection
{
public:
    Connection(const ConnectorRef& source, const ConnectorRef& destination)
        : m_source(source), m_destination(destination) { }

    const ConnectorRef& Source() const CDL_NOEXCEPT { return m_source; }
    const ConnectorRef& Destination() const CDL_NOEXCEPT { return m_destination; }

private:
    ConnectorRef m_source;
    ConnectorRef m_destination;
};


class BlockDescription;


/// A named use of a block type inside a composite block.
class BlockInstance
{
public:
    /**
    \brief  Constructor.

    \param [in] name
        The instance name, unique among its siblings.
    \param [in] type
        The block type.  Must be non-null.
    \param [in] overrides
        Values for (non-constant) parameters of `type`.

    \throws std::invalid_argument if `type` is null.
    */
    BlockInstance(
        const std::string& name,
        std::shared_ptr<const BlockDescription> type,
        const ValueMap& overrides = ValueMap());

    /// The instance name.
    const std::string& Name() const;

    /// The block type.
    const BlockDescription& Type() const;

    /// Shared pointer to the block type.
    const std::shared_ptr<const BlockDescription>& TypePtr() const;

    /// Parameter values which override the type's defaults.
    const ValueMap& Overrides() const;

private:
    std::string m_name;
    std::shared_ptr<const BlockDescription> m_type;
    ValueMap m_overrides;
};


/**
\brief  A description of a block type.

Block descriptions are immutable, and they are normally shared (through
`std::shared_ptr<const BlockDescription>`) by every instance of the type and
by every execution context that runs them.  Because a composite block can only
be constructed from types which already exist, a block can never contain
itself.
*/
class BlockDescription
{
public:
    /// Constructs an elementary block type.
    BlockDescription(
        const std::string& typeName,
        const std::vector<ParameterDescription>& parameters,
        const std::vector<ConnectorDescription>& connectors,
        const std::string& description = std::string());

    /// Constructs a composite block type.
    BlockDescription(
        const std::string& typeName,
        const std::vector<ParameterDescription>& parameters,
        const std::vector<ConnectorDescription>& connectors,
        const std::vector<BlockInstance>& children,
        const std::vector<Connection>& connections,
        const std::string& description = std::string());

    /**
    \brief  The type name.

    For elementary blocks, this is the key under which the implementation
    is registered.
    */
    const std::string& TypeName() const;

    /// Whether the block is elementary or composite.
    BlockKind Kind() const;

    /// A human-readable description.
    const std::string& Description() const;

    /// The parameters, in declaration order.
    const std::vector<ParameterDescription>& Parameters() const;

    /// The connectors (inputs and outputs), in declaration order.
    const std::vector<ConnectorDescription>& Connectors() const;

    /// The child instances in declaration order (empty for elementary blocks).
    const std::vector<BlockInstance>& Children() const;

    /// The connections (empty for elementary blocks).
    const std::vector<Connection>& Connections() const;

    /// Returns the connector with the given name, or null if there is none.
    const ConnectorDescription* FindConnector(const std::string& name) const;

    /// Returns the parameter with the given name, or null if there is none.
    const ParameterDescription* FindParameter(const std::string& name) const;

    /// Returns the child with the given name, or null if there is none.
    const BlockInstance* FindChild(const std::string& name) const;

private:
    std::string m_typeName;
    BlockKind m_kind;
    std::string m_description;
    std::vector<ParameterDescription> m_parameters;
    std::vector<ConnectorDescription> m_connectors;
    std::vector<BlockInstance> m_children;
    std::vector<Connection> m_connections;
};


/**
\brief  Returns whether `s` contains a valid instance name.

Basically, this checks that `s` matches the regular expression
`[a-zA-Z][0-9a-zA-Z_]*`.
*/
bool IsValidInstanceName(const std::string& s);


/**
\brief  Returns the qualified path of a child instance.

The root instance has the empty path, so its children's paths are just their
names.  Deeper instances are separated by dots, e.g. `"outer.inner"`.
*/
std::string JoinInstancePath(const std::string& parentPath, const std::string& child);


/**
\brief  Returns `path.connector` (or just `connector` if `path` is empty),
        for use in messages.
*/
std::string QualifiedConnectorName(const std::string& path, const std::string& connector);


}}      // namespace
#endif  // header guard
