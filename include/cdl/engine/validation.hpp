/**
\file
\brief  Semantic validation of block diagrams.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_VALIDATION_HPP
#define CDL_ENGINE_VALIDATION_HPP

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cdl/engine/registry.hpp"
#include "cdl/model.hpp"


namespace cdl
{
namespace engine
{


/// The severity of a validation issue.
enum class Severity
{
    /// The model can be run, but it is probably not what the author intended.
    warning,

    /// The model cannot be run.
    error,
};


/// The rules checked by Validate().
enum class ValidationRule
{
    /// A child input is not the destination of any connection.
    unconnected_input,

    /// An input or composite output is the destination of several connections.
    multiple_sources,

    /// Incompatible data types, in a connection or for a parameter or start value.
    type_mismatch,

    /// The child instances of a composite depend on each other in a cycle.
    algebraic_loop,

    /// No implementation is registered for an elementary block type.
    unknown_block_type,

    /// A parameter has neither a default value nor an override.
    missing_parameter,

    /// Two children, connectors or parameters have the same name.
    duplicate_name,

    /// A child instance name is not a valid identifier.
    invalid_name,

    /// A connection or override refers to something which does not exist.
    dangling_reference,

    /// A connection does not go from an output to an input in a legal way.
    illegal_connection,

    /// A composite output is not the destination of any connection.
    unconnected_output,

    /// A constant parameter is overridden.
    constant_override,

    /// A value lies outside its declared bounds or allowed literals.
    out_of_bounds,

    /// A composite input is not used by any child.
    unused_input,
};


/// Returns the name of a rule, e.g. "algebraic_loop".
const char* RuleName(ValidationRule rule) CDL_NOEXCEPT;


/// A single problem found by the validator.
class ValidationIssue
{
public:
    ValidationIssue(
        cdl::engine::Severity severity,
        ValidationRule rule,
        const std::string& location,
        const std::string& message);

    cdl::engine::Severity Severity() const CDL_NOEXCEPT;

    ValidationRule Rule() const CDL_NOEXCEPT;

    /**
    \brief  Where the problem is.

    This is the qualified path of the offending instance, possibly followed
    by the name of a connector or parameter, e.g. `"ctrl.gain.k"`.  Problems
    with the root block's own connectors and parameters just have the name.
    */
    const std::string& Location() const CDL_NOEXCEPT;

    /// A human-readable description of the problem.
    const std::string& Message() const CDL_NOEXCEPT;

private:
    cdl::engine::Severity m_severity;
    ValidationRule m_rule;
    std::string m_location;
    std::string m_message;
};

std::ostream& operator<<(std::ostream& stream, const ValidationIssue& issue);


/// The result of validating a block.
class ValidationReport
{
public:
    /// Adds an issue.
    void Add(const ValidationIssue& issue);

    /// All issues, in the order they were found.
    const std::vector<ValidationIssue>& Issues() const CDL_NOEXCEPT;

    /// Returns whether there are any issues with severity `error`.
    bool HasErrors() const CDL_NOEXCEPT;

    std::size_t ErrorCount() const CDL_NOEXCEPT;

    std::size_t WarningCount() const CDL_NOEXCEPT;

    /// Returns the issues which violate the given rule.
    std::vector<ValidationIssue> IssuesFor(ValidationRule rule) const;

    /// Returns a multi-line description of all issues.
    std::string ToString() const;

private:
    std::vector<ValidationIssue> m_issues;
};


/**
\brief  Checks a block for structural and semantic errors.

All problems are collected and reported; the function never stops at the
first one.  Composite blocks are checked recursively, with the locations of
issues in child definitions given relative to `block`.

Elementary block types are looked up in `registry`.
*/
ValidationReport Validate(
    const cdl::model::BlockDescription& block,
    const ImplementationRegistry& registry);


/// Exception thrown when an invalid block is about to be initialised.
class ValidationError : public std::runtime_error
{
public:
    explicit ValidationError(const ValidationReport& report);

    /// The validation report, containing at least one error.
    const ValidationReport& Report() const CDL_NOEXCEPT;

private:
    ValidationReport m_report;
};


}} // namespace
#endif // header guard
