/**
\file
\brief  Main header file for cdl::error.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ERROR_HPP
#define CDL_ERROR_HPP

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include "cdl/config.h"


namespace cdl
{

/// Exception types and error handling facilities.
namespace error
{


/**
\def    CDL_INPUT_CHECK(test)
\brief  Checks the value of one or more function input parameters, and
        throws an `std::invalid_argument` if they do not fulfill the
        given requirements.

Example:

    void Foo(int x)
    {
        CDL_INPUT_CHECK(x > 0);
        ...
    }

If the above fails, i.e. if `x <= 0`, an exception will be thrown with
the following error message:

    Foo: Input requirement not satisfied: x > 0

The test expression should only include input parameters of the
function/method in question, as well as literals and user-accessible
symbols.  Since `std::invalid_argument` is a subclass of `std::logic_error`,
this macro should only be used to catch logic errors, i.e. errors that
are avoidable by design.

\param[in] test An expression which can be implicitly converted to `bool`.
*/
#define CDL_INPUT_CHECK(test)                                                  \
    do {                                                                       \
        if (!(test)) {                                                         \
            cdl::error::detail::Throw<std::invalid_argument>                   \
                (__FUNCTION__, -1, "Input requirement not satisfied", #test);  \
        }                                                                      \
    } while(false)


/**
\brief  An exception which is used to signal that one or more of a function's
        preconditions were not met.

In this library, it is mainly thrown when a method of
cdl::engine::ExecutionContext is called while the context is in a state
that does not allow it, e.g. stepping a faulted context.

\see #CDL_PRECONDITION_CHECK
*/
class PreconditionViolation : public std::logic_error
{
public:
    explicit PreconditionViolation(const std::string& whatArg)
        : std::logic_error(whatArg) { }
};


/**
\def    CDL_PRECONDITION_CHECK(test)
\brief  Throws a cdl::error::PreconditionViolation if the given boolean
        expression evaluates to `false`.

Example:
~~~{.cpp}
void ExecutionContext::Step()
{
    CDL_PRECONDITION_CHECK(State() != ContextState::faulted);
    ...
}
~~~
If the test fails, the error message will be similar to the following:

    Step: Precondition not satisfied: State() != ContextState::faulted

The test expression should be formulated so that it is possible for a user,
who does not know the internals of your class or function, to understand
what is going on and how to fix it.

\param[in]  test    An expression which can be implicitly converted to `bool`.
*/
#define CDL_PRECONDITION_CHECK(test)                                        \
    do {                                                                    \
        if (!(test)) {                                                      \
            cdl::error::detail::Throw<cdl::error::PreconditionViolation>    \
                (__FUNCTION__, -1, "Precondition not satisfied", #test);    \
        }                                                                   \
    } while(false)


namespace detail
{
    // Internal helper function.
    // This function is only designed for use by the macros in this header,
    // and it is subject to change without warning at any time.
    template<class ExceptionT>
    inline void Throw(
        const char* location, int lineNo, const char* msg, const char* detail)
    {
        std::stringstream s;
        s << location;
        if (lineNo >= 0) s << '(' << lineNo << ')';
        s << ": " << msg;
        if (detail) s << ": " << detail;
        throw ExceptionT(s.str());
    }
}


/// Errors that may occur while a model is being stepped.
enum class exec_error
{
    /// A block input had no value when the block was to be evaluated
    missing_input_value = 1,

    /// A block produced a NaN or infinite real value
    non_finite_value,

    /// A value did not have the data type of the connector it was bound to
    type_mismatch,

    /// A block produced a value for a connector it has not declared as output
    undeclared_output,
};

/// Error category for execution errors.
const std::error_category& exec_category() CDL_NOEXCEPT;

// Standard functions to make std::error_code and std::error_condition from
// exec_error.
std::error_code make_error_code(exec_error e) CDL_NOEXCEPT;
std::error_condition make_error_condition(exec_error e) CDL_NOEXCEPT;


/**
\brief  Exception thrown when the evaluation of a block fails.

Besides the error code, it carries the qualified path of the block instance
in which the error occurred and the number of the step that was being
performed (1 for the first step).
*/
class ExecutionError : public std::system_error
{
public:
    ExecutionError(
        exec_error code,
        const std::string& instancePath,
        std::uint64_t step,
        const std::string& details);

    /// The qualified path of the failing instance (empty for the root).
    const std::string& InstancePath() const CDL_NOEXCEPT;

    /// The number of the step during which the error occurred.
    std::uint64_t Step() const CDL_NOEXCEPT;

private:
    std::string m_instancePath;
    std::uint64_t m_step;
};


}} // namespace


namespace std
{
    // Register exec_error for implicit conversion to std::error_code
    template<>
    struct is_error_code_enum<cdl::error::exec_error>
        : public true_type
    { };
}
#endif  // header guard
