/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/error.hpp"


namespace cdl
{
namespace error
{


namespace
{
    class exec_category_impl : public std::error_category
    {
    public:
        const char* name() const noexcept final override { return "execution"; }

        std::string message(int ev) const final override
        {
            switch (static_cast<exec_error>(ev)) {
                case exec_error::missing_input_value:
                    return "Input has no value";
                case exec_error::non_finite_value:
                    return "Non-finite real value";
                case exec_error::type_mismatch:
                    return "Data type mismatch";
                case exec_error::undeclared_output:
                    return "Value produced for undeclared output";
                default:
                    return "Unknown execution error";
            }
        }
    };


    std::string ExecutionErrorMessage(
        const std::string& instancePath,
        std::uint64_t step,
        const std::string& details)
    {
        std::ostringstream s;
        s << "Instance '" << instancePath << "', step " << step;
        if (!details.empty()) s << ", " << details;
        return s.str();
    }
}


const std::error_category& exec_category() noexcept
{
    static exec_category_impl instance;
    return instance;
}


std::error_code make_error_code(exec_error e) noexcept
{
    return std::error_code(
        static_cast<int>(e),
        exec_category());
}


std::error_condition make_error_condition(exec_error e) noexcept
{
    return std::error_condition(
        static_cast<int>(e),
        exec_category());
}


ExecutionError::ExecutionError(
    exec_error code,
    const std::string& instancePath,
    std::uint64_t step,
    const std::string& details)
    : std::system_error(
        make_error_code(code),
        ExecutionErrorMessage(instancePath, step, details)),
      m_instancePath(instancePath),
      m_step(step)
{
}


const std::string& ExecutionError::InstancePath() const noexcept
{
    return m_instancePath;
}


std::uint64_t ExecutionError::Step() const noexcept
{
    return m_step;
}


}} // namespace
