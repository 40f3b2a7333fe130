/**
\file
\brief Main module header for cdl::engine. Includes all headers in `cdl/engine/`.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_HPP
#define CDL_ENGINE_HPP

#include "cdl/engine/execution.hpp"
#include "cdl/engine/execution_options.hpp"
#include "cdl/engine/graph.hpp"
#include "cdl/engine/registry.hpp"
#include "cdl/engine/validation.hpp"


namespace cdl
{
/// Validation, scheduling and execution of block diagrams.
namespace engine
{
}
}
#endif // header guard
