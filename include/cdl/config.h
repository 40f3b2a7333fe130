/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.

NOTE TO USERS:
This header file is meant for internal use in this library, and should
normally not be included directly by client code.  Its purpose is to
aid in maintaining a cross-platform code base.

NOTE TO CONTRIBUTORS:
This file intentionally has a ".h" extension, as it is supposed to
be a valid C header.  C++-specific code should therefore be placed in
#ifdef __cplusplus blocks.
*/
#ifndef CDL_CONFIG_H
#define CDL_CONFIG_H

// Microsoft Visual C++ version macros
#ifdef _MSC_VER
#   define CDL_MSC14_VER 1900 // VS 2015
#endif

// Support for 'noexcept' (C++11) was introduced in Visual Studio 2015
#ifdef __cplusplus
#   if defined(_MSC_VER) && (_MSC_VER < CDL_MSC14_VER)
#       define CDL_NOEXCEPT throw()
#   else
#       define CDL_NOEXCEPT noexcept
#   endif
#endif

// This is as good a place as any to put top-level documentation.
/**
\mainpage

The CDL engine is a C++ library for executing models written in a declarative
block-diagram control language.  A model is a hierarchy of typed blocks whose
connectors are wired together by directed connections, and running it means
computing every block's outputs from its inputs in dependency order, once per
discrete evaluation step.

If you want to describe a model, check out the types in cdl::model.

If you want to check or run one, have a look at cdl::engine, in particular
cdl::engine::Validate() and cdl::engine::ExecutionContext.
*/

#endif // header guard
