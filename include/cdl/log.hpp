/**
\file
\brief  Main header file for cdl::log (but also contains a few macros).
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_LOG_HPP
#define CDL_LOG_HPP

#include <memory>
#include <ostream>
#include <string>
#include <boost/format.hpp>
#include <cdl/config.h>


namespace cdl
{
/// Program logging facilities.
namespace log
{


/// Log levels.
enum Level
{
    trace,
    debug,
    info,
    warning,
    error
};

/// Writes a plain C string to the global logger.
void Log(Level level, const char* message) noexcept;

/// Writes a plain C++ string to the global logger.
void Log(Level level, const std::string& message) noexcept;

/// Writes a formatted message to the global logger.
void Log(Level level, const boost::format& message) noexcept;


namespace detail
{
    // These are intended for use in the macros below
    void LogLoc(Level level, const char* file, int line, const char* message) noexcept;
    void LogLoc(Level level, const char* file, int line, const std::string& message) noexcept;
    void LogLoc(Level level, const char* file, int line, const boost::format& message) noexcept;
}


/**
\def    CDL_LOG_TRACE(args)
\brief  If the macro CDL_LOG_TRACE_ENABLED is defined, this is equivalent
        to calling `Log(trace, args)`, except that the file and line number
        are also logged.  Otherwise, it is a no-op.
*/
#ifdef CDL_LOG_TRACE_ENABLED
#   define CDL_LOG_TRACE(...) cdl::log::detail::LogLoc(cdl::log::trace, __FILE__, __LINE__, __VA_ARGS__)
#else
#   define CDL_LOG_TRACE(...) ((void)0)
#endif

/**
\def    CDL_LOG_DEBUG(args)
\brief  If either of the macros CDL_LOG_DEBUG_ENABLED or CDL_LOG_TRACE_ENABLED
        are defined, this is equivalent to calling `Log(debug, args)`, except
        that the file and line number are also logged.  Otherwise, it is a no-op.
*/
#if defined(CDL_LOG_DEBUG_ENABLED) || defined(CDL_LOG_TRACE_ENABLED)
#   define CDL_LOG_DEBUG(...) cdl::log::detail::LogLoc(cdl::log::debug, __FILE__, __LINE__, __VA_ARGS__)
#else
#   define CDL_LOG_DEBUG(...) ((void)0)
#endif


/**
\brief Adds a new log sink.

Until the first time this function is called, the library will use a default
sink that prints messages to `std::clog` and which filters out anything below
level `error`.

The first time this function is called, the default sink will be *replaced*
with the new one. Subsequent calls will add new sinks.
*/
void AddSink(std::shared_ptr<std::ostream> stream, Level level = error);


/// Convenience function for making a `std::shared_ptr` to `std::clog`.
std::shared_ptr<std::ostream> CLogPtr() noexcept;


/**
\brief  Parses a log level name.

Accepted names are "trace", "debug", "info", "warning" and "error".

\throws std::invalid_argument if `name` is not one of the above.
*/
Level ParseLevel(const std::string& name);


/// Returns the name of a log level, as accepted by ParseLevel().
const char* LevelName(Level level) noexcept;


}} // namespace
#endif // header guard
