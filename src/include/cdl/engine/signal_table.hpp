/**
\file
\brief  Defines the cdl::engine::SignalTable class.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_SIGNAL_TABLE_HPP
#define CDL_ENGINE_SIGNAL_TABLE_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "boost/circular_buffer.hpp"

#include "cdl/engine/execution.hpp"
#include "cdl/model.hpp"


namespace cdl
{
namespace engine
{


/**
\brief  Stores the current value (and, optionally, the recent history) of
        every signal of one level of a block hierarchy.

Signals are keyed by the qualified path of an instance and the name of one
of its connectors.
*/
class SignalTable
{
public:
    typedef std::pair<std::string, std::string> Key;

    /// Creates an empty table which keeps `historyDepth` values per signal.
    explicit SignalTable(std::size_t historyDepth = 0);

    /// Returns the current value of a signal, or null if it has none.
    const cdl::model::ScalarValue* Find(
        const std::string& path,
        const std::string& connector) const;

    /**
    \brief  Sets the value of a signal.

    If history is enabled, the value is also recorded, tagged with `step`.
    */
    void Set(
        const std::string& path,
        const std::string& connector,
        const cdl::model::ScalarValue& value,
        cdl::model::StepCount step);

    /// Sets the value of a signal without recording it in the history.
    void Load(
        const std::string& path,
        const std::string& connector,
        const cdl::model::ScalarValue& value);

    /// Returns the recorded history of a signal, oldest value first.
    std::vector<HistoryEntry> History(
        const std::string& path,
        const std::string& connector) const;

    /// Calls `f(path, connector, value)` for each signal which has a value.
    void ForEach(std::function<void(
        const std::string&,
        const std::string&,
        const cdl::model::ScalarValue&)> f) const;

    /// Removes all values and history.
    void Clear();

private:
    std::size_t m_historyDepth;
    std::map<Key, cdl::model::ScalarValue> m_values;
    std::map<Key, boost::circular_buffer<HistoryEntry>> m_history;
};


}} // namespace
#endif // header guard
