/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/engine/signal_table.hpp"


namespace cdl
{
namespace engine
{


SignalTable::SignalTable(std::size_t historyDepth)
    : m_historyDepth(historyDepth)
{
}


const cdl::model::ScalarValue* SignalTable::Find(
    const std::string& path,
    const std::string& connector) const
{
    const auto it = m_values.find(Key(path, connector));
    return it == m_values.end() ? nullptr : &it->second;
}


void SignalTable::Set(
    const std::string& path,
    const std::string& connector,
    const cdl::model::ScalarValue& value,
    cdl::model::StepCount step)
{
    const auto key = Key(path, connector);
    m_values[key] = value;
    if (m_historyDepth > 0) {
        auto it = m_history.find(key);
        if (it == m_history.end()) {
            it = m_history.insert(std::make_pair(
                key, boost::circular_buffer<HistoryEntry>(m_historyDepth))).first;
        }
        it->second.push_back(HistoryEntry{step, value});
    }
}


void SignalTable::Load(
    const std::string& path,
    const std::string& connector,
    const cdl::model::ScalarValue& value)
{
    m_values[Key(path, connector)] = value;
}


std::vector<HistoryEntry> SignalTable::History(
    const std::string& path,
    const std::string& connector) const
{
    const auto it = m_history.find(Key(path, connector));
    if (it == m_history.end()) return std::vector<HistoryEntry>();
    return std::vector<HistoryEntry>(it->second.begin(), it->second.end());
}


void SignalTable::ForEach(std::function<void(
    const std::string&,
    const std::string&,
    const cdl::model::ScalarValue&)> f) const
{
    for (const auto& entry : m_values) {
        f(entry.first.first, entry.first.second, entry.second);
    }
}


void SignalTable::Clear()
{
    m_values.clear();
    m_history.clear();
}


}} // namespace
