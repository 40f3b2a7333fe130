/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "cdl/engine/graph.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <queue>

#include "boost/algorithm/string/join.hpp"

#include "cdl/log.hpp"


namespace cdl
{
namespace engine
{


// =============================================================================
// DependencyGraph
// =============================================================================


DependencyGraph::DependencyGraph(const std::vector<std::string>& nodeNames)
    : m_names(nodeNames),
      m_successors(nodeNames.size()),
      m_predecessors(nodeNames.size()),
      m_edgeCount(0)
{
}


void DependencyGraph::AddEdge(NodeIndex from, NodeIndex to)
{
    if (from >= m_names.size() || to >= m_names.size()) {
        throw std::out_of_range("Dependency graph node index out of range");
    }
    auto& succ = m_successors[from];
    const auto pos = std::lower_bound(succ.begin(), succ.end(), to);
    if (pos != succ.end() && *pos == to) return;
    succ.insert(pos, to);
    auto& pred = m_predecessors[to];
    pred.insert(std::lower_bound(pred.begin(), pred.end(), from), from);
    ++m_edgeCount;
}


std::size_t DependencyGraph::NodeCount() const CDL_NOEXCEPT
{
    return m_names.size();
}


std::size_t DependencyGraph::EdgeCount() const CDL_NOEXCEPT
{
    return m_edgeCount;
}


const std::string& DependencyGraph::NodeName(NodeIndex node) const
{
    return m_names.at(node);
}


bool DependencyGraph::HasEdge(NodeIndex from, NodeIndex to) const
{
    const auto& succ = m_successors.at(from);
    return std::binary_search(succ.begin(), succ.end(), to);
}


const std::vector<DependencyGraph::NodeIndex>& DependencyGraph::Successors(
    NodeIndex node) const
{
    return m_successors.at(node);
}


const std::vector<DependencyGraph::NodeIndex>& DependencyGraph::Predecessors(
    NodeIndex node) const
{
    return m_predecessors.at(node);
}


// =============================================================================
// BuildDependencyGraph()
// =============================================================================


DependencyGraph BuildDependencyGraph(const cdl::model::BlockDescription& composite)
{
    std::vector<std::string> names;
    std::map<std::string, DependencyGraph::NodeIndex> indexes;
    for (const auto& child : composite.Children()) {
        indexes.insert(std::make_pair(child.Name(), names.size()));
        names.push_back(child.Name());
    }

    const auto lookup = [&] (const cdl::model::ConnectorRef& ref) {
        const auto it = indexes.find(ref.Instance());
        if (it == indexes.end()) {
            throw std::invalid_argument(
                "Connection in block '" + composite.TypeName()
                + "' refers to unknown instance: " + ref.Instance());
        }
        return it->second;
    };

    DependencyGraph graph(names);
    for (const auto& conn : composite.Connections()) {
        const auto& src = conn.Source();
        const auto& dst = conn.Destination();
        if (!src.IsBoundary()) lookup(src);
        if (!dst.IsBoundary()) lookup(dst);
        if (!src.IsBoundary() && !dst.IsBoundary()) {
            graph.AddEdge(lookup(src), lookup(dst));
        }
    }
    return graph;
}


// =============================================================================
// FindCycles()
// =============================================================================


namespace
{
    const std::size_t UNVISITED = std::numeric_limits<std::size_t>::max();

    // Tarjan's strongly connected components algorithm.
    class ComponentFinder
    {
    public:
        explicit ComponentFinder(const DependencyGraph& graph)
            : m_graph(graph),
              m_index(graph.NodeCount(), UNVISITED),
              m_lowLink(graph.NodeCount(), 0),
              m_onStack(graph.NodeCount(), false),
              m_component(graph.NodeCount(), UNVISITED),
              m_counter(0),
              m_componentCount(0)
        {
            for (DependencyGraph::NodeIndex v = 0; v < graph.NodeCount(); ++v) {
                if (m_index[v] == UNVISITED) StrongConnect(v);
            }
        }

        // The component ID of each node.
        const std::vector<std::size_t>& Components() const { return m_component; }

        std::size_t ComponentCount() const { return m_componentCount; }

    private:
        void StrongConnect(DependencyGraph::NodeIndex v)
        {
            m_index[v] = m_counter;
            m_lowLink[v] = m_counter;
            ++m_counter;
            m_stack.push_back(v);
            m_onStack[v] = true;

            for (const auto w : m_graph.Successors(v)) {
                if (m_index[w] == UNVISITED) {
                    StrongConnect(w);
                    m_lowLink[v] = std::min(m_lowLink[v], m_lowLink[w]);
                } else if (m_onStack[w]) {
                    m_lowLink[v] = std::min(m_lowLink[v], m_index[w]);
                }
            }

            if (m_lowLink[v] == m_index[v]) {
                DependencyGraph::NodeIndex w;
                do {
                    w = m_stack.back();
                    m_stack.pop_back();
                    m_onStack[w] = false;
                    m_component[w] = m_componentCount;
                } while (w != v);
                ++m_componentCount;
            }
        }

        const DependencyGraph& m_graph;
        std::vector<std::size_t> m_index;
        std::vector<std::size_t> m_lowLink;
        std::vector<bool> m_onStack;
        std::vector<std::size_t> m_component;
        std::vector<DependencyGraph::NodeIndex> m_stack;
        std::size_t m_counter;
        std::size_t m_componentCount;
    };


    // Breadth-first search for the shortest cycle which passes through
    // `start` and stays within its strongly connected component.
    std::vector<DependencyGraph::NodeIndex> ShortestCycleThrough(
        const DependencyGraph& graph,
        DependencyGraph::NodeIndex start,
        const std::vector<std::size_t>& components)
    {
        if (graph.HasEdge(start, start)) {
            return std::vector<DependencyGraph::NodeIndex>(1, start);
        }
        const auto component = components[start];
        std::vector<DependencyGraph::NodeIndex> parent(graph.NodeCount(), UNVISITED);
        std::vector<bool> visited(graph.NodeCount(), false);
        std::queue<DependencyGraph::NodeIndex> queue;
        visited[start] = true;
        queue.push(start);
        while (!queue.empty()) {
            const auto u = queue.front();
            queue.pop();
            for (const auto v : graph.Successors(u)) {
                if (components[v] != component) continue;
                if (v == start) {
                    std::vector<DependencyGraph::NodeIndex> cycle;
                    for (auto x = u; x != start; x = parent[x]) cycle.push_back(x);
                    cycle.push_back(start);
                    std::reverse(cycle.begin(), cycle.end());
                    return cycle;
                }
                if (!visited[v]) {
                    visited[v] = true;
                    parent[v] = u;
                    queue.push(v);
                }
            }
        }
        // Unreachable for nodes in a cyclic component.
        return std::vector<DependencyGraph::NodeIndex>();
    }
}


std::vector<std::vector<DependencyGraph::NodeIndex>> FindCycles(
    const DependencyGraph& graph)
{
    const ComponentFinder finder(graph);
    const auto& components = finder.Components();

    std::vector<std::size_t> componentSize(finder.ComponentCount(), 0);
    for (const auto c : components) ++componentSize[c];

    std::vector<std::vector<DependencyGraph::NodeIndex>> cycles;
    std::vector<bool> handled(finder.ComponentCount(), false);
    for (DependencyGraph::NodeIndex v = 0; v < graph.NodeCount(); ++v) {
        const auto c = components[v];
        if (handled[c]) continue;
        handled[c] = true;
        if (componentSize[c] > 1 || graph.HasEdge(v, v)) {
            cycles.push_back(ShortestCycleThrough(graph, v, components));
        }
    }
    return cycles;
}


// =============================================================================
// Schedule()
// =============================================================================


namespace
{
    std::string LoopMessage(const std::vector<std::string>& cycle)
    {
        auto names = cycle;
        if (!names.empty()) names.push_back(names.front());
        return "Algebraic loop: " + boost::algorithm::join(names, " -> ");
    }
}


AlgebraicLoopError::AlgebraicLoopError(const std::vector<std::string>& cycle)
    : std::runtime_error(LoopMessage(cycle)),
      m_cycle(cycle)
{
}


const std::vector<std::string>& AlgebraicLoopError::Cycle() const CDL_NOEXCEPT
{
    return m_cycle;
}


std::vector<DependencyGraph::NodeIndex> Schedule(const DependencyGraph& graph)
{
    const auto nodeCount = graph.NodeCount();
    std::vector<std::size_t> inDegree(nodeCount);
    std::priority_queue<
            DependencyGraph::NodeIndex,
            std::vector<DependencyGraph::NodeIndex>,
            std::greater<DependencyGraph::NodeIndex>>
        ready;
    for (DependencyGraph::NodeIndex v = 0; v < nodeCount; ++v) {
        inDegree[v] = graph.Predecessors(v).size();
        if (inDegree[v] == 0) ready.push(v);
    }

    std::vector<DependencyGraph::NodeIndex> order;
    order.reserve(nodeCount);
    while (!ready.empty()) {
        const auto u = ready.top();
        ready.pop();
        order.push_back(u);
        for (const auto v : graph.Successors(u)) {
            if (--inDegree[v] == 0) ready.push(v);
        }
    }

    if (order.size() < nodeCount) {
        const auto cycles = FindCycles(graph);
        std::vector<std::string> names;
        if (!cycles.empty()) {
            for (const auto v : cycles.front()) names.push_back(graph.NodeName(v));
        }
        throw AlgebraicLoopError(names);
    }
    CDL_LOG_TRACE(boost::format("Scheduled %d instances") % order.size());
    return order;
}


}} // namespace
