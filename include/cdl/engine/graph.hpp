/**
\file
\brief  Dependency graphs of composite blocks and their evaluation order.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_ENGINE_GRAPH_HPP
#define CDL_ENGINE_GRAPH_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "cdl/model.hpp"


namespace cdl
{
namespace engine
{


/**
\brief  A directed graph over the child instances of a composite block.

Nodes are identified by their index, which is the position of the child in
the composite's declaration order.  An edge `from -> to` means that `to`
reads an output of `from`, so `from` must be evaluated first.
*/
class DependencyGraph
{
public:
    typedef std::size_t NodeIndex;

    /// Creates a graph with one node per name, and no edges.
    explicit DependencyGraph(const std::vector<std::string>& nodeNames);

    /**
    \brief  Adds the edge `from -> to`, unless it already exists.
    \throws std::out_of_range if either index is out of range.
    */
    void AddEdge(NodeIndex from, NodeIndex to);

    /// The number of nodes.
    std::size_t NodeCount() const CDL_NOEXCEPT;

    /// The number of (distinct) edges.
    std::size_t EdgeCount() const CDL_NOEXCEPT;

    /// The name of a node.
    const std::string& NodeName(NodeIndex node) const;

    /// Returns whether the edge `from -> to` exists.
    bool HasEdge(NodeIndex from, NodeIndex to) const;

    /// The nodes which depend on `node`, in ascending order.
    const std::vector<NodeIndex>& Successors(NodeIndex node) const;

    /// The nodes which `node` depends on, in ascending order.
    const std::vector<NodeIndex>& Predecessors(NodeIndex node) const;

private:
    std::vector<std::string> m_names;
    std::vector<std::vector<NodeIndex>> m_successors;
    std::vector<std::vector<NodeIndex>> m_predecessors;
    std::size_t m_edgeCount;
};


/**
\brief  Builds the dependency graph of a composite block.

There is one edge for every connection from the output of one child to the
input of another (or the same) child.  Connections to and from the
composite's own connectors do not create edges.

\throws std::invalid_argument
    If a connection refers to a child which does not exist.
*/
DependencyGraph BuildDependencyGraph(const cdl::model::BlockDescription& composite);


/**
\brief  Finds the algebraic loops of a dependency graph.

One cycle is returned for each strongly connected component which contains
a cycle.  Each cycle is the shortest one through the lowest-index node of
its component.  It starts with that node and follows the direction of the
edges, so that every node depends on the one before it and the first node
depends on the last.  The cycles are ordered by their first node.
*/
std::vector<std::vector<DependencyGraph::NodeIndex>> FindCycles(
    const DependencyGraph& graph);


/// Exception thrown by Schedule() when the graph contains an algebraic loop.
class AlgebraicLoopError : public std::runtime_error
{
public:
    explicit AlgebraicLoopError(const std::vector<std::string>& cycle);

    /// The names of the instances on the loop, in dependency order.
    const std::vector<std::string>& Cycle() const CDL_NOEXCEPT;

private:
    std::vector<std::string> m_cycle;
};


/**
\brief  Computes the evaluation order of a dependency graph.

This uses Kahn's algorithm.  Whenever more than one node is ready, the one
with the lowest index (i.e., the one declared first) is chosen, so the order
is fully deterministic.

\throws AlgebraicLoopError
    If the graph contains a cycle.  The exception carries the first cycle
    found by FindCycles().
*/
std::vector<DependencyGraph::NodeIndex> Schedule(const DependencyGraph& graph);


}} // namespace
#endif // header guard
