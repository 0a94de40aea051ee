#include "road_tracer/graph.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace road_tracer
{

void validate_weight(double weight)
{
    if (!(weight > 0.0) || !std::isfinite(weight))
    {
        throw GraphError(ErrorKind::InvalidWeight, "Edge weight must be a positive distance, got " + std::to_string(weight));
    }
}

void Graph::require_vertex(const std::string &id) const
{
    if (adjacency_.find(id) == adjacency_.end())
    {
        throw GraphError(ErrorKind::UnknownVertex, "Unknown vertex '" + id + "'");
    }
}

const Arc &Graph::require_arc(const std::string &from, const std::string &to) const
{
    const auto from_it = adjacency_.find(from);
    if (from_it != adjacency_.end())
    {
        const auto arc_it = from_it->second.find(to);
        if (arc_it != from_it->second.end())
        {
            return arc_it->second;
        }
    }
    throw GraphError(ErrorKind::UnknownEdge, "No edge from '" + from + "' to '" + to + "'");
}

void Graph::erase_logical_edge(const std::string &from, const std::string &to)
{
    auto &arcs = adjacency_[from];
    const auto arc_it = arcs.find(to);
    if (arc_it == arcs.end())
    {
        return;
    }

    if (!arc_it->second.directed && from != to)
    {
        adjacency_[to].erase(from);
    }
    arcs.erase(arc_it);
}

void Graph::add_vertex(const std::string &id)
{
    if (adjacency_.find(id) != adjacency_.end())
    {
        throw GraphError(ErrorKind::DuplicateVertex, "Vertex '" + id + "' already exists");
    }
    adjacency_[id];
}

void Graph::remove_vertex(const std::string &id)
{
    require_vertex(id);

    adjacency_.erase(id);
    for (auto &entry : adjacency_)
    {
        entry.second.erase(id);
    }
}

void Graph::add_edge(const std::string &from, const std::string &to, double weight, bool directed)
{
    require_vertex(from);
    require_vertex(to);
    validate_weight(weight);

    // A new edge replaces whatever logical edge already occupies its arcs.
    erase_logical_edge(from, to);
    if (!directed)
    {
        erase_logical_edge(to, from);
    }

    adjacency_[from][to] = {weight, directed};
    if (!directed && from != to)
    {
        adjacency_[to][from] = {weight, false};
    }
}

void Graph::remove_edge(const std::string &from, const std::string &to)
{
    require_arc(from, to);
    erase_logical_edge(from, to);
}

void Graph::set_weight(const std::string &from, const std::string &to, double weight)
{
    const Arc &arc = require_arc(from, to);
    validate_weight(weight);

    const bool mirrored = !arc.directed && from != to;
    adjacency_[from][to].weight = weight;
    if (mirrored)
    {
        adjacency_[to][from].weight = weight;
    }
}

void Graph::make_directed(const std::string &from, const std::string &to)
{
    const Arc &arc = require_arc(from, to);
    if (arc.directed)
    {
        return;
    }

    if (from != to)
    {
        adjacency_[to].erase(from);
    }
    adjacency_[from][to].directed = true;
}

std::vector<std::pair<std::string, double>> Graph::neighbors(const std::string &id) const
{
    require_vertex(id);

    std::vector<std::pair<std::string, double>> result;
    const auto &arcs = adjacency_.at(id);
    result.reserve(arcs.size());
    for (const auto &[target, arc] : arcs)
    {
        result.push_back({target, arc.weight});
    }
    return result;
}

bool Graph::has_vertex(const std::string &id) const
{
    return adjacency_.find(id) != adjacency_.end();
}

bool Graph::has_edge(const std::string &from, const std::string &to) const
{
    const auto from_it = adjacency_.find(from);
    return from_it != adjacency_.end() && from_it->second.count(to) > 0;
}

double Graph::edge_weight(const std::string &from, const std::string &to) const
{
    return require_arc(from, to).weight;
}

bool Graph::is_directed(const std::string &from, const std::string &to) const
{
    return require_arc(from, to).directed;
}

std::vector<std::string> Graph::vertices() const
{
    std::vector<std::string> ids;
    ids.reserve(adjacency_.size());
    for (const auto &entry : adjacency_)
    {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<EdgeRecord> Graph::edges() const
{
    std::vector<EdgeRecord> records;
    for (const auto &[from, arcs] : adjacency_)
    {
        for (const auto &[to, arc] : arcs)
        {
            // Undirected edges are reported once, from their smaller endpoint.
            if (arc.directed || from <= to)
            {
                records.push_back({from, to, arc.weight, arc.directed});
            }
        }
    }
    return records;
}

std::size_t Graph::arc_count() const
{
    std::size_t total = 0;
    for (const auto &entry : adjacency_)
    {
        total += entry.second.size();
    }
    return total;
}

Graph build_graph(const std::vector<std::string> &cities, const std::vector<EdgeRecord> &records)
{
    std::cout << "Building graph from " << cities.size() << " cities and " << records.size() << " road records..." << std::endl;

    Graph graph;
    for (const auto &city : cities)
    {
        if (!graph.has_vertex(city))
        {
            graph.add_vertex(city);
        }
    }

    int oneway_count = 0;
    for (const auto &record : records)
    {
        graph.add_edge(record.from, record.to, record.weight, record.directed);
        if (record.directed)
        {
            oneway_count++;
        }
    }

    std::cout << "Graph built with " << graph.vertex_count() << " cities and " << graph.arc_count() << " directed arcs." << std::endl;
    std::cout << "Identified " << oneway_count << " one-way roads." << std::endl;

    return graph;
}

} // namespace road_tracer
