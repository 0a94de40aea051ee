#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace road_tracer
{

// Weighted road network keyed by city name. Vertices and each vertex's outgoing arcs
// are kept in lexicographic order, which is the order searches break ties in.
// Every mutator validates its arguments first and throws GraphError without touching
// the graph when they are rejected.
class Graph
{
public:
    void add_vertex(const std::string &id);
    void remove_vertex(const std::string &id);

    void add_edge(const std::string &from, const std::string &to, double weight, bool directed);
    void remove_edge(const std::string &from, const std::string &to);
    void set_weight(const std::string &from, const std::string &to, double weight);
    void make_directed(const std::string &from, const std::string &to);

    std::vector<std::pair<std::string, double>> neighbors(const std::string &id) const;

    bool has_vertex(const std::string &id) const;
    bool has_edge(const std::string &from, const std::string &to) const;
    double edge_weight(const std::string &from, const std::string &to) const;
    bool is_directed(const std::string &from, const std::string &to) const;

    std::vector<std::string> vertices() const;
    std::vector<EdgeRecord> edges() const;

    std::size_t vertex_count() const { return adjacency_.size(); }
    std::size_t arc_count() const;

private:
    const Arc &require_arc(const std::string &from, const std::string &to) const;
    void require_vertex(const std::string &id) const;
    void erase_logical_edge(const std::string &from, const std::string &to);

    using Adjacency = std::map<std::string, std::map<std::string, Arc>>;

    Adjacency adjacency_;
};

void validate_weight(double weight);

Graph build_graph(const std::vector<std::string> &cities, const std::vector<EdgeRecord> &records);

} // namespace road_tracer
