#pragma once

#include <string>
#include <vector>

#include "graph.hpp"
#include "types.hpp"

namespace road_tracer
{

struct LoadedNetwork
{
    Graph graph;
    CityAtlas atlas;
};

std::vector<EdgeRecord> load_distance_records(const std::string &path);
CityAtlas load_city_positions(const std::string &path);
LoadedNetwork load_network(const std::string &distances_path, const std::string &positions_path);

} // namespace road_tracer
