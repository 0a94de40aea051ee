#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "graph.hpp"
#include "types.hpp"

namespace road_tracer
{

nlohmann::json distance_to_json(double distance);
nlohmann::json distances_to_json(const DistanceMap &distances);
nlohmann::json step_to_json(const SearchStep &step);
nlohmann::json trace_to_json(const StepTrace &trace);
nlohmann::json result_to_json(const SearchResult &result);
nlohmann::json graph_to_json(const Graph &graph, const CityAtlas &atlas);

bool save_search_run(const SearchRun &run, const std::string &output_file);

} // namespace road_tracer
