#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "graph.hpp"
#include "types.hpp"

namespace road_tracer
{

SearchRun search(const Graph &graph, const std::string &source, const std::optional<std::string> &target, bool early_stop);

std::vector<std::string> reconstruct_path(const std::map<std::string, std::string> &predecessors, const std::string &source, const std::string &target);
std::vector<PathSegment> path_segments(const std::vector<std::string> &path, const DistanceMap &distances);

} // namespace road_tracer
