#include "road_tracer/routing.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace road_tracer
{
namespace
{

struct SearchState
{
    DistanceMap distances;
    std::map<std::string, std::string> predecessors;
    std::set<std::string> visited;
    std::vector<std::string> visit_order;
};

SearchStep make_step(const SearchState &state, StepKind kind, const std::string &current)
{
    SearchStep step;
    step.kind = kind;
    step.current = current;
    step.distances = state.distances;
    step.visited = state.visit_order;
    return step;
}

// Lowest finite tentative distance among unvisited vertices. Ties go to the
// lexicographically smallest id because the distance map iterates in that order.
const std::string *select_next(const SearchState &state)
{
    const std::string *best = nullptr;
    double best_distance = kInfinity;

    for (const auto &[id, distance] : state.distances)
    {
        if (state.visited.count(id))
        {
            continue;
        }
        if (distance < best_distance)
        {
            best_distance = distance;
            best = &id;
        }
    }
    return best;
}

} // namespace

SearchRun search(const Graph &graph, const std::string &source, const std::optional<std::string> &target, bool early_stop)
{
    if (!graph.has_vertex(source))
    {
        throw GraphError(ErrorKind::UnknownVertex, "Unknown source vertex '" + source + "'");
    }
    if (target && !graph.has_vertex(*target))
    {
        throw GraphError(ErrorKind::UnknownVertex, "Unknown target vertex '" + *target + "'");
    }

    const Graph snapshot = graph;

    SearchState state;
    for (const auto &id : snapshot.vertices())
    {
        state.distances[id] = kInfinity;
    }
    state.distances[source] = 0.0;

    SearchRun run;

    while (state.visit_order.size() < snapshot.vertex_count())
    {
        const std::string *next = select_next(state);
        if (next == nullptr)
        {
            // Everything left is unreachable.
            break;
        }

        const std::string current = *next;
        state.visited.insert(current);
        state.visit_order.push_back(current);
        run.trace.push_back(make_step(state, StepKind::Expand, current));

        // A search to its own source is finished once the source is expanded.
        if (target && current == *target && (early_stop || current == source))
        {
            break;
        }

        for (const auto &[neighbor, weight] : snapshot.neighbors(current))
        {
            const double candidate = state.distances[current] + weight;
            const bool improved = candidate < state.distances[neighbor];
            if (improved)
            {
                state.distances[neighbor] = candidate;
                state.predecessors[neighbor] = current;
            }

            SearchStep step = make_step(state, StepKind::Relax, current);
            step.neighbor = neighbor;
            step.improved = improved;
            step.candidate_distance = candidate;
            if (improved)
            {
                step.new_distance = candidate;
            }
            run.trace.push_back(std::move(step));
        }
    }

    SearchResult &result = run.result;
    result.source = source;
    result.target = target;
    result.distances = state.distances;
    result.predecessors = state.predecessors;

    if (!target)
    {
        result.outcome = SearchOutcome::DistancesOnly;
        return run;
    }

    const double target_distance = state.distances[*target];
    if (!std::isfinite(target_distance))
    {
        result.outcome = SearchOutcome::NoPath;
        return run;
    }

    result.outcome = SearchOutcome::PathFound;
    result.path = reconstruct_path(state.predecessors, source, *target);
    result.segments = path_segments(result.path, state.distances);
    result.total_distance = target_distance;

    return run;
}

std::vector<std::string> reconstruct_path(const std::map<std::string, std::string> &predecessors, const std::string &source, const std::string &target)
{
    std::vector<std::string> path;
    std::string node = target;

    while (true)
    {
        path.push_back(node);
        if (node == source)
        {
            break;
        }

        const auto it = predecessors.find(node);
        if (it == predecessors.end() || path.size() > predecessors.size() + 1)
        {
            return {};
        }
        node = it->second;
    }

    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<PathSegment> path_segments(const std::vector<std::string> &path, const DistanceMap &distances)
{
    std::vector<PathSegment> segments;
    if (path.size() < 2)
    {
        return segments;
    }

    segments.reserve(path.size() - 1);
    for (size_t i = 0; i + 1 < path.size(); i++)
    {
        const double from_distance = distances.at(path[i]);
        const double to_distance = distances.at(path[i + 1]);
        segments.push_back({path[i], path[i + 1], to_distance - from_distance});
    }
    return segments;
}

} // namespace road_tracer
