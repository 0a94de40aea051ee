#include "road_tracer/serialization.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <string>

#include "road_tracer/trace.hpp"

namespace road_tracer
{

using json = nlohmann::json;

// Unreached vertices have no JSON number, so they go out as null.
json distance_to_json(double distance)
{
    if (!std::isfinite(distance))
    {
        return json();
    }
    return distance;
}

json distances_to_json(const DistanceMap &distances)
{
    json distances_json = json::object();
    for (const auto &[id, distance] : distances)
    {
        distances_json[id] = distance_to_json(distance);
    }
    return distances_json;
}

json step_to_json(const SearchStep &step)
{
    json step_json;
    step_json["kind"] = step.kind == StepKind::Expand ? "expand" : "relax";
    step_json["current"] = step.current;
    step_json["neighbor"] = step.neighbor ? json(*step.neighbor) : json();
    step_json["improved"] = step.improved;
    step_json["candidate_distance"] = step.kind == StepKind::Relax ? distance_to_json(step.candidate_distance) : json();
    step_json["new_distance"] = step.new_distance ? json(*step.new_distance) : json();
    step_json["distances"] = distances_to_json(step.distances);
    step_json["visited"] = step.visited;
    step_json["description"] = describe_step(step);
    return step_json;
}

json trace_to_json(const StepTrace &trace)
{
    json trace_json = json::array();
    for (const auto &step : trace)
    {
        trace_json.push_back(step_to_json(step));
    }
    return trace_json;
}

json result_to_json(const SearchResult &result)
{
    json result_json;
    result_json["outcome"] = outcome_name(result.outcome);
    result_json["source"] = result.source;
    result_json["target"] = result.target ? json(*result.target) : json();
    result_json["path"] = result.path;
    result_json["total_distance"] = result.outcome == SearchOutcome::PathFound ? distance_to_json(result.total_distance) : json();

    json segments_json = json::array();
    for (const auto &segment : result.segments)
    {
        segments_json.push_back({{"from", segment.from},
                                 {"to", segment.to},
                                 {"distance", segment.distance}});
    }
    result_json["segments"] = segments_json;
    result_json["distances"] = distances_to_json(result.distances);
    result_json["predecessors"] = result.predecessors;
    result_json["summary"] = describe_result(result);
    return result_json;
}

json graph_to_json(const Graph &graph, const CityAtlas &atlas)
{
    json vertices_json = json::array();
    for (const auto &id : graph.vertices())
    {
        const auto position_it = atlas.find(id);
        const Position position = position_it != atlas.end() ? position_it->second : Position{};
        vertices_json.push_back({{"name", id}, {"x", position.x}, {"y", position.y}});
    }

    json edges_json = json::array();
    for (const auto &edge : graph.edges())
    {
        edges_json.push_back({{"from", edge.from},
                              {"to", edge.to},
                              {"weight", edge.weight},
                              {"directed", edge.directed}});
    }

    json graph_json;
    graph_json["vertices"] = vertices_json;
    graph_json["edges"] = edges_json;
    graph_json["vertex_count"] = graph.vertex_count();
    graph_json["arc_count"] = graph.arc_count();
    return graph_json;
}

bool save_search_run(const SearchRun &run, const std::string &output_file)
{
    try
    {
        json run_json;
        run_json["result"] = result_to_json(run.result);
        run_json["trace"] = trace_to_json(run.trace);

        std::ofstream out(output_file);
        if (!out.is_open())
        {
            std::cerr << "Unable to open " << output_file << std::endl;
            return false;
        }
        out << run_json.dump(2);
        if (!out)
        {
            std::cerr << "Failed writing " << output_file << std::endl;
            return false;
        }

        std::cout << "Saved search trace from " << run.result.source << " (" << run.trace.size() << " steps) to " << output_file << std::endl;
        return true;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error saving search trace: " << ex.what() << std::endl;
        return false;
    }
}

} // namespace road_tracer
