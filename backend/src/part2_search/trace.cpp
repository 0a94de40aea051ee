#include "road_tracer/trace.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace road_tracer
{
namespace
{

std::string format_distance(double distance)
{
    if (!std::isfinite(distance))
    {
        return "unreached";
    }
    std::ostringstream out;
    out << distance << " km";
    return out.str();
}

} // namespace

TracePlayer::TracePlayer(StepTrace trace)
    : trace_(std::move(trace)), position_(0)
{
}

const SearchStep &TracePlayer::next()
{
    if (!has_next())
    {
        throw std::out_of_range("Trace replay is finished (" + std::to_string(trace_.size()) + " steps)");
    }
    return trace_[position_++];
}

const SearchStep &TracePlayer::peek() const
{
    if (!has_next())
    {
        throw std::out_of_range("Trace replay is finished (" + std::to_string(trace_.size()) + " steps)");
    }
    return trace_[position_];
}

const SearchStep &TracePlayer::at(std::size_t index) const
{
    if (index >= trace_.size())
    {
        throw std::out_of_range("Step " + std::to_string(index) + " is outside a trace of " + std::to_string(trace_.size()) + " steps");
    }
    return trace_[index];
}

std::string describe_step(const SearchStep &step)
{
    std::ostringstream out;

    const auto current_it = step.distances.find(step.current);
    const double current_distance = current_it != step.distances.end() ? current_it->second : kInfinity;

    if (step.kind == StepKind::Expand || !step.neighbor)
    {
        out << "Expanding " << step.current << " at " << format_distance(current_distance);
        return out.str();
    }

    out << step.current << " -> " << *step.neighbor << ": candidate " << format_distance(step.candidate_distance);
    if (step.improved)
    {
        out << " improves the route to " << *step.neighbor;
    }
    else
    {
        const auto neighbor_it = step.distances.find(*step.neighbor);
        const double best = neighbor_it != step.distances.end() ? neighbor_it->second : kInfinity;
        out << " rejected, best stays " << format_distance(best);
    }
    return out.str();
}

// "Kyiv (540 km) -> Lviv (700 km) -> Odesa, total 1240 km"
std::string describe_result(const SearchResult &result)
{
    std::ostringstream out;

    switch (result.outcome)
    {
    case SearchOutcome::PathFound:
        for (const auto &segment : result.segments)
        {
            out << segment.from << " (" << format_distance(segment.distance) << ") -> ";
        }
        out << (result.path.empty() ? result.source : result.path.back());
        out << ", total " << format_distance(result.total_distance);
        break;
    case SearchOutcome::NoPath:
        out << "No path from " << result.source << " to " << result.target.value_or("?");
        break;
    case SearchOutcome::DistancesOnly:
    {
        std::size_t reached = 0;
        for (const auto &entry : result.distances)
        {
            if (std::isfinite(entry.second))
            {
                reached++;
            }
        }
        out << "Distances from " << result.source << ": " << reached << " of " << result.distances.size() << " cities reached";
        break;
    }
    }
    return out.str();
}

} // namespace road_tracer
