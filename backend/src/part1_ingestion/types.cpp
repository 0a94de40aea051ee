#include "road_tracer/types.hpp"

namespace road_tracer
{

const char *error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::UnknownVertex:
        return "UnknownVertex";
    case ErrorKind::DuplicateVertex:
        return "DuplicateVertex";
    case ErrorKind::UnknownEdge:
        return "UnknownEdge";
    case ErrorKind::InvalidWeight:
        return "InvalidWeight";
    }
    return "Unknown";
}

const char *outcome_name(SearchOutcome outcome)
{
    switch (outcome)
    {
    case SearchOutcome::PathFound:
        return "path_found";
    case SearchOutcome::NoPath:
        return "no_path";
    case SearchOutcome::DistancesOnly:
        return "distances_only";
    }
    return "unknown";
}

bool operator==(const SearchStep &lhs, const SearchStep &rhs)
{
    return lhs.kind == rhs.kind &&
           lhs.current == rhs.current &&
           lhs.neighbor == rhs.neighbor &&
           lhs.improved == rhs.improved &&
           lhs.candidate_distance == rhs.candidate_distance &&
           lhs.new_distance == rhs.new_distance &&
           lhs.distances == rhs.distances &&
           lhs.visited == rhs.visited;
}

bool operator!=(const SearchStep &lhs, const SearchStep &rhs)
{
    return !(lhs == rhs);
}

bool operator==(const SearchResult &lhs, const SearchResult &rhs)
{
    if (lhs.segments.size() != rhs.segments.size())
    {
        return false;
    }
    for (size_t i = 0; i < lhs.segments.size(); i++)
    {
        const auto &a = lhs.segments[i];
        const auto &b = rhs.segments[i];
        if (a.from != b.from || a.to != b.to || a.distance != b.distance)
        {
            return false;
        }
    }

    return lhs.outcome == rhs.outcome &&
           lhs.source == rhs.source &&
           lhs.target == rhs.target &&
           lhs.path == rhs.path &&
           lhs.total_distance == rhs.total_distance &&
           lhs.distances == rhs.distances &&
           lhs.predecessors == rhs.predecessors;
}

bool operator!=(const SearchResult &lhs, const SearchResult &rhs)
{
    return !(lhs == rhs);
}

} // namespace road_tracer
