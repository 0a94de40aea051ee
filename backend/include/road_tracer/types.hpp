#pragma once

#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace road_tracer
{

constexpr double kInfinity = std::numeric_limits<double>::infinity();

enum class ErrorKind
{
    UnknownVertex,
    DuplicateVertex,
    UnknownEdge,
    InvalidWeight
};

const char *error_kind_name(ErrorKind kind);

class GraphError : public std::runtime_error
{
public:
    GraphError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

struct Arc
{
    double weight{};
    bool directed{false};
};

// One logical edge as supplied by a loader or reported back by Graph::edges().
struct EdgeRecord
{
    std::string from;
    std::string to;
    double weight{};
    bool directed{false};
};

struct Position
{
    double x{};
    double y{};
};

using CityAtlas = std::map<std::string, Position>;
using DistanceMap = std::map<std::string, double>;

enum class StepKind
{
    Expand,
    Relax
};

struct SearchStep
{
    StepKind kind{StepKind::Expand};
    std::string current;
    std::optional<std::string> neighbor;
    bool improved{false};
    double candidate_distance{kInfinity};
    std::optional<double> new_distance;
    DistanceMap distances;
    std::vector<std::string> visited;
};

bool operator==(const SearchStep &lhs, const SearchStep &rhs);
bool operator!=(const SearchStep &lhs, const SearchStep &rhs);

using StepTrace = std::vector<SearchStep>;

enum class SearchOutcome
{
    PathFound,
    NoPath,
    DistancesOnly
};

const char *outcome_name(SearchOutcome outcome);

struct PathSegment
{
    std::string from;
    std::string to;
    double distance{};
};

struct SearchResult
{
    SearchOutcome outcome{SearchOutcome::DistancesOnly};
    std::string source;
    std::optional<std::string> target;
    std::vector<std::string> path;
    double total_distance{kInfinity};
    std::vector<PathSegment> segments;
    DistanceMap distances;
    std::map<std::string, std::string> predecessors;
};

bool operator==(const SearchResult &lhs, const SearchResult &rhs);
bool operator!=(const SearchResult &lhs, const SearchResult &rhs);

struct SearchRun
{
    StepTrace trace;
    SearchResult result;
};

} // namespace road_tracer
