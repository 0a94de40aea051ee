#include "road_tracer/session.hpp"

#include <iostream>
#include <utility>

#include "road_tracer/routing.hpp"

namespace road_tracer
{

Session::Session(Graph graph, CityAtlas atlas)
    : graph_(std::move(graph)), atlas_(std::move(atlas))
{
}

void Session::reload(LoadedNetwork network)
{
    std::lock_guard<std::mutex> lock(mutex_);
    graph_ = std::move(network.graph);
    atlas_ = std::move(network.atlas);
    last_run_.reset();
    player_ = TracePlayer();
}

void Session::add_vertex(const std::string &id, const Position &position)
{
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.add_vertex(id);
    atlas_[id] = position;
}

void Session::remove_vertex(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.remove_vertex(id);
    atlas_.erase(id);
}

void Session::add_edge(const std::string &from, const std::string &to, double weight, bool directed)
{
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.add_edge(from, to, weight, directed);
}

void Session::remove_edge(const std::string &from, const std::string &to)
{
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.remove_edge(from, to);
}

void Session::set_weight(const std::string &from, const std::string &to, double weight)
{
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.set_weight(from, to, weight);
}

void Session::make_directed(const std::string &from, const std::string &to)
{
    std::lock_guard<std::mutex> lock(mutex_);
    graph_.make_directed(from, to);
}

Graph Session::graph_snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_;
}

CityAtlas Session::atlas_snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return atlas_;
}

SearchRun Session::run_search(const std::string &source, const std::optional<std::string> &target, bool early_stop)
{
    const Graph snapshot = graph_snapshot();

    std::cout << "Running Dijkstra from " << source;
    if (target)
    {
        std::cout << " to " << *target;
    }
    std::cout << (early_stop ? " (early stop)" : "") << "..." << std::endl;

    SearchRun run = search(snapshot, source, target, early_stop);

    std::cout << "Dijkstra recorded " << run.trace.size() << " steps, outcome " << outcome_name(run.result.outcome) << "." << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    last_run_ = run;
    player_ = TracePlayer(run.trace);
    return run;
}

bool Session::has_run() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_run_.has_value();
}

std::optional<SearchRun> Session::last_run() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_run_;
}

std::optional<SearchStep> Session::next_step()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!player_.has_next())
    {
        return std::nullopt;
    }
    return player_.next();
}

void Session::reset_replay()
{
    std::lock_guard<std::mutex> lock(mutex_);
    player_.reset();
}

std::optional<SearchStep> Session::try_step_at(std::size_t index) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= player_.size())
    {
        return std::nullopt;
    }
    return player_.at(index);
}

std::size_t Session::replay_position() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return player_.position();
}

std::size_t Session::replay_size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return player_.size();
}

} // namespace road_tracer
