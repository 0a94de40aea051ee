#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include "graph.hpp"
#include "loader.hpp"
#include "trace.hpp"
#include "types.hpp"

namespace road_tracer
{

// The one editable road network behind the server, plus the last search and its
// replay cursor. All members are guarded by a single mutex; searches run on a copy
// taken under the lock so edits never race an in-progress search.
class Session
{
public:
    Session() = default;
    Session(Graph graph, CityAtlas atlas);

    void reload(LoadedNetwork network);

    void add_vertex(const std::string &id, const Position &position);
    void remove_vertex(const std::string &id);
    void add_edge(const std::string &from, const std::string &to, double weight, bool directed);
    void remove_edge(const std::string &from, const std::string &to);
    void set_weight(const std::string &from, const std::string &to, double weight);
    void make_directed(const std::string &from, const std::string &to);

    Graph graph_snapshot() const;
    CityAtlas atlas_snapshot() const;

    SearchRun run_search(const std::string &source, const std::optional<std::string> &target, bool early_stop);

    bool has_run() const;
    std::optional<SearchRun> last_run() const;
    std::optional<SearchStep> next_step();
    void reset_replay();
    std::optional<SearchStep> try_step_at(std::size_t index) const;
    std::size_t replay_position() const;
    std::size_t replay_size() const;

private:
    mutable std::mutex mutex_;
    Graph graph_;
    CityAtlas atlas_;
    std::optional<SearchRun> last_run_;
    TracePlayer player_;
};

} // namespace road_tracer
