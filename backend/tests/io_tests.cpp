#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "road_tracer/config.hpp"
#include "road_tracer/loader.hpp"
#include "road_tracer/routing.hpp"
#include "road_tracer/serialization.hpp"
#include "road_tracer/session.hpp"

namespace
{

namespace fs = std::filesystem;

using nlohmann::json;
using road_tracer::ErrorKind;
using road_tracer::Graph;
using road_tracer::GraphError;
using road_tracer::SearchOutcome;
using road_tracer::SearchRun;
using road_tracer::ServerConfig;
using road_tracer::Session;

struct TestCase
{
    const char *name;
    const char *intent;
    std::function<bool(void)> run;
};

bool almost_equal(double a, double b, double eps = 1e-9)
{
    return std::abs(a - b) <= eps;
}

fs::path scratch_dir()
{
    const fs::path dir = fs::temp_directory_path() / "road_tracer_io_tests";
    fs::create_directories(dir);
    return dir;
}

std::string write_file(const std::string &name, const std::string &contents)
{
    const fs::path path = scratch_dir() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

template <typename Fn>
bool throws_runtime_error(Fn &&fn)
{
    try
    {
        fn();
    }
    catch (const GraphError &)
    {
        return false;
    }
    catch (const std::runtime_error &)
    {
        return true;
    }
    return false;
}

Graph make_triangle()
{
    Graph graph;
    graph.add_vertex("Kyiv");
    graph.add_vertex("Lviv");
    graph.add_vertex("Odesa");
    graph.add_edge("Kyiv", "Lviv", 540.0, false);
    graph.add_edge("Lviv", "Odesa", 700.0, false);
    graph.add_edge("Kyiv", "Odesa", 480.0, false);
    return graph;
}

// Intent: the shipped road network loads and routes Kyiv to Lviv through Zhytomyr and Rivne.
bool test_shipped_network_loads()
{
    const ServerConfig config;
    const auto network = road_tracer::load_network(config.distances_path(), config.positions_path());
    const SearchRun run = road_tracer::search(network.graph, "Kyiv", std::string("Lviv"), true);

    return network.graph.vertex_count() == 22 &&
           network.graph.arc_count() == 70 &&
           network.atlas.size() == 22 &&
           almost_equal(network.atlas.at("Kyiv").x, 520.0) &&
           run.result.path == std::vector<std::string>{"Kyiv", "Zhytomyr", "Rivne", "Lviv"} &&
           almost_equal(run.result.total_distance, 540.0);
}

// Intent: CSV rows honour the optional directed column, trimming and blank lines.
bool test_distance_records_parse()
{
    const std::string path = write_file("roads.csv",
                                        "source, target ,distance_km,directed\n"
                                        "Kyiv,Lviv,540,0\n"
                                        "\n"
                                        " Lviv , Odesa ,700.5,yes\n"
                                        "Odesa,Kyiv,480,\n");
    const auto records = road_tracer::load_distance_records(path);

    return records.size() == 3 &&
           records[0].from == "Kyiv" && !records[0].directed &&
           records[1].from == "Lviv" && records[1].to == "Odesa" &&
           almost_equal(records[1].weight, 700.5) && records[1].directed &&
           !records[2].directed;
}

// Intent: a file without the directed column loads every road as undirected.
bool test_distance_records_without_direction()
{
    const std::string path = write_file("plain.csv",
                                        "source,target,distance_km\n"
                                        "Kyiv,Lviv,540\n");
    const auto records = road_tracer::load_distance_records(path);
    return records.size() == 1 && !records[0].directed && almost_equal(records[0].weight, 540.0);
}

// Intent: malformed CSV input is reported instead of silently skipped.
bool test_distance_records_reject_malformed()
{
    const std::string bad_header = write_file("bad_header.csv", "from,to,km\nKyiv,Lviv,540\n");
    const std::string bad_distance = write_file("bad_distance.csv", "source,target,distance_km\nKyiv,Lviv,far\n");
    const std::string short_row = write_file("short_row.csv", "source,target,distance_km\nKyiv,Lviv\n");
    const std::string bad_flag = write_file("bad_flag.csv", "source,target,distance_km,directed\nKyiv,Lviv,540,maybe\n");

    return throws_runtime_error([&]
                                { (void)road_tracer::load_distance_records(bad_header); }) &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_distance_records(bad_distance); }) &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_distance_records(short_row); }) &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_distance_records(bad_flag); }) &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_distance_records((scratch_dir() / "missing.csv").string()); });
}

// Intent: a non-positive distance in the data fails graph construction with InvalidWeight.
bool test_network_rejects_invalid_weight()
{
    const std::string roads = write_file("zero.csv", "source,target,distance_km\nKyiv,Lviv,0\n");
    try
    {
        (void)road_tracer::load_network(roads, (scratch_dir() / "no_positions.json").string());
    }
    catch (const GraphError &ex)
    {
        return ex.kind() == ErrorKind::InvalidWeight;
    }
    return false;
}

// Intent: positions are optional, cities without one sit at the origin.
bool test_positions_optional()
{
    const std::string roads = write_file("pair.csv", "source,target,distance_km\nKyiv,Lviv,540\n");
    const std::string positions = write_file("positions.json", R"({"Kyiv": {"x": 10, "y": 20}, "Simferopol": {"x": 5}})");

    const auto network = road_tracer::load_network(roads, positions);
    const auto missing = road_tracer::load_city_positions((scratch_dir() / "absent.json").string());

    return network.graph.vertex_count() == 3 &&
           network.graph.has_vertex("Simferopol") &&
           almost_equal(network.atlas.at("Kyiv").y, 20.0) &&
           almost_equal(network.atlas.at("Lviv").x, 0.0) &&
           almost_equal(network.atlas.at("Simferopol").y, 0.0) &&
           missing.empty();
}

// Intent: malformed positions JSON is an error.
bool test_positions_reject_malformed()
{
    const std::string broken = write_file("broken.json", "{\"Kyiv\": ");
    const std::string wrong_shape = write_file("array.json", "[1, 2, 3]");
    const std::string wrong_type = write_file("wrong_type.json", R"({"Kyiv": {"x": "east"}})");

    return throws_runtime_error([&]
                                { (void)road_tracer::load_city_positions(broken); }) &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_city_positions(wrong_shape); }) &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_city_positions(wrong_type); });
}

// Intent: step JSON carries the tagged shape and writes unreached distances as null.
bool test_step_json_shape()
{
    const Graph graph = make_triangle();
    const SearchRun run = road_tracer::search(graph, "Kyiv", std::string("Odesa"), true);

    const json expand = road_tracer::step_to_json(run.trace[0]);
    const json relax = road_tracer::step_to_json(run.trace[1]);

    return expand["kind"] == "expand" &&
           expand["neighbor"].is_null() &&
           expand["candidate_distance"].is_null() &&
           expand["distances"]["Kyiv"] == 0.0 &&
           expand["distances"]["Lviv"].is_null() &&
           expand["visited"] == json::array({"Kyiv"}) &&
           relax["kind"] == "relax" &&
           relax["neighbor"] == "Lviv" &&
           relax["improved"] == true &&
           relax["new_distance"] == 540.0 &&
           relax["description"].get<std::string>().find("improves") != std::string::npos;
}

// Intent: result JSON reflects each outcome.
bool test_result_json_outcomes()
{
    Graph graph = make_triangle();
    graph.add_vertex("Simferopol");

    const json found = road_tracer::result_to_json(road_tracer::search(graph, "Kyiv", std::string("Odesa"), true).result);
    const json none = road_tracer::result_to_json(road_tracer::search(graph, "Kyiv", std::string("Simferopol"), true).result);
    const json all = road_tracer::result_to_json(road_tracer::search(graph, "Kyiv", std::nullopt, false).result);

    return found["outcome"] == "path_found" &&
           found["path"] == json::array({"Kyiv", "Odesa"}) &&
           found["total_distance"] == 480.0 &&
           found["segments"].size() == 1 &&
           found["segments"][0]["distance"] == 480.0 &&
           found["predecessors"]["Odesa"] == "Kyiv" &&
           found["summary"] == "Kyiv (480 km) -> Odesa, total 480 km" &&
           none["outcome"] == "no_path" &&
           none["total_distance"].is_null() &&
           none["path"].empty() &&
           all["outcome"] == "distances_only" &&
           all["target"].is_null() &&
           all["distances"]["Simferopol"].is_null() &&
           none["summary"] == "No path from Kyiv to Simferopol";
}

// Intent: graph JSON lists every city with its position and each road once.
bool test_graph_json()
{
    Graph graph = make_triangle();
    graph.make_directed("Lviv", "Odesa");
    const road_tracer::CityAtlas atlas = {{"Kyiv", {520.0, 210.0}}};

    const json graph_json = road_tracer::graph_to_json(graph, atlas);
    const json &edges = graph_json["edges"];

    bool directed_seen = false;
    for (const auto &edge : edges)
    {
        if (edge["from"] == "Lviv" && edge["to"] == "Odesa")
        {
            directed_seen = edge["directed"] == true;
        }
    }

    return graph_json["vertices"].size() == 3 &&
           graph_json["vertices"][0]["name"] == "Kyiv" &&
           graph_json["vertices"][0]["x"] == 520.0 &&
           graph_json["vertices"][1]["x"] == 0.0 &&
           edges.size() == 3 &&
           graph_json["arc_count"] == 5 &&
           directed_seen;
}

// Intent: a saved run is readable JSON; an unwritable path reports failure.
bool test_save_search_run()
{
    const Graph graph = make_triangle();
    const SearchRun run = road_tracer::search(graph, "Kyiv", std::string("Odesa"), true);
    const std::string output = (scratch_dir() / "trace.json").string();

    if (!road_tracer::save_search_run(run, output))
    {
        return false;
    }

    std::ifstream in(output);
    json saved;
    in >> saved;

    const bool unwritable = !road_tracer::save_search_run(run, (scratch_dir() / "no_such_dir" / "trace.json").string());
    return saved["trace"].size() == run.trace.size() &&
           saved["result"]["path"] == json::array({"Kyiv", "Odesa"}) &&
           unwritable;
}

// Intent: config falls back to defaults per key and validates the port.
bool test_server_config()
{
    const ServerConfig defaults = road_tracer::load_server_config("");
    const std::string partial = write_file("config.json", R"({"port": 9090, "data_dir": "/srv/roads/"})");
    const ServerConfig config = road_tracer::load_server_config(partial);
    const std::string bad_port = write_file("bad_port.json", R"({"port": 70000})");
    const std::string malformed = write_file("malformed.json", "{port: 1}");

    return defaults.port == 8080 &&
           defaults.host == "0.0.0.0" &&
           config.port == 9090 &&
           config.host == "0.0.0.0" &&
           config.distances_path() == "/srv/roads/distances.csv" &&
           config.positions_path() == "/srv/roads/cities_positions.json" &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_server_config(bad_port); }) &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_server_config(malformed); }) &&
           throws_runtime_error([&]
                                { (void)road_tracer::load_server_config((scratch_dir() / "nope.json").string()); });
}

// Intent: edits after a search leave the stored run and earlier snapshots untouched.
bool test_session_snapshot_isolation()
{
    Session session(make_triangle(), {});
    const Graph before = session.graph_snapshot();
    const SearchRun run = session.run_search("Kyiv", std::string("Odesa"), true);

    session.remove_edge("Kyiv", "Odesa");
    const auto stored = session.last_run();
    const SearchRun rerun = session.run_search("Kyiv", std::string("Odesa"), true);

    return before.has_edge("Kyiv", "Odesa") &&
           stored.has_value() &&
           stored->result.path == std::vector<std::string>{"Kyiv", "Odesa"} &&
           run.result == stored->result &&
           rerun.result.path == std::vector<std::string>{"Kyiv", "Lviv", "Odesa"} &&
           almost_equal(rerun.result.total_distance, 1240.0);
}

// Intent: the session replays the last trace step by step and rewinds on reset.
bool test_session_replay()
{
    Session session(make_triangle(), {});
    if (session.has_run() || session.next_step().has_value())
    {
        return false;
    }

    const SearchRun run = session.run_search("Kyiv", std::string("Odesa"), true);
    std::size_t count = 0;
    while (const auto step = session.next_step())
    {
        if (*step != run.trace[count])
        {
            return false;
        }
        count++;
    }

    const bool finished = count == run.trace.size() && session.replay_position() == run.trace.size();
    session.reset_replay();
    const auto first = session.next_step();

    return finished &&
           first.has_value() &&
           first->current == "Kyiv" &&
           session.try_step_at(3).has_value() &&
           session.try_step_at(3)->current == "Odesa" &&
           !session.try_step_at(4).has_value() &&
           session.replay_size() == 4;
}

// Intent: session edits keep the atlas in step and surface typed failures.
bool test_session_edits()
{
    Session session(make_triangle(), {{"Kyiv", {1.0, 2.0}}});
    session.add_vertex("Dnipro", {8.0, 3.0});
    session.add_edge("Dnipro", "Kyiv", 480.0, false);
    session.set_weight("Kyiv", "Dnipro", 475.0);
    session.make_directed("Dnipro", "Kyiv");
    session.remove_vertex("Lviv");

    bool duplicate = false;
    try
    {
        session.add_vertex("Kyiv", {});
    }
    catch (const GraphError &ex)
    {
        duplicate = ex.kind() == ErrorKind::DuplicateVertex;
    }

    const Graph graph = session.graph_snapshot();
    const auto atlas = session.atlas_snapshot();
    return duplicate &&
           graph.has_edge("Dnipro", "Kyiv") &&
           !graph.has_edge("Kyiv", "Dnipro") &&
           almost_equal(graph.edge_weight("Dnipro", "Kyiv"), 475.0) &&
           !graph.has_vertex("Lviv") &&
           atlas.count("Dnipro") == 1 &&
           atlas.count("Lviv") == 0 &&
           almost_equal(atlas.at("Kyiv").y, 2.0);
}

// Intent: reloading replaces the network and clears the stored run.
bool test_session_reload()
{
    Session session(make_triangle(), {});
    (void)session.run_search("Kyiv", std::nullopt, false);

    road_tracer::LoadedNetwork network;
    network.graph.add_vertex("Uzhhorod");
    session.reload(std::move(network));

    return !session.has_run() &&
           session.replay_size() == 0 &&
           session.graph_snapshot().vertex_count() == 1;
}

} // namespace

int main()
{
    const std::vector<TestCase> tests = {
        {"Loader_ShippedNetwork", "shipped data loads and routes", test_shipped_network_loads},
        {"Loader_RecordsParse", "CSV rows parse with direction flags", test_distance_records_parse},
        {"Loader_RecordsNoDirection", "missing directed column means undirected", test_distance_records_without_direction},
        {"Loader_RecordsMalformed", "malformed CSV is reported", test_distance_records_reject_malformed},
        {"Loader_InvalidWeight", "zero distance fails with InvalidWeight", test_network_rejects_invalid_weight},
        {"Loader_PositionsOptional", "cities without positions sit at origin", test_positions_optional},
        {"Loader_PositionsMalformed", "malformed positions JSON is reported", test_positions_reject_malformed},
        {"Export_StepJson", "step JSON shape with null infinity", test_step_json_shape},
        {"Export_ResultJson", "result JSON for every outcome", test_result_json_outcomes},
        {"Export_GraphJson", "graph JSON lists cities and roads", test_graph_json},
        {"Export_SaveRun", "saved run is readable, bad path fails", test_save_search_run},
        {"Config_Defaults", "config defaults and validation", test_server_config},
        {"Session_SnapshotIsolation", "edits never alter a finished run", test_session_snapshot_isolation},
        {"Session_Replay", "session replays and rewinds the trace", test_session_replay},
        {"Session_Edits", "session edits keep atlas in step", test_session_edits},
        {"Session_Reload", "reload replaces network and run", test_session_reload},
    };

    bool all_passed = true;
    for (const TestCase &test : tests)
    {
        bool passed = false;
        try
        {
            passed = test.run();
        }
        catch (const std::exception &ex)
        {
            std::cerr << test.name << " threw: " << ex.what() << "\n";
        }
        std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
        all_passed = all_passed && passed;
    }

    if (!all_passed)
    {
        std::cerr << "io tests failed\n";
        return 1;
    }

    std::cout << "io tests passed (" << tests.size() << " cases)\n";
    return 0;
}
