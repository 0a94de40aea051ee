#include "road_tracer/api.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "road_tracer/loader.hpp"
#include "road_tracer/serialization.hpp"
#include "road_tracer/trace.hpp"
#include "road_tracer/types.hpp"

namespace road_tracer
{

using json = nlohmann::json;

namespace
{

void send_error(httplib::Response &res, int status, const std::string &kind, const std::string &message)
{
    json error;
    error["status"] = "error";
    error["kind"] = kind;
    error["message"] = message;
    res.status = status;
    res.set_content(error.dump(), "application/json");
}

void send_success(httplib::Response &res, json response)
{
    response["status"] = "success";
    res.set_content(response.dump(), "application/json");
}

std::string require_string(const json &body, const char *key)
{
    const std::string value = body.at(key).get<std::string>();
    if (value.empty())
    {
        throw BadRequest(std::string("Field '") + key + "' must not be empty");
    }
    return value;
}

json replay_state(const Session &session)
{
    return {{"position", session.replay_position()},
            {"steps", session.replay_size()}};
}

} // namespace

void guarded(httplib::Response &res, const std::function<void()> &body)
{
    try
    {
        body();
    }
    catch (const GraphError &ex)
    {
        send_error(res, 400, error_kind_name(ex.kind()), ex.what());
    }
    catch (const json::exception &ex)
    {
        send_error(res, 400, "BadRequest", ex.what());
    }
    catch (const BadRequest &ex)
    {
        send_error(res, 400, "BadRequest", ex.what());
    }
    catch (const std::invalid_argument &ex)
    {
        send_error(res, 400, "BadRequest", ex.what());
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Request failed: " << ex.what() << std::endl;
        send_error(res, 500, "InternalError", ex.what());
    }
}

void register_cors_handler(httplib::Server &server)
{
    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (req.method == "OPTIONS")
        {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled; });
}

void register_graph_routes(httplib::Server &server, Session &session, const ServerConfig &config)
{
    server.Get("/graph", [&session](const httplib::Request &, httplib::Response &res)
               { guarded(res, [&]
                         {
        json response;
        response["graph"] = graph_to_json(session.graph_snapshot(), session.atlas_snapshot());
        send_success(res, std::move(response)); }); });

    server.Post("/reload-graph", [&session, &config](const httplib::Request &, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto load_start = std::chrono::high_resolution_clock::now();
        session.reload(load_network(config.distances_path(), config.positions_path()));
        const auto load_end = std::chrono::high_resolution_clock::now();

        json response;
        response["graph"] = graph_to_json(session.graph_snapshot(), session.atlas_snapshot());
        response["timing"] = {
            {"load_ms", std::chrono::duration_cast<std::chrono::milliseconds>(load_end - load_start).count()}};
        send_success(res, std::move(response)); }); });

    server.Post("/add-vertex", [&session](const httplib::Request &req, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto body = json::parse(req.body);
        const std::string name = require_string(body, "name");
        session.add_vertex(name, {body.value("x", 0.0), body.value("y", 0.0)});
        std::cout << "Added city " << name << std::endl;
        send_success(res, {{"vertex", name}}); }); });

    server.Post("/remove-vertex", [&session](const httplib::Request &req, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto body = json::parse(req.body);
        const std::string name = require_string(body, "name");
        session.remove_vertex(name);
        std::cout << "Removed city " << name << " and its roads" << std::endl;
        send_success(res, {{"vertex", name}}); }); });

    server.Post("/add-edge", [&session](const httplib::Request &req, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto body = json::parse(req.body);
        const std::string from = require_string(body, "from");
        const std::string to = require_string(body, "to");
        const double weight = body.at("weight").get<double>();
        const bool directed = body.value("directed", false);
        session.add_edge(from, to, weight, directed);
        send_success(res, {{"from", from}, {"to", to}, {"weight", weight}, {"directed", directed}}); }); });

    server.Post("/remove-edge", [&session](const httplib::Request &req, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto body = json::parse(req.body);
        const std::string from = require_string(body, "from");
        const std::string to = require_string(body, "to");
        session.remove_edge(from, to);
        send_success(res, {{"from", from}, {"to", to}}); }); });

    server.Post("/set-weight", [&session](const httplib::Request &req, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto body = json::parse(req.body);
        const std::string from = require_string(body, "from");
        const std::string to = require_string(body, "to");
        const double weight = body.at("weight").get<double>();
        session.set_weight(from, to, weight);
        send_success(res, {{"from", from}, {"to", to}, {"weight", weight}}); }); });

    server.Post("/make-directed", [&session](const httplib::Request &req, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto body = json::parse(req.body);
        const std::string from = require_string(body, "from");
        const std::string to = require_string(body, "to");
        session.make_directed(from, to);
        send_success(res, {{"from", from}, {"to", to}, {"directed", true}}); }); });
}

void register_search_routes(httplib::Server &server, Session &session, const ServerConfig &config)
{
    server.Post("/search", [&session](const httplib::Request &req, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto body = json::parse(req.body);
        const std::string source = require_string(body, "source");
        std::optional<std::string> target;
        if (body.contains("target") && !body["target"].is_null())
        {
            target = require_string(body, "target");
        }
        const bool early_stop = body.value("early_stop", true);

        const auto search_start = std::chrono::high_resolution_clock::now();
        const SearchRun run = session.run_search(source, target, early_stop);
        const auto search_end = std::chrono::high_resolution_clock::now();

        json response;
        response["result"] = result_to_json(run.result);
        response["trace"] = trace_to_json(run.trace);
        response["step_count"] = run.trace.size();
        response["timing"] = {
            {"search_us", std::chrono::duration_cast<std::chrono::microseconds>(search_end - search_start).count()}};
        send_success(res, std::move(response)); }); });

    server.Get("/trace/next", [&session](const httplib::Request &, httplib::Response &res)
               { guarded(res, [&]
                         {
        if (!session.has_run())
        {
            send_error(res, 409, "NoTrace", "No search has been run yet. Call /search first.");
            return;
        }

        json response;
        const auto step = session.next_step();
        response["finished"] = !step.has_value();
        response["step"] = step ? step_to_json(*step) : json();
        response["replay"] = replay_state(session);
        send_success(res, std::move(response)); }); });

    server.Post("/trace/reset", [&session](const httplib::Request &, httplib::Response &res)
                { guarded(res, [&]
                          {
        session.reset_replay();
        send_success(res, {{"replay", replay_state(session)}}); }); });

    server.Get("/trace/step", [&session](const httplib::Request &req, httplib::Response &res)
               { guarded(res, [&]
                         {
        if (!req.has_param("index"))
        {
            send_error(res, 400, "BadRequest", "Missing required parameter 'index'.");
            return;
        }

        std::size_t index = 0;
        try
        {
            index = std::stoul(req.get_param_value("index"));
        }
        catch (const std::exception &)
        {
            throw BadRequest("Parameter 'index' must be a step number.");
        }
        const auto step = session.try_step_at(index);
        if (!step)
        {
            send_error(res, 404, "StepOutOfRange", "Step " + std::to_string(index) + " is outside the current trace.");
            return;
        }

        json response;
        response["index"] = index;
        response["step"] = step_to_json(*step);
        send_success(res, std::move(response)); }); });

    server.Post("/export-trace", [&session, &config](const httplib::Request &req, httplib::Response &res)
                { guarded(res, [&]
                          {
        const auto run = session.last_run();
        if (!run)
        {
            send_error(res, 409, "NoTrace", "No search has been run yet. Call /search first.");
            return;
        }

        const auto body = req.body.empty() ? json::object() : json::parse(req.body);
        const std::string output_file = body.value("output_file", config.export_dir + run->result.source + "_trace.json");
        const bool saved = save_search_run(*run, output_file);

        json response;
        response["saved_to_file"] = saved;
        response["output_file"] = output_file;
        send_success(res, std::move(response)); }); });
}

void register_routes(httplib::Server &server, Session &session, const ServerConfig &config)
{
    register_cors_handler(server);
    register_graph_routes(server, session, config);
    register_search_routes(server, session, config);
}

} // namespace road_tracer
