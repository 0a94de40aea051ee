#pragma once

#include <functional>
#include <stdexcept>

#include <httplib.h>

#include "config.hpp"
#include "session.hpp"

namespace road_tracer
{

// Malformed request input that is not a JSON parse or type failure.
class BadRequest : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Runs a handler body and answers {"status": "error", "kind": ..., "message": ...}
// for anything it throws: 400 for GraphError and bad input, 500 otherwise.
void guarded(httplib::Response &res, const std::function<void()> &body);

void register_cors_handler(httplib::Server &server);
void register_graph_routes(httplib::Server &server, Session &session, const ServerConfig &config);
void register_search_routes(httplib::Server &server, Session &session, const ServerConfig &config);
void register_routes(httplib::Server &server, Session &session, const ServerConfig &config);

} // namespace road_tracer
