#include <httplib.h>

#include <exception>
#include <iostream>

#include "road_tracer/api.hpp"
#include "road_tracer/config.hpp"
#include "road_tracer/loader.hpp"
#include "road_tracer/session.hpp"

int main(int argc, char **argv)
{
    using namespace road_tracer;

    ServerConfig config;
    Session session;
    try
    {
        config = load_server_config(argc > 1 ? argv[1] : "");
        session.reload(load_network(config.distances_path(), config.positions_path()));
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Failed to start: " << ex.what() << std::endl;
        return 1;
    }

    httplib::Server server;

    register_routes(server, session, config);

    std::cout << "Server starting on http://" << config.host << ":" << config.port << std::endl;
    if (!server.listen(config.host, config.port))
    {
        std::cerr << "Unable to listen on " << config.host << ":" << config.port << std::endl;
        return 1;
    }
    return 0;
}
