#pragma once

#include <string>

#ifndef ROAD_TRACER_DATA_DIR
#define ROAD_TRACER_DATA_DIR "data"
#endif

namespace road_tracer
{

struct ServerConfig
{
    std::string host{"0.0.0.0"};
    int port{8080};
    std::string data_dir{ROAD_TRACER_DATA_DIR};
    std::string distances_file{"distances.csv"};
    std::string positions_file{"cities_positions.json"};
    std::string export_dir{"./"};

    std::string distances_path() const;
    std::string positions_path() const;
};

// An empty path yields the defaults; a path that cannot be read or parsed throws.
ServerConfig load_server_config(const std::string &path);

} // namespace road_tracer
