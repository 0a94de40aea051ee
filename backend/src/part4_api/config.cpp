#include "road_tracer/config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace road_tracer
{
namespace
{

std::string join_path(const std::string &dir, const std::string &file)
{
    if (dir.empty() || (!file.empty() && file.front() == '/'))
    {
        return file;
    }
    if (dir.back() == '/')
    {
        return dir + file;
    }
    return dir + "/" + file;
}

} // namespace

std::string ServerConfig::distances_path() const
{
    return join_path(data_dir, distances_file);
}

std::string ServerConfig::positions_path() const
{
    return join_path(data_dir, positions_file);
}

ServerConfig load_server_config(const std::string &path)
{
    ServerConfig config;
    if (path.empty())
    {
        return config;
    }

    std::ifstream in(path);
    if (!in.is_open())
    {
        throw std::runtime_error("Unable to open config " + path);
    }

    try
    {
        nlohmann::json body;
        in >> body;

        config.host = body.value("host", config.host);
        config.port = body.value("port", config.port);
        config.data_dir = body.value("data_dir", config.data_dir);
        config.distances_file = body.value("distances_file", config.distances_file);
        config.positions_file = body.value("positions_file", config.positions_file);
        config.export_dir = body.value("export_dir", config.export_dir);
    }
    catch (const nlohmann::json::exception &ex)
    {
        throw std::runtime_error("Malformed config " + path + ": " + ex.what());
    }

    if (config.port <= 0 || config.port > 65535)
    {
        throw std::runtime_error("Config " + path + " has invalid port " + std::to_string(config.port));
    }

    std::cout << "Loaded config from " << path << std::endl;
    return config;
}

} // namespace road_tracer
