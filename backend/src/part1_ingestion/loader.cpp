#include "road_tracer/loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace road_tracer
{
namespace
{

std::string trim(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> split_csv_line(const std::string &line)
{
    std::vector<std::string> fields;
    std::stringstream stream(line);
    std::string field;
    while (std::getline(stream, field, ','))
    {
        fields.push_back(trim(field));
    }
    if (!line.empty() && line.back() == ',')
    {
        fields.push_back("");
    }
    return fields;
}

bool parse_directed_flag(const std::string &value, int line_number)
{
    const std::string flag = to_lower(value);
    if (flag.empty() || flag == "0" || flag == "false" || flag == "no")
    {
        return false;
    }
    if (flag == "1" || flag == "true" || flag == "yes")
    {
        return true;
    }
    throw std::runtime_error("Line " + std::to_string(line_number) + ": bad directed flag '" + value + "'");
}

int column_index(const std::vector<std::string> &header, const std::string &name)
{
    for (size_t i = 0; i < header.size(); i++)
    {
        if (to_lower(header[i]) == name)
        {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace

std::vector<EdgeRecord> load_distance_records(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw std::runtime_error("Unable to open " + path);
    }

    std::string line;
    if (!std::getline(in, line))
    {
        throw std::runtime_error(path + " is empty");
    }

    const auto header = split_csv_line(line);
    const int source_col = column_index(header, "source");
    const int target_col = column_index(header, "target");
    const int distance_col = column_index(header, "distance_km");
    const int directed_col = column_index(header, "directed");

    if (source_col < 0 || target_col < 0 || distance_col < 0)
    {
        throw std::runtime_error(path + ": header must name source, target and distance_km");
    }

    std::vector<EdgeRecord> records;
    int line_number = 1;

    while (std::getline(in, line))
    {
        line_number++;
        if (trim(line).empty())
        {
            continue;
        }

        const auto fields = split_csv_line(line);
        const int required = std::max({source_col, target_col, distance_col});
        if (static_cast<int>(fields.size()) <= required)
        {
            throw std::runtime_error("Line " + std::to_string(line_number) + " of " + path + " has " + std::to_string(fields.size()) + " fields");
        }

        EdgeRecord record;
        record.from = fields[source_col];
        record.to = fields[target_col];
        if (record.from.empty() || record.to.empty())
        {
            throw std::runtime_error("Line " + std::to_string(line_number) + " of " + path + " is missing a city name");
        }

        try
        {
            size_t consumed = 0;
            record.weight = std::stod(fields[distance_col], &consumed);
            if (consumed != fields[distance_col].size())
            {
                throw std::invalid_argument(fields[distance_col]);
            }
        }
        catch (const std::exception &)
        {
            throw std::runtime_error("Line " + std::to_string(line_number) + " of " + path + ": bad distance '" + fields[distance_col] + "'");
        }

        if (directed_col >= 0 && directed_col < static_cast<int>(fields.size()))
        {
            record.directed = parse_directed_flag(fields[directed_col], line_number);
        }

        records.push_back(record);
    }

    std::cout << "Read " << records.size() << " road records from " << path << std::endl;
    return records;
}

CityAtlas load_city_positions(const std::string &path)
{
    CityAtlas atlas;

    std::ifstream in(path);
    if (!in.is_open())
    {
        std::cerr << "No city positions at " << path << ", every city is placed at (0, 0)." << std::endl;
        return atlas;
    }

    nlohmann::json positions_json;
    try
    {
        in >> positions_json;
        if (!positions_json.is_object())
        {
            throw std::runtime_error("Positions file " + path + " must hold a JSON object");
        }

        for (const auto &[city, position] : positions_json.items())
        {
            if (!position.is_object())
            {
                throw std::runtime_error("Position of " + city + " must be an object with x and y");
            }
            atlas[city] = {position.value("x", 0.0), position.value("y", 0.0)};
        }
    }
    catch (const nlohmann::json::exception &ex)
    {
        throw std::runtime_error("Malformed positions file " + path + ": " + ex.what());
    }

    std::cout << "Read positions for " << atlas.size() << " cities from " << path << std::endl;
    return atlas;
}

LoadedNetwork load_network(const std::string &distances_path, const std::string &positions_path)
{
    const auto records = load_distance_records(distances_path);
    CityAtlas atlas = load_city_positions(positions_path);

    std::set<std::string> cities;
    for (const auto &record : records)
    {
        cities.insert(record.from);
        cities.insert(record.to);
    }
    for (const auto &entry : atlas)
    {
        cities.insert(entry.first);
    }

    for (const auto &city : cities)
    {
        if (atlas.find(city) == atlas.end())
        {
            atlas[city] = Position{};
        }
    }

    LoadedNetwork network;
    network.graph = build_graph(std::vector<std::string>(cities.begin(), cities.end()), records);
    network.atlas = std::move(atlas);
    return network;
}

} // namespace road_tracer
