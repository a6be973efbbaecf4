#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include "vectorwise/distance.h"
#include "cnpy.h"

int save_config(const std::unordered_map<std::string, ConfigValue> &config, const std::string &folder_path, const std::string &config_file)
{
    std::filesystem::create_directories(folder_path);

    std::string config_path = folder_path + "/" + config_file;

    std::ofstream out(config_path);
    if (!out)
    {
        throw std::runtime_error("Could not create config file: " + config_path);
    }

    for (const auto &pair : config)
    {
        out << pair.first << ": ";
        if (std::holds_alternative<size_t>(pair.second))
        {
            out << std::get<size_t>(pair.second);
        }
        else if (std::holds_alternative<float>(pair.second))
        {
            out << std::get<float>(pair.second);
        }
        else if (std::holds_alternative<std::string>(pair.second))
        {
            out << std::get<std::string>(pair.second);
        }
        out << "\n";
    }

    out.close();
    return 0;
}

// Parse the whole string, false if it does not fit
static bool parse_size(const std::string &value_str, size_t &out)
{
    if (value_str.empty() || value_str[0] == '-' || value_str[0] == '+')
        return false;
    try
    {
        size_t idx;
        out = std::stoull(value_str, &idx);
        return idx == value_str.size();
    }
    catch (const std::logic_error &)
    {
        return false;
    }
}

static bool parse_float(const std::string &value_str, float &out)
{
    try
    {
        size_t idx;
        out = std::stof(value_str, &idx);
        return idx == value_str.size();
    }
    catch (const std::logic_error &)
    {
        return false;
    }
}

std::unordered_map<std::string, ConfigValue> load_config(const std::string &config_file)
{
    std::ifstream in(config_file);
    if (!in)
    {
        throw std::runtime_error("Could not open config file: " + config_file);
    }

    std::unordered_map<std::string, ConfigValue> config;
    std::string line;
    while (std::getline(in, line))
    {
        size_t delim_pos = line.find(':');
        if (delim_pos == std::string::npos)
            continue;

        std::string key = line.substr(0, delim_pos);
        std::string value_str = line.substr(delim_pos + 1);
        // Trim whitespace
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r") + 1);
        value_str.erase(0, value_str.find_first_not_of(" \t"));
        value_str.erase(value_str.find_last_not_of(" \t\r") + 1);
        if (key.empty())
            continue;

        // Try to parse as size_t, then float, else string
        size_t value_size_t;
        float value_float;
        if (parse_size(value_str, value_size_t))
            config[key] = value_size_t;
        else if (parse_float(value_str, value_float))
            config[key] = value_float;
        else
            config[key] = value_str;
    }

    in.close();
    return config;
}

size_t config_get_size(const std::unordered_map<std::string, ConfigValue> &config, const std::string &key)
{
    auto it = config.find(key);
    if (it == config.end())
    {
        throw std::runtime_error("Missing config key: " + key);
    }
    if (!std::holds_alternative<size_t>(it->second))
    {
        throw std::runtime_error("Config key is not an integer: " + key);
    }
    return std::get<size_t>(it->second);
}

std::vector<std::vector<float>> load_npy_vectors(const std::string &file_path)
{
    if (!std::filesystem::exists(file_path))
    {
        throw std::runtime_error("Could not open npy file: " + file_path);
    }
    cnpy::NpyArray arr = cnpy::npy_load(file_path);
    if (arr.shape.size() != 2)
    {
        throw std::runtime_error("Expected a 2D array in " + file_path);
    }
    if (arr.word_size != sizeof(float))
    {
        throw std::runtime_error("Expected float32 data in " + file_path);
    }
    if (arr.fortran_order)
    {
        throw std::runtime_error("Fortran-ordered arrays are not supported: " + file_path);
    }

    size_t n_rows = arr.shape[0];
    size_t dim = arr.shape[1];
    const float *data = arr.data<float>();

    std::vector<std::vector<float>> vectors(n_rows);
    for (size_t i = 0; i < n_rows; ++i)
    {
        vectors[i].assign(data + i * dim, data + (i + 1) * dim);
    }
    return vectors;
}

void save_npy_vectors(const std::vector<std::vector<float>> &vectors, const std::string &file_path)
{
    size_t n_rows = vectors.size();
    size_t dim = n_rows ? vectors[0].size() : 0;

    // Flatten the 2D vectors into 1D arrays
    std::vector<float> host(n_rows * dim);
    for (size_t i = 0; i < n_rows; ++i)
    {
        if (vectors[i].size() != dim)
        {
            throw std::runtime_error("Row " + std::to_string(i) + " has a different length");
        }
        std::copy(vectors[i].begin(), vectors[i].end(), host.begin() + i * dim);
    }
    cnpy::npy_save(file_path, host.data(), {n_rows, dim});
}

int save_results(const std::vector<std::vector<int64_t>> &neighbors, const std::vector<std::vector<float>> &distances, const std::string &indices_file, const std::string &distances_file, size_t k)
{
    // Save results in NumPy format for Python compatibility
    size_t n_rows = neighbors.size();
    if (distances.size() != n_rows)
    {
        throw std::runtime_error("neighbors and distances differ in length");
    }

    // Flatten the 2D vectors into 1D arrays, pad short rows
    std::vector<int64_t> host_indices(n_rows * k, -1);
    std::vector<float> host_distances(n_rows * k, std::numeric_limits<float>::infinity());

    for (size_t i = 0; i < n_rows; ++i)
    {
        size_t n = std::min({k, neighbors[i].size(), distances[i].size()});
        for (size_t j = 0; j < n; ++j)
        {
            host_indices[i * k + j] = neighbors[i][j];
            host_distances[i * k + j] = distances[i][j];
        }
    }

    cnpy::npy_save(indices_file, host_indices.data(), {n_rows, k});
    cnpy::npy_save(distances_file, host_distances.data(), {n_rows, k});

    return 0;
}

double percentile(std::vector<double> values, double percentile)
{
    if (values.empty())
    {
        throw std::runtime_error("percentile of an empty sample");
    }
    std::sort(values.begin(), values.end());
    double rank = std::clamp(percentile, 0.0, 100.0) / 100.0 * (values.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(rank));
    size_t hi = static_cast<size_t>(std::ceil(rank));
    return values[lo] + (values[hi] - values[lo]) * (rank - lo);
}

std::vector<std::vector<float>> sample_queries(const std::vector<std::vector<float>> &vectors, size_t n_queries, float noise, uint64_t seed)
{
    if (vectors.empty())
    {
        throw std::runtime_error("Cannot sample queries from an empty vector set");
    }
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, vectors.size() - 1);
    std::normal_distribution<float> gaussian(0.0f, noise);
    std::vector<std::vector<float>> queries(n_queries);
    for (auto &query : queries)
    {
        query = vectors[pick(rng)];
        normalizeL2(query);
        for (auto &x : query)
            x += gaussian(rng);
        normalizeL2(query);
    }
    return queries;
}
