#pragma once

#include <vector>
#include <string>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <filesystem> // C++17
#include <variant>
#include <unordered_map>
#include <cstdint>

using ConfigValue = std::variant<size_t, float, std::string>;

/// @brief Save index config to a text file.
/// @param config Unordered map of config parameters.
/// @param folder_path Folder path to save config file.
/// @param config_file Config file name (default: "config.txt").
/// @return 0 if successful.
int save_config(const std::unordered_map<std::string, ConfigValue> &config, const std::string &folder_path, const std::string &config_file = "config.txt");

/// @brief Load index config from a text file.
/// @param config_file Input config file path.
/// @return Unordered map of config parameters.
/// @example {"dim": 128, "M": 32, "efc": 200, "seed": 42, "num_vectors": 1000000, "index_type": "HNSW"}
std::unordered_map<std::string, ConfigValue> load_config(const std::string &config_file);

/// @brief Read an integer entry of a loaded config.
/// @throws std::runtime_error if the key is missing or not an integer.
size_t config_get_size(const std::unordered_map<std::string, ConfigValue> &config, const std::string &key);

/// @brief Load a 2D float32 .npy file as a list of row vectors.
/// @param file_path Path to the .npy file.
/// @return Vector of rows, each of the file's second dimension.
std::vector<std::vector<float>> load_npy_vectors(const std::string &file_path);

/// @brief Save row vectors to a 2D float32 .npy file. All rows must have the same length.
void save_npy_vectors(const std::vector<std::vector<float>> &vectors, const std::string &file_path);

/// @brief Save search results as [n_rows, k] .npy files. Short rows are padded with -1 / inf.
/// @param neighbors Vector of vectors containing neighbor indices.
/// @param distances Vector of vectors containing distances.
/// @param indices_file Output file for neighbor indices.
/// @param distances_file Output file for distances.
/// @param k Number of nearest neighbors to save.
/// @return 0 if successful.
int save_results(const std::vector<std::vector<int64_t>> &neighbors, const std::vector<std::vector<float>> &distances, const std::string &indices_file, const std::string &distances_file, size_t k);

/// @brief Percentile of a sample using linear interpolation between closest ranks.
/// @param values Sample, need not be sorted.
/// @param percentile In [0, 100].
double percentile(std::vector<double> values, double percentile);

/// @brief Derive test queries from indexed vectors: each query is a randomly picked vector plus gaussian noise, L2-normalized.
/// @param vectors Source vectors, must not be empty.
/// @param n_queries Number of queries to draw.
/// @param noise Standard deviation of the per-component noise.
/// @param seed Random seed.
/// @throws std::runtime_error if vectors is empty.
std::vector<std::vector<float>> sample_queries(const std::vector<std::vector<float>> &vectors, size_t n_queries, float noise, uint64_t seed);
