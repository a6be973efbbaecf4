#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include "config.hpp"
#include "utils.hpp"
#include "vectorwise/serving_facade.h"

int main(int argc, char *argv[])
{
    CLI::App app{"Batch k-NN query through the serving facade"};

    std::string index_dir;
    app.add_option("-x,--index", index_dir, "Index folder (with config.txt)")
        ->required()
        ->check(CLI::ExistingDirectory);

    std::string query_file;
    app.add_option("-i,--input", query_file, "Query vectors (.npy, float32 [Q, D])")
        ->required()
        ->check(CLI::ExistingFile);

    int k = Config::Search::K;
    app.add_option("-k,--k", k, "Number of neighbors per query")
        ->check(CLI::PositiveNumber);

    uint32_t ef = Config::Search::EF;
    app.add_option("-e,--ef", ef, "efSearch")
        ->check(CLI::PositiveNumber);

    std::string output_dir = ".";
    app.add_option("-o,--output", output_dir, "Output folder for indices.npy / distances.npy");

    bool quiet = false;
    app.add_flag("-q,--quiet", quiet, "Only print errors");

    CLI11_PARSE(app, argc, argv);

    try
    {
        bool verbose = Config::VERBOSE && !quiet;
        auto config = load_config(index_dir + "/config.txt");
        uint32_t dim = static_cast<uint32_t>(config_get_size(config, "dim"));
        std::string index_file = index_dir + "/hnsw.index";
        auto it = config.find("index_file");
        if (it != config.end() && std::holds_alternative<std::string>(it->second))
            index_file = index_dir + "/" + std::get<std::string>(it->second);

        ServeParameters serve;
        serve.efSearch = ef;
        serve.maxK = std::max<uint32_t>(Config::Search::MAX_K, static_cast<uint32_t>(k));
        ServingFacade facade(dim, serve, verbose);

        auto load_start = std::chrono::high_resolution_clock::now();
        facade.loadIndex(index_file);
        auto load_end = std::chrono::high_resolution_clock::now();

        auto queries = load_npy_vectors(query_file);
        if (verbose)
        {
            std::cout << "[SEARCH] Index load time: "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(load_end - load_start).count() << " ms" << std::endl;
            std::cout << "[SEARCH] Running " << queries.size() << " queries, k=" << k << ", efSearch=" << ef << std::endl;
        }

        std::vector<std::vector<int64_t>> neighbors(queries.size());
        std::vector<std::vector<float>> distances(queries.size());
        size_t failed = 0;
        auto search_start = std::chrono::high_resolution_clock::now();
        for (size_t i = 0; i < queries.size(); ++i)
        {
            SearchRequest request{queries[i], k};
            SearchResponse response = facade.search(request);
            if (!response.ok())
            {
                std::cerr << "[SEARCH] Query " << i << ": " << static_cast<int>(response.status) << " "
                          << statusName(response.status) << ": " << response.detail << std::endl;
                failed++;
                continue;
            }
            neighbors[i] = std::move(response.indices);
            distances[i] = std::move(response.distances);
        }
        auto search_end = std::chrono::high_resolution_clock::now();
        auto search_duration = std::chrono::duration_cast<std::chrono::microseconds>(search_end - search_start);

        std::filesystem::create_directories(output_dir);
        save_results(neighbors, distances, output_dir + "/indices.npy", output_dir + "/distances.npy", static_cast<size_t>(k));

        if (verbose)
        {
            std::cout << "[SEARCH] Search time: " << search_duration.count() / 1000.0 << " ms";
            if (!queries.empty())
                std::cout << " (" << search_duration.count() / 1000.0 / queries.size() << " ms/query)";
            std::cout << std::endl;
            std::cout << "[SEARCH] Saved results to " << output_dir << std::endl;
        }
        if (failed > 0)
        {
            std::cerr << "Error: " << failed << " queries failed" << std::endl;
            return 1;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
