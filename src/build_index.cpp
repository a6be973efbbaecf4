#include <CLI/CLI.hpp>
#include <chrono>
#include <iostream>
#include "config.hpp"
#include "utils.hpp"
#include "vectorwise/distance.h"
#include "vectorwise/index_builder.h"

int main(int argc, char *argv[])
{
    CLI::App app{"Offline HNSW index builder"};

    std::string input_file;
    app.add_option("-i,--input", input_file, "Input vectors (.npy, float32 [N, D])")
        ->required()
        ->check(CLI::ExistingFile);

    std::string index_dir = "index";
    app.add_option("-o,--output", index_dir, "Output index folder");

    std::string index_name = "hnsw";
    app.add_option("--name", index_name, "Index file name inside the folder");

    uint32_t M = Config::Build::M;
    app.add_option("-M,--M", M, "Graph degree (2M at layer 0)")
        ->check(CLI::Range(2u, 1024u));

    uint32_t efc = Config::Build::EFC;
    app.add_option("-e,--efc", efc, "efConstruction")
        ->check(CLI::PositiveNumber);

    uint64_t seed = Config::Build::SEED;
    app.add_option("-s,--seed", seed, "Level generator seed");

    bool quiet = false;
    app.add_flag("-q,--quiet", quiet, "Only print errors");

    CLI11_PARSE(app, argc, argv);

    try
    {
        bool verbose = Config::VERBOSE && !quiet;
        auto master_start = std::chrono::high_resolution_clock::now();

        if (verbose)
            std::cout << "[MAIN] Loading vectors from: " << input_file << std::endl;
        auto vectors = load_npy_vectors(input_file);
        if (vectors.empty())
        {
            std::cerr << "Error: No vectors in " << input_file << std::endl;
            return 1;
        }
        for (auto &vec : vectors)
            normalizeL2(vec);

        BuildParameters params;
        params.dim = static_cast<uint32_t>(vectors[0].size());
        params.M = M;
        params.efConstruction = efc;
        params.seed = seed;
        params.validate();

        if (verbose)
        {
            std::cout << "[MAIN] BUILD CONFIG:" << std::endl;
            std::cout << "[MAIN] Vectors: " << vectors.size() << std::endl;
            std::cout << "[MAIN] Dimension: " << params.dim << std::endl;
            std::cout << "[MAIN] M: " << params.M << std::endl;
            std::cout << "[MAIN] efConstruction: " << params.efConstruction << std::endl;
            std::cout << "[MAIN] Seed: " << params.seed << std::endl;
        }

        auto build_start = std::chrono::high_resolution_clock::now();
        IndexBuilder builder(params, verbose);
        builder.addBatch(vectors, !quiet);
        auto index = builder.finish();
        auto build_end = std::chrono::high_resolution_clock::now();
        auto build_duration = std::chrono::duration_cast<std::chrono::milliseconds>(build_end - build_start);

        if (verbose)
        {
            std::cout << "[MAIN] Index build time: " << build_duration.count() << " ms" << std::endl;
            index->summarize();
        }

        std::filesystem::create_directories(index_dir);
        std::string index_file = index_dir + "/" + index_name + ".index";
        index->save(index_file);

        std::unordered_map<std::string, ConfigValue> config = {
            {"dim", static_cast<size_t>(params.dim)},
            {"M", static_cast<size_t>(params.M)},
            {"efc", static_cast<size_t>(params.efConstruction)},
            {"seed", static_cast<size_t>(params.seed)},
            {"num_vectors", static_cast<size_t>(index->count())},
            {"num_layers", static_cast<size_t>(index->getNumLayers())},
            {"index_type", std::string("HNSW")},
            {"index_file", index_name + ".index"}};
        save_config(config, index_dir);

        auto master_end = std::chrono::high_resolution_clock::now();
        auto total = std::chrono::duration_cast<std::chrono::milliseconds>(master_end - master_start);
        if (verbose)
        {
            std::cout << "[MAIN] Saved index to " << index_file << std::endl;
            std::cout << "[MAIN] Total time: " << total.count() << " ms" << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
