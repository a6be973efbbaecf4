#include <CLI/CLI.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include "config.hpp"
#include "utils.hpp"
#include "vectorwise/distance.h"

int main(int argc, char *argv[])
{
    CLI::App app{"Synthetic dataset generator: L2-normalized Gaussian vectors"};

    size_t n_vectors = Config::Data::N_VECTORS;
    app.add_option("-n,--num-vectors", n_vectors, "Number of vectors")
        ->check(CLI::PositiveNumber);

    int dim = Config::Data::DIM;
    app.add_option("-d,--dim", dim, "Vector dimension")
        ->check(CLI::PositiveNumber);

    uint64_t seed = Config::Data::SEED;
    app.add_option("-s,--seed", seed, "Random seed");

    std::string output_dir = "data";
    app.add_option("-o,--output", output_dir, "Output folder");

    bool quiet = false;
    app.add_flag("-q,--quiet", quiet, "Only print errors");

    CLI11_PARSE(app, argc, argv);

    try
    {
        auto start_time = std::chrono::high_resolution_clock::now();
        if (!quiet)
        {
            std::cout << "[GEN] Generating " << n_vectors << " vectors of dimension " << dim
                      << " (seed " << seed << ")" << std::endl;
            double mem_mb = static_cast<double>(n_vectors) * dim * sizeof(float) / (1024.0 * 1024.0);
            std::cout << "[GEN] Memory footprint: " << mem_mb << " MB" << std::endl;
        }

        std::mt19937_64 rng(seed);
        std::normal_distribution<float> gaussian(0.0f, 1.0f);
        std::vector<std::vector<float>> vectors(n_vectors, std::vector<float>(dim));
        for (auto &vec : vectors)
        {
            for (auto &x : vec)
                x = gaussian(rng);
            normalizeL2(vec);
        }

        std::filesystem::create_directories(output_dir);
        std::string output_file = output_dir + "/vectors.npy";
        save_npy_vectors(vectors, output_file);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        if (!quiet)
        {
            std::cout << "[GEN] Saved " << output_file << std::endl;
            std::cout << "[GEN] Generation time: " << duration.count() << " ms" << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
