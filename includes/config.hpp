#pragma once

#include <cstddef> // for size_t
#include <cstdint>

namespace Config
{
    // Enable verbose logging for debugging
    constexpr const bool VERBOSE = true;

    namespace Data
    {
        // Number of synthetic vectors
        constexpr const size_t N_VECTORS = 1000000;

        // Vector Dimension
        constexpr const int DIM = 128;

        constexpr const uint64_t SEED = 42;
    }

    namespace Build
    {
        // Vector Dimension
        constexpr const int DIM = 128;

        // Graph degree M (2M at layer 0)
        constexpr const int M = 32;

        // Exploration factor during construction
        constexpr const int EFC = 200;

        // Seed of the level generator, fixed for reproducible builds
        constexpr const uint64_t SEED = 42;
    }

    namespace Search
    {
        // Search parameters
        constexpr const int EF = 64;
        constexpr const int K = 10;
        constexpr const int MAX_K = 100; // largest k a request may ask for
    }

    namespace Bench
    {
        constexpr const int N_QUERIES = 1000;
        constexpr const int K = 10;
        // stddev of the noise added to sampled vectors to form queries
        constexpr const float NOISE = 0.1f;
        constexpr const uint64_t SEED = 123;
        constexpr const int WARMUP = 10;
        constexpr const double TARGET_RECALL = 0.95;
        constexpr const int EF_SWEEP[] = {16, 32, 64, 128, 256};
    }
}
