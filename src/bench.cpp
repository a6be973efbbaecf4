#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include "config.hpp"
#include "utils.hpp"
#include "vectorwise/bruteforce.h"
#include "vectorwise/serving_facade.h"

struct RunStats
{
    int ef = 0;
    double avg_ms = 0, median_ms = 0, p95_ms = 0, p99_ms = 0;
    double recall_avg = 0, recall_min = 0, recall_max = 0;
    double dist_per_query = 0;
};

// Time every query through the facade and score it against the exact neighbors
static RunStats run(const std::shared_ptr<const HnswIndex> &index, const std::vector<std::vector<float>> &queries,
                    const std::vector<std::vector<search_result_t>> &truth, int k, int ef, int warmup)
{
    ServeParameters serve;
    serve.efSearch = static_cast<uint32_t>(ef);
    serve.maxK = std::max<uint32_t>(Config::Search::MAX_K, static_cast<uint32_t>(k));
    ServingFacade facade(index->dim(), serve);
    facade.installIndex(index);

    for (int i = 0; i < warmup && i < static_cast<int>(queries.size()); ++i)
    {
        SearchResponse response = facade.search({queries[i], k});
        if (!response.ok())
            throw std::runtime_error("warmup query failed: " + response.detail);
    }

    RunStats stats;
    stats.ef = ef;
    stats.recall_min = 1.0;
    std::vector<double> latencies;
    latencies.reserve(queries.size());
    double recall_sum = 0;
    resetProfilingCounter();
    for (size_t i = 0; i < queries.size(); ++i)
    {
        auto start = std::chrono::high_resolution_clock::now();
        SearchResponse response = facade.search({queries[i], k});
        auto end = std::chrono::high_resolution_clock::now();
        if (!response.ok())
            throw std::runtime_error("query " + std::to_string(i) + " failed: " + response.detail);
        latencies.push_back(std::chrono::duration<double, std::milli>(end - start).count());

        std::vector<search_result_t> approx;
        for (size_t j = 0; j < response.indices.size(); ++j)
            approx.emplace_back(response.distances[j], static_cast<nodeID_t>(response.indices[j]));
        double recall = recallAtK(approx, truth[i], static_cast<uint32_t>(k));
        recall_sum += recall;
        stats.recall_min = std::min(stats.recall_min, recall);
        stats.recall_max = std::max(stats.recall_max, recall);
    }
    stats.dist_per_query = static_cast<double>(getCountDistCalc()) / queries.size();
    double total = 0;
    for (double l : latencies)
        total += l;
    stats.avg_ms = total / latencies.size();
    stats.median_ms = percentile(latencies, 50);
    stats.p95_ms = percentile(latencies, 95);
    stats.p99_ms = percentile(latencies, 99);
    stats.recall_avg = recall_sum / queries.size();
    return stats;
}

int main(int argc, char *argv[])
{
    CLI::App app{"Latency and Recall@k benchmark against exact search"};

    std::string vectors_file;
    app.add_option("-i,--input", vectors_file, "Indexed vectors (.npy)")
        ->required()
        ->check(CLI::ExistingFile);

    std::string index_dir;
    app.add_option("-x,--index", index_dir, "Index folder (with config.txt)")
        ->required()
        ->check(CLI::ExistingDirectory);

    int n_queries = Config::Bench::N_QUERIES;
    app.add_option("-n,--num-queries", n_queries, "Number of test queries")
        ->check(CLI::PositiveNumber);

    int k = Config::Bench::K;
    app.add_option("-k,--k", k, "Neighbors per query")
        ->check(CLI::PositiveNumber);

    float noise = Config::Bench::NOISE;
    app.add_option("--noise", noise, "Stddev of the noise added to sampled vectors")
        ->check(CLI::NonNegativeNumber);

    uint64_t seed = Config::Bench::SEED;
    app.add_option("-s,--seed", seed, "Query sampling seed");

    std::vector<int> sweep(std::begin(Config::Bench::EF_SWEEP), std::end(Config::Bench::EF_SWEEP));
    app.add_option("--ef", sweep, "efSearch values to sweep")
        ->check(CLI::PositiveNumber);

    std::string output_file = "benchmark_results.txt";
    app.add_option("-o,--output", output_file, "Results file");

    bool quiet = false;
    app.add_flag("-q,--quiet", quiet, "Only print the summary");

    CLI11_PARSE(app, argc, argv);

    try
    {
        if (sweep.empty())
        {
            std::cerr << "Error: --ef needs at least one value" << std::endl;
            return 1;
        }
        auto config = load_config(index_dir + "/config.txt");
        uint32_t dim = static_cast<uint32_t>(config_get_size(config, "dim"));
        std::string index_file = index_dir + "/hnsw.index";
        auto it = config.find("index_file");
        if (it != config.end() && std::holds_alternative<std::string>(it->second))
            index_file = index_dir + "/" + std::get<std::string>(it->second);

        if (!quiet)
            std::cout << "[BENCH] Loading index from " << index_file << std::endl;
        auto index = loadIndex(index_file, dim);

        auto vectors = load_npy_vectors(vectors_file);
        if (vectors.empty())
        {
            std::cerr << "Error: No vectors in " << vectors_file << ", nothing to sample queries from" << std::endl;
            return 1;
        }
        if (vectors.size() != index->count())
        {
            std::cerr << "Error: " << vectors_file << " holds " << vectors.size()
                      << " vectors but the index holds " << index->count() << std::endl;
            return 1;
        }

        auto queries = sample_queries(vectors, static_cast<size_t>(n_queries), noise, seed);

        if (!quiet)
            std::cout << "[BENCH] Computing exact neighbors for " << queries.size() << " queries" << std::endl;
        auto gt_start = std::chrono::high_resolution_clock::now();
        BruteForce exact(index->store());
        auto truth = exact.searchBatch(queries, static_cast<uint32_t>(k), !quiet);
        auto gt_end = std::chrono::high_resolution_clock::now();
        if (!quiet)
            std::cout << "[BENCH] Ground truth time: "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(gt_end - gt_start).count() << " ms" << std::endl;

        std::vector<RunStats> results;
        enableProfiling();
        for (int ef : sweep)
        {
            RunStats stats = run(index, queries, truth, k, ef, Config::Bench::WARMUP);
            results.push_back(stats);
            if (!quiet)
            {
                std::cout << "[BENCH] efSearch=" << std::setw(4) << ef << std::fixed << std::setprecision(4)
                          << "  recall@" << k << " avg=" << stats.recall_avg << " min=" << stats.recall_min
                          << " max=" << stats.recall_max << std::setprecision(3) << "  latency avg=" << stats.avg_ms
                          << "ms p50=" << stats.median_ms << "ms p95=" << stats.p95_ms << "ms p99=" << stats.p99_ms
                          << "ms  dist/query=" << std::setprecision(1) << stats.dist_per_query
                          << std::defaultfloat << std::endl;
            }
        }

        // the served configuration is the default efSearch if swept, else the last value
        const RunStats *served = &results.back();
        for (const auto &stats : results)
        {
            if (stats.ef == Config::Search::EF)
                served = &stats;
        }
        bool target_met = served->recall_avg >= Config::Bench::TARGET_RECALL;

        std::cout << "[BENCH] SUMMARY" << std::endl;
        std::cout << "[BENCH] Vectors: " << index->count() << ", dimension: " << index->dim()
                  << ", layers: " << index->getNumLayers() << std::endl;
        std::cout << "[BENCH] efSearch=" << served->ef << ": Recall@" << k << " " << served->recall_avg
                  << ", avg latency " << served->avg_ms << " ms, p99 " << served->p99_ms << " ms" << std::endl;
        std::cout << "[BENCH] Recall target " << Config::Bench::TARGET_RECALL << ": "
                  << (target_met ? "MET" : "NOT MET") << std::endl;

        std::ofstream out(output_file);
        if (!out)
        {
            throw std::runtime_error("Could not create results file: " + output_file);
        }
        out << "num_vectors: " << index->count() << "\n";
        out << "dimension: " << index->dim() << "\n";
        out << "num_queries: " << queries.size() << "\n";
        out << "k: " << k << "\n";
        out << "M: " << index->params().M << "\n";
        out << "efc: " << index->params().efConstruction << "\n";
        for (const auto &stats : results)
        {
            std::string prefix = "ef" + std::to_string(stats.ef) + "_";
            out << prefix << "recall_avg: " << stats.recall_avg << "\n";
            out << prefix << "recall_min: " << stats.recall_min << "\n";
            out << prefix << "recall_max: " << stats.recall_max << "\n";
            out << prefix << "latency_avg_ms: " << stats.avg_ms << "\n";
            out << prefix << "latency_median_ms: " << stats.median_ms << "\n";
            out << prefix << "latency_p95_ms: " << stats.p95_ms << "\n";
            out << prefix << "latency_p99_ms: " << stats.p99_ms << "\n";
            out << prefix << "distance_calcs_per_query: " << stats.dist_per_query << "\n";
        }
        out << "target_recall: " << Config::Bench::TARGET_RECALL << "\n";
        out << "target_met: " << (target_met ? "true" : "false") << "\n";
        out.close();
        if (!quiet)
            std::cout << "[BENCH] Saved results to " << output_file << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
