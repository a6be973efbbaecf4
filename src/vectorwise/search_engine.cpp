#include "vectorwise/search_engine.h"
#include "vectorwise/errors.h"
#include "vectorwise/layer_search.h"
#include <algorithm>
#include <exception>
#include <queue>
#include <string>
#include <unordered_set>
#include <omp.h>

SearchEngine::SearchEngine(std::shared_ptr<const HnswIndex> index)
    : index_(std::move(index))
{
    if (!this->index_)
    {
        throw IndexUnavailable();
    }
}

void SearchEngine::validate_(size_t queryDim, int k, int efSearch) const
{
    if (k <= 0)
        throw InvalidArgument("k must be > 0, got " + std::to_string(k));
    if (efSearch <= 0)
        throw InvalidArgument("efSearch must be > 0, got " + std::to_string(efSearch));
    if (queryDim != this->index_->dim())
        throw DimensionMismatch(this->index_->dim(), queryDim);
}

std::vector<search_result_t> SearchEngine::searchValidated_(const float *query, uint32_t k, uint32_t efSearch) const
{
    const HNSWGraph &graph = this->index_->graph();
    const VectorStore &store = this->index_->store();
    if (graph.isEmpty())
    {
        return {};
    }
    LayerSearcher searcher(graph, store);
    nodeID_t entrypointID = graph.getEntrypointID();
    search_result_t entry{store.distanceToId(query, entrypointID), entrypointID};
    // greedy descent to layer 1, starting from the entrypoint on the top layer
    for (uint32_t layerID = graph.getTopLayer(); layerID > 0; layerID--)
    {
        entry = searcher.greedySearchLayer(query, entry, layerID);
    }
    auto nearestNeighbors = searcher.searchLayer(query, {entry}, std::max(efSearch, k), 0);
    if (nearestNeighbors.size() > k)
        nearestNeighbors.resize(k);
    // a short beam means every node reachable from the entrypoint was visited,
    // the rest of layer 0 is disconnected from it
    const uint32_t wanted = std::min(k, store.count());
    if (nearestNeighbors.size() < wanted)
        this->completeByScan_(query, nearestNeighbors, wanted);
    return nearestNeighbors;
}

void SearchEngine::completeByScan_(const float *query, std::vector<search_result_t> &results, uint32_t wanted) const
{
    const VectorStore &store = this->index_->store();
    std::unordered_set<nodeID_t> found;
    for (const auto &result : results)
        found.insert(result.second);
    const size_t missing = wanted - results.size();
    // max heap of the closest unreached nodes, worst on top
    std::priority_queue<search_result_t> closest;
    for (nodeID_t nodeID = 0; nodeID < store.count(); nodeID++)
    {
        if (found.count(nodeID))
            continue;
        search_result_t candidate{store.distanceToId(query, nodeID), nodeID};
        if (closest.size() < missing)
        {
            closest.push(candidate);
        }
        else if (candidate < closest.top())
        {
            closest.pop();
            closest.push(candidate);
        }
    }
    while (!closest.empty())
    {
        results.push_back(closest.top());
        closest.pop();
    }
    std::sort(results.begin(), results.end());
}

std::vector<search_result_t> SearchEngine::search(const std::vector<float> &query, int k, int efSearch) const
{
    this->validate_(query.size(), k, efSearch);
    return this->searchValidated_(query.data(), static_cast<uint32_t>(k), static_cast<uint32_t>(efSearch));
}

std::vector<std::vector<search_result_t>> SearchEngine::searchBatch(
    const std::vector<std::vector<float>> &queries, int k, int efSearch) const
{
    // reject the batch before starting any thread
    for (const auto &query : queries)
    {
        this->validate_(query.size(), k, efSearch);
    }
    std::vector<std::vector<search_result_t>> output(queries.size());
    std::vector<std::exception_ptr> errors(queries.size());
#pragma omp parallel for schedule(dynamic, 16) shared(queries, output, errors)
    for (int64_t i = 0; i < static_cast<int64_t>(queries.size()); i++)
    {
        try
        {
            output[i] = this->searchValidated_(queries[i].data(), static_cast<uint32_t>(k), static_cast<uint32_t>(efSearch));
        }
        catch (...)
        {
            // exceptions must not escape an OpenMP region; rethrown below
            errors[i] = std::current_exception();
        }
    }
    for (const auto &error : errors)
    {
        if (error)
            std::rethrow_exception(error);
    }
    return output;
}
