#include "vectorwise/bruteforce.h"
#include "vectorwise/errors.h"
#include <algorithm>
#include <atomic>
#include <functional>
#include <queue>
#include <string>
#include <unordered_set>
#include <omp.h>
#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>

using max_heap_t = std::priority_queue<search_result_t>;

// keep the k smallest in a max heap
static inline void pushBounded(max_heap_t &heap, const search_result_t &item, uint32_t k)
{
    if (heap.size() < k)
    {
        heap.push(item);
    }
    else if (item < heap.top())
    {
        heap.pop();
        heap.push(item);
    }
}

// Extract the elements from a max heap into an increasing vector
static std::vector<search_result_t> drain(max_heap_t &heap)
{
    std::vector<search_result_t> k_nearest(heap.size());
    for (size_t i = k_nearest.size(); i > 0; i--)
    {
        k_nearest[i - 1] = heap.top();
        heap.pop();
    }
    return k_nearest;
}

std::vector<search_result_t> BruteForce::scan_(const float *query, uint32_t k) const
{
    max_heap_t heap;
    const uint32_t n = this->store_.count();
    for (nodeID_t i = 0; i < n; ++i)
    {
        pushBounded(heap, {this->store_.distanceToId(query, i), i}, k);
    }
    return drain(heap);
}

std::vector<search_result_t> BruteForce::search(const std::vector<float> &query, uint32_t k) const
{
    if (query.size() != this->store_.dim())
    {
        throw DimensionMismatch(this->store_.dim(), query.size());
    }
    if (k == 0)
    {
        throw InvalidArgument("k must be > 0");
    }
    max_heap_t max_heap;
    const int64_t n = this->store_.count();

#pragma omp parallel
    {
        // Local priority queue for each thread
        max_heap_t local_max_heap;

#pragma omp for nowait // Distribute loop iterations across threads
        for (int64_t i = 0; i < n; ++i)
        {
            nodeID_t nodeID = static_cast<nodeID_t>(i);
            float distance = this->store_.distance(query.data(), this->store_.get(nodeID));
            // Access to the local max heap does not need to be synchronized
            pushBounded(local_max_heap, {distance, nodeID}, k);
        }

// Merge local heaps into the global heap
#pragma omp critical
        {
            while (!local_max_heap.empty())
            {
                pushBounded(max_heap, local_max_heap.top(), k);
                local_max_heap.pop();
            }
        }
    }
    return drain(max_heap);
}

std::vector<std::vector<search_result_t>> BruteForce::searchBatch(
    const std::vector<std::vector<float>> &queries, uint32_t k, bool showProgress) const
{
    for (const auto &query : queries)
    {
        if (query.size() != this->store_.dim())
        {
            throw DimensionMismatch(this->store_.dim(), query.size());
        }
    }
    if (k == 0)
    {
        throw InvalidArgument("k must be > 0");
    }
    std::vector<std::vector<search_result_t>> output(queries.size());
    if (showProgress)
        indicators::show_console_cursor(false);
    indicators::ProgressBar progressBar{
        indicators::option::BarWidth{80},
        indicators::option::PrefixText{"ground truth for " + std::to_string(queries.size()) + " queries"},
        indicators::option::ShowElapsedTime{true},
        indicators::option::ShowRemainingTime{true}};
    std::atomic<size_t> done{0};

#pragma omp parallel for schedule(dynamic) shared(queries, output)
    for (int64_t i = 0; i < static_cast<int64_t>(queries.size()); i++)
    {
        output[i] = this->scan_(queries[i].data(), k);
        size_t finished = ++done;
        if (showProgress && omp_get_thread_num() == 0)
        {
            progressBar.set_progress(std::min<size_t>(finished * 100 / queries.size(), 99));
        }
    }
    if (showProgress)
    {
        progressBar.mark_as_completed();
        indicators::show_console_cursor(true);
    }
    return output;
}

double recallAtK(const std::vector<search_result_t> &approx, const std::vector<search_result_t> &exact, uint32_t k)
{
    const size_t nExact = std::min<size_t>(k, exact.size());
    if (nExact == 0)
        return 1.0;
    std::unordered_set<nodeID_t> truth;
    for (size_t i = 0; i < nExact; i++)
    {
        truth.insert(exact[i].second);
    }
    size_t hits = 0;
    for (size_t i = 0; i < std::min<size_t>(k, approx.size()); i++)
    {
        if (truth.count(approx[i].second))
            hits++;
    }
    return static_cast<double>(hits) / nExact;
}
