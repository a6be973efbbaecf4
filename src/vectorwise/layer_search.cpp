#include "vectorwise/layer_search.h"
#include "vectorwise/visited.h"
#include <algorithm>
#include <functional>
#include <queue>

search_result_t LayerSearcher::greedySearchLayer(const float *query, search_result_t entry, uint32_t layerID) const
{
    search_result_t best = entry;
    bool changed = true;
    while (changed)
    {
        changed = false;
        for (auto neighborID : this->graph_.getNeighborsId(best.second, layerID))
        {
            float dist = this->store_.distanceToId(query, neighborID);
            if (search_result_t(dist, neighborID) < best)
            {
                best = {dist, neighborID};
                changed = true;
            }
        }
    }
    return best;
}

std::vector<search_result_t> LayerSearcher::searchLayer(
    const float *query, const std::vector<search_result_t> &entrypoints, uint32_t ef, uint32_t layerID) const
{
    if (ef == 0 || entrypoints.empty())
        return {};
    // visited nodes on this layer
    VisitedCheck visited(static_cast<uint64_t>(ef) * this->graph_.maxNeighbors(layerID));
    // Candidate list. min heap (distance, nodeID)
    std::priority_queue<search_result_t, std::vector<search_result_t>, std::greater<search_result_t>> candidates;
    // current best ef results. max heap (distance, nodeID), worst on top
    std::priority_queue<search_result_t> nearestNeighbors;
    for (const auto &entry : entrypoints)
    {
        if (!visited.insert(entry.second))
            continue;
        candidates.push(entry);
        nearestNeighbors.push(entry);
        if (nearestNeighbors.size() > ef)
            nearestNeighbors.pop();
    }
    while (!candidates.empty())
    {
        // consider the closest candidate to the query
        auto [candidateDist, candidateID] = candidates.top();
        candidates.pop();
        // stop search if candidate is further than the current worst on nearestNeighbors
        if (nearestNeighbors.size() >= ef && candidateDist > nearestNeighbors.top().first)
            break;
        // check all neighbors of this candidate
        for (auto neighborID : this->graph_.getNeighborsId(candidateID, layerID))
        {
            if (!visited.insert(neighborID))
                continue;
            float neighborDist = this->store_.distanceToId(query, neighborID);
            // if this neighbor distance is better than the worst on nearestNeighbors,
            // put it on both the candidates and the nearestNeighbors lists
            // if the nearestNeighbors list is full, remove the furthest node
            if (nearestNeighbors.size() < ef || neighborDist < nearestNeighbors.top().first)
            {
                candidates.push({neighborDist, neighborID});
                nearestNeighbors.push({neighborDist, neighborID});
                if (nearestNeighbors.size() > ef)
                    nearestNeighbors.pop();
            }
        }
    }
    // drain the max heap into an increasing array
    std::vector<search_result_t> result(nearestNeighbors.size());
    for (size_t i = result.size(); i > 0; i--)
    {
        result[i - 1] = nearestNeighbors.top();
        nearestNeighbors.pop();
    }
    return result;
}
