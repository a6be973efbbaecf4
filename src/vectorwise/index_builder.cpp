#include "vectorwise/index_builder.h"
#include "vectorwise/errors.h"
#include "vectorwise/layer_search.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>

IndexBuilder::IndexBuilder(const BuildParameters &params, bool verbose)
    : IndexBuilder(params, LevelGenerator(params.M, params.seed), verbose)
{
}

IndexBuilder::IndexBuilder(const BuildParameters &params, LevelGenerator levels, bool verbose)
    : index_(std::make_unique<HnswIndex>(params)), levels_(std::move(levels)), verbose_(verbose)
{
}

HnswIndex &IndexBuilder::index_ref_() const
{
    if (!this->index_)
    {
        throw std::logic_error("IndexBuilder already finished");
    }
    return *this->index_;
}

uint32_t IndexBuilder::count() const
{
    return this->index_ref_().count();
}

void IndexBuilder::selectNeighborsHeuristic_(std::vector<search_result_t> &candidates, uint32_t M) const
{
    if (candidates.size() <= M)
        return;
    const VectorStore &store = this->index_ref_().store_;
    std::vector<search_result_t> selected;
    selected.reserve(M);
    std::vector<search_result_t> discarded;
    for (const auto &[distCandidateToBase, candidateID] : candidates)
    {
        if (selected.size() >= M)
            break;
        // keep the candidate unless an already selected neighbor is closer to it than the base node is
        bool good = true;
        for (const auto &[_dist, selectedID] : selected)
        {
            float distCandidateToSelected = store.distanceBetween(candidateID, selectedID);
            if (distCandidateToSelected < distCandidateToBase)
            {
                good = false;
                break;
            }
        }
        // we can add this candidateID to the result or discard
        if (good)
            selected.push_back({distCandidateToBase, candidateID});
        else
            discarded.push_back({distCandidateToBase, candidateID});
    }
    // Add some discarded candidates if the return list is not large enough
    if (this->index_ref_().params_.keepPrunedConnections)
    {
        for (size_t i = 0; i < discarded.size() && selected.size() < M; i++)
        {
            selected.push_back(discarded[i]);
        }
        std::sort(selected.begin(), selected.end());
    }
    candidates.swap(selected);
}

void IndexBuilder::shrinkConnections_(nodeID_t nodeID, uint32_t layerID, nodeID_t newID)
{
    HnswIndex &index = this->index_ref_();
    HNSWGraph &graph = index.graph_;
    const uint32_t Mmax = graph.maxNeighbors(layerID);
    const auto &neighborIDs = graph.getNeighborsId(nodeID, layerID);
    if (neighborIDs.size() <= Mmax)
        return;
    const float *nodeVec = index.store_.get(nodeID);
    std::vector<search_result_t> candidates;
    candidates.reserve(neighborIDs.size());
    for (auto neighborID : neighborIDs)
    {
        candidates.push_back({index.store_.distanceToId(nodeVec, neighborID), neighborID});
    }
    std::sort(candidates.begin(), candidates.end());
    float newDist = index.store_.distanceToId(nodeVec, newID);
    this->selectNeighborsHeuristic_(candidates, Mmax);
    // equal distances sort the newest node last, so it would lose this in-edge on every
    // tie. Keep it in place of the worst kept neighbor when it ties that neighbor
    bool keptNew = std::any_of(candidates.begin(), candidates.end(),
                               [newID](const search_result_t &c) { return c.second == newID; });
    if (!keptNew && !candidates.empty() && newDist == candidates.back().first)
    {
        candidates.back() = {newDist, newID};
    }
    std::vector<nodeID_t> kept;
    kept.reserve(candidates.size());
    for (const auto &[_dist, nID] : candidates)
    {
        kept.push_back(nID);
    }
    graph.setNeighbors(nodeID, layerID, std::move(kept));
}

void IndexBuilder::insert_(nodeID_t nodeID, uint32_t level)
{
    HnswIndex &index = this->index_ref_();
    HNSWGraph &graph = index.graph_;
    const float *vector = index.store_.get(nodeID);
    const uint32_t efc = index.params_.efConstruction;

    if (graph.getNumNodes() == 1)
    {
        // first node: it becomes the entrypoint at its drawn level
        graph.setEntrypoint(nodeID);
        return;
    }

    LayerSearcher searcher(graph, index.store_);
    const uint32_t topLayer = graph.getTopLayer();
    nodeID_t entrypointID = graph.getEntrypointID();
    search_result_t entry{index.store_.distanceToId(vector, entrypointID), entrypointID};

    // first we find the entrypoint of the layers above level with a width-1 greedy walk
    for (uint32_t l = topLayer; l > level; --l)
    {
        entry = searcher.greedySearchLayer(vector, entry, l);
    }

    // now we link this vector into the layers from min(level, topLayer) down to 0
    std::vector<search_result_t> entrypoints{entry};
    for (int l = std::min(level, topLayer); l >= 0; --l)
    {
        const uint32_t layerID = static_cast<uint32_t>(l);
        std::vector<search_result_t> nearestNeighbors = searcher.searchLayer(vector, entrypoints, efc, layerID);
        // the beam of this layer seeds the search of the next one
        entrypoints = nearestNeighbors;
        this->selectNeighborsHeuristic_(nearestNeighbors, graph.maxNeighbors(layerID));
        std::vector<nodeID_t> neighborsID;
        neighborsID.reserve(nearestNeighbors.size());
        for (const auto &[_dist, nID] : nearestNeighbors)
        {
            neighborsID.push_back(nID);
        }
        graph.setNeighbors(nodeID, layerID, neighborsID);
        // add connections from the selected neighbors to this node,
        // then shrink any neighbor whose degree went over the cap
        for (auto neighborID : neighborsID)
        {
            graph.addConnection(neighborID, nodeID, layerID);
            this->shrinkConnections_(neighborID, layerID, nodeID);
        }
    }

    if (level > topLayer)
    {
        graph.setEntrypoint(nodeID);
    }
}

nodeID_t IndexBuilder::add(const std::vector<float> &vector)
{
    HnswIndex &index = this->index_ref_();
    // validate before any mutation so a rejected vector leaves no trace
    if (vector.size() != index.store_.dim())
    {
        throw DimensionMismatch(index.store_.dim(), vector.size());
    }
    uint32_t level = this->levels_.draw();
    nodeID_t nodeID = index.store_.add(vector);
    nodeID_t graphID = index.graph_.addNode(level);
    if (graphID != nodeID)
    {
        throw std::logic_error("vector store and graph are out of sync");
    }
    this->insert_(nodeID, level);
    return nodeID;
}

void IndexBuilder::addBatch(const std::vector<std::vector<float>> &vectors, bool showProgress)
{
    HnswIndex &index = this->index_ref_();
    // reject the whole batch up front rather than stopping half-way
    for (size_t i = 0; i < vectors.size(); i++)
    {
        if (vectors[i].size() != index.store_.dim())
        {
            throw DimensionMismatch(index.store_.dim(), vectors[i].size());
        }
    }
    index.store_.reserve(static_cast<uint64_t>(index.count()) + vectors.size());

    if (this->verbose_)
    {
        std::cout << "[BUILD] Inserting " << vectors.size() << " vectors (M=" << index.params_.M
                  << ", efConstruction=" << index.params_.efConstruction << ")" << std::endl;
    }
    if (!showProgress)
    {
        for (const auto &vector : vectors)
        {
            this->add(vector);
        }
        return;
    }

    // setup progress bar
    indicators::show_console_cursor(false);
    indicators::ProgressBar progressBar{
        indicators::option::BarWidth{80},
        indicators::option::PrefixText{"inserting " + std::to_string(vectors.size()) + " vectors"},
        indicators::option::ShowElapsedTime{true},
        indicators::option::ShowRemainingTime{true}};
    size_t lastPercent = 0;
    for (size_t i = 0; i < vectors.size(); i++)
    {
        this->add(vectors[i]);
        size_t percent = (i + 1) * 100 / vectors.size();
        if (percent != lastPercent)
        {
            progressBar.set_progress((percent < 100) ? percent : 99);
            lastPercent = percent;
        }
    }
    progressBar.mark_as_completed();
    indicators::show_console_cursor(true);
}

std::shared_ptr<const HnswIndex> IndexBuilder::finish()
{
    this->index_ref_();
    std::shared_ptr<const HnswIndex> built(std::move(this->index_));
    if (this->verbose_)
    {
        std::cout << "[BUILD] Finished: " << built->count() << " vectors in " << built->getNumLayers() << " layers" << std::endl;
    }
    return built;
}
