#include "vectorwise/hnsw_graph.h"
#include "vectorwise/errors.h"
#include <algorithm>
#include <iostream>
#include <string>

HNSWGraph::HNSWGraph(uint32_t M)
{
    if (M < 2)
    {
        throw InvalidArgument("M must be >= 2, got " + std::to_string(M));
    }
    this->M_ = M;
    this->Mmax_ = M;
    this->Mmax0_ = M * 2;
    this->entrypointID_ = ENTRYPOINT_NOT_SET;
    this->topLayer_ = 0;
}

nodeID_t HNSWGraph::getEntrypointID() const
{
    if (this->isEmpty())
    {
        throw IndexUnavailable("graph is empty, no entrypoint");
    }
    return this->entrypointID_;
}

uint32_t HNSWGraph::getTopLayer() const
{
    if (this->isEmpty())
    {
        throw IndexUnavailable("graph is empty, no top layer");
    }
    return this->topLayer_;
}

uint32_t HNSWGraph::getNodeLevel(nodeID_t nodeID) const
{
    if (nodeID >= this->nodes_.size())
    {
        throw NotFound(nodeID);
    }
    return this->nodes_[nodeID].maxLayer;
}

bool HNSWGraph::containsNode(nodeID_t nodeID, uint32_t layerID) const
{
    return nodeID < this->nodes_.size() && this->nodes_[nodeID].maxLayer >= layerID;
}

const std::vector<nodeID_t> &HNSWGraph::getNeighborsId(nodeID_t nodeID, uint32_t layerID) const
{
    if (!this->containsNode(nodeID, layerID))
    {
        throw NotFound(nodeID);
    }
    return this->nodes_[nodeID].neighbors[layerID];
}

uint32_t HNSWGraph::getNeighborhoodSize(nodeID_t nodeID, uint32_t layerID) const
{
    return static_cast<uint32_t>(this->getNeighborsId(nodeID, layerID).size());
}

uint32_t HNSWGraph::getNumNodesInLayer(uint32_t layerID) const
{
    uint32_t n = 0;
    for (const auto &node : this->nodes_)
    {
        if (node.maxLayer >= layerID)
            n++;
    }
    return n;
}

nodeID_t HNSWGraph::addNode(uint32_t level)
{
    if (this->nodes_.size() >= ENTRYPOINT_NOT_SET)
    {
        throw InvalidArgument("graph capacity exceeded");
    }
    GraphNode node;
    node.maxLayer = level;
    node.neighbors.resize(level + 1);
    node.neighbors[0].reserve(this->Mmax0_ + 1);
    this->nodes_.push_back(std::move(node));
    return static_cast<nodeID_t>(this->nodes_.size() - 1);
}

void HNSWGraph::setNeighbors(nodeID_t nodeID, uint32_t layerID, std::vector<nodeID_t> neighborIDs)
{
    if (!this->containsNode(nodeID, layerID))
    {
        throw NotFound(nodeID);
    }
    this->nodes_[nodeID].neighbors[layerID] = std::move(neighborIDs);
}

void HNSWGraph::addConnection(nodeID_t fromID, nodeID_t toID, uint32_t layerID)
{
    if (!this->containsNode(fromID, layerID))
    {
        throw NotFound(fromID);
    }
    if (!this->containsNode(toID, layerID))
    {
        throw NotFound(toID);
    }
    this->nodes_[fromID].neighbors[layerID].push_back(toID);
}

void HNSWGraph::setEntrypoint(nodeID_t nodeID)
{
    if (nodeID >= this->nodes_.size())
    {
        throw NotFound(nodeID);
    }
    this->entrypointID_ = nodeID;
    this->topLayer_ = this->nodes_[nodeID].maxLayer;
}

void HNSWGraph::validate(uint32_t numVectors) const
{
    if (this->M_ < 2 || this->Mmax_ != this->M_ || this->Mmax0_ != this->M_ * 2)
    {
        throw CorruptArtifact("invalid connection parameters (M=" + std::to_string(this->M_) + ")");
    }
    if (this->nodes_.size() != numVectors)
    {
        throw CorruptArtifact("graph has " + std::to_string(this->nodes_.size()) +
                              " nodes but store has " + std::to_string(numVectors) + " vectors");
    }
    if (this->isEmpty())
    {
        if (this->entrypointID_ != ENTRYPOINT_NOT_SET)
            throw CorruptArtifact("empty graph has an entrypoint");
        return;
    }
    if (this->entrypointID_ >= this->nodes_.size())
    {
        throw CorruptArtifact("entrypoint " + std::to_string(this->entrypointID_) + " out of range");
    }
    if (this->nodes_[this->entrypointID_].maxLayer != this->topLayer_)
    {
        throw CorruptArtifact("entrypoint is not on the top layer");
    }
    for (nodeID_t nodeID = 0; nodeID < this->nodes_.size(); nodeID++)
    {
        const GraphNode &node = this->nodes_[nodeID];
        if (node.maxLayer > this->topLayer_)
        {
            throw CorruptArtifact("node " + std::to_string(nodeID) + " is above the top layer");
        }
        if (node.neighbors.size() != static_cast<size_t>(node.maxLayer) + 1)
        {
            throw CorruptArtifact("node " + std::to_string(nodeID) + " has " + std::to_string(node.neighbors.size()) +
                                  " neighbor lists for level " + std::to_string(node.maxLayer));
        }
        for (uint32_t l = 0; l <= node.maxLayer; l++)
        {
            const auto &neighborIDs = node.neighbors[l];
            if (neighborIDs.size() > this->maxNeighbors(l))
            {
                throw CorruptArtifact("node " + std::to_string(nodeID) + " exceeds the neighbor cap at layer " + std::to_string(l));
            }
            for (auto nbID : neighborIDs)
            {
                if (nbID >= this->nodes_.size())
                {
                    throw CorruptArtifact("node " + std::to_string(nodeID) + " references out-of-range id " + std::to_string(nbID));
                }
                if (nbID == nodeID)
                {
                    throw CorruptArtifact("node " + std::to_string(nodeID) + " links to itself");
                }
                // layer containment: a neighbor at layer l must itself be present at layer l
                if (this->nodes_[nbID].maxLayer < l)
                {
                    throw CorruptArtifact("node " + std::to_string(nodeID) + " links to " + std::to_string(nbID) +
                                          " at layer " + std::to_string(l) + " where it does not exist");
                }
            }
        }
    }
}

void HNSWGraph::summarize() const
{
    if (this->isEmpty())
    {
        std::cout << "Graph is empty" << std::endl;
        return;
    }
    for (int layerID = this->topLayer_; layerID >= 0; layerID--)
    {
        // Calculate min, max, and average number of neighbors per node
        size_t numNodes = 0;
        size_t totalNeighbors = 0;
        size_t minNeighbors = 0xfffffff;
        size_t maxNeighbors = 0;
        for (const auto &node : this->nodes_)
        {
            if (node.maxLayer < static_cast<uint32_t>(layerID))
                continue;
            numNodes++;
            size_t numNeighbors = node.neighbors[layerID].size();
            totalNeighbors += numNeighbors;
            minNeighbors = std::min(minNeighbors, numNeighbors);
            maxNeighbors = std::max(maxNeighbors, numNeighbors);
        }
        double averageNeighbors = static_cast<double>(totalNeighbors) / numNodes;
        std::cout << "layer " << layerID << ": " << numNodes << " nodes. ";
        std::cout << "Neighbors per node: min=" << minNeighbors << " ";
        std::cout << "avg=" << averageNeighbors << " ";
        std::cout << "max=" << maxNeighbors << "\n";
    }
    std::cout << "entrypoint: " << this->entrypointID_ << std::endl;
}
