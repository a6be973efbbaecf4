#pragma once
#include "common.h"
#include <vector>
#include <stdint.h>
#include <cereal/access.hpp>

// one node of the multi-layer graph
struct GraphNode
{
  // highest layer this node participates in
  uint32_t maxLayer = 0;
  // neighbors[l] = nodeIDs adjacent to this node at layer l, for l in 0..maxLayer
  std::vector<std::vector<nodeID_t>> neighbors;

  template <class Archive>
  void serialize(Archive &ar)
  {
    ar(maxLayer, neighbors);
  }
};

// Multi-layer proximity graph over the nodeIDs of a VectorStore.
// Layer 0 holds every node, layer l > 0 holds the nodes whose maxLayer >= l.
// Edges are directed: pruning may drop B->A while A->B stays
class HNSWGraph
{
private:
  // neighbors to connect per insertion at layers > 0
  uint32_t M_;
  // max number of neighbors a node can have at any time
  uint32_t Mmax_;  // at higher layers
  uint32_t Mmax0_; // at layer 0
  // one entry per nodeID
  std::vector<GraphNode> nodes_;
  // nodeID every search starts from, ENTRYPOINT_NOT_SET while empty
  nodeID_t entrypointID_;
  // maxLayer of the entrypoint
  uint32_t topLayer_;

  friend class cereal::access;
  template <class Archive>
  void serialize(Archive &ar)
  {
    ar(M_, Mmax_, Mmax0_, nodes_, entrypointID_, topLayer_);
  }

public:
  // constructor
  explicit HNSWGraph(uint32_t M = 16);
  // connection parameter the graph was built with
  uint32_t getM() const { return this->M_; }
  // neighbor-list cap at a layer (2M at layer 0, M above)
  uint32_t maxNeighbors(uint32_t layerID) const { return (layerID == 0) ? this->Mmax0_ : this->Mmax_; }
  // check if this graph is empty
  bool isEmpty() const { return this->nodes_.empty(); }
  // get number of nodes in this graph
  uint32_t getNumNodes() const { return static_cast<uint32_t>(this->nodes_.size()); }
  // get entrypoint nodeID for a top-down search
  nodeID_t getEntrypointID() const;
  // highest non-empty layer
  uint32_t getTopLayer() const;
  // number of non-empty layers (0 when empty)
  uint32_t getNumLayers() const { return this->isEmpty() ? 0 : this->topLayer_ + 1; }
  // maxLayer of a node
  uint32_t getNodeLevel(nodeID_t nodeID) const;
  // check if a node exists and participates in layerID
  bool containsNode(nodeID_t nodeID, uint32_t layerID = 0) const;
  // given a nodeID, find its neighbors' nodeIDs at layerID
  const std::vector<nodeID_t> &getNeighborsId(nodeID_t nodeID, uint32_t layerID) const;
  // how many neighbors does a node have at layerID?
  uint32_t getNeighborhoodSize(nodeID_t nodeID, uint32_t layerID) const;
  // number of nodes present at layerID
  uint32_t getNumNodesInLayer(uint32_t layerID) const;
  // append a node participating in layers 0..level, with no edges yet. Returns its nodeID
  nodeID_t addNode(uint32_t level);
  // replace a node's neighbor list at layerID
  void setNeighbors(nodeID_t nodeID, uint32_t layerID, std::vector<nodeID_t> neighborIDs);
  // add a directed edge from -> to at layerID
  void addConnection(nodeID_t fromID, nodeID_t toID, uint32_t layerID);
  // make nodeID the entrypoint; the top layer becomes its maxLayer
  void setEntrypoint(nodeID_t nodeID);
  // structural check against a store of numVectors vectors. Throws CorruptArtifact
  void validate(uint32_t numVectors) const;
  // print a summary to stdout
  void summarize() const;
};
