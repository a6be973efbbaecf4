#pragma once
#include "common.h"
#include "hnsw_graph.h"
#include "vector_store.h"
#include <vector>

// Traversal of a single graph layer, shared by construction and query.
// Holds only references; all working state is local to each call, so one
// LayerSearcher (or many) can serve concurrent readers of an immutable graph
class LayerSearcher
{
private:
  const HNSWGraph &graph_;
  const VectorStore &store_;

public:
  LayerSearcher(const HNSWGraph &graph, const VectorStore &store) : graph_(graph), store_(store) {}

  // Greedy walk with a candidate list of width 1: move to the closest neighbor
  // until no neighbor improves on the current node.
  // entry: (distance to query, nodeID) of the start node
  // Return: the locally closest (distance, nodeID)
  search_result_t greedySearchLayer(const float *query, search_result_t entry, uint32_t layerID) const;

  // Beam search bounded by ef, starting from the given entry points.
  // Return: up to ef (distance, nodeID) ordered increasingly by distance
  std::vector<search_result_t> searchLayer(
      const float *query, const std::vector<search_result_t> &entrypoints, uint32_t ef, uint32_t layerID) const;
};
