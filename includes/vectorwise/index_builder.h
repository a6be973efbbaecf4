#pragma once
#include "common.h"
#include "hnsw_index.h"
#include "level_generator.h"
#include <memory>
#include <vector>

// Grows an HnswIndex one vector at a time. Single-threaded; the result is
// handed out read-only by finish(). Callers normalize vectors before add()
class IndexBuilder
{
private:
  // index under construction, null after finish()
  std::unique_ptr<HnswIndex> index_;
  // draws each node's top layer
  LevelGenerator levels_;
  // print build progress
  bool verbose_;
  // the index, or throws if finish() was already called
  HnswIndex &index_ref_() const;
  // select up to M points from candidates to connect to a base node
  // candidates: list of (distance_to_base, nodeID), sorted increasingly; replaced in-place by the selection
  void selectNeighborsHeuristic_(std::vector<search_result_t> &candidates, uint32_t M) const;
  // prune nodeID's neighbor list at layerID back to the layer's cap.
  // newID is the node whose reverse edge was just added to the list
  void shrinkConnections_(nodeID_t nodeID, uint32_t layerID, nodeID_t newID);
  // link an already-stored vector into the graph at layers 0..level
  void insert_(nodeID_t nodeID, uint32_t level);

public:
  // Constructor. Throws InvalidArgument on malformed parameters
  explicit IndexBuilder(const BuildParameters &params, bool verbose = false);
  // Constructor with an injected level generator
  IndexBuilder(const BuildParameters &params, LevelGenerator levels, bool verbose = false);
  // insert one vector and return its nodeID. Throws DimensionMismatch before any mutation
  nodeID_t add(const std::vector<float> &vector);
  // insert a batch of vectors in order, with a progress bar when showProgress is set
  void addBatch(const std::vector<std::vector<float>> &vectors, bool showProgress = false);
  // number of vectors inserted so far
  uint32_t count() const;
  // the index being built
  const HnswIndex &index() const { return this->index_ref_(); }
  // stop building and hand out the immutable index
  std::shared_ptr<const HnswIndex> finish();
};
