#pragma once
#include "common.h"
#include "hnsw_graph.h"
#include "vector_store.h"
#include <memory>
#include <string>
#include <stdint.h>
#include <cereal/access.hpp>

// Construction parameters. Baked into the persisted index
struct BuildParameters
{
  // vector dimension
  uint32_t dim = 128;
  // number of neighbors to connect per layer (2M at layer 0)
  uint32_t M = 32;
  // candidate list width while inserting
  uint32_t efConstruction = 200;
  // seed of the level generator
  uint64_t seed = 42;
  // top up a pruned neighbor list with discarded candidates when the heuristic keeps fewer than the cap
  bool keepPrunedConnections = false;

  // throws InvalidArgument on malformed values
  void validate() const;

  template <class Archive>
  void serialize(Archive &ar)
  {
    ar(dim, M, efConstruction, seed, keepPrunedConnections);
  }
};

// A built index: the vectors, the graph over them and the parameters used to build it.
// Immutable once handed out by IndexBuilder::finish() or loadIndex()
class HnswIndex
{
private:
  BuildParameters params_;
  VectorStore store_;
  HNSWGraph graph_;

  friend class IndexBuilder;
  friend class cereal::access;
  template <class Archive>
  void save(Archive &ar) const;
  template <class Archive>
  void load(Archive &ar);

public:
  // Constructor
  explicit HnswIndex(const BuildParameters &params = BuildParameters());
  const BuildParameters &params() const { return this->params_; }
  const VectorStore &store() const { return this->store_; }
  const HNSWGraph &graph() const { return this->graph_; }
  // number of indexed vectors
  uint32_t count() const { return this->store_.count(); }
  uint32_t dim() const { return this->store_.dim(); }
  uint32_t getNumLayers() const { return this->graph_.getNumLayers(); }
  // structural check of the whole index. Throws CorruptArtifact
  void validate() const;
  // print a summary to stdout
  void summarize() const;
  // serialize to an opaque byte blob
  std::string toBlob() const;
  // saving index
  void save(const std::string &filename) const;
};

// Decode a blob produced by toBlob(). expectedDim == 0 accepts any dimension.
// Throws CorruptArtifact, or DimensionMismatch when the dimension differs from expectedDim
std::shared_ptr<const HnswIndex> indexFromBlob(const std::string &blob, uint32_t expectedDim = 0);

// loading index. Same checks as indexFromBlob
std::shared_ptr<const HnswIndex> loadIndex(const std::string &filename, uint32_t expectedDim = 0);
