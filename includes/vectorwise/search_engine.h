#pragma once
#include "common.h"
#include "hnsw_index.h"
#include <memory>
#include <vector>

// Answers k-NN queries against a built index. Read-only: any number of
// search() calls may run concurrently on one engine
class SearchEngine
{
private:
  // the index this engine reads. Kept alive for as long as the engine exists
  std::shared_ptr<const HnswIndex> index_;
  // throws InvalidArgument / DimensionMismatch for a bad request
  void validate_(size_t queryDim, int k, int efSearch) const;
  // search without argument checks
  std::vector<search_result_t> searchValidated_(const float *query, uint32_t k, uint32_t efSearch) const;
  // add the closest nodes missing from results by an exact scan until it holds wanted entries
  void completeByScan_(const float *query, std::vector<search_result_t> &results, uint32_t wanted) const;

public:
  // Constructor. Throws IndexUnavailable for a null index
  explicit SearchEngine(std::shared_ptr<const HnswIndex> index);
  // search for a query's k nearest neighbors with a candidate list of max(efSearch, k)
  // Return: up to k (distance, nodeID) ordered increasingly by distance
  std::vector<search_result_t> search(const std::vector<float> &query, int k, int efSearch) const;
  // parallel search for multiple queries (2d array, first dim is batch_size, 2nd dim is vector size)
  // Return: one result list per query, each as search() returns it
  std::vector<std::vector<search_result_t>> searchBatch(
      const std::vector<std::vector<float>> &queries, int k, int efSearch) const;
  const HnswIndex &index() const { return *this->index_; }
};
