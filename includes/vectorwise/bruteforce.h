#pragma once
#include "common.h"
#include "vector_store.h"
#include <vector>

// Exact k-NN by scanning every stored vector. Ground truth for recall measurements
class BruteForce
{
private:
  // vectors to scan. Must outlive this object
  const VectorStore &store_;
  // sequential scan, returns up to k (distance, nodeID) increasing
  std::vector<search_result_t> scan_(const float *query, uint32_t k) const;

public:
  // Constructor
  explicit BruteForce(const VectorStore &store) : store_(store) {}
  // exact search for one query, the scan is split across OpenMP threads
  std::vector<search_result_t> search(const std::vector<float> &query, uint32_t k = 1) const;
  // exact search for many queries, one query per thread
  std::vector<std::vector<search_result_t>> searchBatch(
      const std::vector<std::vector<float>> &queries, uint32_t k, bool showProgress = false) const;
};

// fraction of the first k exact nodeIDs that appear in the first k approximate results
double recallAtK(const std::vector<search_result_t> &approx, const std::vector<search_result_t> &exact, uint32_t k);
