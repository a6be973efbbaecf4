#pragma once
#include "common.h"
#include <vector>
#include <stdint.h>
#include <cereal/access.hpp>

// Append-only storage of fixed-dimension vectors. Node IDs are dense (0..N-1)
// and assigned in insertion order. All vectors live in one flat float array
class VectorStore
{
private:
  // fixed dimension of every vector in this store
  uint32_t dim_;
  // flat storage: vector i occupies [i * dim_, (i + 1) * dim_)
  std::vector<float> data_;

  friend class cereal::access;
  template <class Archive>
  void serialize(Archive &ar)
  {
    ar(dim_, data_);
  }

public:
  // Constructor. dim must be > 0
  explicit VectorStore(uint32_t dim = 1);
  // dimension of stored vectors
  uint32_t dim() const { return this->dim_; }
  // number of stored vectors
  uint32_t count() const { return (this->dim_ == 0) ? 0 : static_cast<uint32_t>(this->data_.size() / this->dim_); }
  // append a vector and return its nodeID. Throws DimensionMismatch on wrong length
  nodeID_t add(const std::vector<float> &vector);
  nodeID_t add(const float *vector, uint32_t dim);
  // pointer to the vector at nodeID (dim() floats). Throws NotFound if out of range
  const float *get(nodeID_t nodeID) const;
  // copy of the vector at nodeID
  std::vector<float> getVector(nodeID_t nodeID) const;
  // squared euclidean distance between two vectors of this store's dimension
  float distance(const float *a, const float *b) const;
  // distance from a query to a stored vector
  float distanceToId(const float *query, nodeID_t nodeID) const;
  // distance between two stored vectors
  float distanceBetween(nodeID_t nodeID1, nodeID_t nodeID2) const;
  // pre-allocate space for n vectors
  void reserve(uint64_t n);
  // raw flat array, used by structural validation after load
  const std::vector<float> &rawData() const { return this->data_; }
};
