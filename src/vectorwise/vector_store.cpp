#include "vectorwise/vector_store.h"
#include "vectorwise/distance.h"
#include "vectorwise/errors.h"

VectorStore::VectorStore(uint32_t dim)
{
    if (dim == 0)
    {
        throw InvalidArgument("VectorStore dim must be > 0");
    }
    this->dim_ = dim;
}

nodeID_t VectorStore::add(const std::vector<float> &vector)
{
    return this->add(vector.data(), static_cast<uint32_t>(vector.size()));
}

nodeID_t VectorStore::add(const float *vector, uint32_t dim)
{
    if (dim != this->dim_)
    {
        throw DimensionMismatch(this->dim_, dim);
    }
    if (this->count() == ENTRYPOINT_NOT_SET)
    {
        throw InvalidArgument("VectorStore is full");
    }
    nodeID_t nodeID = this->count();
    this->data_.insert(this->data_.end(), vector, vector + dim);
    return nodeID;
}

const float *VectorStore::get(nodeID_t nodeID) const
{
    if (nodeID >= this->count())
    {
        throw NotFound(nodeID);
    }
    return this->data_.data() + static_cast<uint64_t>(nodeID) * this->dim_;
}

std::vector<float> VectorStore::getVector(nodeID_t nodeID) const
{
    const float *vec = this->get(nodeID);
    return std::vector<float>(vec, vec + this->dim_);
}

float VectorStore::distance(const float *a, const float *b) const
{
    return squaredEuclideanDistance(a, b, this->dim_);
}

float VectorStore::distanceToId(const float *query, nodeID_t nodeID) const
{
    return squaredEuclideanDistance(query, this->get(nodeID), this->dim_);
}

float VectorStore::distanceBetween(nodeID_t nodeID1, nodeID_t nodeID2) const
{
    return squaredEuclideanDistance(this->get(nodeID1), this->get(nodeID2), this->dim_);
}

void VectorStore::reserve(uint64_t n)
{
    this->data_.reserve(n * this->dim_);
}
