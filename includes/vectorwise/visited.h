#pragma once
#include <stdint.h>
#include <unordered_set>
#include "common.h"

// Visited marker for one graph traversal. Lives on the caller's stack so
// concurrent searches never share it
class VisitedCheck
{
private:
    std::unordered_set<nodeID_t> data_;

public:
    explicit VisitedCheck(uint64_t expected = 256)
    {
        this->data_.reserve(expected);
    }

    // reset the visited set
    void clear()
    {
        this->data_.clear();
    }

    // mark visited. Returns false if it was already marked
    bool insert(nodeID_t x)
    {
        return this->data_.insert(x).second;
    }

    // check if visited
    bool contains(nodeID_t x) const
    {
        return this->data_.count(x) != 0;
    }

    uint64_t size() const
    {
        return this->data_.size();
    }

    void reserve(uint64_t size)
    {
        this->data_.reserve(size);
    }
};
