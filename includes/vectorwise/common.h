#pragma once
#include <stdint.h>
#include <limits>
#include <utility>
#include <vector>

using nodeID_t = uint32_t;
// (distance, nodeID). Ordered by distance first so std::less/std::greater on the pair sort by distance
using search_result_t = std::pair<float, nodeID_t>;

#define ENTRYPOINT_NOT_SET 0xFFFFFFFF
