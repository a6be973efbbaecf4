#pragma once
#include <stdint.h>
#include <vector>

// distance-evaluation counter, used by the benchmark to report work per query
void enableProfiling();
void disableProfiling();
void resetProfilingCounter();
uint64_t getCountDistCalc();

// squared euclidean distance over `dim` floats
float squaredEuclideanDistance(const float *v1, const float *v2, uint32_t dim);
float squaredEuclideanDistance(const std::vector<float> &v1, const std::vector<float> &v2);

// scale a vector to unit L2 norm in place. A zero vector is left unchanged
void normalizeL2(float *vec, uint32_t dim);
void normalizeL2(std::vector<float> &vec);
