#include "vectorwise/distance.h"
#include <atomic>
#include <cmath>
#include <stdexcept>
#include <string>

#ifdef __AVX2__
#include <immintrin.h>
#endif

static std::atomic<bool> _Profiling_enabled{false};
static std::atomic<uint64_t> _Count_dist_calc{0};

void enableProfiling()
{
    _Profiling_enabled.store(true, std::memory_order_relaxed);
}

void disableProfiling()
{
    _Profiling_enabled.store(false, std::memory_order_relaxed);
}

void resetProfilingCounter()
{
    _Count_dist_calc.store(0, std::memory_order_relaxed);
}

uint64_t getCountDistCalc()
{
    return _Count_dist_calc.load(std::memory_order_relaxed);
}

float squaredEuclideanDistance(const float *v1, const float *v2, uint32_t dim)
{
    if (_Profiling_enabled.load(std::memory_order_relaxed))
        _Count_dist_calc.fetch_add(1, std::memory_order_relaxed);

    uint32_t i = 0;
    float distance = 0.0f;
#ifdef __AVX2__
    __m256 sum = _mm256_setzero_ps();
    // Process 8 floats at a time using AVX2
    for (; i + 8 <= dim; i += 8)
    {
        __m256 vec1 = _mm256_loadu_ps(v1 + i);
        __m256 vec2 = _mm256_loadu_ps(v2 + i);
        __m256 diff = _mm256_sub_ps(vec1, vec2);
        sum = _mm256_fmadd_ps(diff, diff, sum);
    }
    // Sum up all elements
    sum = _mm256_hadd_ps(sum, sum);
    sum = _mm256_hadd_ps(sum, sum);
    alignas(32) float temp[8];
    _mm256_store_ps(temp, sum);
    distance = temp[3] + temp[4];
#endif
    // tail (or the whole vector without AVX2)
    for (; i < dim; ++i)
    {
        float diff = v1[i] - v2[i];
        distance += diff * diff;
    }
    return distance;
}

float squaredEuclideanDistance(const std::vector<float> &v1, const std::vector<float> &v2)
{
    if (v1.size() != v2.size())
    {
        throw std::invalid_argument("Vector sizes mismatch: " + std::to_string(v1.size()) + " vs " + std::to_string(v2.size()));
    }
    return squaredEuclideanDistance(v1.data(), v2.data(), static_cast<uint32_t>(v1.size()));
}

void normalizeL2(float *vec, uint32_t dim)
{
    double norm = 0.0;
    for (uint32_t i = 0; i < dim; ++i)
    {
        norm += static_cast<double>(vec[i]) * vec[i];
    }
    norm = std::sqrt(norm);
    if (norm == 0.0)
        return;
    for (uint32_t i = 0; i < dim; ++i)
    {
        vec[i] = static_cast<float>(vec[i] / norm);
    }
}

void normalizeL2(std::vector<float> &vec)
{
    normalizeL2(vec.data(), static_cast<uint32_t>(vec.size()));
}
