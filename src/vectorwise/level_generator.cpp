#include "vectorwise/level_generator.h"
#include "vectorwise/errors.h"
#include <algorithm>
#include <cmath>
#include <string>

LevelGenerator::LevelGenerator(uint32_t M, uint64_t seed)
    : rng_(seed), uniform_(0.0, 1.0)
{
    if (M < 2)
    {
        throw InvalidArgument("M must be >= 2, got " + std::to_string(M));
    }
    this->mL_ = 1 / std::log(static_cast<double>(M));
}

uint32_t LevelGenerator::draw()
{
    // uniform_ yields [0, 1); 1 - r lies in (0, 1] so the log is finite
    double r = 1.0 - this->uniform_(this->rng_);
    double level = std::floor(-std::log(r) * this->mL_);
    return static_cast<uint32_t>(std::min(level, static_cast<double>(HNSW_MAX_LEVEL)));
}
