#pragma once
#include <stdint.h>
#include <random>

// highest layer a node may be assigned to
#define HNSW_MAX_LEVEL 32

// Draws the top layer of each inserted node: floor(-ln(U(0,1)) * mL) with mL = 1/ln(M).
// Seeded so that a build is reproducible
class LevelGenerator
{
private:
  // exponential scaling parameter for layer distribution
  double mL_;
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> uniform_;

public:
  LevelGenerator(uint32_t M, uint64_t seed);
  // draw the level for the next node
  uint32_t draw();
  double getLevelMult() const { return this->mL_; }
};
