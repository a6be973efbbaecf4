#pragma once
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include <unistd.h>
#include "vectorwise/distance.h"
#include "vectorwise/index_builder.h"

// n unit-length gaussian vectors of dimension dim, reproducible from seed
inline std::vector<std::vector<float>> randomUnitVectors(size_t n, uint32_t dim, uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::normal_distribution<float> gaussian(0.0f, 1.0f);
    std::vector<std::vector<float>> vectors(n, std::vector<float>(dim));
    for (auto &vec : vectors)
    {
        for (auto &x : vec)
            x = gaussian(rng);
        normalizeL2(vec);
    }
    return vectors;
}

inline BuildParameters smallParams(uint32_t dim, uint32_t M = 8, uint32_t efc = 64, uint64_t seed = 42)
{
    BuildParameters params;
    params.dim = dim;
    params.M = M;
    params.efConstruction = efc;
    params.seed = seed;
    return params;
}

inline std::shared_ptr<const HnswIndex> buildIndex(const std::vector<std::vector<float>> &vectors, const BuildParameters &params)
{
    IndexBuilder builder(params);
    builder.addBatch(vectors);
    return builder.finish();
}

// temporary directory removed when the object goes out of scope
class TempDir
{
private:
  std::filesystem::path path_;

public:
  TempDir()
  {
      static int counter = 0;
      this->path_ = std::filesystem::temp_directory_path() /
                    ("vectorwise_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
      std::filesystem::create_directories(this->path_);
  }
  ~TempDir()
  {
      std::error_code ec;
      std::filesystem::remove_all(this->path_, ec);
  }
  std::string path() const { return this->path_.string(); }
  std::string file(const std::string &name) const { return (this->path_ / name).string(); }
};
