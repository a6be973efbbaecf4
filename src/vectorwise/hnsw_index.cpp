#include "vectorwise/hnsw_index.h"
#include "vectorwise/errors.h"
#include <fstream>
#include <iostream>
#include <new>
#include <sstream>
#include <stdexcept>
#include <cereal/archives/binary.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

static const char *INDEX_MAGIC = "VWHNSW";
static const uint32_t INDEX_FORMAT_VERSION = 1;

void BuildParameters::validate() const
{
    if (this->dim == 0)
        throw InvalidArgument("dim must be > 0");
    if (this->M < 2)
        throw InvalidArgument("M must be >= 2, got " + std::to_string(this->M));
    if (this->efConstruction == 0)
        throw InvalidArgument("efConstruction must be > 0");
}

HnswIndex::HnswIndex(const BuildParameters &params)
    : params_(params), store_(params.dim), graph_(params.M)
{
    this->params_.validate();
}

template <class Archive>
void HnswIndex::save(Archive &ar) const
{
    ar(std::string(INDEX_MAGIC), INDEX_FORMAT_VERSION, params_, store_, graph_);
}

template <class Archive>
void HnswIndex::load(Archive &ar)
{
    std::string magic;
    uint32_t version = 0;
    ar(magic);
    if (magic != INDEX_MAGIC)
    {
        throw CorruptArtifact("bad magic tag");
    }
    ar(version);
    if (version != INDEX_FORMAT_VERSION)
    {
        throw CorruptArtifact("unsupported format version " + std::to_string(version));
    }
    ar(params_, store_, graph_);
}

void HnswIndex::validate() const
{
    try
    {
        this->params_.validate();
    }
    catch (const InvalidArgument &e)
    {
        throw CorruptArtifact(std::string("stored build parameters: ") + e.what());
    }
    if (this->store_.dim() != this->params_.dim)
    {
        throw CorruptArtifact("store dimension " + std::to_string(this->store_.dim()) +
                              " differs from build dimension " + std::to_string(this->params_.dim));
    }
    if (this->store_.rawData().size() % this->store_.dim() != 0)
    {
        throw CorruptArtifact("vector data is not a multiple of the dimension");
    }
    if (this->graph_.getM() != this->params_.M)
    {
        throw CorruptArtifact("graph M differs from build M");
    }
    this->graph_.validate(this->store_.count());
}

void HnswIndex::summarize() const
{
    std::cout << "================HNSW=====================" << std::endl;
    std::cout << "Database size: " << this->count() << std::endl;
    std::cout << "Dimension: " << this->dim() << std::endl;
    std::cout << "M: " << this->params_.M << ", efConstruction: " << this->params_.efConstruction << std::endl;
    this->graph_.summarize();
}

std::string HnswIndex::toBlob() const
{
    std::ostringstream oss(std::ios::binary);
    {
        cereal::BinaryOutputArchive archive(oss);
        archive(*this);
    }
    return oss.str();
}

void HnswIndex::save(const std::string &filename) const
{
    std::ofstream ofs(filename, std::ios::binary);
    if (!ofs.is_open())
    {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    {
        cereal::BinaryOutputArchive archive(ofs);
        archive(*this);
    }
    if (!ofs)
    {
        throw std::runtime_error("Failed writing index to: " + filename);
    }
}

static std::shared_ptr<const HnswIndex> readIndex(std::istream &is, uint32_t expectedDim)
{
    auto index = std::make_shared<HnswIndex>();
    try
    {
        cereal::BinaryInputArchive archive(is);
        archive(*index);
    }
    catch (const cereal::Exception &e)
    {
        throw CorruptArtifact(e.what());
    }
    catch (const std::bad_alloc &)
    {
        throw CorruptArtifact("encoded sizes are out of range");
    }
    catch (const std::length_error &e)
    {
        throw CorruptArtifact(e.what());
    }
    index->validate();
    if (expectedDim != 0 && index->dim() != expectedDim)
    {
        throw DimensionMismatch(expectedDim, index->dim());
    }
    return index;
}

std::shared_ptr<const HnswIndex> indexFromBlob(const std::string &blob, uint32_t expectedDim)
{
    std::istringstream iss(blob, std::ios::binary);
    return readIndex(iss, expectedDim);
}

std::shared_ptr<const HnswIndex> loadIndex(const std::string &filename, uint32_t expectedDim)
{
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open())
    {
        throw std::runtime_error("Cannot open file for reading: " + filename);
    }
    return readIndex(ifs, expectedDim);
}
