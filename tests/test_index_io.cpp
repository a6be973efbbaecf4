#include <gtest/gtest.h>
#include <fstream>
#include "test_helpers.h"
#include "vectorwise/errors.h"
#include "vectorwise/search_engine.h"

class IndexIOTest : public ::testing::Test
{
protected:
    static constexpr uint32_t DIM = 12;
    std::vector<std::vector<float>> vectors_ = randomUnitVectors(250, DIM, 21);
    std::shared_ptr<const HnswIndex> index_ = buildIndex(vectors_, smallParams(DIM));
};

TEST_F(IndexIOTest, BlobPreservesGraphAndResults)
{
    auto loaded = indexFromBlob(this->index_->toBlob(), DIM);
    ASSERT_EQ(loaded->count(), this->index_->count());
    EXPECT_EQ(loaded->getNumLayers(), this->index_->getNumLayers());
    EXPECT_EQ(loaded->params().M, this->index_->params().M);
    EXPECT_EQ(loaded->graph().getEntrypointID(), this->index_->graph().getEntrypointID());

    SearchEngine before(this->index_), after(loaded);
    auto queries = randomUnitVectors(20, DIM, 22);
    for (const auto &query : queries)
        EXPECT_EQ(before.search(query, 5, 32), after.search(query, 5, 32));
}

TEST_F(IndexIOTest, FileRoundTrip)
{
    TempDir dir;
    std::string file = dir.file("test.index");
    this->index_->save(file);
    auto loaded = loadIndex(file);
    EXPECT_EQ(loaded->count(), 250u);
    EXPECT_EQ(loaded->dim(), DIM);
    EXPECT_THROW(loadIndex(dir.file("missing.index")), std::runtime_error);
}

TEST_F(IndexIOTest, EmptyIndexLoads)
{
    IndexBuilder builder(smallParams(DIM));
    auto loaded = indexFromBlob(builder.finish()->toBlob());
    EXPECT_EQ(loaded->count(), 0u);
    EXPECT_TRUE(loaded->graph().isEmpty());
}

TEST_F(IndexIOTest, DimensionMismatchOnLoad)
{
    std::string blob = this->index_->toBlob();
    EXPECT_THROW(indexFromBlob(blob, DIM + 1), DimensionMismatch);
    EXPECT_NO_THROW(indexFromBlob(blob, 0));
}

TEST_F(IndexIOTest, TruncatedBlobIsCorrupt)
{
    std::string blob = this->index_->toBlob();
    EXPECT_THROW(indexFromBlob(blob.substr(0, blob.size() / 2)), CorruptArtifact);
    EXPECT_THROW(indexFromBlob(blob.substr(0, 4)), CorruptArtifact);
    EXPECT_THROW(indexFromBlob(""), CorruptArtifact);
}

TEST_F(IndexIOTest, BadMagicIsCorrupt)
{
    std::string blob = this->index_->toBlob();
    // the blob opens with the length-prefixed magic tag
    blob[sizeof(uint64_t)] ^= 0x5A;
    EXPECT_THROW(indexFromBlob(blob), CorruptArtifact);
}

TEST_F(IndexIOTest, OutOfRangeEntrypointIsCorrupt)
{
    std::string blob = this->index_->toBlob();
    // the graph is written last: the final fields are entrypointID (4 bytes) and topLayer (4 bytes).
    // Point the entrypoint past the end of the store
    size_t entrypointOffset = blob.size() - 2 * sizeof(uint32_t);
    uint32_t bogus = 0xFFFFFFF0u;
    blob.replace(entrypointOffset, sizeof(uint32_t), reinterpret_cast<const char *>(&bogus), sizeof(uint32_t));
    EXPECT_THROW(indexFromBlob(blob), CorruptArtifact);
}
