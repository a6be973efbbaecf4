#include <gtest/gtest.h>
#include "vectorwise/errors.h"
#include "vectorwise/vector_store.h"

TEST(VectorStoreTest, ZeroDimensionRejected)
{
    EXPECT_THROW(VectorStore(0), InvalidArgument);
}

TEST(VectorStoreTest, AddAssignsDenseIds)
{
    VectorStore store(3);
    EXPECT_EQ(store.count(), 0u);
    EXPECT_EQ(store.add({1.0f, 2.0f, 3.0f}), 0u);
    EXPECT_EQ(store.add({4.0f, 5.0f, 6.0f}), 1u);
    EXPECT_EQ(store.count(), 2u);
    EXPECT_EQ(store.getVector(1), (std::vector<float>{4.0f, 5.0f, 6.0f}));
    EXPECT_FLOAT_EQ(store.get(0)[2], 3.0f);
}

TEST(VectorStoreTest, WrongDimensionLeavesStoreUnchanged)
{
    VectorStore store(3);
    store.add({1.0f, 2.0f, 3.0f});
    try
    {
        store.add({1.0f, 2.0f});
        FAIL() << "expected DimensionMismatch";
    }
    catch (const DimensionMismatch &e)
    {
        EXPECT_EQ(e.expected(), 3u);
        EXPECT_EQ(e.actual(), 2u);
    }
    EXPECT_EQ(store.count(), 1u);
}

TEST(VectorStoreTest, GetPastEndThrowsNotFound)
{
    VectorStore store(2);
    store.add({0.0f, 0.0f});
    EXPECT_THROW(store.get(1), NotFound);
    EXPECT_THROW(store.getVector(7), NotFound);
}

TEST(VectorStoreTest, Distances)
{
    VectorStore store(2);
    store.add({0.0f, 0.0f});
    store.add({3.0f, 4.0f});
    float query[2] = {0.0f, 1.0f};
    EXPECT_FLOAT_EQ(store.distanceBetween(0, 1), 25.0f);
    EXPECT_FLOAT_EQ(store.distanceToId(query, 0), 1.0f);
    EXPECT_FLOAT_EQ(store.distanceToId(query, 1), 18.0f);
}
