#include <gtest/gtest.h>
#include "test_helpers.h"
#include "vectorwise/errors.h"
#include "vectorwise/index_builder.h"

TEST(BuildParametersTest, Validate)
{
    BuildParameters params = smallParams(8);
    EXPECT_NO_THROW(params.validate());
    params.dim = 0;
    EXPECT_THROW(params.validate(), InvalidArgument);
    params = smallParams(8, 1);
    EXPECT_THROW(params.validate(), InvalidArgument);
    params = smallParams(8, 4, 0);
    EXPECT_THROW(IndexBuilder{params}, InvalidArgument);
}

TEST(IndexBuilderTest, FirstNodeBecomesEntrypoint)
{
    IndexBuilder builder(smallParams(4));
    EXPECT_EQ(builder.add({1.0f, 0.0f, 0.0f, 0.0f}), 0u);
    const HNSWGraph &graph = builder.index().graph();
    EXPECT_EQ(graph.getEntrypointID(), 0u);
    EXPECT_EQ(graph.getTopLayer(), graph.getNodeLevel(0));
}

TEST(IndexBuilderTest, WrongDimensionLeavesIndexUnchanged)
{
    IndexBuilder builder(smallParams(4));
    builder.add({1.0f, 0.0f, 0.0f, 0.0f});
    EXPECT_THROW(builder.add({1.0f, 0.0f}), DimensionMismatch);
    EXPECT_EQ(builder.count(), 1u);
    EXPECT_EQ(builder.index().graph().getNumNodes(), 1u);

    // a batch with one bad row is rejected as a whole
    std::vector<std::vector<float>> batch{{0.0f, 1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
    EXPECT_THROW(builder.addBatch(batch), DimensionMismatch);
    EXPECT_EQ(builder.count(), 1u);
}

TEST(IndexBuilderTest, GraphInvariantsHold)
{
    const uint32_t dim = 16, M = 6;
    auto vectors = randomUnitVectors(600, dim, 1);
    auto index = buildIndex(vectors, smallParams(dim, M, 40));
    const HNSWGraph &graph = index->graph();

    ASSERT_EQ(index->count(), 600u);
    ASSERT_EQ(graph.getNumNodes(), 600u);
    EXPECT_GT(graph.getNumLayers(), 1u);
    EXPECT_EQ(graph.getNodeLevel(graph.getEntrypointID()), graph.getTopLayer());

    for (nodeID_t id = 0; id < graph.getNumNodes(); id++)
    {
        uint32_t level = graph.getNodeLevel(id);
        EXPECT_LE(level, graph.getTopLayer());
        for (uint32_t l = 0; l <= level; l++)
        {
            const auto &neighbors = graph.getNeighborsId(id, l);
            // neighbor caps
            EXPECT_LE(neighbors.size(), graph.maxNeighbors(l));
            for (nodeID_t nb : neighbors)
            {
                EXPECT_NE(nb, id);
                // layer containment
                EXPECT_TRUE(graph.containsNode(nb, l));
            }
        }
        // every node is linked at layer 0
        EXPECT_GT(graph.getNeighborhoodSize(id, 0), 0u);
    }
    EXPECT_NO_THROW(index->validate());
}

TEST(IndexBuilderTest, NewestDuplicateKeepsAnInEdge)
{
    std::vector<std::vector<float>> vectors(60, randomUnitVectors(1, 8, 17)[0]);
    auto index = buildIndex(vectors, smallParams(8, 4, 64));
    const HNSWGraph &graph = index->graph();
    const nodeID_t newest = 59;
    size_t inEdges = 0;
    for (nodeID_t id = 0; id < graph.getNumNodes(); id++)
    {
        for (nodeID_t nb : graph.getNeighborsId(id, 0))
        {
            if (nb == newest)
                inEdges++;
        }
    }
    EXPECT_GT(inEdges, 0u);
    EXPECT_NO_THROW(index->validate());
}

TEST(IndexBuilderTest, SameSeedSameGraph)
{
    const uint32_t dim = 8;
    auto vectors = randomUnitVectors(200, dim, 3);
    auto a = buildIndex(vectors, smallParams(dim, 4, 32, 99));
    auto b = buildIndex(vectors, smallParams(dim, 4, 32, 99));
    ASSERT_EQ(a->graph().getEntrypointID(), b->graph().getEntrypointID());
    for (nodeID_t id = 0; id < a->count(); id++)
    {
        ASSERT_EQ(a->graph().getNodeLevel(id), b->graph().getNodeLevel(id));
        EXPECT_EQ(a->graph().getNeighborsId(id, 0), b->graph().getNeighborsId(id, 0));
    }
}

TEST(IndexBuilderTest, FinishHandsOutIndexOnce)
{
    IndexBuilder builder(smallParams(2));
    builder.add({1.0f, 0.0f});
    auto index = builder.finish();
    EXPECT_EQ(index->count(), 1u);
    EXPECT_THROW(builder.add({0.0f, 1.0f}), std::logic_error);
    EXPECT_THROW(builder.finish(), std::logic_error);
}
