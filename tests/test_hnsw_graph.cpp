#include <gtest/gtest.h>
#include "vectorwise/errors.h"
#include "vectorwise/hnsw_graph.h"
#include "vectorwise/level_generator.h"

TEST(HNSWGraphTest, EmptyGraph)
{
    HNSWGraph graph(4);
    EXPECT_TRUE(graph.isEmpty());
    EXPECT_EQ(graph.getNumLayers(), 0u);
    EXPECT_THROW(graph.getEntrypointID(), IndexUnavailable);
    EXPECT_NO_THROW(graph.validate(0));
}

TEST(HNSWGraphTest, CapsAreMAndTwoM)
{
    HNSWGraph graph(5);
    EXPECT_EQ(graph.maxNeighbors(0), 10u);
    EXPECT_EQ(graph.maxNeighbors(1), 5u);
    EXPECT_EQ(graph.maxNeighbors(7), 5u);
    EXPECT_THROW(HNSWGraph(1), InvalidArgument);
}

TEST(HNSWGraphTest, NodesAndLayers)
{
    HNSWGraph graph(4);
    nodeID_t a = graph.addNode(2);
    nodeID_t b = graph.addNode(0);
    graph.setEntrypoint(a);
    EXPECT_EQ(graph.getTopLayer(), 2u);
    EXPECT_EQ(graph.getNumLayers(), 3u);
    EXPECT_TRUE(graph.containsNode(a, 2));
    EXPECT_FALSE(graph.containsNode(b, 1));
    EXPECT_EQ(graph.getNumNodesInLayer(0), 2u);
    EXPECT_EQ(graph.getNumNodesInLayer(1), 1u);
    EXPECT_THROW(graph.getNodeLevel(5), NotFound);
}

TEST(HNSWGraphTest, ConnectionRequiresBothEndsAtLayer)
{
    HNSWGraph graph(4);
    nodeID_t a = graph.addNode(1);
    nodeID_t b = graph.addNode(0);
    graph.setEntrypoint(a);
    graph.addConnection(a, b, 0);
    EXPECT_EQ(graph.getNeighborsId(a, 0), std::vector<nodeID_t>{b});
    EXPECT_THROW(graph.addConnection(a, b, 1), NotFound);
    EXPECT_NO_THROW(graph.validate(2));
}

TEST(HNSWGraphTest, ValidateDetectsNodeCountMismatch)
{
    HNSWGraph graph(4);
    graph.setEntrypoint(graph.addNode(0));
    EXPECT_THROW(graph.validate(3), CorruptArtifact);
}

TEST(LevelGeneratorTest, SeededAndGeometric)
{
    LevelGenerator g1(16, 7), g2(16, 7);
    size_t atZero = 0;
    const size_t n = 20000;
    for (size_t i = 0; i < n; i++)
    {
        uint32_t level = g1.draw();
        EXPECT_EQ(level, g2.draw());
        EXPECT_LE(level, static_cast<uint32_t>(HNSW_MAX_LEVEL));
        if (level == 0)
            atZero++;
    }
    // P(level == 0) = 1 - 1/M
    EXPECT_NEAR(static_cast<double>(atZero) / n, 1.0 - 1.0 / 16, 0.01);
    EXPECT_THROW(LevelGenerator(1, 0), InvalidArgument);
}
