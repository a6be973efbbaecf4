#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "test_helpers.h"
#include "vectorwise/errors.h"
#include "vectorwise/serving_facade.h"

class ServingFacadeTest : public ::testing::Test
{
protected:
    static constexpr uint32_t DIM = 8;
    std::vector<std::vector<float>> vectors_ = randomUnitVectors(120, DIM, 31);
    std::shared_ptr<const HnswIndex> index_ = buildIndex(vectors_, smallParams(DIM));
};

TEST_F(ServingFacadeTest, NotLoadedIsServiceUnavailable)
{
    ServingFacade facade(DIM);
    EXPECT_FALSE(facade.isLoaded());
    SearchResponse response = facade.search({this->vectors_[0], 5});
    EXPECT_EQ(response.status, StatusCode::ServiceUnavailable);
    EXPECT_TRUE(response.indices.empty());

    HealthReport health = facade.health();
    EXPECT_FALSE(health.healthy);
    EXPECT_EQ(health.vectors_indexed, 0u);
    EXPECT_FALSE(facade.status().loaded);
}

TEST_F(ServingFacadeTest, BadRequests)
{
    ServeParameters params;
    params.maxK = 20;
    ServingFacade facade(DIM, params);
    facade.installIndex(this->index_);

    EXPECT_EQ(facade.search({std::vector<float>(DIM + 1, 0.5f), 5}).status, StatusCode::BadRequest);
    EXPECT_EQ(facade.search({this->vectors_[0], 0}).status, StatusCode::BadRequest);
    EXPECT_EQ(facade.search({this->vectors_[0], 21}).status, StatusCode::BadRequest);
    SearchResponse response = facade.search({this->vectors_[0], 20});
    EXPECT_TRUE(response.ok());
    EXPECT_EQ(response.indices.size(), 20u);
}

TEST_F(ServingFacadeTest, QueryIsNormalized)
{
    ServingFacade facade(DIM);
    facade.installIndex(this->index_);
    std::vector<float> scaled = this->vectors_[42];
    for (auto &x : scaled)
        x *= 7.5f;
    SearchResponse response = facade.search({scaled, 3});
    ASSERT_TRUE(response.ok()) << response.detail;
    ASSERT_EQ(response.indices.size(), 3u);
    EXPECT_EQ(response.indices[0], 42);
    EXPECT_NEAR(response.distances[0], 0.0f, 1e-5f);
    EXPECT_EQ(response.indices.size(), response.distances.size());
}

TEST_F(ServingFacadeTest, HealthAndStatus)
{
    ServeParameters params;
    params.efSearch = 50;
    params.maxK = 30;
    ServingFacade facade(DIM, params);
    facade.installIndex(this->index_);

    HealthReport health = facade.health();
    EXPECT_TRUE(health.healthy);
    EXPECT_EQ(health.service, "vectorwise");
    EXPECT_EQ(health.vectors_indexed, 120u);

    ServiceStatus status = facade.status();
    EXPECT_TRUE(status.loaded);
    EXPECT_EQ(status.total_vectors, 120u);
    EXPECT_EQ(status.dimension, DIM);
    EXPECT_EQ(status.index_type, "HNSW");
    EXPECT_EQ(status.M, this->index_->params().M);
    EXPECT_EQ(status.efConstruction, this->index_->params().efConstruction);
    EXPECT_EQ(status.efSearch, 50u);
    EXPECT_EQ(status.max_k, 30u);
    EXPECT_EQ(status.num_layers, this->index_->getNumLayers());
}

TEST_F(ServingFacadeTest, FailedReloadKeepsServingIndex)
{
    TempDir dir;
    ServingFacade facade(DIM);
    facade.installIndex(this->index_);

    // wrong dimension
    auto other = buildIndex(randomUnitVectors(10, DIM * 2, 1), smallParams(DIM * 2));
    other->save(dir.file("other.index"));
    EXPECT_THROW(facade.loadIndex(dir.file("other.index")), DimensionMismatch);
    EXPECT_THROW(facade.installIndex(other), DimensionMismatch);

    // corrupt file
    {
        std::ofstream out(dir.file("corrupt.index"), std::ios::binary);
        out << "definitely not an index";
    }
    EXPECT_THROW(facade.loadIndex(dir.file("corrupt.index")), CorruptArtifact);

    EXPECT_EQ(facade.health().vectors_indexed, 120u);
    EXPECT_TRUE(facade.search({this->vectors_[0], 1}).ok());
}

TEST_F(ServingFacadeTest, ReloadWhileSearching)
{
    TempDir dir;
    auto bigger = buildIndex(randomUnitVectors(200, DIM, 32), smallParams(DIM));
    bigger->save(dir.file("bigger.index"));

    ServingFacade facade(DIM);
    facade.installIndex(this->index_);
    std::atomic<bool> stop{false};
    std::atomic<size_t> failures{0};
    std::thread reader([&]() {
        while (!stop.load())
        {
            SearchResponse response = facade.search({this->vectors_[3], 10});
            if (!response.ok() || response.indices.size() != 10)
                failures++;
        }
    });
    for (int i = 0; i < 5; i++)
    {
        facade.loadIndex(dir.file("bigger.index"));
        facade.installIndex(this->index_);
    }
    stop.store(true);
    reader.join();
    EXPECT_EQ(failures.load(), 0u);
}

TEST(ServeParametersTest, Validate)
{
    ServeParameters params;
    EXPECT_NO_THROW(params.validate());
    params.efSearch = 0;
    EXPECT_THROW(ServingFacade(4, params), InvalidArgument);
    EXPECT_THROW(ServingFacade(0), InvalidArgument);
    EXPECT_STREQ(statusName(StatusCode::ServiceUnavailable), "Service Unavailable");
}
