#include "vectorwise/serving_facade.h"
#include "vectorwise/distance.h"
#include "vectorwise/errors.h"
#include <exception>
#include <iostream>
#include <string>

static const char *SERVICE_NAME = "vectorwise";
static const char *INDEX_TYPE = "HNSW";

const char *statusName(StatusCode code)
{
    switch (code)
    {
    case StatusCode::Ok:
        return "OK";
    case StatusCode::BadRequest:
        return "Bad Request";
    case StatusCode::InternalError:
        return "Internal Server Error";
    case StatusCode::ServiceUnavailable:
        return "Service Unavailable";
    }
    return "Unknown";
}

void ServeParameters::validate() const
{
    if (this->efSearch == 0)
        throw InvalidArgument("efSearch must be > 0");
    if (this->maxK == 0)
        throw InvalidArgument("maxK must be > 0");
}

ServingFacade::ServingFacade(uint32_t dim, const ServeParameters &params, bool verbose)
    : dim_(dim), params_(params), verbose_(verbose)
{
    if (dim == 0)
        throw InvalidArgument("dim must be > 0");
    this->params_.validate();
}

void ServingFacade::loadIndex(const std::string &filename)
{
    if (this->verbose_)
        std::cout << "[SERVE] Loading index from " << filename << std::endl;
    // loadIndex checks the dimension, nothing is swapped before it succeeds
    this->installIndex(::loadIndex(filename, this->dim_));
}

void ServingFacade::installIndex(std::shared_ptr<const HnswIndex> index)
{
    if (!index)
        throw IndexUnavailable("cannot serve a null index");
    if (index->dim() != this->dim_)
        throw DimensionMismatch(this->dim_, index->dim());
    std::shared_ptr<const SearchEngine> engine = std::make_shared<SearchEngine>(std::move(index));
    std::atomic_store(&this->engine_, engine);
    if (this->verbose_)
    {
        std::cout << "[SERVE] Serving " << engine->index().count() << " vectors, "
                  << engine->index().getNumLayers() << " layers" << std::endl;
    }
}

std::shared_ptr<const SearchEngine> ServingFacade::snapshot() const
{
    return std::atomic_load(&this->engine_);
}

SearchResponse ServingFacade::search(const SearchRequest &request) const
{
    SearchResponse response;
    try
    {
        if (request.k < 1 || static_cast<uint32_t>(request.k) > this->params_.maxK)
        {
            throw InvalidArgument("k must be in [1, " + std::to_string(this->params_.maxK) +
                                  "], got " + std::to_string(request.k));
        }
        if (request.query_vector.size() != this->dim_)
        {
            throw DimensionMismatch(this->dim_, request.query_vector.size());
        }
        auto engine = this->snapshot();
        if (!engine)
        {
            throw IndexUnavailable();
        }
        // build-time vectors are unit length
        std::vector<float> query = request.query_vector;
        normalizeL2(query);
        auto results = engine->search(query, request.k, static_cast<int>(this->params_.efSearch));
        response.indices.reserve(results.size());
        response.distances.reserve(results.size());
        for (const auto &result : results)
        {
            response.distances.push_back(result.first);
            response.indices.push_back(static_cast<int64_t>(result.second));
        }
    }
    catch (const DimensionMismatch &e)
    {
        response.status = StatusCode::BadRequest;
        response.detail = e.what();
    }
    catch (const InvalidArgument &e)
    {
        response.status = StatusCode::BadRequest;
        response.detail = e.what();
    }
    catch (const IndexUnavailable &e)
    {
        response.status = StatusCode::ServiceUnavailable;
        response.detail = e.what();
    }
    catch (const std::exception &e)
    {
        response.status = StatusCode::InternalError;
        response.detail = e.what();
    }
    if (!response.ok())
    {
        response.indices.clear();
        response.distances.clear();
        if (this->verbose_)
            std::cerr << "[SERVE] " << static_cast<int>(response.status) << " " << response.detail << std::endl;
    }
    return response;
}

HealthReport ServingFacade::health() const
{
    HealthReport report;
    report.service = SERVICE_NAME;
    auto engine = this->snapshot();
    report.healthy = engine != nullptr;
    report.vectors_indexed = engine ? engine->index().count() : 0;
    return report;
}

ServiceStatus ServingFacade::status() const
{
    ServiceStatus status;
    status.dimension = this->dim_;
    status.index_type = INDEX_TYPE;
    status.efSearch = this->params_.efSearch;
    status.max_k = this->params_.maxK;
    auto engine = this->snapshot();
    if (engine)
    {
        const HnswIndex &index = engine->index();
        status.loaded = true;
        status.total_vectors = index.count();
        status.M = index.params().M;
        status.efConstruction = index.params().efConstruction;
        status.num_layers = index.getNumLayers();
    }
    return status;
}
