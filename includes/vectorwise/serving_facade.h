#pragma once
#include "common.h"
#include "hnsw_index.h"
#include "search_engine.h"
#include <memory>
#include <string>
#include <vector>
#include <stdint.h>

// Outcome of a request at the service boundary
enum class StatusCode : int
{
  Ok = 200,
  BadRequest = 400,
  InternalError = 500,
  ServiceUnavailable = 503
};

const char *statusName(StatusCode code);

struct SearchRequest
{
  std::vector<float> query_vector;
  int k = 10;
};

struct SearchResponse
{
  StatusCode status = StatusCode::Ok;
  // ranked nodeIDs, ascending by distance
  std::vector<int64_t> indices;
  std::vector<float> distances;
  // error message when status != Ok
  std::string detail;

  bool ok() const { return this->status == StatusCode::Ok; }
};

struct HealthReport
{
  std::string service;
  bool healthy = false;
  uint64_t vectors_indexed = 0;
};

struct ServiceStatus
{
  bool loaded = false;
  uint64_t total_vectors = 0;
  uint32_t dimension = 0;
  std::string index_type;
  uint32_t M = 0;
  uint32_t efConstruction = 0;
  uint32_t efSearch = 0;
  uint32_t max_k = 0;
  uint32_t num_layers = 0;
};

// Query-time parameters of the service
struct ServeParameters
{
  // candidate list width at layer 0
  uint32_t efSearch = 64;
  // largest k a request may ask for
  uint32_t maxK = 100;

  // throws InvalidArgument on malformed values
  void validate() const;
};

// Request/response boundary in front of SearchEngine. Validates and normalizes
// queries, and maps failures to status codes. The served index can be replaced
// while requests are in flight: each request works on the snapshot it started with
class ServingFacade
{
private:
  // fixed dimension D every request and every loaded index must match
  uint32_t dim_;
  ServeParameters params_;
  bool verbose_;
  // current engine, swapped atomically. nullptr until an index is installed
  std::shared_ptr<const SearchEngine> engine_;

public:
  // Constructor
  ServingFacade(uint32_t dim, const ServeParameters &params = ServeParameters(), bool verbose = false);
  // load an index file and start serving it. On any failure the previously served
  // index stays in place and the error is rethrown
  void loadIndex(const std::string &filename);
  // serve an already built index. Throws DimensionMismatch for a wrong dimension
  void installIndex(std::shared_ptr<const HnswIndex> index);
  // engine currently served, nullptr if none
  std::shared_ptr<const SearchEngine> snapshot() const;
  bool isLoaded() const { return this->snapshot() != nullptr; }
  uint32_t dim() const { return this->dim_; }
  const ServeParameters &params() const { return this->params_; }

  // answer one request. Never throws
  SearchResponse search(const SearchRequest &request) const;
  HealthReport health() const;
  ServiceStatus status() const;
};
