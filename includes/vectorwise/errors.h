#pragma once
#include <stdexcept>
#include <string>
#include <stdint.h>

// Base class of every error raised by the index
class VectorWiseError : public std::runtime_error
{
public:
  explicit VectorWiseError(const std::string &what) : std::runtime_error(what) {}
};

// vector length differs from the dimension the store/index was configured with
class DimensionMismatch : public VectorWiseError
{
public:
  DimensionMismatch(uint64_t expected, uint64_t actual)
      : VectorWiseError("dimension mismatch: expected " + std::to_string(expected) + ", got " + std::to_string(actual)),
        expected_(expected), actual_(actual) {}
  uint64_t expected() const { return this->expected_; }
  uint64_t actual() const { return this->actual_; }

private:
  uint64_t expected_;
  uint64_t actual_;
};

// bad k, bad build/search parameters
class InvalidArgument : public VectorWiseError
{
public:
  explicit InvalidArgument(const std::string &what) : VectorWiseError("invalid argument: " + what) {}
};

// id lookup past the end of the store
class NotFound : public VectorWiseError
{
public:
  explicit NotFound(uint64_t id)
      : VectorWiseError("id " + std::to_string(id) + " not found"), id_(id) {}
  uint64_t id() const { return this->id_; }

private:
  uint64_t id_;
};

// no index loaded (or load still in progress)
class IndexUnavailable : public VectorWiseError
{
public:
  explicit IndexUnavailable(const std::string &what = "index not loaded") : VectorWiseError(what) {}
};

// persisted index failed decoding or structural validation
class CorruptArtifact : public VectorWiseError
{
public:
  explicit CorruptArtifact(const std::string &what) : VectorWiseError("corrupt index artifact: " + what) {}
};
