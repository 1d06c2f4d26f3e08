#pragma once

#include <stdexcept>
#include <string>

namespace healthopt {

// Base class for failures raised by the scaler, the regressor and the optimizer.
class ModelError : public std::runtime_error {
public:
    explicit ModelError(const std::string& what) : std::runtime_error(what) {}
};

// Operation needs a prior successful fit.
class UnfittedModelError : public ModelError {
public:
    explicit UnfittedModelError(const std::string& what) : ModelError(what) {}
};

class DimensionMismatchError : public ModelError {
public:
    explicit DimensionMismatchError(const std::string& what) : ModelError(what) {}

    DimensionMismatchError(const std::string& where, size_t expected, size_t got)
        : ModelError(where + ": dimension mismatch (expected " + std::to_string(expected) + ", got " +
                     std::to_string(got) + ")") {}
};

class MissingScoreError : public ModelError {
public:
    explicit MissingScoreError(const std::string& what) : ModelError(what) {}
};

class EmptyTrainingSetError : public ModelError {
public:
    explicit EmptyTrainingSetError(const std::string& what) : ModelError(what) {}
};

}  // namespace healthopt
