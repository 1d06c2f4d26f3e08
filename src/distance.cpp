#include "healthopt/distance.hpp"

#include <cmath>

#include "healthopt/errors.hpp"

namespace healthopt {

double squared_distance(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError("squared_distance", a.size(), b.size());
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

double euclidean_distance(const std::vector<double>& a, const std::vector<double>& b) {
    return std::sqrt(squared_distance(a, b));
}

}  // namespace healthopt
