#pragma once

#include <vector>

namespace healthopt {

// Throws DimensionMismatchError when a.size() != b.size().
double euclidean_distance(const std::vector<double>& a, const std::vector<double>& b);
double squared_distance(const std::vector<double>& a, const std::vector<double>& b);

}  // namespace healthopt
