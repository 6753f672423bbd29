#pragma once

#include <vector>

namespace wirescan::detection::core {

double mean(const std::vector<double>& v);

//! Largest absolute distance of any value from a reference. 0 for an empty list.
double maxAbsDeviation(const std::vector<double>& v, double reference);

//! Differences between consecutive values (size n - 1).
std::vector<double> adjacentGaps(const std::vector<double>& sorted);

} // namespace wirescan::detection::core
