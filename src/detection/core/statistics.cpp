#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace wirescan::detection::core {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	};
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double maxAbsDeviation(const std::vector<double>& v, const double reference) {
	double worst = 0.0;
	for (double x: v) {
		worst = std::max(worst, std::abs(x - reference));
	}
	return worst;
}

std::vector<double> adjacentGaps(const std::vector<double>& sorted) {
	if (sorted.size() < 2u) {
		return {};
	}

	std::vector<double> gaps;
	gaps.reserve(sorted.size() - 1);
	for (std::size_t i = 1; i < sorted.size(); ++i)
		gaps.push_back(sorted[i] - sorted[i - 1]);

	return gaps;
}

} // namespace wirescan::detection::core
