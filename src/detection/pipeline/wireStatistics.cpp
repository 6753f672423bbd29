#include "detection/wireStatistics.hpp"

#include <algorithm>
#include <iomanip>
#include <string>

namespace wirescan::detection {

using namespace core;

WireStatistics computeStatistics(const std::array<std::vector<LineSegment>, LINE_TYPE_COUNT>& buckets, const std::vector<WirePath>& paths,
                                 const std::vector<cv::Point2d>& junctions) {
	WireStatistics stats{};
	stats.pageCount = 1u;

	for (std::size_t t = 0; t < LINE_TYPE_COUNT; ++t) {
		stats.lineTypeCounts[t] = buckets[t].size();
		stats.totalSegments += buckets[t].size();
	}

	const auto& wires = buckets[static_cast<std::size_t>(LineType::Wire)];
	stats.wireCount   = wires.size();
	for (const auto& wire: wires) {
		stats.colorCounts[static_cast<std::size_t>(wire.color)]++;
		stats.voltageCounts[std::string(voltageType(wire))]++;

		const double len    = length(wire);
		stats.minWireLength = (&wire == &wires.front()) ? len : std::min(stats.minWireLength, len);
		stats.maxWireLength = std::max(stats.maxWireLength, len);
		stats.wireLengthSum += len;

		if (isHorizontal(wire)) {
			stats.horizontalCount++;
		} else if (isVertical(wire)) {
			stats.verticalCount++;
		}
	}

	stats.pathCount     = paths.size();
	stats.junctionCount = junctions.size();
	return stats;
}

void merge(WireStatistics& into, const WireStatistics& other) {
	// Min/max only carry meaning where wires were seen.
	if (other.wireCount > 0u) {
		if (into.wireCount == 0u) {
			into.minWireLength = other.minWireLength;
			into.maxWireLength = other.maxWireLength;
		} else {
			into.minWireLength = std::min(into.minWireLength, other.minWireLength);
			into.maxWireLength = std::max(into.maxWireLength, other.maxWireLength);
		}
	}

	into.pageCount += other.pageCount;
	into.totalSegments += other.totalSegments;
	for (std::size_t t = 0; t < LINE_TYPE_COUNT; ++t) {
		into.lineTypeCounts[t] += other.lineTypeCounts[t];
	}
	for (std::size_t c = 0; c < WIRE_COLOR_COUNT; ++c) {
		into.colorCounts[c] += other.colorCounts[c];
	}
	for (const auto& [label, count]: other.voltageCounts) {
		into.voltageCounts[label] += count;
	}
	into.wireCount += other.wireCount;
	into.wireLengthSum += other.wireLengthSum;
	into.horizontalCount += other.horizontalCount;
	into.verticalCount += other.verticalCount;
	into.pathCount += other.pathCount;
	into.junctionCount += other.junctionCount;
}

double averageWireLength(const WireStatistics& statistics) {
	if (statistics.wireCount == 0u) {
		return 0.0;
	}
	return statistics.wireLengthSum / static_cast<double>(statistics.wireCount);
}

std::size_t countOf(const WireStatistics& statistics, const LineType type) {
	return statistics.lineTypeCounts[static_cast<std::size_t>(type)];
}

std::size_t countOf(const WireStatistics& statistics, const WireColor color) {
	return statistics.colorCounts[static_cast<std::size_t>(color)];
}

void printStatistics(std::ostream& os, const WireStatistics& statistics) {
	os << "Pages:     " << statistics.pageCount << "\n";
	os << "Segments:  " << statistics.totalSegments << "\n";
	for (std::size_t t = 0; t < LINE_TYPE_COUNT; ++t) {
		os << "  " << std::left << std::setw(18) << toString(static_cast<LineType>(t)) << statistics.lineTypeCounts[t] << "\n";
	}

	os << "Wires:     " << statistics.wireCount << " (horizontal " << statistics.horizontalCount << ", vertical " << statistics.verticalCount
	   << ")\n";
	os << "Length:    avg " << std::fixed << std::setprecision(1) << averageWireLength(statistics) << ", min " << statistics.minWireLength
	   << ", max " << statistics.maxWireLength << "\n";
	os.unsetf(std::ios_base::floatfield);
	os << std::setprecision(6);

	os << "Colors:\n";
	for (std::size_t c = 0; c < WIRE_COLOR_COUNT; ++c) {
		if (statistics.colorCounts[c] == 0u) {
			continue;
		}
		os << "  " << std::left << std::setw(18) << toString(static_cast<WireColor>(c)) << statistics.colorCounts[c] << "\n";
	}
	os << "Voltages:\n";
	for (const auto& [label, count]: statistics.voltageCounts) {
		os << "  " << std::left << std::setw(18) << label << count << "\n";
	}
	os << "Paths:     " << statistics.pathCount << "\n";
	os << "Junctions: " << statistics.junctionCount << std::endl;
}

} // namespace wirescan::detection
