#include "detection/core/wirePathTracer.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <numeric>
#include <unordered_map>

namespace wirescan::detection::core {

namespace {

//! All segment endpoints that snap onto the same endpoint key.
struct EndpointGroup {
	cv::Point2d point;                 //!< First point seen for this key.
	std::vector<std::size_t> segments; //!< Incident segment indices (a closed segment appears twice).
};

//! Segment adjacency, built once per trace.
struct ConnectivityGraph {
	std::vector<EndpointGroup> endpoints;
	std::vector<std::vector<std::size_t>> neighbours; //!< Per segment, sorted and unique. Never contains the segment itself.
};

using EndpointIndex = std::unordered_map<EndpointKey, std::size_t, EndpointKeyHash>;

static std::vector<EndpointGroup> groupEndpoints(const std::vector<LineSegment>& segments) {
	std::vector<EndpointGroup> groups;
	EndpointIndex index;

	const auto addEndpoint = [&](const cv::Point2d& p, const std::size_t segmentIdx) {
		const auto [it, inserted] = index.try_emplace(endpointKey(p), groups.size());
		if (inserted) {
			groups.push_back(EndpointGroup{p, {}});
		}
		groups[it->second].segments.push_back(segmentIdx);
	};

	for (std::size_t i = 0; i < segments.size(); ++i) {
		addEndpoint(segments[i].start, i);
		addEndpoint(segments[i].end, i);
	}
	return groups;
}

//! Bucket of the coarse proximity grid (cell size = tolerance).
static EndpointKey proximityCell(const cv::Point2d& p, const double cellSize) {
	return {static_cast<std::int64_t>(std::floor(p.x / cellSize)), static_cast<std::int64_t>(std::floor(p.y / cellSize))};
}

/*! Build the segment connectivity graph.
 *  1) Segments sharing an endpoint key are connected.
 *  2) Segments at two different endpoint keys closer than the tolerance are connected.
 *     Candidate pairs come from the 3x3 neighbourhood in a grid of tolerance-sized cells.
 */
static ConnectivityGraph buildGraph(const std::vector<LineSegment>& segments, const double tolerance) {
	ConnectivityGraph graph{groupEndpoints(segments), std::vector<std::vector<std::size_t>>(segments.size())};

	const auto link = [&graph](const std::size_t a, const std::size_t b) {
		if (a == b) {
			return;
		}
		graph.neighbours[a].push_back(b);
		graph.neighbours[b].push_back(a);
	};

	// 1. Exact endpoint sharing.
	for (const auto& group: graph.endpoints) {
		for (std::size_t i = 0; i < group.segments.size(); ++i) {
			for (std::size_t j = i + 1; j < group.segments.size(); ++j) {
				link(group.segments[i], group.segments[j]);
			}
		}
	}

	// 2. Tolerance bridges between distinct endpoints.
	if (tolerance > 0.0) {
		std::unordered_map<EndpointKey, std::vector<std::size_t>, EndpointKeyHash> cells;
		for (std::size_t g = 0; g < graph.endpoints.size(); ++g) {
			cells[proximityCell(graph.endpoints[g].point, tolerance)].push_back(g);
		}

		for (std::size_t g = 0; g < graph.endpoints.size(); ++g) {
			const EndpointGroup& a = graph.endpoints[g];
			const EndpointKey home = proximityCell(a.point, tolerance);

			for (std::int64_t dx = -1; dx <= 1; ++dx) {
				for (std::int64_t dy = -1; dy <= 1; ++dy) {
					const auto cellIt = cells.find(EndpointKey{home.x + dx, home.y + dy});
					if (cellIt == cells.end()) {
						continue;
					}

					for (const std::size_t h: cellIt->second) {
						if (h <= g) {
							continue; // Each pair once.
						}
						const EndpointGroup& b = graph.endpoints[h];
						const double dist      = cv::norm(a.point - b.point);
						if (dist <= 0.0 || dist > tolerance) {
							continue;
						}

						for (const std::size_t sa: a.segments) {
							for (const std::size_t sb: b.segments) {
								link(sa, sb);
							}
						}
					}
				}
			}
		}
	}

	for (auto& n: graph.neighbours) {
		std::sort(n.begin(), n.end());
		n.erase(std::unique(n.begin(), n.end()), n.end());
	}
	return graph;
}

} // namespace

std::vector<cv::Point2d> pathPoints(const WirePath& path) {
	if (path.segments.empty()) {
		return {};
	}

	std::vector<cv::Point2d> points;
	points.reserve(path.segments.size() + 1);
	points.push_back(path.segments.front().start);
	for (const auto& segment: path.segments) {
		points.push_back(segment.end);
	}
	return points;
}

double totalLength(const WirePath& path) {
	return std::accumulate(path.segments.begin(), path.segments.end(), 0.0, [](double sum, const LineSegment& s) { return sum + length(s); });
}

std::string_view voltageType(const WirePath& path) {
	if (path.segments.empty()) {
		return "UNKNOWN";
	}
	return voltageType(path.segments.front());
}

WirePathTracer::WirePathTracer(TracerConfig config) : m_config{config} {
}

std::vector<WirePath> WirePathTracer::tracePaths(const std::vector<LineSegment>& segments) const {
	if (segments.empty()) {
		return {};
	}

	const ConnectivityGraph graph = buildGraph(segments, m_config.tolerance);

	std::vector<WirePath> paths;
	std::vector<bool> visited(segments.size(), false);

	for (std::size_t seed = 0; seed < segments.size(); ++seed) {
		if (visited[seed]) {
			continue;
		}

		WirePath path{{}, segments[seed].color, segments[seed].page};
		std::deque<std::size_t> queue{seed};
		visited[seed] = true;

		// BFS. Edges are only crossed between segments of the same color.
		while (!queue.empty()) {
			const std::size_t current = queue.front();
			queue.pop_front();
			path.segments.push_back(segments[current]);

			for (const std::size_t next: graph.neighbours[current]) {
				if (visited[next] || segments[next].color != segments[current].color) {
					continue;
				}
				visited[next] = true;
				queue.push_back(next);
			}
		}

		paths.push_back(std::move(path));
	}

	return paths;
}

std::vector<cv::Point2d> WirePathTracer::findJunctions(const std::vector<LineSegment>& segments) const {
	const std::vector<EndpointGroup> groups = groupEndpoints(segments);

	std::vector<cv::Point2d> junctions;
	for (const auto& group: groups) {
		if (group.segments.size() >= 3u) {
			junctions.push_back(group.point);
		}
	}
	return junctions;
}

} // namespace wirescan::detection::core
