#include "detection/core/connectionRouter.hpp"

namespace wirescan::detection::core {

cv::Point2d center(const DevicePlacement& placement) {
	return {placement.x + placement.width / 2.0, placement.y + placement.height / 2.0};
}

std::vector<RoutedConnection> routeConnections(const std::vector<Connection>& connections, const std::map<std::string, DevicePlacement>& placements,
                                               const RoutingStyle style) {
	std::vector<RoutedConnection> routed;
	routed.reserve(connections.size());

	for (const auto& connection: connections) {
		const auto src = placements.find(connection.sourceDevice);
		const auto tgt = placements.find(connection.targetDevice);
		if (src == placements.end() || tgt == placements.end()) {
			continue;
		}

		routed.push_back(RoutedConnection{
		        connection.sourceDevice,
		        connection.targetDevice,
		        connection.voltageLevel.empty() ? std::string("UNKNOWN") : connection.voltageLevel,
		        connection.wireColor,
		        generatePath(style, center(src->second), center(tgt->second)),
		});
	}

	return routed;
}

} // namespace wirescan::detection::core
