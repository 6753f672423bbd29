#pragma once

#include "detection/core/wirePathGenerator.hpp"

#include <opencv2/core/types.hpp>

#include <map>
#include <string>
#include <vector>

namespace wirescan::detection::core {

//! Logical connection between two devices, e.g. a row of a cable routing table.
struct Connection {
	std::string sourceDevice;
	std::string targetDevice;
	std::string voltageLevel{}; //!< Empty if unknown.
	std::string wireColor{};    //!< Free text from the table, may be empty.
};

//! Where a device is drawn on the page. Width and height may be 0 for point-like placements.
struct DevicePlacement {
	double x{0.0};
	double y{0.0};
	double width{0.0};
	double height{0.0};
};

cv::Point2d center(const DevicePlacement& placement);

//! A connection with its synthesised route.
struct RoutedConnection {
	std::string fromDevice;
	std::string toDevice;
	std::string voltageLevel; //!< "UNKNOWN" if the connection did not name one.
	std::string wireColor;
	std::vector<cv::Point2d> points;
};

/*! Route every connection between the centers of its two devices.
 * \param [in] connections Connections to draw.
 * \param [in] placements  Device tag -> placement on the page.
 * \param [in] style       Routing policy for all connections.
 * \return     Routed connections in input order. Connections with an unplaced device are skipped.
 */
std::vector<RoutedConnection> routeConnections(const std::vector<Connection>& connections, const std::map<std::string, DevicePlacement>& placements,
                                               RoutingStyle style = RoutingStyle::Manhattan);

} // namespace wirescan::detection::core
