#pragma once

#include <opencv2/core/types.hpp>

#include <string_view>
#include <vector>

// Synthesised wire routes between two points, used when a connection is known but no traced geometry exists.
// All functions are pure. Coincident endpoints are valid input and still produce a well formed point list.
namespace wirescan::detection::core {

//! First leg direction of a Manhattan route.
enum class ManhattanExit { Auto, Horizontal, Vertical };

//! Routing policy.
enum class RoutingStyle { Manhattan, LPath, Straight, Smooth };

std::string_view toString(RoutingStyle style);

//! Orthogonal route with two right-angle bends: start, two points on the half-way line of the first leg, end (4 points).
//! \param [in] exit Auto goes horizontal first if |dx| > |dy|, else vertical first.
std::vector<cv::Point2d> generateManhattanPath(const cv::Point2d& start, const cv::Point2d& end, ManhattanExit exit = ManhattanExit::Auto);

//! Route with a single right-angle bend (3 points). The corner takes the target x (horizontal first) or the target y (vertical first).
std::vector<cv::Point2d> generateLPath(const cv::Point2d& start, const cv::Point2d& end, bool horizontalFirst = true);

//! Direct connection (2 points).
std::vector<cv::Point2d> generateStraightLine(const cv::Point2d& start, const cv::Point2d& end);

/*! Curved route for diagonal connections.
 *  Samples a quadratic Bezier curve whose control point is the midpoint moved perpendicular to the start->end direction by 10% of the
 *  distance.
 * \param [in] segments Number of curve pieces (>= 1, smaller values are raised to 1).
 * \return     segments + 1 points, first == start and last == end. Only start and end if the endpoints are less than one unit apart.
 */
std::vector<cv::Point2d> generateSmoothPath(const cv::Point2d& start, const cv::Point2d& end, int segments = 10);

//! Dispatch on routing style with the default options of every policy.
std::vector<cv::Point2d> generatePath(RoutingStyle style, const cv::Point2d& start, const cv::Point2d& end);

} // namespace wirescan::detection::core
