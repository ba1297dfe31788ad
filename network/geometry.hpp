#pragma once
/*-----------------------------------------------------------------------------
 *  geometry.hpp
 *
 *  Vertex extraction and validation of asset geometry. Every function throws
 *  MalformedGeometry when the vertices do not fit the category's kind.
 *---------------------------------------------------------------------------*/
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

#include "asset.hpp"

namespace attribution {

/** Location of a point asset. */
cv::Point2d pointLocation(const AssetGeometry& g);

/** (start, end) vertices of a line asset. */
std::pair<cv::Point2d, cv::Point2d> lineEndpoints(const AssetGeometry& g);

/** Area centroid of a polygon ring. */
cv::Point2d polygonCentroid(const std::vector<cv::Point2d>& ring);

/**
 * Representative location used for zone containment and fingerprinting:
 * the point itself, the polygon centroid, or the line midpoint.
 */
cv::Point2d representativePoint(const AssetGeometry& g, GeometryKind kind);

} // namespace attribution
