#include "geometry.hpp"

#include <cmath>
#include <opencv2/imgproc.hpp>

#include "../errors.hpp"
#include "../utils.hpp"

namespace attribution {

namespace {

void requireFinite(const std::vector<cv::Point2d>& vertices)
{
    for (const auto& p : vertices)
        if (!isFinite(p))
            throw MalformedGeometry("vertex " + formatPoint(p) + " is not finite");
}

} // namespace

cv::Point2d pointLocation(const AssetGeometry& g)
{
    if (g.vertices.size() != 1)
        throw MalformedGeometry("point geometry needs exactly one vertex, got " +
                                std::to_string(g.vertices.size()));
    requireFinite(g.vertices);
    return g.vertices.front();
}

std::pair<cv::Point2d, cv::Point2d> lineEndpoints(const AssetGeometry& g)
{
    if (g.vertices.size() < 2)
        throw MalformedGeometry("line geometry needs at least two vertices, got " +
                                std::to_string(g.vertices.size()));
    requireFinite(g.vertices);
    return {g.start(), g.end()};
}

cv::Point2d polygonCentroid(const std::vector<cv::Point2d>& ring)
{
    if (ring.size() < 3)
        throw MalformedGeometry("polygon geometry needs at least three vertices, got " +
                                std::to_string(ring.size()));
    requireFinite(ring);

    /* moments are computed in float: shift the ring next to the origin first */
    const cv::Point2d origin = ring.front();
    std::vector<cv::Point2f> local;
    local.reserve(ring.size());
    for (const auto& p : ring)
        local.emplace_back(static_cast<float>(p.x - origin.x),
                           static_cast<float>(p.y - origin.y));

    const cv::Moments m = cv::moments(local);
    if (std::fabs(m.m00) < 1e-9)
        throw MalformedGeometry("polygon geometry has zero area");

    return {origin.x + m.m10 / m.m00, origin.y + m.m01 / m.m00};
}

cv::Point2d representativePoint(const AssetGeometry& g, GeometryKind kind)
{
    switch (kind)
    {
    case GeometryKind::Point:
        return pointLocation(g);
    case GeometryKind::Line:
    {
        const auto [a, b] = lineEndpoints(g);
        return (a + b) * 0.5;
    }
    case GeometryKind::Polygon:
        return polygonCentroid(g.vertices);
    }
    throw MalformedGeometry("unknown geometry kind");
}

} // namespace attribution
