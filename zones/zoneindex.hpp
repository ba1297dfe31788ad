#pragma once
/*-----------------------------------------------------------------------------
 *  zoneindex.hpp
 *
 *  Map-grid partition polygons (quarter sections) with point containment.
 *  Containment is strict: a point on a zone edge is not inside that zone.
 *---------------------------------------------------------------------------*/
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace attribution {

/* ---------- basic geometry ------------------------------------------------ */
/**
 * @brief Axis-aligned bounding box helper.
 */
struct AABB
{
    cv::Point2d min;   ///< lower-left corner
    cv::Point2d max;   ///< upper-right corner

    /** Check whether a point lies inside the box (edges included). */
    [[nodiscard]] bool contains(const cv::Point2d& p) const noexcept
    {
        return p.x >= min.x && p.x <= max.x &&
               p.y >= min.y && p.y <= max.y;
    }

    [[nodiscard]] double width () const noexcept { return max.x - min.x; }
    [[nodiscard]] double height() const noexcept { return max.y - min.y; }
};

/**
 * @brief One partition polygon.
 */
struct Zone
{
    std::string              code;   ///< raw zone code, e.g. "14-14"
    std::vector<cv::Point2d> ring;   ///< outer ring in store coordinates
};

/**
 * @brief Flat list of zones with bounding-box prefiltered containment.
 *
 * Rings are stored relative to their bounding-box origin as float contours
 * so cv::pointPolygonTest keeps sub-unit precision on large coordinates.
 */
class ZoneIndex
{
public:
    /** Add a zone; throws MalformedGeometry for a degenerate ring. */
    void addZone(Zone zone);

    /** Codes of every zone strictly containing `p`, in insertion order. */
    std::vector<std::string> containing(const cv::Point2d& p) const;

    const std::vector<Zone>& zones() const noexcept { return zones_; }
    std::size_t size() const noexcept { return zones_.size(); }
    bool empty() const noexcept { return zones_.empty(); }
    void clear();

private:
    struct Entry
    {
        AABB                     bbox;
        std::vector<cv::Point2f> local;   ///< ring relative to bbox.min
    };

    std::vector<Zone>  zones_;
    std::vector<Entry> entries_;          ///< parallel to zones_
};

/**
 * Reduce a containment result to exactly one zone code.
 * Throws ZoneNotFound for zero candidates and AmbiguousZone for several.
 */
std::string requireSingleZone(const std::vector<std::string>& codes, const cv::Point2d& p);

} // namespace attribution
