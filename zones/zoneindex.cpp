/*-----------------------------------------------------------------------------
 *  zoneindex.cpp
 *---------------------------------------------------------------------------*/
#include "zoneindex.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>

#include "../errors.hpp"
#include "../utils.hpp"

namespace attribution {

/* ===== ZoneIndex ========================================================== */
void ZoneIndex::addZone(Zone zone)
{
    if (zone.ring.size() < 3)
        throw MalformedGeometry("zone '" + zone.code + "' needs at least three vertices");

    Entry e;
    e.bbox.min = e.bbox.max = zone.ring.front();
    for (const auto& p : zone.ring)
    {
        if (!isFinite(p))
            throw MalformedGeometry("zone '" + zone.code + "' has a non-finite vertex");
        e.bbox.min.x = std::min(e.bbox.min.x, p.x);
        e.bbox.min.y = std::min(e.bbox.min.y, p.y);
        e.bbox.max.x = std::max(e.bbox.max.x, p.x);
        e.bbox.max.y = std::max(e.bbox.max.y, p.y);
    }
    if (e.bbox.width() <= 0.0 || e.bbox.height() <= 0.0)
        throw MalformedGeometry("zone '" + zone.code + "' has zero extent");

    e.local.reserve(zone.ring.size());
    for (const auto& p : zone.ring)
        e.local.emplace_back(static_cast<float>(p.x - e.bbox.min.x),
                             static_cast<float>(p.y - e.bbox.min.y));

    zones_.push_back(std::move(zone));
    entries_.push_back(std::move(e));
}

std::vector<std::string> ZoneIndex::containing(const cv::Point2d& p) const
{
    std::vector<std::string> codes;
    if (!isFinite(p))
        return codes;

    for (std::size_t i = 0; i < entries_.size(); ++i)
    {
        const Entry& e = entries_[i];
        if (!e.bbox.contains(p)) continue;

        const cv::Point2f local(static_cast<float>(p.x - e.bbox.min.x),
                                static_cast<float>(p.y - e.bbox.min.y));
        /* +1 inside, 0 on the edge, -1 outside */
        if (cv::pointPolygonTest(e.local, local, false) > 0)
            codes.push_back(zones_[i].code);
    }
    return codes;
}

void ZoneIndex::clear()
{
    zones_.clear();
    entries_.clear();
}

/* ===== helpers ============================================================ */
std::string requireSingleZone(const std::vector<std::string>& codes, const cv::Point2d& p)
{
    if (codes.empty())
        throw ZoneNotFound("no zone contains " + formatPoint(p));

    if (codes.size() > 1)
    {
        std::string list;
        for (const auto& c : codes)
            list += (list.empty() ? "" : ", ") + c;
        throw AmbiguousZone(formatPoint(p) + " lies in " + std::to_string(codes.size()) +
                            " zones: " + list);
    }
    return codes.front();
}

} // namespace attribution
