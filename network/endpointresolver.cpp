#include "endpointresolver.h"

#include <algorithm>

#include "geometry.hpp"
#include "../logging.hpp"
#include "../utils.hpp"

namespace attribution {

EndpointResolver::EndpointResolver(const IAssetStore& store, EndpointConfig cfg)
    : store_(store)
    , cfg_(std::move(cfg))
{}

EndpointLabel EndpointResolver::resolveVertex(const cv::Point2d& vertex,
                                              AssetId lineId,
                                              const char* side) const
{
    EndpointLabel label;
    const auto candidates = store_.pointsAt(vertex, cfg_.categories, cfg_.tolerance);
    label.candidates = candidates.size();

    if (candidates.size() == 1)
    {
        label.facilityId = candidates.front().facilityId;
        return label;
    }
    if (candidates.empty())
        return label;

    /* several point assets stacked on one vertex: data-quality issue */
    std::string ids;
    for (const auto& c : candidates)
    {
        ids += (ids.empty() ? "" : ", ") + std::to_string(c.id);
        if (!c.facilityId) continue;
        if (!label.facilityId || *c.facilityId < *label.facilityId)
            label.facilityId = c.facilityId;
    }
    logging::get()->warn("line {} {} vertex {} coincides with {} point assets [{}], using '{}'",
                         lineId, side, formatPoint(vertex), candidates.size(), ids,
                         label.facilityId.value_or("<none>"));
    return label;
}

EndpointResolution EndpointResolver::resolveEndpoints(const Asset& line) const
{
    const auto [start, end] = lineEndpoints(line.geometry);

    EndpointResolution r;
    if (line.endpointFrom)
    {
        r.from.facilityId = line.endpointFrom;
        r.from.reused = true;
    }
    else
    {
        r.from = resolveVertex(start, line.id, "start");
    }

    if (line.endpointTo)
    {
        r.to.facilityId = line.endpointTo;
        r.to.reused = true;
    }
    else
    {
        r.to = resolveVertex(end, line.id, "end");
    }
    return r;
}

} // namespace attribution
