#ifndef ENDPOINTRESOLVER_H
#define ENDPOINTRESOLVER_H

#include <optional>
#include <string>
#include <opencv2/core.hpp>

#include "assetstore.hpp"
#include "../config.hpp"

namespace attribution {

/** Outcome for one end of a line. */
struct EndpointLabel
{
    std::optional<std::string> facilityId;     ///< label of the coincident point asset
    std::size_t                candidates{0};  ///< point assets found at the vertex
    bool                       reused{false};  ///< already set on the line, not queried
};

/** FROMMH / TOMH of one line. */
struct EndpointResolution
{
    EndpointLabel from;
    EndpointLabel to;

    bool complete() const noexcept { return from.facilityId && to.facilityId; }
};

/**
 * @brief Labels line endpoints with the facility id of the coincident point
 *        asset (manhole) found at each vertex.
 *
 * - one candidate      → its facility id (nullopt if it has none yet)
 * - no candidate       → nullopt
 * - several candidates → smallest non-null facility id, logged as a warning
 *
 * A side already set on the line is returned as is and never queried again.
 */
class EndpointResolver
{
public:
    EndpointResolver(const IAssetStore& store, EndpointConfig cfg);

    /** Throws MalformedGeometry when the line has fewer than two vertices. */
    EndpointResolution resolveEndpoints(const Asset& line) const;

    /** Label of the point asset at `vertex`. */
    EndpointLabel resolveVertex(const cv::Point2d& vertex, AssetId lineId, const char* side) const;

private:
    const IAssetStore& store_;
    EndpointConfig     cfg_;
};

} // namespace attribution

#endif // ENDPOINTRESOLVER_H
