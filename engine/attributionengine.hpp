#pragma once
/*-----------------------------------------------------------------------------
 *  attributionengine.hpp
 *
 *  Run-to-completion attribution of every eligible asset:
 *
 *      select -> spatial fields -> classify -> ZoneSequence batches
 *                                           -> EndpointPair
 *                                           -> FingerprintOnly
 *                                           -> Deferred
 *
 *  Spatial fields are always committed before any facility id of the same
 *  asset. The engine assumes exclusive access to the store for one run.
 *---------------------------------------------------------------------------*/
#include <atomic>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

#include "runreport.hpp"
#include "../config.hpp"
#include "../identifiers/fingerprint.hpp"
#include "../identifiers/sequenceallocator.hpp"
#include "../network/assetstore.hpp"
#include "../network/categoryregistry.h"
#include "../network/endpointresolver.h"
#include "../rules/attributionrule.h"

namespace attribution {

class AttributionEngine
{
public:
    /**
     * @param store     shared asset store, written in place
     * @param registry  loaded category registry
     * @param rules     compiled rule table
     * @param cfg       deployment configuration (editor, codes, formats)
     */
    AttributionEngine(IAssetStore& store,
                      const CategoryRegistry& registry,
                      const AttributionRule& rules,
                      const AttributorConfig& cfg);

    /** Attribute every eligible asset. StoreUnavailable propagates. */
    RunReport run();

    /** Attribute the eligible assets that also match `subset`. */
    RunReport run(const AssetPredicate& subset);

    /** Stop at the next asset or zone boundary; safe from a signal handler. */
    void requestStop() noexcept { stop_.store(true); }
    bool stopRequested() const noexcept { return stop_.load(); }

    /** (spatialId or facilityId missing) and not last edited by the authoritative editor. */
    bool isEligible(const Asset& asset) const;

private:
    /* asset carried through the stages of one run */
    struct WorkItem
    {
        Asset               asset;
        const CategoryInfo* category{nullptr};
        cv::Point2d         location;      ///< point, centroid or line midpoint
        cv::Point2d         start, end;    ///< line vertices
    };

    using BatchKey = std::pair<std::string, std::string>;   ///< (zone code, sequence group)

    /* stages */
    std::vector<WorkItem> spatialStage(std::vector<Asset> assets, RunReport& report);
    void sequenceStage(std::vector<WorkItem>& items, std::vector<WorkItem>& fallback, RunReport& report);
    void sequenceBatch(const BatchKey& key, std::vector<WorkItem*>& members, RunReport& report);
    void endpointStage(std::vector<WorkItem>& items, RunReport& report);
    void fingerprintStage(std::vector<WorkItem>& items, RunReport& report);
    void deferredStage(const std::vector<WorkItem>& items, RunReport& report);

    /* per-asset helpers */
    void resolveGeometry(WorkItem& item, AssetUpdate& update) const;
    void resolveSpatialIds(WorkItem& item, AssetUpdate& update) const;
    void resolveElevation(WorkItem& item, AssetUpdate& update) const;
    void writeFacilityId(WorkItem& item, const std::string& facilityId);
    void commit(AssetUpdate& update);

    /* returns true and logs when a stop was requested */
    bool checkStop(RunReport& report, const char* stage);

    IAssetStore&            store_;
    const CategoryRegistry& registry_;
    const AttributionRule&  rules_;
    AttributorConfig        cfg_;
    CoordinateFingerprint   fingerprint_;
    ZoneSequenceAllocator   allocator_;
    EndpointResolver        resolver_;
    std::atomic<bool>       stop_{false};
};

} // namespace attribution
