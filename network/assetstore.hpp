#pragma once
/*-----------------------------------------------------------------------------
 *  assetstore.hpp
 *
 *  Access to the shared spatial store: predicate selection, the spatial
 *  primitives the engine needs (zone containment, point coincidence) and
 *  all-or-nothing field updates.
 *---------------------------------------------------------------------------*/
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <opencv2/core.hpp>

#include "asset.hpp"
#include "../zones/zoneindex.hpp"

namespace attribution {

using AssetPredicate = std::function<bool(const Asset&)>;

/* ---------- store interface ----------------------------------------------- */
class IAssetStore
{
public:
    virtual ~IAssetStore() = default;

    /** Copies of all assets matching `where`, ascending by id. */
    virtual std::vector<Asset>        select(const AssetPredicate& where) const = 0;

    virtual std::optional<Asset>      find(AssetId id) const = 0;

    /** Codes of the zones strictly containing `p`. */
    virtual std::vector<std::string>  zonesContaining(const cv::Point2d& p) const = 0;

    /** Point assets of `categories` located at `p`, ascending by id. */
    virtual std::vector<Asset>        pointsAt(const cv::Point2d& p,
                                               const std::vector<std::string>& categories,
                                               double tolerance) const = 0;

    /** Survey nodes located at `p`, ascending by id. */
    virtual std::vector<SurveyNode>   surveyNodesAt(const cv::Point2d& p, double tolerance) const = 0;

    /** Every non-null facility id of `categories`. */
    virtual std::vector<std::string>  facilityIds(const std::vector<std::string>& categories) const = 0;

    /**
     * Apply one update all-or-nothing. Throws DuplicateFacilityId when the
     * facility id is taken within the asset's category, std::logic_error
     * when a set-once field would change, StoreUnavailable on I/O trouble.
     */
    virtual void                      update(const AssetUpdate& u) = 0;
};

/* ---------- in-memory store ----------------------------------------------- */
/**
 * @brief Store kept entirely in memory; the CLI fills it from a YAML file.
 */
class InMemoryAssetStore final : public IAssetStore
{
public:
    /** Insert a new asset; throws std::invalid_argument on duplicate id/facility id. */
    void insert(Asset asset);
    void addZone(Zone zone) { zones_.addZone(std::move(zone)); }
    void addSurveyNode(SurveyNode node);

    /* IAssetStore */
    std::vector<Asset>        select(const AssetPredicate& where) const override;
    std::optional<Asset>      find(AssetId id) const override;
    std::vector<std::string>  zonesContaining(const cv::Point2d& p) const override;
    std::vector<Asset>        pointsAt(const cv::Point2d& p,
                                       const std::vector<std::string>& categories,
                                       double tolerance) const override;
    std::vector<SurveyNode>   surveyNodesAt(const cv::Point2d& p, double tolerance) const override;
    std::vector<std::string>  facilityIds(const std::vector<std::string>& categories) const override;
    void                      update(const AssetUpdate& u) override;

    const std::map<AssetId, Asset>&      assets()      const noexcept { return assets_; }
    const std::vector<Zone>&             zones()       const noexcept { return zones_.zones(); }
    const std::map<AssetId, SurveyNode>& surveyNodes() const noexcept { return survey_; }

private:
    bool facilityIdTaken(const std::string& category, const std::string& facilityId) const;

    std::map<AssetId, Asset>                                         assets_;
    std::map<AssetId, SurveyNode>                                    survey_;
    ZoneIndex                                                        zones_;
    std::unordered_map<std::string, std::unordered_set<std::string>> facility_by_category_;
};

} // namespace attribution
