/*-----------------------------------------------------------------------------
 *  assetstore.cpp
 *---------------------------------------------------------------------------*/
#include "assetstore.hpp"

#include <algorithm>
#include <stdexcept>

#include "../errors.hpp"
#include "../utils.hpp"

namespace attribution {

namespace {

// Throws when an engaged update field would change an already set value.
template<typename T>
void checkSetOnce(const std::optional<T>& current, const std::optional<T>& incoming,
                  AssetId id, const char* field)
{
    if (current && incoming && !(*current == *incoming))
        throw std::logic_error("asset " + std::to_string(id) + ": field '" + field +
                               "' is already set");
}

template<typename T>
bool assign(std::optional<T>& current, const std::optional<T>& incoming)
{
    if (!incoming || current) return false;
    current = incoming;
    return true;
}

} // namespace

/* ===== mutation =========================================================== */
void InMemoryAssetStore::insert(Asset asset)
{
    if (assets_.count(asset.id))
        throw std::invalid_argument("duplicate asset id " + std::to_string(asset.id));
    if (asset.facilityId && facilityIdTaken(asset.category, *asset.facilityId))
        throw std::invalid_argument("duplicate facility id '" + *asset.facilityId +
                                    "' in category " + asset.category);

    if (asset.facilityId)
        facility_by_category_[asset.category].insert(*asset.facilityId);
    const AssetId id = asset.id;
    assets_.emplace(id, std::move(asset));
}

void InMemoryAssetStore::addSurveyNode(SurveyNode node)
{
    if (!survey_.emplace(node.id, node).second)
        throw std::invalid_argument("duplicate survey node id " + std::to_string(node.id));
}

void InMemoryAssetStore::update(const AssetUpdate& u)
{
    auto it = assets_.find(u.id);
    if (it == assets_.end())
        throw std::invalid_argument("update of unknown asset " + std::to_string(u.id));
    Asset& a = it->second;

    /* 1. validate everything before touching the record */
    checkSetOnce(a.spatialStart, u.spatialStart, a.id, "spatialStart");
    checkSetOnce(a.spatialEnd,   u.spatialEnd,   a.id, "spatialEnd");
    checkSetOnce(a.spatialId,    u.spatialId,    a.id, "spatialId");
    checkSetOnce(a.facilityId,   u.facilityId,   a.id, "facilityId");
    checkSetOnce(a.endpointFrom, u.endpointFrom, a.id, "endpointFrom");
    checkSetOnce(a.endpointTo,   u.endpointTo,   a.id, "endpointTo");

    if (u.facilityId && !a.facilityId && facilityIdTaken(a.category, *u.facilityId))
        throw DuplicateFacilityId(*u.facilityId,
                                  "facility id '" + *u.facilityId + "' already used in " + a.category);
    if (u.facilityId && !a.spatialId && !u.spatialId)
        throw std::logic_error("asset " + std::to_string(a.id) +
                               ": facility id written without a spatial id");

    /* 2. apply; recorded coordinates are only filled when missing */
    bool changed = false;
    changed |= assign(a.point,        u.point);
    changed |= assign(a.lineStart,    u.lineStart);
    changed |= assign(a.lineEnd,      u.lineEnd);
    changed |= assign(a.spatialStart, u.spatialStart);
    changed |= assign(a.spatialEnd,   u.spatialEnd);
    changed |= assign(a.spatialId,    u.spatialId);
    changed |= assign(a.endpointFrom, u.endpointFrom);
    changed |= assign(a.endpointTo,   u.endpointTo);
    changed |= assign(a.elevation,    u.elevation);
    if (assign(a.facilityId, u.facilityId))
    {
        facility_by_category_[a.category].insert(*a.facilityId);
        changed = true;
    }

    if (changed && u.lastEditor)
        a.lastEditor = *u.lastEditor;
}

/* ===== queries ============================================================ */
std::vector<Asset> InMemoryAssetStore::select(const AssetPredicate& where) const
{
    std::vector<Asset> out;
    for (const auto& kv : assets_)
        if (!where || where(kv.second))
            out.push_back(kv.second);
    return out;
}

std::optional<Asset> InMemoryAssetStore::find(AssetId id) const
{
    auto it = assets_.find(id);
    if (it == assets_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> InMemoryAssetStore::zonesContaining(const cv::Point2d& p) const
{
    return zones_.containing(p);
}

std::vector<Asset> InMemoryAssetStore::pointsAt(const cv::Point2d& p,
                                                const std::vector<std::string>& categories,
                                                double tolerance) const
{
    std::vector<Asset> out;
    for (const auto& kv : assets_)
    {
        const Asset& a = kv.second;
        if (std::find(categories.begin(), categories.end(), a.category) == categories.end())
            continue;
        if (a.geometry.vertices.size() != 1 || !isFinite(a.geometry.start()))
            continue;
        if (coincident(a.geometry.start(), p, tolerance))
            out.push_back(a);
    }
    return out;
}

std::vector<SurveyNode> InMemoryAssetStore::surveyNodesAt(const cv::Point2d& p, double tolerance) const
{
    std::vector<SurveyNode> out;
    for (const auto& kv : survey_)
        if (coincident(kv.second.position, p, tolerance))
            out.push_back(kv.second);
    return out;
}

std::vector<std::string> InMemoryAssetStore::facilityIds(const std::vector<std::string>& categories) const
{
    std::vector<std::string> out;
    for (const auto& category : categories)
    {
        auto it = facility_by_category_.find(category);
        if (it == facility_by_category_.end()) continue;
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool InMemoryAssetStore::facilityIdTaken(const std::string& category, const std::string& facilityId) const
{
    auto it = facility_by_category_.find(category);
    return it != facility_by_category_.end() && it->second.count(facilityId) > 0;
}

} // namespace attribution
