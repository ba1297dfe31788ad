/*-----------------------------------------------------------------------------
 *  attributionengine.cpp
 *---------------------------------------------------------------------------*/
#include "attributionengine.hpp"

#include <stdexcept>

#include "../errors.hpp"
#include "../logging.hpp"
#include "../network/geometry.hpp"
#include "../utils.hpp"
#include "../zones/zoneindex.hpp"

namespace attribution {

namespace {

// "START <stage> - COUNT=n", or "PASS <stage> - COUNT=0" when there is nothing to do.
bool startStage(const char* stage, std::size_t count)
{
    if (count == 0)
    {
        logging::get()->info("PASS {} - COUNT=0", stage);
        return false;
    }
    logging::get()->info("START {} - COUNT={}", stage, count);
    return true;
}

void finishStage(const char* stage, std::size_t count)
{
    logging::get()->info("FINISH {} - COUNT={}", stage, count);
}

cv::Point2d requireRecorded(const cv::Point2d& p, AssetId id, const char* field)
{
    if (!isFinite(p))
        throw MalformedGeometry("asset " + std::to_string(id) + ": recorded " + field +
                                " " + formatPoint(p) + " is not finite");
    return p;
}

} // namespace

AttributionEngine::AttributionEngine(IAssetStore& store,
                                     const CategoryRegistry& registry,
                                     const AttributionRule& rules,
                                     const AttributorConfig& cfg)
    : store_(store)
    , registry_(registry)
    , rules_(rules)
    , cfg_(cfg)
    , fingerprint_(cfg.fingerprint.padWidth)
    , allocator_(cfg.sequence)
    , resolver_(store, cfg.endpoints)
{}

bool AttributionEngine::isEligible(const Asset& asset) const
{
    return (!asset.spatialId || !asset.facilityId) &&
           asset.lastEditor != cfg_.editor.authoritative;
}

RunReport AttributionEngine::run()
{
    return run(AssetPredicate{});
}

RunReport AttributionEngine::run(const AssetPredicate& subset)
{
    RunReport report;
    auto log = logging::get();

    /* 1. selection */
    std::vector<Asset> selected = store_.select([&](const Asset& a) {
        return isEligible(a) && (!subset || subset(a));
    });
    if (!startStage("select", selected.size()))
    {
        report.logSummary();
        return report;
    }
    finishStage("select", selected.size());

    /* 2. geometry fields, spatial ids, elevation */
    std::vector<WorkItem> items = spatialStage(std::move(selected), report);

    /* 3. routing */
    std::vector<WorkItem> sequence, endpoint, fingerprint, deferred;
    for (auto& item : items)
    {
        if (item.asset.facilityId)
            continue;   // only spatial fields were missing

        const RuleMatch match = rules_.classify(item.asset);
        log->debug("asset {} ({}) -> {} by rule '{}'",
                   item.asset.id, item.asset.category, toString(match.strategy), match.rule);
        switch (match.strategy)
        {
        case Strategy::ZoneSequence:    sequence.push_back(std::move(item));    break;
        case Strategy::EndpointPair:    endpoint.push_back(std::move(item));    break;
        case Strategy::FingerprintOnly: fingerprint.push_back(std::move(item)); break;
        case Strategy::Deferred:        deferred.push_back(std::move(item));    break;
        }
    }

    /* 4. naming; sequence first so its fallbacks join the fingerprint stage */
    sequenceStage(sequence, fingerprint, report);
    endpointStage(endpoint, report);
    fingerprintStage(fingerprint, report);
    deferredStage(deferred, report);

    report.logSummary();
    return report;
}

/* ===== stages ============================================================= */
std::vector<AttributionEngine::WorkItem>
AttributionEngine::spatialStage(std::vector<Asset> assets, RunReport& report)
{
    std::vector<WorkItem> out;
    out.reserve(assets.size());
    if (!startStage("spatial", assets.size()))
        return out;

    std::size_t written = 0;
    for (auto& asset : assets)
    {
        if (checkStop(report, "spatial"))
            break;

        WorkItem item;
        item.asset = std::move(asset);
        item.category = registry_.get(item.asset.category);
        if (!item.category)
        {
            report.skip(item.asset, SkipReason::Failed,
                        "category '" + item.asset.category + "' is not registered");
            continue;
        }

        try {
            AssetUpdate update;
            update.id = item.asset.id;
            resolveGeometry(item, update);
            resolveSpatialIds(item, update);
            resolveElevation(item, update);
            if (!update.empty())
            {
                commit(update);
                ++written;
            }
        } catch (const MalformedGeometry& e) {
            report.skip(item.asset, SkipReason::Malformed, e.what());
            continue;
        } catch (const std::logic_error& e) {
            report.skip(item.asset, SkipReason::Failed, e.what());
            continue;
        }
        out.push_back(std::move(item));
    }

    finishStage("spatial", written);
    return out;
}

void AttributionEngine::sequenceStage(std::vector<WorkItem>& items,
                                      std::vector<WorkItem>& fallback,
                                      RunReport& report)
{
    if (!startStage("ZoneSequence", items.size()))
        return;

    /* 1. resolve exactly one zone per asset, group by (zone, sequence group) */
    std::map<BatchKey, std::vector<WorkItem*>> batches;
    for (auto& item : items)
    {
        try {
            const std::string zone = requireSingleZone(store_.zonesContaining(item.location), item.location);
            batches[{zone, item.category->sequenceGroup}].push_back(&item);
        } catch (const ZoneNotFound& e) {
            if (cfg_.sequence.fingerprintFallback)
            {
                logging::get()->debug("asset {} outside every zone, falling back to its spatial id",
                                      item.asset.id);
                fallback.push_back(item);
            }
            else
            {
                report.skip(item.asset, SkipReason::NoZone, e.what());
            }
        } catch (const AmbiguousZone& e) {
            report.skip(item.asset, SkipReason::Ambiguous, e.what());
        }
    }

    /* 2. one batch at a time, members already ascending by id */
    std::size_t done = 0;
    for (auto& [key, members] : batches)
    {
        if (checkStop(report, "ZoneSequence"))
            break;
        sequenceBatch(key, members, report);
        done += members.size();
    }

    finishStage("ZoneSequence", done);
}

void AttributionEngine::sequenceBatch(const BatchKey& key,
                                      std::vector<WorkItem*>& members,
                                      RunReport& report)
{
    const std::string& zone  = key.first;
    const std::string& group = key.second;

    std::vector<std::string> categories, suffixes;
    for (const CategoryInfo* c : registry_.group(group))
    {
        categories.push_back(c->name);
        if (!c->suffix.empty())
            suffixes.push_back(c->suffix);
    }

    std::size_t written = 0;
    std::string failure;
    try {
        /* 1. current maximum straight from the store */
        SequenceState state = allocator_.scan(zone, store_.facilityIds(categories), suffixes);
        const long long previous = state.maximum;

        /* 2. allocate the whole batch before the first write */
        std::vector<std::string> ids;
        ids.reserve(members.size());
        for (const WorkItem* m : members)
            ids.push_back(allocator_.next(state, m->category->suffix));

        logging::get()->info("zone {} / {}: {} identifier(s) {}..{} after {}",
                             zone, group, ids.size(), ids.front(), ids.back(), previous);

        /* 3. write in allocation order */
        for (; written < members.size(); ++written)
        {
            try {
                writeFacilityId(*members[written], ids[written]);
            } catch (const DuplicateFacilityId& e) {
                throw ZoneAllocationConflict("identifier '" + e.facilityId() + "' of zone " + zone +
                                             " already exists: another writer changed the store");
            }
            report.attributed(members[written]->asset.category);
        }
    } catch (const ZoneAllocationConflict& e) {
        failure = e.what();
    } catch (const SequenceExhausted& e) {
        failure = e.what();
    } catch (const ZoneNotFound& e) {
        failure = e.what();
    } catch (const std::logic_error& e) {
        failure = e.what();
    }

    if (failure.empty())
        return;

    report.failBatch(zone, group, failure);
    for (std::size_t i = written; i < members.size(); ++i)
        report.skip(members[i]->asset, SkipReason::Failed, "zone batch " + zone + " failed");
}

void AttributionEngine::endpointStage(std::vector<WorkItem>& items, RunReport& report)
{
    if (!startStage("EndpointPair", items.size()))
        return;

    std::size_t done = 0;
    for (auto& item : items)
    {
        if (checkStop(report, "EndpointPair"))
            break;

        Asset& line = item.asset;
        try {
            const EndpointResolution r = resolver_.resolveEndpoints(line);

            /* 1. endpoint labels on their own, kept even if the id write fails */
            AssetUpdate update;
            update.id = line.id;
            if (!line.endpointFrom && r.from.facilityId) update.endpointFrom = r.from.facilityId;
            if (!line.endpointTo   && r.to.facilityId)   update.endpointTo   = r.to.facilityId;
            if (!update.empty())
            {
                commit(update);
                if (update.endpointFrom) line.endpointFrom = update.endpointFrom;
                if (update.endpointTo)   line.endpointTo   = update.endpointTo;
            }

            /* 2. facility id only once both sides are known */
            if (r.complete())
            {
                writeFacilityId(item, *r.from.facilityId + "-" + *r.to.facilityId);
                report.attributed(line.category);
            }
            else
            {
                logging::get()->debug("line {} waits for endpoints (from={}, to={})", line.id,
                                      r.from.facilityId.value_or("-"), r.to.facilityId.value_or("-"));
                report.pending(line.category);
            }
            ++done;
        } catch (const MalformedGeometry& e) {
            report.skip(line, SkipReason::Malformed, e.what());
        } catch (const DuplicateFacilityId& e) {
            report.skip(line, SkipReason::Failed, e.what());
        } catch (const std::logic_error& e) {
            report.skip(line, SkipReason::Failed, e.what());
        }
    }

    finishStage("EndpointPair", done);
}

void AttributionEngine::fingerprintStage(std::vector<WorkItem>& items, RunReport& report)
{
    if (!startStage("FingerprintOnly", items.size()))
        return;

    std::size_t done = 0;
    for (auto& item : items)
    {
        if (checkStop(report, "FingerprintOnly"))
            break;
        try {
            writeFacilityId(item, *item.asset.spatialId);
            report.attributed(item.asset.category);
            ++done;
        } catch (const DuplicateFacilityId& e) {
            report.skip(item.asset, SkipReason::Failed, e.what());
        } catch (const std::logic_error& e) {
            report.skip(item.asset, SkipReason::Failed, e.what());
        }
    }

    finishStage("FingerprintOnly", done);
}

void AttributionEngine::deferredStage(const std::vector<WorkItem>& items, RunReport& report)
{
    if (!startStage("Deferred", items.size()))
        return;
    for (const auto& item : items)
        report.pending(item.asset.category);
    finishStage("Deferred", items.size());
}

/* ===== per-asset helpers ================================================== */
void AttributionEngine::resolveGeometry(WorkItem& item, AssetUpdate& update) const
{
    Asset& a = item.asset;
    switch (item.category->kind)
    {
    case GeometryKind::Point:
    case GeometryKind::Polygon:
        if (a.point)
        {
            item.location = requireRecorded(*a.point, a.id, "point");
        }
        else
        {
            item.location = representativePoint(a.geometry, item.category->kind);
            a.point = update.point = item.location;
        }
        break;

    case GeometryKind::Line:
    {
        if (!a.lineStart || !a.lineEnd)
        {
            const auto [start, end] = lineEndpoints(a.geometry);
            if (!a.lineStart) a.lineStart = update.lineStart = start;
            if (!a.lineEnd)   a.lineEnd   = update.lineEnd   = end;
        }
        item.start    = requireRecorded(*a.lineStart, a.id, "line start");
        item.end      = requireRecorded(*a.lineEnd,   a.id, "line end");
        item.location = (item.start + item.end) * 0.5;
        break;
    }
    }
}

void AttributionEngine::resolveSpatialIds(WorkItem& item, AssetUpdate& update) const
{
    Asset& a = item.asset;
    if (item.category->kind != GeometryKind::Line)
    {
        if (!a.spatialId)
            a.spatialId = update.spatialId = fingerprint_.point(item.location);
        return;
    }

    if (!a.spatialStart)
        a.spatialStart = update.spatialStart = fingerprint_.point(item.start);
    if (!a.spatialEnd)
        a.spatialEnd = update.spatialEnd = fingerprint_.point(item.end);
    if (!a.spatialId)
        a.spatialId = update.spatialId = CoordinateFingerprint::line(*a.spatialStart, *a.spatialEnd);
}

void AttributionEngine::resolveElevation(WorkItem& item, AssetUpdate& update) const
{
    Asset& a = item.asset;
    if (!item.category->elevation || item.category->kind != GeometryKind::Point ||
        a.elevation || a.stage != cfg_.codes.asBuiltStage)
        return;

    const auto nodes = store_.surveyNodesAt(item.location, cfg_.endpoints.tolerance);
    if (nodes.empty())
        return;
    if (nodes.size() > 1)
        logging::get()->warn("asset {} coincides with {} survey nodes, using node {}",
                             a.id, nodes.size(), nodes.front().id);

    a.elevation = update.elevation = nodes.front().z;
}

void AttributionEngine::writeFacilityId(WorkItem& item, const std::string& facilityId)
{
    AssetUpdate update;
    update.id = item.asset.id;
    update.facilityId = facilityId;
    commit(update);
    item.asset.facilityId = facilityId;
}

void AttributionEngine::commit(AssetUpdate& update)
{
    update.lastEditor = cfg_.editor.engine;
    store_.update(update);
}

bool AttributionEngine::checkStop(RunReport& report, const char* stage)
{
    if (!stopRequested())
        return false;
    if (!report.stopped())
        logging::get()->warn("stop requested, leaving {} early", stage);
    report.markStopped();
    return true;
}

} // namespace attribution
