#include "runreport.hpp"

#include <sstream>

#include "../logging.hpp"

namespace attribution {

std::string toString(SkipReason reason)
{
    switch (reason)
    {
    case SkipReason::Malformed: return "malformed";
    case SkipReason::NoZone:    return "no-zone";
    case SkipReason::Ambiguous: return "ambiguous";
    case SkipReason::Failed:    return "failed";
    }
    return "unknown";
}

void RunReport::skip(const Asset& asset, SkipReason reason, const std::string& message)
{
    CategoryCounts& c = counts_[asset.category];
    switch (reason)
    {
    case SkipReason::Malformed: c.skippedMalformed++; break;
    case SkipReason::NoZone:    c.skippedNoZone++;    break;
    case SkipReason::Ambiguous: c.skippedAmbiguous++; break;
    case SkipReason::Failed:    c.failed++;           break;
    }
    issues_.push_back({asset.id, asset.category, reason, message});
    logging::get()->warn("asset {} ({}) skipped: {}: {}",
                         asset.id, asset.category, toString(reason), message);
}

void RunReport::failBatch(const std::string& zone, const std::string& group, const std::string& message)
{
    failed_batches_.push_back({zone, group, message});
    logging::get()->error("zone batch {} / {} failed: {}", zone, group, message);
}

std::string RunReport::summaryLine() const
{
    std::ostringstream out;
    out << "SUMMARY -";
    if (counts_.empty())
        out << " nothing eligible";
    for (const auto& [category, c] : counts_)
        out << " " << category << "{attributed=" << c.attributed
            << " pending=" << c.pending
            << " skipped-malformed=" << c.skippedMalformed
            << " skipped-no-zone=" << c.skippedNoZone
            << " skipped-ambiguous=" << c.skippedAmbiguous
            << " failed=" << c.failed << "}";
    return out.str();
}

void RunReport::logSummary() const
{
    auto log = logging::get();
    log->info("{}", summaryLine());
    if (!failed_batches_.empty())
        log->error("SUMMARY {} zone batch(es) failed", failed_batches_.size());
}

CategoryCounts RunReport::countsFor(const std::string& category) const
{
    auto it = counts_.find(category);
    return it == counts_.end() ? CategoryCounts{} : it->second;
}

} // namespace attribution
