#pragma once
/*-----------------------------------------------------------------------------
 *  runreport.hpp
 *
 *  Outcome of one engine run: per-category counters, failed zone batches and
 *  one detail line per skipped or failed asset.
 *---------------------------------------------------------------------------*/
#include <map>
#include <string>
#include <vector>

#include "../network/asset.hpp"

namespace attribution {

/** Why an asset was not attributed in this run. */
enum class SkipReason
{
    Malformed,   ///< MalformedGeometry
    NoZone,      ///< ZoneNotFound
    Ambiguous,   ///< AmbiguousZone
    Failed,      ///< rejected write or failed zone batch
};

std::string toString(SkipReason reason);

/** Counters of one category. */
struct CategoryCounts
{
    std::size_t attributed{0};        ///< facility id written this run
    std::size_t pending{0};           ///< spatial fields only (deferred, endpoint incomplete)
    std::size_t skippedMalformed{0};
    std::size_t skippedNoZone{0};
    std::size_t skippedAmbiguous{0};
    std::size_t failed{0};
};

/** One skipped or failed asset. */
struct AssetIssue
{
    AssetId     id{0};
    std::string category;
    SkipReason  reason{SkipReason::Failed};
    std::string message;
};

/** Zone batch that failed as a whole. */
struct FailedBatch
{
    std::string zone;          ///< raw zone code
    std::string group;         ///< sequence group
    std::string message;
};

class RunReport
{
public:
    void attributed(const std::string& category) { counts_[category].attributed++; }
    void pending(const std::string& category)    { counts_[category].pending++; }

    /** Record a skipped/failed asset and log its detail line. */
    void skip(const Asset& asset, SkipReason reason, const std::string& message);

    /** Record a failed zone batch and log it as an error. */
    void failBatch(const std::string& zone, const std::string& group, const std::string& message);

    /** Single run-summary line, counters grouped per category. */
    std::string summaryLine() const;
    void logSummary() const;

    bool hasFailedBatches() const noexcept { return !failed_batches_.empty(); }

    /** The run stopped early on request. */
    void markStopped() noexcept { stopped_ = true; }
    bool stopped() const noexcept { return stopped_; }

    const std::map<std::string, CategoryCounts>& counts()        const noexcept { return counts_; }
    const std::vector<AssetIssue>&               issues()        const noexcept { return issues_; }
    const std::vector<FailedBatch>&              failedBatches() const noexcept { return failed_batches_; }

    /** Counters of `category`, all zero when it was never seen. */
    CategoryCounts countsFor(const std::string& category) const;

private:
    std::map<std::string, CategoryCounts> counts_;
    std::vector<AssetIssue>               issues_;
    std::vector<FailedBatch>              failed_batches_;
    bool                                  stopped_{false};
};

} // namespace attribution
