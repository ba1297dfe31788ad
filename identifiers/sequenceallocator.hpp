#pragma once
/*-----------------------------------------------------------------------------
 *  sequenceallocator.hpp
 *
 *  Zone-scoped sequence identifiers: sanitized zone code + zero-padded
 *  counter + optional category suffix ("14-14" -> "1414071", "1414072C").
 *
 *  The counter state of one (zone, sequence group) pair is an explicit value:
 *  scan() derives it from the identifiers already in the store, next()
 *  advances it. Nothing is cached between calls.
 *---------------------------------------------------------------------------*/
#include <optional>
#include <string>
#include <vector>

#include "../config.hpp"

namespace attribution {

/** Counter state of one (zone, sequence group) pair. */
struct SequenceState
{
    std::string token;      ///< sanitized zone code
    long long   maximum{0}; ///< highest suffix in use, 0 if none
};

class ZoneSequenceAllocator
{
public:
    explicit ZoneSequenceAllocator(SequenceConfig cfg = {});

    /** Strip separator characters; throws ZoneNotFound if nothing is left. */
    std::string sanitize(const std::string& zoneCode) const;

    /**
     * Numeric suffix of an existing identifier of zone `token`, or nullopt.
     * Marker tokens and any of `suffixes` are removed first; the remaining
     * text must be exactly `token` followed by `width` digits.
     */
    std::optional<long long> parseSuffix(const std::string& facilityId,
                                         const std::string& token,
                                         const std::vector<std::string>& suffixes) const;

    /** Current maximum of zone `zoneCode` among `existingIds`. */
    SequenceState scan(const std::string& zoneCode,
                       const std::vector<std::string>& existingIds,
                       const std::vector<std::string>& suffixes) const;

    /** Advance `state` by one and format the identifier; throws SequenceExhausted. */
    std::string next(SequenceState& state, const std::string& suffix) const;

    /** Single allocation: scan + next. */
    std::string allocate(const std::string& zoneCode,
                         const std::string& suffix,
                         const std::vector<std::string>& existingIds) const;

    /**
     * `count` consecutive identifiers for one zone, strictly increasing from
     * the current maximum + 1. All-or-nothing: throws SequenceExhausted before
     * returning anything if the width would overflow.
     */
    std::vector<std::string> allocate(const std::string& zoneCode,
                                      const std::string& suffix,
                                      const std::vector<std::string>& existingIds,
                                      std::size_t count) const;

    const SequenceConfig& config() const noexcept { return cfg_; }

private:
    SequenceConfig cfg_;
    long long      limit_;   ///< largest value that fits `width` digits
};

} // namespace attribution
