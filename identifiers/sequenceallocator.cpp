#include "sequenceallocator.hpp"

#include <algorithm>

#include "../errors.hpp"
#include "../utils.hpp"

namespace attribution {

ZoneSequenceAllocator::ZoneSequenceAllocator(SequenceConfig cfg)
    : cfg_{std::move(cfg)}
    , limit_{1}
{
    if (cfg_.width < 1 || cfg_.width > 9)
        throw ConfigError("sequence width must be within 1..9");
    for (int i = 0; i < cfg_.width; ++i)
        limit_ *= 10;
    limit_ -= 1;
}

std::string ZoneSequenceAllocator::sanitize(const std::string& zoneCode) const
{
    std::string token = stripCharacters(zoneCode, cfg_.separators);
    if (token.empty())
        throw ZoneNotFound("zone code '" + zoneCode + "' is empty after sanitizing");
    return token;
}

std::optional<long long> ZoneSequenceAllocator::parseSuffix(const std::string& facilityId,
                                                            const std::string& token,
                                                            const std::vector<std::string>& suffixes) const
{
    std::string id = facilityId;
    for (const auto& marker : cfg_.stripTokens)
        id = eraseToken(id, marker);
    for (const auto& suffix : suffixes)
    {
        if (!suffix.empty() && endsWith(id, suffix))
        {
            id.erase(id.size() - suffix.size());
            break;
        }
    }

    /* exactly <token><digits>; "1414065" does not belong to zone token "414" */
    const auto width = static_cast<std::size_t>(cfg_.width);
    if (id.size() != width + token.size())
        return std::nullopt;

    const std::string digits = id.substr(id.size() - width);
    const std::string head   = id.substr(0, id.size() - width);
    if (!allDigits(digits) || head != token)
        return std::nullopt;

    return std::stoll(digits);
}

SequenceState ZoneSequenceAllocator::scan(const std::string& zoneCode,
                                          const std::vector<std::string>& existingIds,
                                          const std::vector<std::string>& suffixes) const
{
    SequenceState state;
    state.token = sanitize(zoneCode);

    for (const auto& id : existingIds)
    {
        if (id.find(state.token) == std::string::npos) continue;
        if (auto value = parseSuffix(id, state.token, suffixes))
            state.maximum = std::max(state.maximum, *value);
    }
    return state;
}

std::string ZoneSequenceAllocator::next(SequenceState& state, const std::string& suffix) const
{
    if (state.maximum >= limit_)
        throw SequenceExhausted("zone '" + state.token + "' has no " +
                                std::to_string(cfg_.width) + "-digit sequence left after " +
                                std::to_string(state.maximum));
    ++state.maximum;
    return state.token + zeroPad(state.maximum, static_cast<std::size_t>(cfg_.width)) + suffix;
}

std::string ZoneSequenceAllocator::allocate(const std::string& zoneCode,
                                            const std::string& suffix,
                                            const std::vector<std::string>& existingIds) const
{
    SequenceState state = scan(zoneCode, existingIds, {suffix});
    return next(state, suffix);
}

std::vector<std::string> ZoneSequenceAllocator::allocate(const std::string& zoneCode,
                                                         const std::string& suffix,
                                                         const std::vector<std::string>& existingIds,
                                                         std::size_t count) const
{
    SequenceState state = scan(zoneCode, existingIds, {suffix});
    if (static_cast<long long>(count) > limit_ - state.maximum)
        throw SequenceExhausted("zone '" + state.token + "' cannot take " +
                                std::to_string(count) + " more identifiers after " +
                                std::to_string(state.maximum));

    std::vector<std::string> ids;
    ids.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        ids.push_back(next(state, suffix));
    return ids;
}

} // namespace attribution
