#include "fingerprint.hpp"

#include <cmath>
#include <cstdint>

#include "../errors.hpp"
#include "../utils.hpp"

namespace attribution {

namespace {

// Beyond this the truncated value no longer fits the integer conversion.
constexpr double kMaxMagnitude = 1.0e15;

} // namespace

CoordinateFingerprint::CoordinateFingerprint(int padWidth)
    : padWidth_{padWidth}
{
    if (padWidth_ < 5)
        throw ConfigError("fingerprint pad width must be at least 5, got " +
                          std::to_string(padWidth_));
}

std::string CoordinateFingerprint::integerDigits(double value) const
{
    if (!std::isfinite(value))
        throw MalformedGeometry("coordinate is not finite");

    const double truncated = std::fabs(std::trunc(value));
    if (truncated >= kMaxMagnitude)
        throw MalformedGeometry("coordinate out of range: " + std::to_string(value));

    return zeroPad(std::to_string(static_cast<std::int64_t>(truncated)),
                   static_cast<std::size_t>(padWidth_));
}

std::string CoordinateFingerprint::point(double x, double y) const
{
    const std::string xs = integerDigits(x);
    const std::string ys = integerDigits(y);

    std::string token;
    token.reserve(12);
    token += xs.substr(2, 2);
    token += ys.substr(2, 2);
    token += '-';
    token += xs[4];
    token += ys[4];
    token += '-';
    token += xs.substr(xs.size() - 2);
    token += ys.substr(ys.size() - 2);
    return token;
}

std::string CoordinateFingerprint::line(const std::string& startToken, const std::string& endToken)
{
    return startToken + "_" + endToken;
}

} // namespace attribution
