#ifndef UTILS_H
#define UTILS_H

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace attribution {

// Remove every character listed in `separators` ("14-14" -> "1414").
inline std::string stripCharacters(const std::string& value, const std::string& separators)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (separators.find(c) == std::string::npos)
            out.push_back(c);
    }
    return out;
}

// Remove all occurrences of `token` ("1414SD065" without "SD" -> "1414065").
inline std::string eraseToken(std::string value, const std::string& token)
{
    if (token.empty())
        return value;
    std::size_t pos = value.find(token);
    while (pos != std::string::npos) {
        value.erase(pos, token.size());
        pos = value.find(token, pos);
    }
    return value;
}

// Left-pad with zeros up to `width` characters; longer values are kept as is.
inline std::string zeroPad(const std::string& digits, std::size_t width)
{
    if (digits.size() >= width)
        return digits;
    return std::string(width - digits.size(), '0') + digits;
}

inline std::string zeroPad(long long value, std::size_t width)
{
    return zeroPad(std::to_string(value), width);
}

inline bool allDigits(const std::string& s)
{
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
}

inline bool endsWith(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool isFinite(const cv::Point2d& p)
{
    return std::isfinite(p.x) && std::isfinite(p.y);
}

// Two points are coincident when both axes differ by at most `tolerance`.
// tolerance == 0 means exact equality.
inline bool coincident(const cv::Point2d& a, const cv::Point2d& b, double tolerance)
{
    return std::fabs(a.x - b.x) <= tolerance && std::fabs(a.y - b.y) <= tolerance;
}

inline std::string formatPoint(const cv::Point2d& p)
{
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

} // namespace attribution

#endif // UTILS_H
