#pragma once
/*-----------------------------------------------------------------------------
 *  fingerprint.hpp
 *
 *  Spatial identifier derived from coordinates only.
 *
 *      x = 123456.7  ->  "123456"      y = 987654.3  ->  "987654"
 *      token = x[2:4] y[2:4] '-' x[4] y[4] '-' x[-2:] y[-2:]
 *            = "3476-55-5654"
 *
 *  The truncated integer part of |v| is left-padded with zeros to padWidth
 *  digits first, so small coordinates never index past the string.
 *---------------------------------------------------------------------------*/
#include <string>
#include <opencv2/core.hpp>

namespace attribution {

class CoordinateFingerprint
{
public:
    explicit CoordinateFingerprint(int padWidth = 6);

    /** Token of one coordinate pair; throws MalformedGeometry if non-finite. */
    std::string point(double x, double y) const;
    std::string point(const cv::Point2d& p) const { return point(p.x, p.y); }

    /** Line token: start + "_" + end. */
    static std::string line(const std::string& startToken, const std::string& endToken);

    /** Zero-padded digits of the truncated |value|. */
    std::string integerDigits(double value) const;

    int padWidth() const noexcept { return padWidth_; }

private:
    int padWidth_;
};

} // namespace attribution
