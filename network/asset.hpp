#pragma once
/*-----------------------------------------------------------------------------
 *  asset.hpp
 *
 *  One network record of the shared store (manhole, cleanout, main, ...)
 *  together with the derived identifier fields the engine owns.
 *---------------------------------------------------------------------------*/
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace attribution {

using AssetId = std::uint64_t;

/** Geometry shape of a category. */
enum class GeometryKind : std::uint8_t
{
    Point   = 0,
    Line    = 1,
    Polygon = 2,
};

/**
 * @brief Raw geometry as stored.
 *
 * Point: one vertex. Line: two or more vertices, start = front, end = back.
 * Polygon: closed ring of three or more vertices (closing vertex optional).
 */
struct AssetGeometry
{
    std::vector<cv::Point2d> vertices;

    [[nodiscard]] bool empty() const noexcept { return vertices.empty(); }
    [[nodiscard]] const cv::Point2d& start() const { return vertices.front(); }
    [[nodiscard]] const cv::Point2d& end()   const { return vertices.back(); }
};

/**
 * @brief A network asset and its attribution fields.
 *
 * `spatialId`, `facilityId`, `endpointFrom`, `endpointTo`, `spatialStart`,
 * `spatialEnd` and `elevation` are written by the engine only, each at most
 * once.
 */
struct Asset
{
    AssetId                    id{0};           ///< store primary key
    std::string                category;        ///< "Manhole", "GravityMain", ...
    AssetGeometry              geometry;        ///< raw geometry
    int                        ownership{0};    ///< OWNEDBY code
    std::string                waterType;       ///< "SS", "CB", "SW" or empty
    int                        stage{0};        ///< 0 = as-built
    std::string                lastEditor;      ///< last modification source

    /* recorded coordinate fields (NAD83X/Y, ...START/END) */
    std::optional<cv::Point2d> point;           ///< points and polygon centroids
    std::optional<cv::Point2d> lineStart;
    std::optional<cv::Point2d> lineEnd;

    std::optional<std::string> spatialStart;    ///< lines only
    std::optional<std::string> spatialEnd;      ///< lines only
    std::optional<std::string> spatialId;
    std::optional<std::string> facilityId;
    std::optional<std::string> endpointFrom;    ///< FROMMH, lines only
    std::optional<std::string> endpointTo;      ///< TOMH, lines only
    std::optional<double>      elevation;       ///< surveyed Z, points only
};

/**
 * @brief Field-level update of one asset, applied all-or-nothing.
 *
 * Only engaged fields are written. The store refuses to overwrite a field
 * that already holds a different value.
 */
struct AssetUpdate
{
    AssetId                    id{0};
    std::optional<cv::Point2d> point;
    std::optional<cv::Point2d> lineStart;
    std::optional<cv::Point2d> lineEnd;
    std::optional<std::string> spatialStart;
    std::optional<std::string> spatialEnd;
    std::optional<std::string> spatialId;
    std::optional<std::string> facilityId;
    std::optional<std::string> endpointFrom;
    std::optional<std::string> endpointTo;
    std::optional<double>      elevation;
    std::optional<std::string> lastEditor;

    [[nodiscard]] bool empty() const noexcept
    {
        return !point && !lineStart && !lineEnd && !spatialStart && !spatialEnd &&
               !spatialId && !facilityId && !endpointFrom && !endpointTo && !elevation;
    }
};

/** Surveyed GPS node; read-only source of elevations. */
struct SurveyNode
{
    AssetId     id{0};
    cv::Point2d position;
    double      z{0.0};
};

} // namespace attribution
