#pragma once
/*-----------------------------------------------------------------------------
 *  errors.hpp
 *
 *  Error taxonomy of the attribution engine. Per-asset errors are caught and
 *  recorded by the engine, zone-batch errors fail one (zone, group) batch,
 *  StoreUnavailable aborts the run.
 *---------------------------------------------------------------------------*/
#include <stdexcept>
#include <string>

namespace attribution {

/** Base class for every error raised by the attribution modules. */
class AttributionError : public std::runtime_error
{
public:
    explicit AttributionError(const std::string& what) : std::runtime_error(what) {}
};

/* ---------- per-asset ----------------------------------------------------- */
/** Coordinate missing, non-finite or geometry of the wrong shape. */
class MalformedGeometry : public AttributionError
{
public:
    using AttributionError::AttributionError;
};

/** Point is not strictly inside any zone polygon. */
class ZoneNotFound : public AttributionError
{
public:
    using AttributionError::AttributionError;
};

/** Point is inside more than one zone polygon (overlapping partition). */
class AmbiguousZone : public AttributionError
{
public:
    using AttributionError::AttributionError;
};

/** Store refused a facility id already used in the category namespace. */
class DuplicateFacilityId : public AttributionError
{
public:
    DuplicateFacilityId(const std::string& facilityId, const std::string& what)
        : AttributionError(what), facilityId_(facilityId) {}

    const std::string& facilityId() const noexcept { return facilityId_; }

private:
    std::string facilityId_;
};

/* ---------- per-zone ------------------------------------------------------ */
/** A freshly allocated sequence id already exists: a concurrent writer ran. */
class ZoneAllocationConflict : public AttributionError
{
public:
    using AttributionError::AttributionError;
};

/** The zone counter would need more digits than the configured width. */
class SequenceExhausted : public AttributionError
{
public:
    using AttributionError::AttributionError;
};

/* ---------- per-run ------------------------------------------------------- */
/** Store cannot be read or written. */
class StoreUnavailable : public AttributionError
{
public:
    using AttributionError::AttributionError;
};

/** Invalid configuration file, rule table or category registry. */
class ConfigError : public AttributionError
{
public:
    using AttributionError::AttributionError;
};

} // namespace attribution
