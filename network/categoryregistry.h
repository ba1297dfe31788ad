#ifndef CATEGORYREGISTRY_H
#define CATEGORYREGISTRY_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "asset.hpp"

namespace attribution {

/* Category description, extensible without recompilation */
struct CategoryInfo
{
    std::uint16_t id{0};          // numeric code, registry order when not given
    std::string   name;           // "Cleanout"
    GeometryKind  kind{GeometryKind::Point};
    std::string   suffix;         // appended after the sequence digits, "C"
    std::string   sequenceGroup;  // categories of one group share a zone counter
    bool          elevation{false}; // copy Z from coincident survey nodes
};

/**
 * @brief Registry of asset categories loaded from the "categories" section.
 *
 *   categories:
 *     Manhole:  { kind: point, elevation: true }
 *     Cleanout: { kind: point, suffix: C }
 *     GravityMain: { kind: line }
 */
class CategoryRegistry
{
public:
    /** Parse the section; throws ConfigError on an invalid entry. */
    void load(const YAML::Node& categories_y);

    /** nullptr for an unknown name. */
    const CategoryInfo* get(const std::string& name) const;

    /** All categories of a sequence group, ordered by id. */
    std::vector<const CategoryInfo*> group(const std::string& sequenceGroup) const;

    /** All categories ordered by id. */
    std::vector<const CategoryInfo*> all() const;

    std::size_t size() const noexcept { return by_name_.size(); }

private:
    std::unordered_map<std::string, std::unique_ptr<CategoryInfo>> by_name_;

    static GeometryKind parseKind(const std::string& kind, const std::string& category);
};

/** "point", "line", "polygon". */
std::string toString(GeometryKind kind);

} // namespace attribution

#endif // CATEGORYREGISTRY_H
