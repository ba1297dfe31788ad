#include "categoryregistry.h"

#include <algorithm>
#include <unordered_set>

#include "../errors.hpp"

namespace attribution {

GeometryKind CategoryRegistry::parseKind(const std::string& kind, const std::string& category)
{
    if (kind == "point")   return GeometryKind::Point;
    if (kind == "line")    return GeometryKind::Line;
    if (kind == "polygon") return GeometryKind::Polygon;
    throw ConfigError("category '" + category + "': unknown kind '" + kind + "'");
}

void CategoryRegistry::load(const YAML::Node& categories_y)
{
    by_name_.clear();

    if (!categories_y || !categories_y.IsMap())
        throw ConfigError("CategoryRegistry::load(): 'categories' node not a map");

    std::unordered_set<std::uint16_t> used_ids;
    for (const auto& kv : categories_y)
    {
        const std::string name = kv.first.as<std::string>();
        const YAML::Node body = kv.second;
        if (!body["kind"])
            throw ConfigError("category '" + name + "': 'kind' missing");

        /* 1. fill every field before moving into the map */
        auto ci = std::make_unique<CategoryInfo>();
        try {
            ci->id = body["id"]
                   ? body["id"].as<std::uint16_t>()
                   : static_cast<std::uint16_t>(by_name_.size() + 1);
            ci->name = name;
            ci->kind = parseKind(body["kind"].as<std::string>(), name);
            ci->suffix = body["suffix"] ? body["suffix"].as<std::string>() : std::string{};
            ci->sequenceGroup = body["sequence_group"]
                              ? body["sequence_group"].as<std::string>()
                              : name;
            ci->elevation = body["elevation"] && body["elevation"].as<bool>();
        } catch (const YAML::Exception& e) {
            throw ConfigError("category '" + name + "': " + e.what());
        }

        if (!used_ids.insert(ci->id).second)
            throw ConfigError("category '" + name + "': duplicate id " + std::to_string(ci->id));
        if (ci->elevation && ci->kind != GeometryKind::Point)
            throw ConfigError("category '" + name + "': elevation applies to point categories only");

        by_name_[name] = std::move(ci);
    }

    /* 2. a shared counter only makes sense between point categories */
    for (const auto& kv : by_name_)
    {
        const auto members = group(kv.second->sequenceGroup);
        if (members.size() < 2)
            continue;
        for (const CategoryInfo* member : members)
        {
            if (member->kind != GeometryKind::Point)
                throw ConfigError("sequence group '" + kv.second->sequenceGroup +
                                  "' contains non-point category '" + member->name + "'");
        }
    }
}

const CategoryInfo* CategoryRegistry::get(const std::string& name) const
{
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second.get();
}

std::vector<const CategoryInfo*> CategoryRegistry::group(const std::string& sequenceGroup) const
{
    std::vector<const CategoryInfo*> out;
    for (const auto& kv : by_name_)
        if (kv.second->sequenceGroup == sequenceGroup)
            out.push_back(kv.second.get());
    std::sort(out.begin(), out.end(),
              [](const CategoryInfo* a, const CategoryInfo* b){ return a->id < b->id; });
    return out;
}

std::vector<const CategoryInfo*> CategoryRegistry::all() const
{
    std::vector<const CategoryInfo*> out;
    out.reserve(by_name_.size());
    for (const auto& kv : by_name_)
        out.push_back(kv.second.get());
    std::sort(out.begin(), out.end(),
              [](const CategoryInfo* a, const CategoryInfo* b){ return a->id < b->id; });
    return out;
}

std::string toString(GeometryKind kind)
{
    switch (kind)
    {
    case GeometryKind::Point:   return "point";
    case GeometryKind::Line:    return "line";
    case GeometryKind::Polygon: return "polygon";
    }
    return "unknown";
}

} // namespace attribution
