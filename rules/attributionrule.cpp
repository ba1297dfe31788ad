#include "attributionrule.h"

#include <algorithm>

#include "../errors.hpp"

namespace attribution {

std::string toString(Strategy s)
{
    switch (s)
    {
    case Strategy::FingerprintOnly: return "FingerprintOnly";
    case Strategy::ZoneSequence:    return "ZoneSequence";
    case Strategy::EndpointPair:    return "EndpointPair";
    case Strategy::Deferred:        return "Deferred";
    }
    return "Unknown";
}

Strategy parseStrategy(const std::string& name)
{
    if (name == "FingerprintOnly") return Strategy::FingerprintOnly;
    if (name == "ZoneSequence")    return Strategy::ZoneSequence;
    if (name == "EndpointPair")    return Strategy::EndpointPair;
    if (name == "Deferred")        return Strategy::Deferred;
    throw ConfigError("unknown strategy '" + name + "'");
}

AttributionRule::AttributionRule(const YAML::Node& rules_y,
                                 const CategoryRegistry& registry,
                                 const CodeConfig& codes,
                                 const std::string& defaultStrategy)
    : registry_(registry)
    , codes_(codes)
    , default_(parseStrategy(defaultStrategy))
{
    loadRules(rules_y);
}

RuleMatch AttributionRule::classify(const Asset& asset) const
{
    const CategoryInfo* category = registry_.get(asset.category);
    if (!category)
        throw AttributionError("unknown category '" + asset.category + "'");

    /* 1. fill the asset variables */
    *point_   = category->kind == GeometryKind::Point   ? 1.0 : 0.0;
    *line_    = category->kind == GeometryKind::Line    ? 1.0 : 0.0;
    *polygon_ = category->kind == GeometryKind::Polygon ? 1.0 : 0.0;
    *owner_   = static_cast<double>(asset.ownership);
    *stage_   = static_cast<double>(asset.stage);
    *water_   = static_cast<double>(codes_.waterCode(asset.waterType));

    /* 2. rules in priority order, first match wins */
    for (const auto& rule : rules_)
    {
        if (!rule.categories.empty() &&
            std::find(rule.categories.begin(), rule.categories.end(), asset.category) == rule.categories.end())
            continue;

        if (rule.expr.value() != 0.0)
            return RuleMatch{rule.strategy, rule.name};
    }

    /* 3. fallback */
    return RuleMatch{default_, "default"};
}

void AttributionRule::loadRules(const YAML::Node& rules_y)
{
    if (!rules_y || !rules_y.IsSequence())
        throw ConfigError("AttributionRule: section 'rules' missing or not a list");

    // ❶ asset variables
    point_   = addVar("point");
    line_    = addVar("line");
    polygon_ = addVar("polygon");
    owner_   = addVar("owner");
    stage_   = addVar("stage");
    water_   = addVar("water");

    // ❷ code constants
    addConstant("primary", codes_.primaryOwner);
    addConstant("private_owner", codes_.privateOwner);
    addConstant("as_built", codes_.asBuiltStage);
    for (const auto& kv : codes_.waterTypes)
        addConstant(kv.first, kv.second);

    // ❸ parse every rule, compile its expression
    for (const auto& y : rules_y)
    {
        Rule r;
        try {
            r.name     = y["name"].as<std::string>();
            r.priority = y["priority"] ? y["priority"].as<int>() : 0;
            r.strategy = parseStrategy(y["strategy"].as<std::string>());
            if (y["categories"])
                r.categories = y["categories"].as<std::vector<std::string>>();
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("invalid rule entry: ") + e.what());
        }

        for (const auto& c : r.categories)
            if (!registry_.get(c))
                throw ConfigError("rule '" + r.name + "' names unknown category '" + c + "'");

        const std::string expr_str = y["expr"] ? y["expr"].as<std::string>() : std::string("1");
        r.expr.register_symbol_table(syms_);
        if (!parser_.compile(expr_str, r.expr))
            throw ConfigError("ExprTk error in rule '" + r.name + "': " + parser_.error());

        rules_.push_back(std::move(r));
    }

    // ❹ sort by priority ↓, file order kept on ties
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const Rule& a, const Rule& b){ return a.priority > b.priority; });
}

double* AttributionRule::addVar(const std::string& name)
{
    double& slot = var_pool_[name];   // default-initialised to zero
    if (!syms_.add_variable(name, slot))
        throw ConfigError("AttributionRule: cannot register variable '" + name + "'");
    return &slot;
}

void AttributionRule::addConstant(const std::string& name, double value)
{
    if (!syms_.add_constant(name, value))
        throw ConfigError("AttributionRule: cannot register constant '" + name +
                          "' (clashes with a variable or is not a valid name)");
}

} // namespace attribution
