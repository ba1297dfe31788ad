#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>
#include <exprtk.hpp>

#include "../config.hpp"
#include "../network/asset.hpp"
#include "../network/categoryregistry.h"

namespace attribution {

/** Naming strategy an asset is routed to. */
enum class Strategy
{
    FingerprintOnly, ///< facility id = spatial id
    ZoneSequence,    ///< sanitized zone code + sequence
    EndpointPair,    ///< FROMMH + "-" + TOMH
    Deferred,        ///< spatial fields only, no facility id this run
};

std::string toString(Strategy s);

/** Throws ConfigError for an unknown name. */
Strategy parseStrategy(const std::string& name);

/** Result of classify(): the strategy and the rule that produced it. */
struct RuleMatch
{
    Strategy    strategy{Strategy::FingerprintOnly};
    std::string rule;    ///< matching rule name, "default" if none matched
};

/**
 * @brief Rule-based router from asset attributes to a naming strategy.
 *
 * Rules come from the "rules" section, are ordered by priority (higher
 * first, file order on ties) and the first match wins:
 *
 *   - name: city_points_sequence
 *     priority: 100
 *     categories: [Manhole, Cleanout]
 *     expr: "owner == primary and stage == as_built and water != SW"
 *     strategy: ZoneSequence
 *
 * Expression variables: point, line, polygon, owner, stage, water;
 * constants: primary, private_owner, as_built and one per water type code.
 */
class AttributionRule
{
    struct Rule
    {
        std::string                name;       ///< rule identifier
        int                        priority{0};///< higher value processed first
        std::vector<std::string>   categories; ///< empty = every category
        Strategy                   strategy{Strategy::FingerprintOnly};
        exprtk::expression<double> expr;       ///< compiled predicate
    };

public:
    AttributionRule(const YAML::Node& rules_y,
                    const CategoryRegistry& registry,
                    const CodeConfig& codes,
                    const std::string& defaultStrategy);

    AttributionRule(const AttributionRule&) = delete;
    AttributionRule& operator=(const AttributionRule&) = delete;

    /** Classify one asset; throws AttributionError for an unknown category. */
    RuleMatch classify(const Asset& asset) const;

    std::size_t size() const noexcept { return rules_.size(); }

private:
    /** Parse YAML rules and compile their expressions. */
    void loadRules(const YAML::Node& rules_y);

    double* addVar(const std::string& name);
    void    addConstant(const std::string& name, double value);

    const CategoryRegistry&          registry_;
    CodeConfig                       codes_;
    Strategy                         default_;

    exprtk::symbol_table<double>     syms_;
    exprtk::parser<double>           parser_;

    // Pointers to asset vars (for speed)
    double *point_{nullptr}, *line_{nullptr}, *polygon_{nullptr};
    double *owner_{nullptr}, *stage_{nullptr}, *water_{nullptr};

    std::vector<Rule>                        rules_;     ///< ordered rule list
    std::unordered_map<std::string, double>  var_pool_;  ///< backing storage for variables
};

} // namespace attribution
