#pragma once
#include <map>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace attribution {

    /** Logger setup. */
    struct LoggingConfig {
        std::string level = "info"; ///< trace, debug, info, warn, error
        std::string file;           ///< optional log file, empty = console only
    };

    /** Editor markers used for selection and write stamping. */
    struct EditorConfig {
        std::string authoritative = "COSPW";  ///< records last edited by it are never selected
        std::string engine = "ATTRIBUTOR";    ///< stamped into lastEditor on every write
    };

    /** Enumerated attribute codes of the store. */
    struct CodeConfig {
        int primaryOwner = 1;   ///< OWNEDBY of the primary operator
        int privateOwner = -2;  ///< OWNEDBY of private owners
        int asBuiltStage = 0;   ///< STAGE of as-built assets
        std::map<std::string, int> waterTypes{{"SS", 1}, {"CB", 2}, {"SW", 3}}; ///< text -> numeric

        /** Numeric code of a water type, 0 when unknown or empty. */
        int waterCode(const std::string& waterType) const;
    };

    /** Spatial fingerprint digit scheme. */
    struct FingerprintConfig {
        int padWidth = 6; ///< integer parts are left-padded with zeros to this width
    };

    /** Zone sequence formatting. */
    struct SequenceConfig {
        int width = 3;                                ///< zero-padded digits of the suffix
        std::string separators = "-";                 ///< stripped from zone codes
        std::vector<std::string> stripTokens{"SD"};   ///< removed before parsing a suffix
        bool fingerprintFallback = false;             ///< ZoneNotFound -> use the spatial id
    };

    /** Endpoint resolution of line assets. */
    struct EndpointConfig {
        std::vector<std::string> categories{"Manhole"}; ///< point categories searched
        double tolerance = 0.0;                         ///< 0 = exact coincidence
    };

    /**
     * Complete deployment configuration. The category registry and the rule
     * table are kept as YAML nodes and compiled by CategoryRegistry and
     * AttributionRule.
     */
    struct AttributorConfig {
        LoggingConfig logging;
        EditorConfig editor;
        CodeConfig codes;
        FingerprintConfig fingerprint;
        SequenceConfig sequence;
        EndpointConfig endpoints;
        YAML::Node categories;                            ///< "categories" section
        YAML::Node rules;                                 ///< "rules" section
        std::string defaultStrategy = "FingerprintOnly";  ///< when no rule matches
    };

    /** Parse a configuration tree; throws ConfigError on invalid values. */
    AttributorConfig parseConfig(const YAML::Node& root);

    /** Load and parse a configuration file; throws ConfigError. */
    AttributorConfig loadConfig(const std::string& path);

} // namespace attribution
