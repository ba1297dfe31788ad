#include "config.hpp"

#include "errors.hpp"

namespace attribution {

int CodeConfig::waterCode(const std::string& waterType) const
{
    auto it = waterTypes.find(waterType);
    return it == waterTypes.end() ? 0 : it->second;
}

namespace {

template<typename T>
void readOptional(const YAML::Node& node, const char* key, T& target)
{
    if (node[key])
        target = node[key].as<T>();
}

} // namespace

AttributorConfig parseConfig(const YAML::Node& root)
{
    AttributorConfig cfg;
    if (!root || !root.IsMap())
        throw ConfigError("configuration root is not a map");

    try {
        if (const YAML::Node n = root["logging"]) {
            readOptional(n, "level", cfg.logging.level);
            readOptional(n, "file", cfg.logging.file);
        }
        if (const YAML::Node n = root["editor"]) {
            readOptional(n, "authoritative", cfg.editor.authoritative);
            readOptional(n, "engine", cfg.editor.engine);
        }
        if (const YAML::Node n = root["codes"]) {
            readOptional(n, "primary_owner", cfg.codes.primaryOwner);
            readOptional(n, "private_owner", cfg.codes.privateOwner);
            readOptional(n, "as_built_stage", cfg.codes.asBuiltStage);
            if (n["water_types"])
                cfg.codes.waterTypes = n["water_types"].as<std::map<std::string, int>>();
        }
        if (const YAML::Node n = root["fingerprint"])
            readOptional(n, "pad_width", cfg.fingerprint.padWidth);
        if (const YAML::Node n = root["sequence"]) {
            readOptional(n, "width", cfg.sequence.width);
            readOptional(n, "separators", cfg.sequence.separators);
            readOptional(n, "strip_tokens", cfg.sequence.stripTokens);
            readOptional(n, "fingerprint_fallback", cfg.sequence.fingerprintFallback);
        }
        if (const YAML::Node n = root["endpoints"]) {
            readOptional(n, "categories", cfg.endpoints.categories);
            readOptional(n, "tolerance", cfg.endpoints.tolerance);
        }
        readOptional(root, "default_strategy", cfg.defaultStrategy);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    cfg.categories = root["categories"];
    cfg.rules = root["rules"];

    if (cfg.fingerprint.padWidth < 5)
        throw ConfigError("fingerprint.pad_width must be at least 5");
    if (cfg.sequence.width < 1 || cfg.sequence.width > 9)
        throw ConfigError("sequence.width must be within 1..9");
    if (cfg.endpoints.tolerance < 0.0)
        throw ConfigError("endpoints.tolerance must not be negative");
    if (!cfg.categories || !cfg.categories.IsMap())
        throw ConfigError("section 'categories' missing or not a map");
    if (!cfg.rules || !cfg.rules.IsSequence())
        throw ConfigError("section 'rules' missing or not a list");

    return cfg;
}

AttributorConfig loadConfig(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to load config file '" + path + "': " + e.what());
    }
    return parseConfig(root);
}

} // namespace attribution
