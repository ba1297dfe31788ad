#pragma once
/*-----------------------------------------------------------------------------
 *  storeyaml.hpp
 *
 *  YAML file backing for InMemoryAssetStore:
 *
 *    zones:
 *      - { code: "14-14", ring: [[0, 0], [1000, 0], [1000, 1000], [0, 1000]] }
 *    survey_nodes:
 *      - { id: 7, x: 100.0, y: 200.0, z: 512.3 }
 *    assets:
 *      - id: 1
 *        category: Manhole
 *        geometry: [[100.0, 200.0]]
 *        owner: 1
 *        water_type: SS
 *        stage: 0
 *        last_editor: ""
 *        facility_id: "1414065"      # derived fields only when set
 *
 *  Every failure is reported as StoreUnavailable.
 *---------------------------------------------------------------------------*/
#include <string>
#include <yaml-cpp/yaml.h>

#include "../network/assetstore.hpp"

namespace attribution {

/** Build a store from a parsed YAML tree. */
InMemoryAssetStore readStore(const YAML::Node& root);

/** Load a store file. */
InMemoryAssetStore loadStore(const std::string& path);

/** Serialize the store as YAML text. */
std::string writeStore(const InMemoryAssetStore& store);

/** Write the store next to `path` and rename it over the old file. */
void saveStore(const InMemoryAssetStore& store, const std::string& path);

} // namespace attribution
