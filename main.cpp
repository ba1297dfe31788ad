#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "engine/attributionengine.hpp"
#include "io/runlock.hpp"
#include "io/storeyaml.hpp"
#include "network/categoryregistry.h"
#include "rules/attributionrule.h"

using namespace attribution;

namespace {

/* process exit codes */
constexpr int kExitOk           = 0;
constexpr int kExitUsage        = 1;
constexpr int kExitStore        = 2;
constexpr int kExitConfig       = 3;
constexpr int kExitLocked       = 4;
constexpr int kExitBatchFailed  = 5;

std::atomic<AttributionEngine*> g_engine{nullptr};

extern "C" void onSignal(int)
{
    if (AttributionEngine* engine = g_engine.load())
        engine->requestStop();
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <store.yml> [config.yml]" << std::endl;
        return kExitUsage;
    }

    const std::string storeFile = argv[1];
    // config file from argv[2] if given, otherwise "default.yml"
    const std::string configFile = (argc >= 3) ? argv[2] : "default.yml";

    /* 1. configuration and logging */
    AttributorConfig cfg;
    try {
        cfg = loadConfig(configFile);
        logging::init(cfg.logging);
    } catch (const ConfigError& e) {
        std::cerr << "Failed to load config file: " << e.what() << std::endl;
        return kExitConfig;
    }
    auto log = logging::get();
    log->info("Loaded config from: {}", configFile);

    try {
        /* 2. category registry and rule table */
        CategoryRegistry registry;
        registry.load(cfg.categories);
        AttributionRule rules(cfg.rules, registry, cfg.codes, cfg.defaultStrategy);
        log->info("{} categories, {} rules, default strategy {}",
                  registry.size(), rules.size(), cfg.defaultStrategy);
        for (const CategoryInfo* c : registry.all())
            log->debug("category {} ({}), suffix '{}', sequence group {}",
                       c->name, toString(c->kind), c->suffix, c->sequenceGroup);

        /* 3. single writer per store */
        RunLock lock(storeFile + ".lock");
        if (!lock.tryLock()) {
            log->error("another run holds {}, store left untouched", lock.path());
            return kExitLocked;
        }

        /* 4. run */
        InMemoryAssetStore store = loadStore(storeFile);
        log->info("Loaded store from: {} ({} assets, {} zones, {} survey nodes)",
                  storeFile, store.assets().size(), store.zones().size(), store.surveyNodes().size());

        AttributionEngine engine(store, registry, rules, cfg);
        g_engine.store(&engine);
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        const RunReport report = engine.run();

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_engine.store(nullptr);

        /* 5. persist whatever was written, even after a stop request */
        saveStore(store, storeFile);
        log->info("Store written to: {}", storeFile);

        if (report.stopped())
            log->warn("run stopped before completion; remaining assets stay eligible");
        return report.hasFailedBatches() ? kExitBatchFailed : kExitOk;
    } catch (const ConfigError& e) {
        log->critical("configuration error: {}", e.what());
        return kExitConfig;
    } catch (const StoreUnavailable& e) {
        log->critical("store unavailable: {}", e.what());
        return kExitStore;
    } catch (const std::exception& e) {
        log->critical("run aborted: {}", e.what());
        return kExitUsage;
    }
}
