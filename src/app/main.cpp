/// @file main.cpp
/// @brief gsim_runner entry point.
///
/// Loads configuration, seeds the demo world and drives the simulation
/// for a fixed number of ticks or until SIGINT/SIGTERM, then writes a
/// final snapshot.

#include <cstdlib>
#include <iostream>
#include <string>

#include "gsim/ai/behavior_engine.hpp"
#include "gsim/app/console_logger.hpp"
#include "gsim/app/demo_world.hpp"
#include "gsim/app/runner.hpp"
#include "gsim/foundation/config_manager.hpp"
#include "gsim/foundation/game_logger.hpp"
#include "gsim/runtime/simulation.hpp"
#include "gsim/runtime/tick_scheduler.hpp"
#include "gsim/state/snapshot_store.hpp"
#include "gsim/state/state_manager.hpp"
#include "gsim/version.hpp"

namespace {

void applyLogLevel(const gsim::foundation::ConfigManager& config) {
    auto level = config.getOr<std::string>("logging.level", "info");
    if (!level) {
        std::cerr << "Ignoring logging.level: " << level.error().message() << "\n";
        return;
    }
    auto parsed = gsim::foundation::parseLogLevel(level.value());
    if (!parsed) {
        std::cerr << "Ignoring unknown logging.level '" << level.value() << "'\n";
        return;
    }
    gsim::foundation::GameLogger::instance().setAllLevels(*parsed);
}

} // namespace

int main(int argc, char* argv[]) {
    gsim::app::SignalHandler signals;
    gsim::app::installConsoleLogger();

    auto options = gsim::app::parseArgs(argc, argv);
    if (!options) {
        std::cerr << options.error().message() << "\n"
                  << "usage: gsim_runner [--config path] [--ticks n]\n";
        return EXIT_FAILURE;
    }

    auto configPath = options.value().configPath;
    if (configPath.empty()) {
        configPath = "config/gsim.yaml";
    }

    gsim::foundation::ConfigManager config;
    auto loadResult = gsim::app::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    applyLogLevel(config);

    auto simConfig = gsim::runtime::loadSimulationConfig(config);
    if (!simConfig) {
        std::cerr << "Invalid config: " << simConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto created = gsim::runtime::Simulation::create(simConfig.value());
    if (!created) {
        std::cerr << "Failed to create simulation: " << created.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto& sim = *created.value();

    auto tree = gsim::app::buildMemberTree();
    if (!tree) {
        std::cerr << "Invalid member tree: " << tree.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto registered = sim.behaviors().registerTree(std::string(gsim::app::kMemberTreeId),
                                                   std::move(tree).value());
    if (!registered) {
        std::cerr << "Failed to register tree: " << registered.error().message() << "\n";
        return EXIT_FAILURE;
    }

    gsim::runtime::AgentPlannerConfig planner;
    planner.treeId = std::string(gsim::app::kMemberTreeId);
    auto installed = sim.installDefaultSystems({}, planner);
    if (!installed) {
        std::cerr << "Failed to install systems: " << installed.error().message() << "\n";
        return EXIT_FAILURE;
    }
    gsim::app::registerDemoEffects(*sim.decisionApply());

    auto seeded = sim.state().initialize(gsim::app::buildDemoWorld());
    if (!seeded) {
        std::cerr << "Failed to seed world: " << seeded.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "gsim_runner " << gsim::Version::string << " started (tick_rate: "
              << simConfig.value().ticks.tickRate << " Hz, workers: "
              << simConfig.value().workerPoolSize << ")\n";

    if (options.value().ticks) {
        sim.ticks().runTicks(*options.value().ticks);
    } else {
        if (!sim.ticks().start()) {
            std::cerr << "Tick loop already running\n";
            return EXIT_FAILURE;
        }
        signals.waitForShutdown();
        std::cout << "Shutting down...\n";
    }
    sim.ticks().stop();

    auto saved = sim.saveSnapshot();
    if (!saved) {
        std::cerr << "Final snapshot failed: " << saved.error().message() << "\n";
        sim.shutdown();
        return EXIT_FAILURE;
    }

    const auto& health = sim.ticks().health();
    std::cout << "Ran " << sim.ticks().tickCount() << " ticks (avg "
              << health.averageTickTime.count() << "us, dropped " << health.droppedTicks
              << "), state v" << sim.state().version() << ", snapshot " << saved.value().id
              << "\n";

    sim.shutdown();
    std::cout << "gsim_runner stopped\n";
    return EXIT_SUCCESS;
}
