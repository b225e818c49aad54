#include <iostream>

#include "core/Config.h"
#include "core/Simulation.h"
#include "logging/Logger.h"

int main() {
    try {
        Config::loadEnvFile();
        Config::validate();
    } catch (const std::exception &e) {
        std::cerr << "Config error: " << e.what() << "\n";
        std::cerr << "Check " << SLOTBOOK_PROJECT_DIR << "/slotbook.env or export the SLOTBOOK_* variables\n";
        return 1;
    }

    Logger::info("Main", "%u members, %u s run, lock timeout %u ms, ledger %u rows",
                 Config::Simulation::NUM_MEMBERS(),
                 Config::Simulation::DURATION_US() / Config::Time::ONE_SECOND_US(),
                 Config::Store::LOCK_TIMEOUT_MS(),
                 Config::Store::LEDGER_CAPACITY());

    Simulation simulation;
    return simulation.run();
}
