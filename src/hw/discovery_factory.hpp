#pragma once
#include "discovery_source.hpp"
#include "simulated_discovery.hpp"
#include "../control/config.hpp"
#include "../core/errors.hpp"
#include <memory>

#if defined(ATTENDANCE_WITH_BLUEZ)
#include "bluetooth_discovery.hpp"
#endif

/**
 * @brief Build the discovery source named by the configuration
 *
 * Selected once at startup. Asking for "bluetooth" in a build without
 * BlueZ fails instead of quietly running the simulator.
 *
 * @param cfg Service configuration (discovery section and scan duration)
 * @param candidates Registered identities, used by the simulator
 * @throws InvalidConfiguration for an unknown or unavailable source
 */
inline std::unique_ptr<IDiscoverySource> make_discovery_source(
    const AppConfig& cfg, SimulatedDiscovery::CandidateProvider candidates) {
  if (cfg.discovery.source == "simulated") {
    auto latency = cfg.discovery.simulate_latency ? cfg.scan_duration() / 2
                                                  : std::chrono::milliseconds(0);
    auto sim = std::make_unique<SimulatedDiscovery>(std::move(candidates),
                                                    cfg.discovery.detection_probability,
                                                    cfg.discovery.seed, latency);
    sim->set_strangers(cfg.discovery.strangers);
    return sim;
  }
  if (cfg.discovery.source == "bluetooth") {
#if defined(ATTENDANCE_WITH_BLUEZ)
    return std::make_unique<BluetoothDiscovery>(cfg.scan_duration(), cfg.discovery.hci_device);
#else
    throw InvalidConfiguration(
        "discovery.source is \"bluetooth\" but this build has no BlueZ support "
        "(reconfigure with -DATTENDANCE_WITH_BLUEZ=ON)");
#endif
  }
  throw InvalidConfiguration("unknown discovery source \"" + cfg.discovery.source + "\"");
}
