#pragma once

#include "elux_accessory.h"
#include "elux_config.h"
#include "elux_discovery.h"
#include "elux_polling.h"
#include "elux_registry.h"
#include "elux_session.h"

namespace elux {

class ApplianceClient;

// Top-level bridge object. The embedding host replays cached accessories via
// configureAccessory(), then calls start() when it is ready and stop() on
// shutdown.
class Platform
{
public:
    Platform(const PlatformConfig &config,
             ApplianceClient &client,
             AccessoryHost &host);
    ~Platform();

    Platform(const Platform &) = delete;
    Platform &operator=(const Platform &) = delete;

    void configureAccessory(const AccessoryHandle &accessory);

    void start();
    void stop();

    const PlatformConfig &config() const { return m_config; }
    TokenStore &tokens() { return m_tokens; }
    AccessoryRegistry &registry() { return m_registry; }
    ReconciliationEngine &engine() { return m_engine; }
    PollingScheduler &scheduler() { return m_scheduler; }

private:
    PlatformConfig m_config;
    TokenStore m_tokens;
    AccessoryRegistry m_registry;
    ReconciliationEngine m_engine;
    PollingScheduler m_scheduler;
};

} // namespace elux
