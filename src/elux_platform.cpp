#include "elux_platform.h"

#include "elux_logging.h"

namespace elux {

Platform::Platform(const PlatformConfig &config,
                   ApplianceClient &client,
                   AccessoryHost &host)
    : m_config(config)
    , m_tokens(client)
    , m_engine(m_tokens, client, m_registry, host)
    , m_scheduler(m_tokens, client, m_registry, m_engine, host)
{
    m_scheduler.setIntervalMs(m_config.pollingIntervalMs());
    if (!m_config.refreshToken.isEmpty())
        m_tokens.seedRefreshToken(m_config.refreshToken);

    qCDebug(eluxDiscoveryLog) << "Finished initializing platform:" << m_config.name;
}

Platform::~Platform()
{
    m_scheduler.stop();
}

void Platform::configureAccessory(const AccessoryHandle &accessory)
{
    if (!accessory)
        return;

    qCInfo(eluxAccessoryLog) << "Loading accessory from cache:" << accessory->displayName();
    if (!m_registry.restore(accessory))
        qCWarning(eluxAccessoryLog) << "Ignoring duplicate cached accessory" << accessory->identity();
}

void Platform::start()
{
    m_scheduler.start();
}

void Platform::stop()
{
    m_scheduler.stop();
}

} // namespace elux
