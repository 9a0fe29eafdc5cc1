#pragma once

#include <functional>

#include <QString>
#include <QStringList>

#include "elux_controllers.h"
#include "elux_model.h"

namespace elux {

class AccessoryHost;
class AccessoryRegistry;
class ApplianceClient;
class TokenStore;

struct DiscoveryResult {
    bool ok = false;
    // No session yet; nothing was attempted.
    bool deferred = false;
    int added = 0;
    int restored = 0;
    int skippedModels = 0;
    int unsupportedCapabilities = 0;
    int capabilityFetches = 0;
    QStringList failedAppliances;
    QString error;
};

// Runs discovery passes: fetches the appliance listing and reconciles it
// against the registry, creating controllers and registering new accessories.
class ReconciliationEngine
{
public:
    ReconciliationEngine(TokenStore &tokens,
                         ApplianceClient &client,
                         AccessoryRegistry &registry,
                         AccessoryHost &host);

    using FactoryLookup = std::function<ControllerFactory(const QString &modelName)>;

    DiscoveryResult discover();

    // Defaults to findControllerFactory().
    void setFactoryLookup(FactoryLookup lookup);

    bool devicesDiscovered() const { return m_devicesDiscovered; }

private:
    enum class ItemOutcome {
        Added,
        Restored,
        SkippedModel,
        Failed
    };

    ItemOutcome reconcile(const ApplianceDescriptor &appliance, const Session &session, DiscoveryResult *result);
    Capabilities resolveCapabilities(const QString &identity,
                                     const ApplianceDescriptor &appliance,
                                     const Session &session,
                                     DiscoveryResult *result);

    TokenStore &m_tokens;
    ApplianceClient &m_client;
    AccessoryRegistry &m_registry;
    AccessoryHost &m_host;
    FactoryLookup m_factoryLookup;

    bool m_devicesDiscovered = false;
    bool m_inProgress = false;
};

} // namespace elux
