#include "elux_discovery.h"

#include <utility>

#include <QScopedValueRollback>
#include <QSet>

#include "elux_accessory.h"
#include "elux_client.h"
#include "elux_controllers.h"
#include "elux_logging.h"
#include "elux_registry.h"
#include "elux_session.h"

namespace elux {

ReconciliationEngine::ReconciliationEngine(TokenStore &tokens,
                                           ApplianceClient &client,
                                           AccessoryRegistry &registry,
                                           AccessoryHost &host)
    : m_tokens(tokens)
    , m_client(client)
    , m_registry(registry)
    , m_host(host)
    , m_factoryLookup(findControllerFactory)
{
}

void ReconciliationEngine::setFactoryLookup(FactoryLookup lookup)
{
    m_factoryLookup = lookup ? std::move(lookup) : FactoryLookup(findControllerFactory);
}

DiscoveryResult ReconciliationEngine::discover()
{
    DiscoveryResult result;

    if (!m_tokens.hasAccessToken()) {
        qCDebug(eluxDiscoveryLog) << "No access token yet, deferring discovery";
        result.deferred = true;
        return result;
    }

    // HttpClient spins a nested event loop, so a timer tick can re-enter here.
    if (m_inProgress) {
        result.error = QStringLiteral("Discovery already in progress");
        return result;
    }
    const QScopedValueRollback<bool> inProgress(m_inProgress, true);

    qCInfo(eluxDiscoveryLog) << "Discovering devices...";

    const Session session = m_tokens.session();
    QList<ApplianceDescriptor> appliances;
    if (!m_client.listAppliances(session, &appliances, &result.error))
        return result;

    QSet<QString> seen;
    for (const ApplianceDescriptor &appliance : std::as_const(appliances)) {
        switch (reconcile(appliance, session, &result)) {
        case ItemOutcome::Added:
            ++result.added;
            break;
        case ItemOutcome::Restored:
            ++result.restored;
            break;
        case ItemOutcome::SkippedModel:
            ++result.skippedModels;
            continue;
        case ItemOutcome::Failed:
            result.failedAppliances.push_back(appliance.applianceId);
            break;
        }
        seen.insert(m_host.deriveIdentity(appliance.applianceId));
    }

    const QStringList stale = m_registry.staleIdentities(seen);
    if (!stale.isEmpty())
        qCDebug(eluxDiscoveryLog) << "Accessories missing from the cloud listing (kept):" << stale;

    qCInfo(eluxDiscoveryLog) << "Devices discovered!" << "added:" << result.added
                             << "restored:" << result.restored << "skipped:" << result.skippedModels
                             << "failed:" << result.failedAppliances.size();

    result.ok = true;
    m_devicesDiscovered = true;
    return result;
}

ReconciliationEngine::ItemOutcome ReconciliationEngine::reconcile(const ApplianceDescriptor &appliance,
                                                                  const Session &session,
                                                                  DiscoveryResult *result)
{
    const ControllerFactory factory = m_factoryLookup(appliance.modelName);
    if (!factory) {
        qCWarning(eluxDiscoveryLog) << "Accessory not found for model:" << appliance.modelName;
        return ItemOutcome::SkippedModel;
    }

    const QString identity = m_host.deriveIdentity(appliance.applianceId);
    const AccessoryHandle existing = m_registry.accessory(identity);
    const Capabilities capabilities = resolveCapabilities(identity, appliance, session, result);

    if (existing) {
        qCInfo(eluxDiscoveryLog) << "Restoring existing accessory from cache:" << existing->displayName();

        ControllerContext context;
        context.host = &m_host;
        context.accessory = existing;
        context.descriptor = appliance;
        context.capabilities = capabilities;

        std::unique_ptr<ApplianceController> controller = factory(context);
        if (!controller) {
            // The previous controller stays; the resolved capabilities are already cached.
            qCWarning(eluxDiscoveryLog) << "Failed to create controller for" << appliance.displayName;
            m_host.updateAccessories({existing});
            return ItemOutcome::Failed;
        }

        m_registry.attach(identity, appliance, capabilities, std::move(controller));
        m_host.updateAccessories({existing});
        return ItemOutcome::Restored;
    }

    qCInfo(eluxDiscoveryLog) << "Adding new accessory:" << appliance.displayName;

    const AccessoryHandle accessory = m_host.createAccessory(appliance.displayName, identity);
    if (!accessory) {
        qCWarning(eluxDiscoveryLog) << "Host refused to create accessory for" << appliance.displayName;
        return ItemOutcome::Failed;
    }

    ControllerContext context;
    context.host = &m_host;
    context.accessory = accessory;
    context.descriptor = appliance;
    context.capabilities = capabilities;

    std::unique_ptr<ApplianceController> controller = factory(context);
    if (!controller) {
        qCWarning(eluxDiscoveryLog) << "Failed to create controller for" << appliance.displayName;
        return ItemOutcome::Failed;
    }

    if (!m_registry.insert(accessory, appliance, capabilities, std::move(controller)))
        return ItemOutcome::Failed;

    m_host.registerAccessories({accessory});
    return ItemOutcome::Added;
}

Capabilities ReconciliationEngine::resolveCapabilities(const QString &identity,
                                                       const ApplianceDescriptor &appliance,
                                                       const Session &session,
                                                       DiscoveryResult *result)
{
    const Capabilities cached = m_registry.cachedCapabilities(identity);
    if (!cached.isUnknown()) {
        if (cached.isUnsupported())
            ++result->unsupportedCapabilities;
        return cached;
    }

    ++result->capabilityFetches;
    const CapabilityLookup lookup = m_client.getCapabilities(appliance.applianceId, session);
    Capabilities resolved;
    if (lookup.ok) {
        resolved = Capabilities::known(lookup.document);
    } else {
        qCInfo(eluxDiscoveryLog) << "Capabilities unavailable for" << appliance.displayName
                                 << (lookup.notFound ? QStringLiteral("(not found)") : lookup.error);
        ++result->unsupportedCapabilities;
        resolved = Capabilities::unsupported();
    }

    // Cached on an existing record straight away, whatever happens to its controller.
    m_registry.setCapabilities(identity, resolved);
    return resolved;
}

} // namespace elux
