#include "elux_polling.h"

#include <exception>
#include <utility>

#include <QDateTime>
#include <QScopedValueRollback>

#include "elux_accessory.h"
#include "elux_client.h"
#include "elux_config.h"
#include "elux_discovery.h"
#include "elux_logging.h"
#include "elux_registry.h"
#include "elux_session.h"

namespace elux {

PollingScheduler::PollingScheduler(TokenStore &tokens,
                                   ApplianceClient &client,
                                   AccessoryRegistry &registry,
                                   ReconciliationEngine &engine,
                                   AccessoryHost &host,
                                   QObject *parent)
    : QObject(parent)
    , m_tokens(tokens)
    , m_client(client)
    , m_registry(registry)
    , m_engine(engine)
    , m_host(host)
{
    m_timer.setInterval(kDefaultPollingIntervalSec * 1000);
    m_timer.setSingleShot(false);
    m_timer.setParent(this);
    connect(&m_timer, &QTimer::timeout,
            this, &PollingScheduler::onPollTimeout);
}

PollingScheduler::~PollingScheduler()
{
    stop();
}

void PollingScheduler::setIntervalMs(int intervalMs)
{
    m_timer.setInterval(qMax(1000, intervalMs));
}

void PollingScheduler::setClock(std::function<qint64()> clock)
{
    m_clock = std::move(clock);
}

qint64 PollingScheduler::now() const
{
    return m_clock ? m_clock() : QDateTime::currentMSecsSinceEpoch();
}

void PollingScheduler::start()
{
    if (m_started)
        return;
    m_started = true;
    m_stopRequested = false;

    QString error;
    if (!ensureSession(&error)) {
        qCWarning(eluxPollingLog) << error;
    } else {
        const DiscoveryResult result = m_engine.discover();
        if (!result.ok && !result.deferred)
            qCWarning(eluxPollingLog) << result.error;
    }

    // stop() may have been called while the startup requests were in flight.
    if (m_stopRequested)
        return;

    qCInfo(eluxPollingLog) << "Polling every" << m_timer.interval() / 1000 << "s";
    m_timer.start();
}

void PollingScheduler::stop()
{
    m_stopRequested = true;
    m_started = false;
    if (m_timer.isActive()) {
        m_timer.stop();
        qCInfo(eluxPollingLog) << "Polling stopped";
    }
}

void PollingScheduler::onPollTimeout()
{
    tick();
}

bool PollingScheduler::ensureSession(QString *error)
{
    if (!m_tokens.hasRefreshToken())
        return m_tokens.signIn(error);
    return m_tokens.refresh(error);
}

PollingScheduler::TickOutcome PollingScheduler::tick()
{
    if (m_tickInFlight) {
        qCDebug(eluxPollingLog) << "Previous tick still running, skipping";
        return TickOutcome::Skipped;
    }
    const QScopedValueRollback<bool> inFlight(m_tickInFlight, true);

    TickOutcome outcome = TickOutcome::PollFailed;
    try {
        outcome = runTick();
    } catch (const std::exception &e) {
        qCWarning(eluxPollingLog) << "Polling error:" << e.what();
    } catch (...) {
        // Nothing may unwind into the QTimer dispatch.
        qCWarning(eluxPollingLog) << "Polling error: unknown";
    }

    qCDebug(eluxPollingLog) << "Tick finished:" << outcome;
    return outcome;
}

PollingScheduler::TickOutcome PollingScheduler::runTick()
{
    QString error;

    // Without any refresh token the session was never established: retry sign-in.
    if (!m_tokens.hasRefreshToken()) {
        if (!m_tokens.signIn(&error)) {
            qCWarning(eluxPollingLog) << "Polling error:" << error;
            return TickOutcome::TokenRefreshFailed;
        }
    } else if (m_tokens.isExpired(now())) {
        if (!m_tokens.refresh(&error)) {
            qCWarning(eluxPollingLog) << "Polling error:" << error;
            return TickOutcome::TokenRefreshFailed;
        }
    }

    if (!m_engine.devicesDiscovered()) {
        const DiscoveryResult result = m_engine.discover();
        if (result.deferred)
            return TickOutcome::DiscoveryDeferred;
        if (!result.ok) {
            qCWarning(eluxPollingLog) << "Polling error:" << result.error;
            return TickOutcome::DiscoveryFailed;
        }
        return TickOutcome::Discovered;
    }

    return pollStatus();
}

PollingScheduler::TickOutcome PollingScheduler::pollStatus()
{
    qCDebug(eluxPollingLog) << "Polling appliances status...";

    QString error;
    QList<ApplianceDescriptor> appliances;
    if (!m_client.listAppliances(m_tokens.session(), &appliances, &error)) {
        qCWarning(eluxPollingLog) << "Polling error:" << error;
        return TickOutcome::PollFailed;
    }

    int updated = 0;
    for (const ApplianceDescriptor &appliance : std::as_const(appliances)) {
        // Unknown appliances are left for the next discovery pass.
        if (m_registry.dispatchUpdate(m_host.deriveIdentity(appliance.applianceId), appliance))
            ++updated;
    }

    qCDebug(eluxPollingLog) << "Appliances status polled!" << updated << "of" << appliances.size() << "updated";
    return TickOutcome::Polled;
}

} // namespace elux
