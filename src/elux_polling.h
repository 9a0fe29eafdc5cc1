#pragma once

#include <functional>

#include <QObject>
#include <QTimer>

namespace elux {

class AccessoryHost;
class AccessoryRegistry;
class ApplianceClient;
class ReconciliationEngine;
class TokenStore;

// Drives the recurring refresh cycle. Each tick runs the token, discovery and
// poll phases in order inside one failure boundary; a failed tick never stops
// the timer.
class PollingScheduler : public QObject
{
    Q_OBJECT
public:
    enum class TickOutcome {
        Skipped,
        TokenRefreshFailed,
        DiscoveryDeferred,
        DiscoveryFailed,
        Discovered,
        PollFailed,
        Polled
    };
    Q_ENUM(TickOutcome)

    PollingScheduler(TokenStore &tokens,
                     ApplianceClient &client,
                     AccessoryRegistry &registry,
                     ReconciliationEngine &engine,
                     AccessoryHost &host,
                     QObject *parent = nullptr);
    ~PollingScheduler() override;

    void setIntervalMs(int intervalMs);
    int intervalMs() const { return m_timer.interval(); }
    void setClock(std::function<qint64()> clock);

    // Host is ready: one best-effort sign-in/refresh + discovery, then the
    // interval starts whatever the outcome.
    void start();
    // Idempotent, safe without start(). An in-flight tick runs to completion.
    void stop();
    bool isActive() const { return m_timer.isActive(); }

    TickOutcome tick();

private slots:
    void onPollTimeout();

private:
    TickOutcome runTick();
    bool ensureSession(QString *error);
    TickOutcome pollStatus();
    qint64 now() const;

    TokenStore &m_tokens;
    ApplianceClient &m_client;
    AccessoryRegistry &m_registry;
    ReconciliationEngine &m_engine;
    AccessoryHost &m_host;

    QTimer m_timer;
    std::function<qint64()> m_clock;
    bool m_started = false;
    bool m_stopRequested = false;
    bool m_tickInFlight = false;
};

} // namespace elux
