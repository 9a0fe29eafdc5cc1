#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <QCoreApplication>
#include <QTimer>

#include "elux_accessory_store.h"
#include "elux_client.h"
#include "elux_config.h"
#include "elux_platform.h"

namespace {

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("elux-bridge"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const char *envConfigPath = std::getenv("ELUX_BRIDGE_CONFIG");
    const QString configPath = (argc > 1)
        ? QString::fromLocal8Bit(argv[1])
        : (envConfigPath ? QString::fromLocal8Bit(envConfigPath) : QStringLiteral("elux-bridge.json"));

    elux::PlatformConfig config;
    QString error;
    if (!elux::PlatformConfig::fromFile(configPath, &config, &error)) {
        std::cerr << "failed to load config: " << error.toStdString() << '\n';
        return 1;
    }

    std::cerr << "starting elux-bridge name=" << config.name.toStdString()
              << " storage=" << config.storagePath.toStdString()
              << " pollingInterval=" << config.pollingIntervalSec << "s" << '\n';

    elux::ElectroluxApiClient client(config);
    elux::JsonAccessoryStore store(config.storagePath);
    elux::Platform platform(config, client, store);

    if (!store.load([&platform](const elux::AccessoryHandle &accessory) {
            platform.configureAccessory(accessory);
        }, &error)) {
        std::cerr << "failed to load accessory cache: " << error.toStdString() << '\n';
    }

    // Cached accessories are in place: the host is ready.
    QTimer::singleShot(0, &app, [&platform]() { platform.start(); });

    QTimer signalWatch;
    QObject::connect(&signalWatch, &QTimer::timeout, &app, []() {
        if (!g_running.load())
            QCoreApplication::quit();
    });
    signalWatch.start(250);

    const int rc = app.exec();

    platform.stop();
    std::cerr << "stopping elux-bridge" << '\n';
    return rc;
}
