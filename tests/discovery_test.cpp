#include "elux_discovery.h"

#include <memory>

#include <QJsonObject>

#include "elux_registry.h"
#include "elux_session.h"
#include "gtest/gtest.h"
#include "support/fake_accessory_host.h"
#include "support/fake_appliance_client.h"

using elux::AccessoryRegistry;
using elux::Capabilities;
using elux::DiscoveryResult;
using elux::PlatformAccessory;
using elux::ReconciliationEngine;
using elux::TokenStore;
using elux::testing::FakeAccessoryHost;
using elux::testing::FakeApplianceClient;
using elux::testing::makeAppliance;

namespace {

class DiscoveryTest : public ::testing::Test
{
protected:
    DiscoveryTest()
        : tokens(client)
        , engine(tokens, client, registry, host)
    {
    }

    void signIn()
    {
        QString error;
        ASSERT_TRUE(tokens.signIn(&error)) << error.toStdString();
    }

    void restoreCached(const QString &applianceId, const QJsonObject &context = {})
    {
        auto accessory = std::make_shared<PlatformAccessory>(QStringLiteral("Cached ") + applianceId,
                                                             host.deriveIdentity(applianceId));
        accessory->setContext(context);
        ASSERT_TRUE(registry.restore(accessory));
    }

    FakeApplianceClient client;
    FakeAccessoryHost host;
    TokenStore tokens;
    AccessoryRegistry registry;
    ReconciliationEngine engine;
};

} // namespace

TEST_F(DiscoveryTest, DefersWithoutAccessToken)
{
    client.appliances = {makeAppliance(QStringLiteral("1"), QStringLiteral("PUREA9"), QStringLiteral("Bedroom"))};

    const DiscoveryResult result = engine.discover();
    EXPECT_TRUE(result.deferred);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(0, client.listCalls);
    EXPECT_FALSE(engine.devicesDiscovered());
}

TEST_F(DiscoveryTest, AddsSupportedAppliancesAndSkipsUnknownModels)
{
    signIn();
    client.appliances = {
        makeAppliance(QStringLiteral("1"), QStringLiteral("PUREA9"), QStringLiteral("Bedroom")),
        makeAppliance(QStringLiteral("2"), QStringLiteral("OVEN42"), QStringLiteral("Kitchen")),
    };

    const DiscoveryResult result = engine.discover();
    ASSERT_TRUE(result.ok) << result.error.toStdString();
    EXPECT_EQ(1, result.added);
    EXPECT_EQ(1, result.skippedModels);
    EXPECT_TRUE(engine.devicesDiscovered());

    EXPECT_EQ(1, registry.size());
    EXPECT_TRUE(registry.hasController(QStringLiteral("uuid-1")));
    EXPECT_FALSE(registry.contains(QStringLiteral("uuid-2")));
    EXPECT_EQ(QStringList{QStringLiteral("uuid-1")}, host.registered);
    EXPECT_EQ(QStringList{QStringLiteral("1")}, client.capabilityRequests);
    EXPECT_EQ(QStringLiteral("access-1"), client.lastListToken);
}

TEST_F(DiscoveryTest, SecondPassReusesRecordsWithoutRefetching)
{
    signIn();
    client.appliances = {makeAppliance(QStringLiteral("1"), QStringLiteral("WELLA5"), QStringLiteral("Office"))};

    ASSERT_TRUE(engine.discover().ok);
    ASSERT_EQ(1, client.capabilityCalls);
    ASSERT_EQ(1, host.registerCalls);

    QJsonObject reported;
    reported.insert(QStringLiteral("Workmode"), QStringLiteral("Auto"));
    client.appliances = {makeAppliance(QStringLiteral("1"), QStringLiteral("WELLA5"), QStringLiteral("Office v2"), reported)};

    const DiscoveryResult second = engine.discover();
    ASSERT_TRUE(second.ok);
    EXPECT_EQ(0, second.added);
    EXPECT_EQ(1, second.restored);
    EXPECT_EQ(0, second.capabilityFetches);
    EXPECT_EQ(1, client.capabilityCalls);
    EXPECT_EQ(1, host.registerCalls);
    EXPECT_EQ(1, registry.size());

    const auto descriptor = registry.descriptor(QStringLiteral("uuid-1"));
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(QStringLiteral("Office v2"), descriptor->displayName);
}

TEST_F(DiscoveryTest, CachedUnsupportedMarkerSkipsFetch)
{
    QJsonObject context;
    context.insert(QStringLiteral("capabilities"), QJsonValue(QJsonValue::Null));
    restoreCached(QStringLiteral("7"), context);

    signIn();
    client.appliances = {makeAppliance(QStringLiteral("7"), QStringLiteral("PUREA9"), QStringLiteral("Hall"))};

    const DiscoveryResult result = engine.discover();
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(1, result.restored);
    EXPECT_EQ(0, result.capabilityFetches);
    EXPECT_EQ(1, result.unsupportedCapabilities);
    EXPECT_EQ(0, client.capabilityCalls);
    EXPECT_EQ(0, host.registerCalls);
    EXPECT_TRUE(registry.hasController(QStringLiteral("uuid-7")));
    EXPECT_TRUE(registry.cachedCapabilities(QStringLiteral("uuid-7")).isUnsupported());
}

TEST_F(DiscoveryTest, CachedKnownCapabilitiesSkipFetch)
{
    QJsonObject context;
    context.insert(QStringLiteral("capabilities"), FakeApplianceClient::defaultCapabilities());
    restoreCached(QStringLiteral("8"), context);

    signIn();
    client.appliances = {makeAppliance(QStringLiteral("8"), QStringLiteral("Azul"), QStringLiteral("Study"))};

    ASSERT_TRUE(engine.discover().ok);
    EXPECT_EQ(0, client.capabilityCalls);
    EXPECT_TRUE(registry.cachedCapabilities(QStringLiteral("uuid-8")).isKnown());
}

TEST_F(DiscoveryTest, CapabilityFailureMarksApplianceUnsupported)
{
    signIn();
    client.appliances = {
        makeAppliance(QStringLiteral("1"), QStringLiteral("PUREA9"), QStringLiteral("A")),
        makeAppliance(QStringLiteral("2"), QStringLiteral("PUREA9"), QStringLiteral("B")),
        makeAppliance(QStringLiteral("3"), QStringLiteral("Muju"), QStringLiteral("C")),
    };
    client.capabilityFailures.insert(QStringLiteral("2"));
    client.capabilityNotFound.insert(QStringLiteral("3"));

    const DiscoveryResult result = engine.discover();
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(3, result.added);
    EXPECT_EQ(2, result.unsupportedCapabilities);
    EXPECT_TRUE(result.failedAppliances.isEmpty());

    EXPECT_TRUE(registry.cachedCapabilities(QStringLiteral("uuid-1")).isKnown());
    EXPECT_TRUE(registry.cachedCapabilities(QStringLiteral("uuid-2")).isUnsupported());
    EXPECT_TRUE(registry.cachedCapabilities(QStringLiteral("uuid-3")).isUnsupported());

    const auto accessory = registry.accessory(QStringLiteral("uuid-2"));
    ASSERT_NE(nullptr, accessory);
    EXPECT_TRUE(accessory->context().value(QStringLiteral("capabilities")).isNull());
}

TEST_F(DiscoveryTest, ListingFailureLeavesDiscoveryPending)
{
    signIn();
    client.listFailuresRemaining = 1;

    const DiscoveryResult result = engine.discover();
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.deferred);
    EXPECT_EQ(QStringLiteral("service unavailable"), result.error);
    EXPECT_FALSE(engine.devicesDiscovered());
    EXPECT_EQ(0, registry.size());
}

TEST_F(DiscoveryTest, StaleRecordsAreKept)
{
    restoreCached(QStringLiteral("gone"));

    signIn();
    client.appliances = {makeAppliance(QStringLiteral("1"), QStringLiteral("PUREA9"), QStringLiteral("A"))};

    ASSERT_TRUE(engine.discover().ok);
    EXPECT_EQ(2, registry.size());
    EXPECT_TRUE(registry.contains(QStringLiteral("uuid-gone")));
    EXPECT_FALSE(registry.hasController(QStringLiteral("uuid-gone")));
}

TEST_F(DiscoveryTest, ReentrantPassIsRejected)
{
    signIn();
    client.appliances = {makeAppliance(QStringLiteral("1"), QStringLiteral("PUREA9"), QStringLiteral("A"))};

    DiscoveryResult nested;
    bool entered = false;
    client.onList = [this, &nested, &entered]() {
        if (entered)
            return;
        entered = true;
        nested = engine.discover();
    };

    const DiscoveryResult outer = engine.discover();
    ASSERT_TRUE(entered);
    EXPECT_FALSE(nested.ok);
    EXPECT_FALSE(nested.deferred);
    EXPECT_EQ(QStringLiteral("Discovery already in progress"), nested.error);

    EXPECT_TRUE(outer.ok);
    EXPECT_EQ(1, client.listCalls);
    EXPECT_EQ(1, host.registerCalls);
    EXPECT_EQ(1, registry.size());
}

TEST_F(DiscoveryTest, AccessoryCreationFailureIsIsolated)
{
    signIn();
    client.appliances = {
        makeAppliance(QStringLiteral("a"), QStringLiteral("PUREA9"), QStringLiteral("A")),
        makeAppliance(QStringLiteral("x"), QStringLiteral("WELLA5"), QStringLiteral("X")),
        makeAppliance(QStringLiteral("c"), QStringLiteral("Azul"), QStringLiteral("C")),
    };
    host.createFailures.insert(host.deriveIdentity(QStringLiteral("x")));

    const DiscoveryResult result = engine.discover();
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(2, result.added);
    EXPECT_EQ(QStringList{QStringLiteral("x")}, result.failedAppliances);
    EXPECT_TRUE(engine.devicesDiscovered());

    EXPECT_EQ(2, registry.size());
    EXPECT_FALSE(registry.contains(QStringLiteral("uuid-x")));
    EXPECT_TRUE(registry.hasController(QStringLiteral("uuid-a")));
    EXPECT_TRUE(registry.hasController(QStringLiteral("uuid-c")));
    EXPECT_EQ(QStringList({QStringLiteral("uuid-a"), QStringLiteral("uuid-c")}), host.registered);
}

TEST_F(DiscoveryTest, ControllerFailureOnCachedRecordStillCachesCapabilities)
{
    restoreCached(QStringLiteral("5"));

    signIn();
    client.appliances = {
        makeAppliance(QStringLiteral("5"), QStringLiteral("PUREA9"), QStringLiteral("Cached")),
        makeAppliance(QStringLiteral("6"), QStringLiteral("PUREA9"), QStringLiteral("Fresh")),
    };
    client.capabilityFailures.insert(QStringLiteral("5"));

    const QString failing = host.deriveIdentity(QStringLiteral("5"));
    engine.setFactoryLookup([failing](const QString &modelName) -> elux::ControllerFactory {
        const elux::ControllerFactory real = elux::findControllerFactory(modelName);
        return [real, failing](const elux::ControllerContext &context) -> std::unique_ptr<elux::ApplianceController> {
            if (context.accessory && context.accessory->identity() == failing)
                return nullptr;
            return real(context);
        };
    });

    const DiscoveryResult first = engine.discover();
    ASSERT_TRUE(first.ok);
    EXPECT_EQ(QStringList{QStringLiteral("5")}, first.failedAppliances);
    EXPECT_EQ(1, first.added);
    EXPECT_FALSE(registry.hasController(failing));
    EXPECT_TRUE(registry.cachedCapabilities(failing).isUnsupported());

    const auto accessory = registry.accessory(failing);
    ASSERT_NE(nullptr, accessory);
    EXPECT_TRUE(accessory->context().contains(QStringLiteral("capabilities")));
    EXPECT_TRUE(accessory->context().value(QStringLiteral("capabilities")).isNull());

    const DiscoveryResult second = engine.discover();
    ASSERT_TRUE(second.ok);
    EXPECT_EQ(0, second.capabilityFetches);
    EXPECT_EQ(2, client.capabilityCalls);
}
