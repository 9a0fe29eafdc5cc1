#include "elux_accessory.h"

namespace elux {

namespace {

const QString kCapabilitiesKey = QStringLiteral("capabilities");

QString characteristicKey(const QString &service, const QString &characteristic)
{
    return service + QLatin1Char('.') + characteristic;
}

} // namespace

PlatformAccessory::PlatformAccessory(const QString &displayName, const QString &identity)
    : m_identity(identity)
    , m_displayName(displayName)
{
}

Capabilities PlatformAccessory::capabilities() const
{
    return Capabilities::fromJsonValue(m_context.value(kCapabilitiesKey));
}

void PlatformAccessory::setCapabilities(const Capabilities &capabilities)
{
    if (capabilities.isUnknown()) {
        m_context.remove(kCapabilitiesKey);
        return;
    }
    m_context.insert(kCapabilitiesKey, capabilities.toJsonValue());
}

bool PlatformAccessory::setCharacteristic(const QString &service,
                                          const QString &characteristic,
                                          const QVariant &value)
{
    const QString key = characteristicKey(service, characteristic);
    auto it = m_characteristics.find(key);
    if (it != m_characteristics.end() && it.value() == value)
        return false;
    m_characteristics.insert(key, value);
    return true;
}

QVariant PlatformAccessory::characteristic(const QString &service, const QString &characteristic) const
{
    return m_characteristics.value(characteristicKey(service, characteristic));
}

} // namespace elux
