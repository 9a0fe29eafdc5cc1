#pragma once

#include <memory>

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QVariant>
#include <QVariantMap>

#include "elux_model.h"

namespace elux {

// Host-side representation of an appliance. The context blob is persisted
// by the host across restarts; characteristics are what the host exposes.
class PlatformAccessory
{
public:
    PlatformAccessory(const QString &displayName, const QString &identity);

    const QString &identity() const { return m_identity; }
    const QString &displayName() const { return m_displayName; }
    void setDisplayName(const QString &name) { m_displayName = name; }

    const QJsonObject &context() const { return m_context; }
    void setContext(const QJsonObject &context) { m_context = context; }

    Capabilities capabilities() const;
    void setCapabilities(const Capabilities &capabilities);

    // Returns true when the stored value changed.
    bool setCharacteristic(const QString &service, const QString &characteristic, const QVariant &value);
    QVariant characteristic(const QString &service, const QString &characteristic) const;
    const QVariantMap &characteristics() const { return m_characteristics; }

private:
    QString m_identity;
    QString m_displayName;
    QJsonObject m_context;
    QVariantMap m_characteristics;
};

using AccessoryHandle = std::shared_ptr<PlatformAccessory>;
using AccessoryList = QList<AccessoryHandle>;

// Accessory-management runtime embedding the bridge.
class AccessoryHost
{
public:
    virtual ~AccessoryHost() = default;

    // Deterministic: the same appliance id always maps to the same identity.
    virtual QString deriveIdentity(const QString &applianceId) const = 0;
    virtual AccessoryHandle createAccessory(const QString &displayName, const QString &identity) = 0;
    virtual void registerAccessories(const AccessoryList &accessories) = 0;
    virtual void updateAccessories(const AccessoryList &accessories) = 0;
};

} // namespace elux
