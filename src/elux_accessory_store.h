#pragma once

#include <functional>

#include <QHash>
#include <QString>
#include <QStringList>

#include "elux_accessory.h"

namespace elux {

// Standalone host: keeps registered accessories in memory and persists
// them (identity, name, context) to <storagePath>/accessories.json.
class JsonAccessoryStore final : public AccessoryHost
{
public:
    using ConfigureCallback = std::function<void(const AccessoryHandle &)>;

    explicit JsonAccessoryStore(const QString &storagePath);

    QString deriveIdentity(const QString &applianceId) const override;
    AccessoryHandle createAccessory(const QString &displayName, const QString &identity) override;
    void registerAccessories(const AccessoryList &accessories) override;
    void updateAccessories(const AccessoryList &accessories) override;

    // Replays the cached accessories through configure. A missing cache file
    // is not an error.
    bool load(const ConfigureCallback &configure, QString *error = nullptr);
    bool save(QString *error = nullptr) const;

    QString cacheFilePath() const;
    int size() const { return m_order.size(); }

private:
    QString m_storagePath;
    QHash<QString, AccessoryHandle> m_accessories;
    QStringList m_order;
};

} // namespace elux
