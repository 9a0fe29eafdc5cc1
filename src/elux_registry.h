#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <QHash>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QStringList>

#include "elux_accessory.h"
#include "elux_controllers.h"
#include "elux_model.h"

namespace elux {

struct AccessoryRecord {
    QString identity;
    AccessoryHandle accessory;
    std::optional<ApplianceDescriptor> descriptor;
    Capabilities capabilities;
    // Shared so a status update can run outside the registry lock while
    // attach() swaps in a replacement.
    std::shared_ptr<ApplianceController> controller;
};

// Identity-keyed store of accessory records, iterated in insertion order.
// Records are never removed. Every method takes the registry mutex, so
// mutations from overlapping discovery passes are serialized. Controllers run
// outside the lock and may call back into the registry.
class AccessoryRegistry
{
public:
    AccessoryRegistry() = default;

    AccessoryRegistry(const AccessoryRegistry &) = delete;
    AccessoryRegistry &operator=(const AccessoryRegistry &) = delete;

    // Host replayed a persisted accessory. Returns false for a duplicate.
    bool restore(const AccessoryHandle &accessory);

    bool contains(const QString &identity) const;
    Capabilities cachedCapabilities(const QString &identity) const;
    AccessoryHandle accessory(const QString &identity) const;
    std::optional<ApplianceDescriptor> descriptor(const QString &identity) const;
    bool hasController(const QString &identity) const;

    // Caches resolved capabilities on the record and its accessory context.
    // Ignored for identities without a record.
    void setCapabilities(const QString &identity, const Capabilities &capabilities);

    bool attach(const QString &identity,
                const ApplianceDescriptor &descriptor,
                const Capabilities &capabilities,
                std::unique_ptr<ApplianceController> controller);

    bool insert(const AccessoryHandle &accessory,
                const ApplianceDescriptor &descriptor,
                const Capabilities &capabilities,
                std::unique_ptr<ApplianceController> controller);

    // Forwards fresh status to the record's controller. False when the
    // identity is unknown or has no controller.
    bool dispatchUpdate(const QString &identity, const ApplianceDescriptor &descriptor);

    QStringList identities() const;
    QStringList staleIdentities(const QSet<QString> &seen) const;
    int size() const;

private:
    AccessoryRecord *findLocked(const QString &identity) const;

    mutable QMutex m_mutex;
    std::vector<std::unique_ptr<AccessoryRecord>> m_records;
    QHash<QString, AccessoryRecord *> m_index;
};

} // namespace elux
