#include "elux_registry.h"

#include <QMutexLocker>

#include "elux_logging.h"

namespace elux {

AccessoryRecord *AccessoryRegistry::findLocked(const QString &identity) const
{
    return m_index.value(identity, nullptr);
}

bool AccessoryRegistry::restore(const AccessoryHandle &accessory)
{
    if (!accessory || accessory->identity().isEmpty())
        return false;

    QMutexLocker locker(&m_mutex);
    if (findLocked(accessory->identity()))
        return false;

    auto record = std::make_unique<AccessoryRecord>();
    record->identity = accessory->identity();
    record->accessory = accessory;
    record->capabilities = accessory->capabilities();

    m_index.insert(record->identity, record.get());
    m_records.push_back(std::move(record));
    return true;
}

bool AccessoryRegistry::contains(const QString &identity) const
{
    QMutexLocker locker(&m_mutex);
    return findLocked(identity) != nullptr;
}

Capabilities AccessoryRegistry::cachedCapabilities(const QString &identity) const
{
    QMutexLocker locker(&m_mutex);
    const AccessoryRecord *record = findLocked(identity);
    return record ? record->capabilities : Capabilities();
}

AccessoryHandle AccessoryRegistry::accessory(const QString &identity) const
{
    QMutexLocker locker(&m_mutex);
    const AccessoryRecord *record = findLocked(identity);
    return record ? record->accessory : AccessoryHandle();
}

std::optional<ApplianceDescriptor> AccessoryRegistry::descriptor(const QString &identity) const
{
    QMutexLocker locker(&m_mutex);
    const AccessoryRecord *record = findLocked(identity);
    if (!record)
        return std::nullopt;
    return record->descriptor;
}

bool AccessoryRegistry::hasController(const QString &identity) const
{
    QMutexLocker locker(&m_mutex);
    const AccessoryRecord *record = findLocked(identity);
    return record && record->controller;
}

void AccessoryRegistry::setCapabilities(const QString &identity, const Capabilities &capabilities)
{
    QMutexLocker locker(&m_mutex);
    AccessoryRecord *record = findLocked(identity);
    if (!record)
        return;

    record->capabilities = capabilities;
    if (record->accessory)
        record->accessory->setCapabilities(capabilities);
}

bool AccessoryRegistry::attach(const QString &identity,
                               const ApplianceDescriptor &descriptor,
                               const Capabilities &capabilities,
                               std::unique_ptr<ApplianceController> controller)
{
    QMutexLocker locker(&m_mutex);
    AccessoryRecord *record = findLocked(identity);
    if (!record)
        return false;

    record->descriptor = descriptor;
    record->capabilities = capabilities;
    if (record->accessory)
        record->accessory->setCapabilities(capabilities);
    record->controller = std::move(controller);
    return true;
}

bool AccessoryRegistry::insert(const AccessoryHandle &accessory,
                               const ApplianceDescriptor &descriptor,
                               const Capabilities &capabilities,
                               std::unique_ptr<ApplianceController> controller)
{
    if (!accessory || accessory->identity().isEmpty())
        return false;

    QMutexLocker locker(&m_mutex);
    if (findLocked(accessory->identity())) {
        qCWarning(eluxAccessoryLog) << "Refusing duplicate accessory" << accessory->identity();
        return false;
    }

    accessory->setCapabilities(capabilities);

    auto record = std::make_unique<AccessoryRecord>();
    record->identity = accessory->identity();
    record->accessory = accessory;
    record->descriptor = descriptor;
    record->capabilities = capabilities;
    record->controller = std::move(controller);

    m_index.insert(record->identity, record.get());
    m_records.push_back(std::move(record));
    return true;
}

bool AccessoryRegistry::dispatchUpdate(const QString &identity, const ApplianceDescriptor &descriptor)
{
    std::shared_ptr<ApplianceController> controller;
    {
        QMutexLocker locker(&m_mutex);
        AccessoryRecord *record = findLocked(identity);
        if (!record || !record->controller)
            return false;

        record->descriptor = descriptor;
        controller = record->controller;
    }

    // update() persists through the host, which may read the registry back.
    controller->update(descriptor);
    return true;
}

QStringList AccessoryRegistry::identities() const
{
    QMutexLocker locker(&m_mutex);
    QStringList out;
    out.reserve(int(m_records.size()));
    for (const auto &record : m_records)
        out.push_back(record->identity);
    return out;
}

QStringList AccessoryRegistry::staleIdentities(const QSet<QString> &seen) const
{
    QMutexLocker locker(&m_mutex);
    QStringList out;
    for (const auto &record : m_records) {
        if (!seen.contains(record->identity))
            out.push_back(record->identity);
    }
    return out;
}

int AccessoryRegistry::size() const
{
    QMutexLocker locker(&m_mutex);
    return int(m_records.size());
}

} // namespace elux
