#include "elux_accessory_store.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QUuid>

#include "elux_logging.h"

namespace elux {

namespace {

const QUuid kIdentityNamespace(QStringLiteral("{6f1c3a52-94d8-4b7e-a0c5-2e9d41b8f307}"));

} // namespace

JsonAccessoryStore::JsonAccessoryStore(const QString &storagePath)
    : m_storagePath(storagePath)
{
}

QString JsonAccessoryStore::cacheFilePath() const
{
    return QDir(m_storagePath).filePath(QStringLiteral("accessories.json"));
}

QString JsonAccessoryStore::deriveIdentity(const QString &applianceId) const
{
    return QUuid::createUuidV5(kIdentityNamespace, applianceId).toString(QUuid::WithoutBraces);
}

AccessoryHandle JsonAccessoryStore::createAccessory(const QString &displayName, const QString &identity)
{
    return std::make_shared<PlatformAccessory>(displayName, identity);
}

void JsonAccessoryStore::registerAccessories(const AccessoryList &accessories)
{
    for (const AccessoryHandle &accessory : accessories) {
        if (!accessory)
            continue;
        if (!m_accessories.contains(accessory->identity()))
            m_order.push_back(accessory->identity());
        m_accessories.insert(accessory->identity(), accessory);
        qCInfo(eluxAccessoryLog) << "Registered accessory" << accessory->displayName() << accessory->identity();
    }

    QString error;
    if (!save(&error))
        qCWarning(eluxAccessoryLog) << "Failed to persist accessory cache:" << error;
}

void JsonAccessoryStore::updateAccessories(const AccessoryList &accessories)
{
    if (accessories.isEmpty())
        return;

    QString error;
    if (!save(&error))
        qCWarning(eluxAccessoryLog) << "Failed to persist accessory cache:" << error;
}

bool JsonAccessoryStore::load(const ConfigureCallback &configure, QString *error)
{
    QFile file(cacheFilePath());
    if (!file.exists())
        return true;
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(file.fileName(), file.errorString());
        return false;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("Accessory cache %1 is corrupt").arg(file.fileName());
        return false;
    }

    const QJsonArray entries = doc.object().value(QStringLiteral("accessories")).toArray();
    for (const QJsonValue &value : entries) {
        const QJsonObject entry = value.toObject();
        const QString identity = entry.value(QStringLiteral("identity")).toString().trimmed();
        if (identity.isEmpty() || m_accessories.contains(identity))
            continue;

        AccessoryHandle accessory = createAccessory(entry.value(QStringLiteral("displayName")).toString(), identity);
        accessory->setContext(entry.value(QStringLiteral("context")).toObject());
        m_accessories.insert(identity, accessory);
        m_order.push_back(identity);

        if (configure)
            configure(accessory);
    }

    return true;
}

bool JsonAccessoryStore::save(QString *error) const
{
    if (!QDir().mkpath(m_storagePath)) {
        if (error)
            *error = QStringLiteral("Cannot create storage directory %1").arg(m_storagePath);
        return false;
    }

    QJsonArray entries;
    for (const QString &identity : m_order) {
        const AccessoryHandle accessory = m_accessories.value(identity);
        if (!accessory)
            continue;
        QJsonObject entry;
        entry.insert(QStringLiteral("identity"), accessory->identity());
        entry.insert(QStringLiteral("displayName"), accessory->displayName());
        entry.insert(QStringLiteral("context"), accessory->context());
        entries.push_back(entry);
    }

    QJsonObject root;
    root.insert(QStringLiteral("accessories"), entries);

    QSaveFile file(cacheFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        if (error)
            *error = file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error)
            *error = file.errorString();
        return false;
    }
    return true;
}

} // namespace elux
