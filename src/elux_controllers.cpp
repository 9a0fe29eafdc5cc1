#include "elux_controllers.h"

#include <algorithm>
#include <cmath>

#include "elux_logging.h"

namespace elux {

namespace {

struct ModelEntry {
    const char *name;
    ApplianceModel model;
};

// Cloud model names, matched case-sensitively as reported by applianceData.modelName.
constexpr ModelEntry kModels[] = {
    {"PUREA9", ApplianceModel::PureA9},
    {"WELLA5", ApplianceModel::WellA5},
    {"WELLA7", ApplianceModel::WellA7},
    {"Muju", ApplianceModel::UltimateHome500},
    {"Azul", ApplianceModel::Comfort600},
};

std::optional<double> readNumber(const QJsonObject &obj, const QString &key)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble())
        return value.toDouble();
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().toDouble(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

QString readText(const QJsonObject &obj, const QString &key)
{
    return obj.value(key).toString().trimmed().toLower();
}

int airQualityFromPm25(double pm25)
{
    if (pm25 <= 10.0)
        return 1;
    if (pm25 <= 20.0)
        return 2;
    if (pm25 <= 25.0)
        return 3;
    if (pm25 <= 50.0)
        return 4;
    return 5;
}

bool isRunning(const QJsonObject &reported)
{
    const QString state = readText(reported, QStringLiteral("applianceState"));
    return !state.isEmpty() && state != QLatin1String("off");
}

} // namespace

std::optional<ApplianceModel> modelFromName(const QString &modelName)
{
    for (const ModelEntry &entry : kModels) {
        if (modelName == QLatin1String(entry.name))
            return entry.model;
    }
    return std::nullopt;
}

QString modelName(ApplianceModel model)
{
    for (const ModelEntry &entry : kModels) {
        if (entry.model == model)
            return QString::fromLatin1(entry.name);
    }
    return {};
}

ApplianceController::ApplianceController(const ControllerContext &context)
    : m_host(context.host)
    , m_accessory(context.accessory)
    , m_descriptor(context.descriptor)
    , m_capabilities(context.capabilities)
{
    const QString info = QStringLiteral("AccessoryInformation");
    publish(info, QStringLiteral("Manufacturer"), QStringLiteral("Electrolux"));
    publish(info, QStringLiteral("Model"), m_descriptor.modelName);
    publish(info, QStringLiteral("SerialNumber"), m_descriptor.applianceId);
    publish(info, QStringLiteral("Name"), m_descriptor.displayName);
}

void ApplianceController::update(const ApplianceDescriptor &descriptor)
{
    m_descriptor = descriptor;

    bool changed = publish(QStringLiteral("AccessoryInformation"), QStringLiteral("StatusFault"),
                           descriptor.isConnected() || descriptor.connectionState.isEmpty() ? 0 : 1);
    if (applyState(descriptor.reportedProperties()))
        changed = true;

    if (changed && m_host && m_accessory) {
        qCDebug(eluxControllerLog) << "State changed for" << m_accessory->displayName();
        m_host->updateAccessories({m_accessory});
    }
}

bool ApplianceController::publish(const QString &service, const QString &characteristic, const QVariant &value)
{
    if (!m_accessory)
        return false;
    return m_accessory->setCharacteristic(service, characteristic, value);
}

bool ApplianceController::supports(const QString &capability) const
{
    if (!m_capabilities.isKnown())
        return true;
    return m_capabilities.has(capability);
}

AirPurifierController::AirPurifierController(const ControllerContext &context, int maxFanSpeed)
    : ApplianceController(context)
    , m_maxFanSpeed(std::max(1, maxFanSpeed))
{
}

bool AirPurifierController::applyState(const QJsonObject &reported)
{
    const QString service = QStringLiteral("AirPurifier");
    bool changed = false;

    const QString workmode = readText(reported, QStringLiteral("Workmode"));
    if (!workmode.isEmpty()) {
        const bool active = workmode != QLatin1String("poweroff");
        changed |= publish(service, QStringLiteral("Active"), active ? 1 : 0);
        changed |= publish(service, QStringLiteral("CurrentAirPurifierState"), active ? 2 : 0);
        changed |= publish(service, QStringLiteral("TargetAirPurifierState"),
                           workmode == QLatin1String("auto") ? 1 : 0);
    }

    if (const auto fanspeed = readNumber(reported, QStringLiteral("Fanspeed"))) {
        const double percent = std::clamp(*fanspeed, 0.0, double(m_maxFanSpeed)) * 100.0 / m_maxFanSpeed;
        changed |= publish(service, QStringLiteral("RotationSpeed"), int(std::lround(percent)));
    }

    if (supports(QStringLiteral("SafetyLock"))) {
        const QJsonValue lock = reported.value(QStringLiteral("SafetyLock"));
        if (lock.isBool())
            changed |= publish(service, QStringLiteral("LockPhysicalControls"), lock.toBool() ? 1 : 0);
    }

    if (supports(QStringLiteral("PM2_5"))) {
        if (const auto pm25 = readNumber(reported, QStringLiteral("PM2_5"))) {
            changed |= publish(QStringLiteral("AirQualitySensor"), QStringLiteral("PM2_5Density"), *pm25);
            changed |= publish(QStringLiteral("AirQualitySensor"), QStringLiteral("AirQuality"),
                               airQualityFromPm25(*pm25));
        }
    }
    if (supports(QStringLiteral("PM10"))) {
        if (const auto pm10 = readNumber(reported, QStringLiteral("PM10")))
            changed |= publish(QStringLiteral("AirQualitySensor"), QStringLiteral("PM10Density"), *pm10);
    }
    if (supports(QStringLiteral("Temp"))) {
        if (const auto temp = readNumber(reported, QStringLiteral("Temp")))
            changed |= publish(QStringLiteral("TemperatureSensor"), QStringLiteral("CurrentTemperature"), *temp);
    }
    if (supports(QStringLiteral("Humidity"))) {
        if (const auto humidity = readNumber(reported, QStringLiteral("Humidity")))
            changed |= publish(QStringLiteral("HumiditySensor"), QStringLiteral("CurrentRelativeHumidity"),
                               *humidity);
    }
    if (supports(QStringLiteral("FilterLife"))) {
        if (const auto filterLife = readNumber(reported, QStringLiteral("FilterLife"))) {
            changed |= publish(QStringLiteral("FilterMaintenance"), QStringLiteral("FilterLifeLevel"), *filterLife);
            changed |= publish(QStringLiteral("FilterMaintenance"), QStringLiteral("FilterChangeIndication"),
                               *filterLife < 10.0 ? 1 : 0);
        }
    }

    return changed;
}

bool DehumidifierController::applyState(const QJsonObject &reported)
{
    const QString service = QStringLiteral("HumidifierDehumidifier");
    bool changed = false;

    if (reported.contains(QStringLiteral("applianceState"))) {
        const bool running = isRunning(reported);
        changed |= publish(service, QStringLiteral("Active"), running ? 1 : 0);
        changed |= publish(service, QStringLiteral("CurrentHumidifierDehumidifierState"), running ? 3 : 0);
        changed |= publish(service, QStringLiteral("TargetHumidifierDehumidifierState"), 2);
    }

    if (const auto humidity = readNumber(reported, QStringLiteral("sensorHumidity")))
        changed |= publish(service, QStringLiteral("CurrentRelativeHumidity"), *humidity);

    if (supports(QStringLiteral("targetHumidity"))) {
        if (const auto target = readNumber(reported, QStringLiteral("targetHumidity")))
            changed |= publish(service, QStringLiteral("RelativeHumidityDehumidifierThreshold"), *target);
    }

    if (supports(QStringLiteral("waterTankFull"))) {
        const QJsonValue tankFull = reported.value(QStringLiteral("waterTankFull"));
        if (tankFull.isBool())
            changed |= publish(service, QStringLiteral("WaterLevel"), tankFull.toBool() ? 100 : 0);
    }

    return changed;
}

bool AirConditionerController::applyState(const QJsonObject &reported)
{
    const QString service = QStringLiteral("HeaterCooler");
    bool changed = false;

    const bool running = isRunning(reported);
    const QString mode = readText(reported, QStringLiteral("mode"));

    if (reported.contains(QStringLiteral("applianceState")))
        changed |= publish(service, QStringLiteral("Active"), running ? 1 : 0);

    if (!mode.isEmpty()) {
        int target = 0;
        int current = running ? 1 : 0;
        if (mode == QLatin1String("heat")) {
            target = 1;
            current = running ? 2 : 0;
        } else if (mode == QLatin1String("cool")) {
            target = 2;
            current = running ? 3 : 0;
        }
        changed |= publish(service, QStringLiteral("TargetHeaterCoolerState"), target);
        changed |= publish(service, QStringLiteral("CurrentHeaterCoolerState"), current);
    }

    if (const auto ambient = readNumber(reported, QStringLiteral("ambientTemperatureC")))
        changed |= publish(service, QStringLiteral("CurrentTemperature"), *ambient);

    if (supports(QStringLiteral("targetTemperatureC"))) {
        if (const auto target = readNumber(reported, QStringLiteral("targetTemperatureC"))) {
            changed |= publish(service, QStringLiteral("CoolingThresholdTemperature"), *target);
            changed |= publish(service, QStringLiteral("HeatingThresholdTemperature"), *target);
        }
    }

    if (supports(QStringLiteral("fanSpeedSetting"))) {
        const QString fan = readText(reported, QStringLiteral("fanSpeedSetting"));
        int speed = -1;
        if (fan == QLatin1String("low"))
            speed = 33;
        else if (fan == QLatin1String("middle"))
            speed = 66;
        else if (fan == QLatin1String("high"))
            speed = 100;
        else if (fan == QLatin1String("auto"))
            speed = 0;
        if (speed >= 0)
            changed |= publish(service, QStringLiteral("RotationSpeed"), speed);
    }

    return changed;
}

std::unique_ptr<ApplianceController> createController(ApplianceModel model, const ControllerContext &context)
{
    if (!context.accessory) {
        qCWarning(eluxControllerLog) << "Cannot create controller for" << context.descriptor.applianceId
                                     << "without an accessory";
        return nullptr;
    }

    std::unique_ptr<ApplianceController> controller;
    switch (model) {
    case ApplianceModel::PureA9:
        controller = std::make_unique<AirPurifierController>(context, 9);
        break;
    case ApplianceModel::WellA5:
    case ApplianceModel::WellA7:
        controller = std::make_unique<AirPurifierController>(context, 5);
        break;
    case ApplianceModel::UltimateHome500:
        controller = std::make_unique<DehumidifierController>(context);
        break;
    case ApplianceModel::Comfort600:
        controller = std::make_unique<AirConditionerController>(context);
        break;
    }

    if (controller)
        controller->update(context.descriptor);
    return controller;
}

ControllerFactory findControllerFactory(const QString &modelName)
{
    const std::optional<ApplianceModel> model = modelFromName(modelName);
    if (!model.has_value())
        return {};

    const ApplianceModel resolved = *model;
    return [resolved](const ControllerContext &context) {
        return createController(resolved, context);
    };
}

} // namespace elux
