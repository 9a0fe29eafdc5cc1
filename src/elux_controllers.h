#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <QJsonObject>
#include <QString>
#include <QVariant>

#include "elux_accessory.h"
#include "elux_model.h"

namespace elux {

enum class ApplianceModel {
    PureA9,
    WellA5,
    WellA7,
    UltimateHome500,
    Comfort600
};

std::optional<ApplianceModel> modelFromName(const QString &modelName);
QString modelName(ApplianceModel model);

struct ControllerContext {
    AccessoryHost *host = nullptr;
    AccessoryHandle accessory;
    ApplianceDescriptor descriptor;
    Capabilities capabilities;
};

class ApplianceController
{
public:
    explicit ApplianceController(const ControllerContext &context);
    virtual ~ApplianceController() = default;

    ApplianceController(const ApplianceController &) = delete;
    ApplianceController &operator=(const ApplianceController &) = delete;

    // Maps the reported status in descriptor onto the accessory and asks the
    // host to persist it when anything changed.
    void update(const ApplianceDescriptor &descriptor);

    const ApplianceDescriptor &descriptor() const { return m_descriptor; }
    const Capabilities &capabilities() const { return m_capabilities; }
    const AccessoryHandle &accessory() const { return m_accessory; }

protected:
    virtual bool applyState(const QJsonObject &reported) = 0;

    bool publish(const QString &service, const QString &characteristic, const QVariant &value);
    // Optional characteristics are only published when a known capability
    // document lists them. Without a document, whatever is reported is shown.
    bool supports(const QString &capability) const;

private:
    AccessoryHost *m_host = nullptr;
    AccessoryHandle m_accessory;
    ApplianceDescriptor m_descriptor;
    Capabilities m_capabilities;
};

class AirPurifierController final : public ApplianceController
{
public:
    AirPurifierController(const ControllerContext &context, int maxFanSpeed);

protected:
    bool applyState(const QJsonObject &reported) override;

private:
    int m_maxFanSpeed;
};

class DehumidifierController final : public ApplianceController
{
public:
    using ApplianceController::ApplianceController;

protected:
    bool applyState(const QJsonObject &reported) override;
};

class AirConditionerController final : public ApplianceController
{
public:
    using ApplianceController::ApplianceController;

protected:
    bool applyState(const QJsonObject &reported) override;
};

using ControllerFactory = std::function<std::unique_ptr<ApplianceController>(const ControllerContext &)>;

std::unique_ptr<ApplianceController> createController(ApplianceModel model, const ControllerContext &context);

// Empty for models without a controller.
ControllerFactory findControllerFactory(const QString &modelName);

} // namespace elux
