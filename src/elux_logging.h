#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(eluxSessionLog)
Q_DECLARE_LOGGING_CATEGORY(eluxClientLog)
Q_DECLARE_LOGGING_CATEGORY(eluxDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(eluxPollingLog)
Q_DECLARE_LOGGING_CATEGORY(eluxAccessoryLog)
Q_DECLARE_LOGGING_CATEGORY(eluxControllerLog)
