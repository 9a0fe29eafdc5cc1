#include "elux_logging.h"

Q_LOGGING_CATEGORY(eluxSessionLog, "elux.session")
Q_LOGGING_CATEGORY(eluxClientLog, "elux.client")
Q_LOGGING_CATEGORY(eluxDiscoveryLog, "elux.discovery")
Q_LOGGING_CATEGORY(eluxPollingLog, "elux.polling")
Q_LOGGING_CATEGORY(eluxAccessoryLog, "elux.accessories")
Q_LOGGING_CATEGORY(eluxControllerLog, "elux.controllers")
