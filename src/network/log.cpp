#include "network/log.hpp"

Q_LOGGING_CATEGORY(lanternScanLog, "lantern.scan")
Q_LOGGING_CATEGORY(lanternResolverLog, "lantern.resolver")
Q_LOGGING_CATEGORY(lanternProberLog, "lantern.prober")
Q_LOGGING_CATEGORY(lanternStorageLog, "lantern.storage")
Q_LOGGING_CATEGORY(lanternNotifyLog, "lantern.notify")
