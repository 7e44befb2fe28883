#pragma once

#include <QLoggingCategory>

// Logging categories shared by the network, scan and daemon layers.
Q_DECLARE_LOGGING_CATEGORY(lanternScanLog)
Q_DECLARE_LOGGING_CATEGORY(lanternResolverLog)
Q_DECLARE_LOGGING_CATEGORY(lanternProberLog)
Q_DECLARE_LOGGING_CATEGORY(lanternStorageLog)
Q_DECLARE_LOGGING_CATEGORY(lanternNotifyLog)
