#include "adblogging.h"

Q_LOGGING_CATEGORY(lcAdbWire, "adb.wire", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAdbAuth, "adb.auth", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAdbStream, "adb.stream", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAdbSync, "adb.sync", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAdbUsb, "adb.usb", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAdbTcp, "adb.tcp", QtWarningMsg)
Q_LOGGING_CATEGORY(lcFastboot, "adb.fastboot", QtWarningMsg)

void setAdbVerboseLogging(bool verbose)
{
    if (verbose) {
        QLoggingCategory::setFilterRules("adb.*.debug=true\nadb.*.info=true");
    } else {
        QLoggingCategory::setFilterRules(QString());
    }
}
