// -*- mode: c++ -*-
#ifndef ADBLOGGING_H
#define ADBLOGGING_H
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcAdbWire)
Q_DECLARE_LOGGING_CATEGORY(lcAdbAuth)
Q_DECLARE_LOGGING_CATEGORY(lcAdbStream)
Q_DECLARE_LOGGING_CATEGORY(lcAdbSync)
Q_DECLARE_LOGGING_CATEGORY(lcAdbUsb)
Q_DECLARE_LOGGING_CATEGORY(lcAdbTcp)
Q_DECLARE_LOGGING_CATEGORY(lcFastboot)

/** Turns debug output of every adb.* category on or off.
QT_LOGGING_RULES set in the environment still takes precedence. */
void setAdbVerboseLogging(bool verbose);

#endif // ADBLOGGING_H
