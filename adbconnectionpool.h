// -*- mode: c++ -*-
#ifndef ADBCONNECTIONPOOL_H
#define ADBCONNECTIONPOOL_H
#include "adbconnection.h"
#include <functional>
#include <map>
#include <memory>

/** Connections keyed by device serial, owned by whoever creates the pool.

The connector opens and authenticates a connection for a serial that has
none yet; a connection found broken is replaced on the next get(). */
class AdbConnectionPool
{
public:
    typedef std::function<std::unique_ptr<AdbConnection>(const QString& serial)> Connector;

    explicit AdbConnectionPool(const Connector& connector);
    ~AdbConnectionPool();

    /** The live connection for serial, connecting first when needed.
    Whatever the connector throws is passed on. */
    AdbConnection* get(const QString& serial);

    bool contains(const QString& serial) const;
    QStringList serials() const;

    void remove(const QString& serial);
    void closeAll();

private:
    AdbConnectionPool(const AdbConnectionPool&);
    AdbConnectionPool& operator=(const AdbConnectionPool&);

    Connector connector;
    std::map<QString, std::unique_ptr<AdbConnection> > connections;
};

#endif // ADBCONNECTIONPOOL_H
