#include "adbconnectionpool.h"
#include "adberror.h"
#include "adblogging.h"
#include <QStringList>

AdbConnectionPool::AdbConnectionPool(const Connector& connector)
    : connector(connector)
{
}

AdbConnectionPool::~AdbConnectionPool()
{
    closeAll();
}

AdbConnection* AdbConnectionPool::get(const QString& serial)
{
    std::map<QString, std::unique_ptr<AdbConnection> >::iterator it = connections.find(serial);
    if (it != connections.end()) {
        if (it->second->isConnected()) {
            return it->second.get();
        }
        qCDebug(lcAdbStream) << "dropping broken connection to" << serial;
        connections.erase(it);
    }

    std::unique_ptr<AdbConnection> connection = connector(serial);
    if (!connection) {
        throw TransportError(QString("no connection could be made to %1").arg(serial));
    }
    AdbConnection* result = connection.get();
    connections[serial] = std::move(connection);
    return result;
}

bool AdbConnectionPool::contains(const QString& serial) const
{
    return connections.find(serial) != connections.end();
}

QStringList AdbConnectionPool::serials() const
{
    QStringList result;
    std::map<QString, std::unique_ptr<AdbConnection> >::const_iterator it;
    for (it = connections.begin(); it != connections.end(); ++it) {
        result << it->first;
    }
    return result;
}

void AdbConnectionPool::remove(const QString& serial)
{
    connections.erase(serial);
}

void AdbConnectionPool::closeAll()
{
    connections.clear();
}
