// -*- mode: c++ -*-
#ifndef ADBCONNECTION_H
#define ADBCONNECTION_H
#include "adbhandshake.h"
#include "adboptions.h"
#include "adbstream.h"
#include "transport.h"
#include <memory>

class AdbMultiplexer;
class AdbWire;

/** One authenticated ADB session over a transport it owns.

connect() runs the handshake; afterwards any number of streams may be
opened, from any thread. Closing the connection, or losing the transport,
fails every stream still in use with ConnectionClosedError. */
class AdbConnection
{
public:
    explicit AdbConnection(std::unique_ptr<Transport> transport,
                           const ConnectionOptions& options = ConnectionOptions());
    ~AdbConnection();

    void connect(const QList<AuthSigner*>& signers = QList<AuthSigner*>());

    std::unique_ptr<AdbStream> openStream(const QString& destination);
    std::unique_ptr<AdbStream> openStream(const QString& destination, int timeoutMs);

    void close();
    bool isConnected() const;

    const AdbConnectionInfo& info() const { return connectionInfo; }
    QString deviceState() const { return connectionInfo.banner.state; }
    bool hasFeature(const QString& feature) const;

    const ConnectionOptions& options() const { return opts; }
    Transport* transport() const { return link.get(); }

private:
    AdbConnection(const AdbConnection&);
    AdbConnection& operator=(const AdbConnection&);

    ConnectionOptions opts;
    std::unique_ptr<Transport> link;
    std::unique_ptr<AdbWire> wire;
    std::unique_ptr<AdbMultiplexer> mux;
    AdbConnectionInfo connectionInfo;
};

#endif // ADBCONNECTION_H
