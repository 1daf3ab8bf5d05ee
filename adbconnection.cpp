#include "adbconnection.h"
#include "adberror.h"
#include "adblogging.h"
#include "adbmultiplexer.h"
#include "adbwire.h"

AdbConnection::AdbConnection(std::unique_ptr<Transport> transport, const ConnectionOptions& options)
    : opts(options), link(std::move(transport))
{
    if (opts.maxPayload == 0 || opts.maxPayload > MAX_PAYLOAD) {
        throw AdbError(QString("max payload must be between 1 and %1 bytes").arg(MAX_PAYLOAD));
    }
    link->setTimeout(opts.timeoutMs);
    wire.reset(new AdbWire(link.get()));
}

AdbConnection::~AdbConnection()
{
    close();
}

void AdbConnection::connect(const QList<AuthSigner*>& signers)
{
    if (mux) {
        throw AdbError("connection is already established");
    }

    AdbHandshake handshake(wire.get(), opts);
    try {
        connectionInfo = handshake.run(signers);
    } catch (const AdbError&) {
        link->close();
        throw;
    }

    mux.reset(new AdbMultiplexer(wire.get(), opts));
    mux->start();
}

std::unique_ptr<AdbStream> AdbConnection::openStream(const QString& destination)
{
    return openStream(destination, opts.timeoutMs);
}

std::unique_ptr<AdbStream> AdbConnection::openStream(const QString& destination, int timeoutMs)
{
    if (!mux) {
        throw ConnectionClosedError("not connected");
    }
    return mux->openStream(destination, timeoutMs);
}

void AdbConnection::close()
{
    link->close();
    if (mux) {
        mux->shutdown();
    }
}

bool AdbConnection::isConnected() const
{
    return mux && !mux->isFailed() && link->isOpen();
}

bool AdbConnection::hasFeature(const QString& feature) const
{
    return connectionInfo.banner.features.contains(feature);
}
