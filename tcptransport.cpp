#include "tcptransport.h"
#include "adberror.h"
#include "adblogging.h"
#include <QElapsedTimer>
#include <QHostAddress>
#include <QHostInfo>
#include <QMetaObject>
#include <QMutex>
#include <QMutexLocker>
#include <QTcpSocket>
#include <QWaitCondition>

/** The socket side of a TcpTransport. Its slots and invokables run on the
transport's I/O thread; everything below lock is shared with other threads. */
class TcpLink : public QObject
{
    Q_OBJECT

public:
    enum Result { Done, TimedOut, Gone, Failed };

    TcpLink();

    Q_INVOKABLE int connectToPeer(const QString& address, int port, int timeoutMs);
    Q_INVOKABLE int send(const QByteArray& data, int timeoutMs);
    Q_INVOKABLE void abort();
    Q_INVOKABLE void release();

    QMutex lock;
    QWaitCondition arrived;
    QByteArray inbound;
    bool peerGone;
    QString failure;

private slots:
    void takeData();
    void lostPeer();

private:
    QTcpSocket* socket;
};

TcpLink::TcpLink()
    : peerGone(false), socket(new QTcpSocket(this))
{
    connect(socket, SIGNAL(readyRead()), this, SLOT(takeData()));
    connect(socket, SIGNAL(disconnected()), this, SLOT(lostPeer()));
}

int TcpLink::connectToPeer(const QString& address, int port, int timeoutMs)
{
    socket->abort();
    {
        QMutexLocker locker(&lock);
        inbound.clear();
        peerGone = false;
        failure.clear();
    }

    socket->connectToHost(QHostAddress(address), port);
    if (socket->waitForConnected(timeoutMs)) {
        socket->setSocketOption(QAbstractSocket::LowDelayOption, 1);
        return Done;
    }
    qCDebug(lcAdbTcp) << "connect to" << address << "failed:" << socket->errorString();
    int result = socket->error() == QAbstractSocket::SocketTimeoutError ? TimedOut : Failed;
    socket->abort();
    return result;
}

int TcpLink::send(const QByteArray& data, int timeoutMs)
{
    if (socket->state() != QAbstractSocket::ConnectedState) {
        return Gone;
    }
    QElapsedTimer timer;
    timer.start();

    if (socket->write(data) != data.size()) {
        QMutexLocker locker(&lock);
        failure = socket->errorString();
        return Failed;
    }
    while (socket->bytesToWrite() > 0) {
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            return TimedOut;
        }
        if (!socket->waitForBytesWritten(remaining)) {
            if (socket->state() != QAbstractSocket::ConnectedState) {
                return Gone;
            }
            if (socket->error() != QAbstractSocket::SocketTimeoutError) {
                QMutexLocker locker(&lock);
                failure = socket->errorString();
                return Failed;
            }
        }
    }
    return Done;
}

void TcpLink::abort()
{
    if (socket) {
        socket->abort();
    }
}

void TcpLink::release()
{
    QTcpSocket* doomed = socket;
    socket = 0;
    if (doomed) {
        doomed->disconnect(this);
        delete doomed;
    }
}

void TcpLink::takeData()
{
    if (!socket) {
        return;
    }
    QByteArray data = socket->readAll();
    QMutexLocker locker(&lock);
    inbound += data;
    arrived.wakeAll();
}

void TcpLink::lostPeer()
{
    QMutexLocker locker(&lock);
    peerGone = true;
    if (socket) {
        failure = socket->errorString();
    }
    arrived.wakeAll();
}

// Runs method on the link's thread and waits for it to return.
static bool runOnLink(TcpLink* link, const char* method,
                      QGenericReturnArgument ret = QGenericReturnArgument(),
                      QGenericArgument a0 = QGenericArgument(),
                      QGenericArgument a1 = QGenericArgument(),
                      QGenericArgument a2 = QGenericArgument())
{
    Qt::ConnectionType type = QThread::currentThread() == link->thread()
                                  ? Qt::DirectConnection : Qt::BlockingQueuedConnection;
    return QMetaObject::invokeMethod(link, method, type, ret, a0, a1, a2);
}

TcpTransport::TcpTransport(const QString& peer)
    : peer(peer), link(new TcpLink), closed(0)
{
    link->moveToThread(&ioThread);
    ioThread.setObjectName("adb tcp " + peer);
    ioThread.start();
}

TcpTransport::~TcpTransport()
{
    close();
    if (!runOnLink(link, "release")) {
        qCWarning(lcAdbTcp) << "could not release the socket of" << peer;
    }
    ioThread.quit();
    ioThread.wait();
    delete link;
}

bool TcpTransport::parseSerial(const QString& serial, QString* host, quint16* port)
{
    int colon = serial.lastIndexOf(':');
    if (colon < 0) {
        *host = serial;
        *port = ADB_DEFAULT_TCP_PORT;
        return !serial.isEmpty();
    }

    bool ok = false;
    uint value = serial.mid(colon + 1).toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        return false;
    }
    *host = serial.left(colon);
    *port = value;
    return !host->isEmpty();
}

std::unique_ptr<TcpTransport> TcpTransport::connectTo(const QString& host, quint16 port,
                                                      int timeoutMs)
{
    QList<QHostAddress> addresses;
    QHostAddress literal;
    if (literal.setAddress(host)) {
        addresses << literal;
    } else {
        QHostInfo info = QHostInfo::fromName(host);
        if (info.error() != QHostInfo::NoError) {
            throw TransportError(QString("cannot resolve %1: %2").arg(host).arg(info.errorString()));
        }
        addresses = info.addresses();
    }

    std::unique_ptr<TcpTransport> transport(new TcpTransport(QString("%1:%2").arg(host).arg(port)));
    foreach (const QHostAddress& address, addresses) {
        int result = TcpLink::Failed;
        if (!runOnLink(transport->link, "connectToPeer", Q_RETURN_ARG(int, result),
                       Q_ARG(QString, address.toString()), Q_ARG(int, port), Q_ARG(int, timeoutMs))) {
            throw TransportError(QString("cannot start connecting to %1").arg(transport->peer));
        }
        if (result == TcpLink::Done) {
            qCDebug(lcAdbTcp) << "connected to" << transport->peer << "via" << address.toString();
            return transport;
        }
        if (result == TcpLink::TimedOut) {
            throw TimeoutError(QString("connecting to %1:%2 timed out after %3ms")
                                   .arg(address.toString()).arg(port).arg(timeoutMs));
        }
    }
    throw TransportError(QString("failed to connect to %1:%2").arg(host).arg(port));
}

QByteArray TcpTransport::read(int maxBytes, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    QMutexLocker locker(&link->lock);
    for (;;) {
        if (closed.loadAcquire()) {
            throw ConnectionClosedError(QString("connection to %1 closed").arg(peer));
        }
        if (!link->inbound.isEmpty()) {
            QByteArray data = link->inbound.left(maxBytes);
            link->inbound.remove(0, data.size());
            return data;
        }
        if (link->peerGone) {
            closed.storeRelease(1);
            throw ConnectionClosedError(QString("%1 closed the connection: %2").arg(peer).arg(link->failure));
        }
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            return QByteArray();
        }
        link->arrived.wait(&link->lock, remaining);
    }
}

void TcpTransport::write(const QByteArray& data, int timeoutMs)
{
    if (closed.loadAcquire()) {
        throw ConnectionClosedError(QString("connection to %1 closed").arg(peer));
    }

    int result = TcpLink::Failed;
    if (!runOnLink(link, "send", Q_RETURN_ARG(int, result), Q_ARG(QByteArray, data), Q_ARG(int, timeoutMs))) {
        throw TransportError(QString("cannot hand data for %1 to the socket thread").arg(peer));
    }
    switch (result) {
    case TcpLink::Done:
        return;
    case TcpLink::TimedOut:
        throw TimeoutError(QString("sending data to %1 timed out after %2ms").arg(peer).arg(timeoutMs));
    case TcpLink::Gone:
        throw ConnectionClosedError(QString("connection to %1 closed").arg(peer));
    }
    QMutexLocker locker(&link->lock);
    throw TransportError(QString("could not send data to %1: %2").arg(peer).arg(link->failure));
}

void TcpTransport::close()
{
    if (closed.testAndSetOrdered(0, 1)) {
        qCDebug(lcAdbTcp) << "closing" << peer;
        {
            QMutexLocker locker(&link->lock);
            link->arrived.wakeAll();
        }
        if (!runOnLink(link, "abort")) {
            qCWarning(lcAdbTcp) << "could not abort the socket of" << peer;
        }
    }
}

bool TcpTransport::isOpen() const
{
    if (closed.loadAcquire()) {
        return false;
    }
    QMutexLocker locker(&link->lock);
    return !link->peerGone;
}

#include "tcptransport.moc"
