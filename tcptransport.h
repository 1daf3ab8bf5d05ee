// -*- mode: c++ -*-
#ifndef TCPTRANSPORT_H
#define TCPTRANSPORT_H
#include "transport.h"
#include <QAtomicInt>
#include <QThread>
#include <memory>

class TcpLink;

const quint16 ADB_DEFAULT_TCP_PORT = 5555;

/** adbd listening on a TCP port ("adb tcpip", emulators).

The QTcpSocket lives on a thread of its own. write() and close() are handed
to that thread; read() takes from a buffer the socket fills as data arrives,
so any thread may read, write or close. */
class TcpTransport : public Transport
{
public:
    ~TcpTransport();

    /** Resolves host and connects, giving up after timeoutMs. */
    static std::unique_ptr<TcpTransport> connectTo(const QString& host, quint16 port, int timeoutMs);

    /** Splits "host" or "host:port"; port defaults to 5555. */
    static bool parseSerial(const QString& serial, QString* host, quint16* port);

    QByteArray read(int maxBytes, int timeoutMs);
    void write(const QByteArray& data, int timeoutMs);
    void close();
    bool isOpen() const;
    QString description() const { return peer; }

private:
    explicit TcpTransport(const QString& peer);

    QString peer;
    QThread ioThread;
    TcpLink* link;
    QAtomicInt closed;
};

#endif // TCPTRANSPORT_H
