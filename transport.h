// -*- mode: c++ -*-
#ifndef TRANSPORT_H
#define TRANSPORT_H
#include <QByteArray>
#include <QString>

/** A reliable duplex byte channel to one device: a USB interface or a TCP socket.

One reader thread and one writer thread may use a transport at the same time;
the multiplexer serializes writers among themselves. close() may be called
from any thread: a read blocked at that moment returns within its own timeout
and every later call throws ConnectionClosedError. */
class Transport
{
public:
    Transport() : defaultTimeoutMs(10000) {}
    virtual ~Transport() {}

    /** Reads at most maxBytes.
    Returns an empty array when timeoutMs elapsed without data.
    Throws ConnectionClosedError once closed, TransportError on I/O failure. */
    virtual QByteArray read(int maxBytes, int timeoutMs) = 0;

    /** Writes all of data or throws (TimeoutError, ConnectionClosedError, TransportError). */
    virtual void write(const QByteArray& data, int timeoutMs) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /** Serial number, host:port or similar, for messages. */
    virtual QString description() const = 0;

    int timeout() const { return defaultTimeoutMs; }
    void setTimeout(int timeoutMs) { defaultTimeoutMs = timeoutMs; }

private:
    Transport(const Transport&);
    Transport& operator=(const Transport&);

    int defaultTimeoutMs;
};

#endif // TRANSPORT_H
