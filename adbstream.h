// -*- mode: c++ -*-
#ifndef ADBSTREAM_H
#define ADBSTREAM_H
#include <QByteArray>
#include <QMutex>
#include <QQueue>
#include <QString>
#include <QWaitCondition>
#include <memory>

class AdbMultiplexer;

/** Per-stream state shared between the dispatcher and the stream's user.
Everything below lock is guarded by it. */
struct StreamChannel
{
    enum State { Opening, Open, Closing, Closed };

    StreamChannel(quint32 localId, const QString& destination)
        : localId(localId), remoteId(0), destination(destination), state(Opening),
          writeCredit(false), ackOwed(false), connectionLost(false) {}

    const quint32 localId;
    quint32 remoteId;
    const QString destination;

    QMutex lock;
    QWaitCondition changed;
    State state;
    bool writeCredit;       // no WRTE of ours is waiting for its OKAY
    bool ackOwed;           // the device's last WRTE was not acked, queue was full
    bool connectionLost;
    QString lostReason;
    QQueue<QByteArray> inbound;

    QMutex writeLock;       // one writer at a time per stream
};

/** One logical channel ("shell:ls", "sync:", ...) on an AdbConnection.
Must not outlive the connection it was opened on. */
class AdbStream
{
public:
    AdbStream(AdbMultiplexer* mux, const std::shared_ptr<StreamChannel>& channel, int timeoutMs);
    ~AdbStream();

    /** Sends data as one or more WRTE frames no larger than the negotiated
    payload, each after the previous one was acknowledged, and returns once
    the last one is. Throws StreamClosedError when either side closed the
    stream, ConnectionClosedError when the connection went away and
    TimeoutError when the device stops acknowledging. */
    void write(const QByteArray& data);

    /** Next payload received, in arrival order. Returns false once the device
    closed the stream and everything queued was read. */
    bool read(QByteArray* data);
    bool read(QByteArray* data, int timeoutMs);

    /** Everything until the device closes the stream. */
    QByteArray readAll();

    /** Sends CLSE and waits for the device's answer. Does nothing when the
    stream is already closed. */
    void close();

    StreamChannel::State state() const;
    quint32 localId() const { return channel->localId; }
    quint32 remoteId() const;
    QString destination() const { return channel->destination; }

    /** Largest payload a single WRTE may carry on this connection. */
    quint32 maxPayload() const;

    int timeout() const { return timeoutMs; }
    void setTimeout(int ms) { timeoutMs = ms; }

private:
    AdbStream(const AdbStream&);
    AdbStream& operator=(const AdbStream&);

    AdbMultiplexer* mux;
    std::shared_ptr<StreamChannel> channel;
    int timeoutMs;
};

#endif // ADBSTREAM_H
