// -*- mode: c++ -*-
#ifndef ADBMULTIPLEXER_H
#define ADBMULTIPLEXER_H
#include "adbmessage.h"
#include "adboptions.h"
#include "adbstream.h"
#include <QAtomicInt>
#include <QThread>
#include <map>

class AdbWire;

/** Routes frames of an authenticated connection to its streams.

A dispatch thread reads the wire and hands every WRTE to its stream's queue,
acknowledging it at once while the queue has room. A stream whose queue is
full gets its OKAY only when its reader catches up, which stalls that stream
alone. Writers send directly; the wire serializes them. */
class AdbMultiplexer
{
public:
    AdbMultiplexer(AdbWire* wire, const ConnectionOptions& options);
    ~AdbMultiplexer();

    void start();

    /** Stops the dispatcher and fails every stream with ConnectionClosedError.
    The transport must already be closed or about to be. */
    void shutdown();

    /** Sends OPEN and waits for the device to bind or refuse the stream.
    Throws StreamRejectedError, TimeoutError or ConnectionClosedError. */
    std::unique_ptr<AdbStream> openStream(const QString& destination, int timeoutMs);

    /** Streams currently known, including ones that are still closing. */
    int streamCount() const;

    bool isFailed() const;
    QString failureReason() const;

    // Used by AdbStream.
    void send(const AdbMessage& message);
    quint32 maxPayload() const;
    void release(quint32 localId);
    int queueDepth() const { return options.streamQueueDepth; }

private:
    class DispatchThread : public QThread
    {
    public:
        explicit DispatchThread(AdbMultiplexer* mux) : mux(mux) {}
    protected:
        void run();
    private:
        AdbMultiplexer* mux;
    };

    void dispatchLoop();
    void dispatch(const AdbMessage& message);
    void onOkay(const AdbMessage& message);
    void onWrite(const AdbMessage& message);
    void onClose(const AdbMessage& message);
    void failAll(const QString& reason);
    std::shared_ptr<StreamChannel> find(quint32 localId) const;

    AdbWire* wire;
    ConnectionOptions options;
    DispatchThread dispatcher;
    QAtomicInt stopping;

    mutable QMutex tableLock;
    std::map<quint32, std::shared_ptr<StreamChannel> > streams;
    quint32 nextLocalId;
    bool failed;
    QString failure;
};

#endif // ADBMULTIPLEXER_H
