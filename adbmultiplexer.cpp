#include "adbmultiplexer.h"
#include "adberror.h"
#include "adblogging.h"
#include "adbwire.h"
#include "transport.h"
#include <QElapsedTimer>
#include <QMutexLocker>

void AdbMultiplexer::DispatchThread::run()
{
    mux->dispatchLoop();
}

AdbMultiplexer::AdbMultiplexer(AdbWire* wire, const ConnectionOptions& options)
    : wire(wire), options(options), dispatcher(this), stopping(0),
      nextLocalId(1), failed(false)
{
}

AdbMultiplexer::~AdbMultiplexer()
{
    shutdown();
}

void AdbMultiplexer::start()
{
    dispatcher.start();
}

void AdbMultiplexer::shutdown()
{
    stopping.storeRelease(1);
    if (dispatcher.isRunning()) {
        dispatcher.wait();
    }
    failAll("connection closed");
}

int AdbMultiplexer::streamCount() const
{
    QMutexLocker locker(&tableLock);
    return int(streams.size());
}

bool AdbMultiplexer::isFailed() const
{
    QMutexLocker locker(&tableLock);
    return failed;
}

QString AdbMultiplexer::failureReason() const
{
    QMutexLocker locker(&tableLock);
    return failure;
}

void AdbMultiplexer::send(const AdbMessage& message)
{
    wire->send(message, options.timeoutMs);
}

quint32 AdbMultiplexer::maxPayload() const
{
    return wire->maxPayload();
}

void AdbMultiplexer::release(quint32 localId)
{
    QMutexLocker locker(&tableLock);
    streams.erase(localId);
}

std::shared_ptr<StreamChannel> AdbMultiplexer::find(quint32 localId) const
{
    QMutexLocker locker(&tableLock);
    std::map<quint32, std::shared_ptr<StreamChannel> >::const_iterator it = streams.find(localId);
    if (it == streams.end()) {
        return std::shared_ptr<StreamChannel>();
    }
    return it->second;
}

std::unique_ptr<AdbStream> AdbMultiplexer::openStream(const QString& destination, int timeoutMs)
{
    std::shared_ptr<StreamChannel> channel;
    {
        QMutexLocker locker(&tableLock);
        if (failed) {
            throw ConnectionClosedError(failure);
        }
        channel = std::make_shared<StreamChannel>(nextLocalId++, destination);
        streams[channel->localId] = channel;
    }

    qCDebug(lcAdbStream) << "opening" << destination << "as" << channel->localId;
    QByteArray payload = destination.toUtf8();
    payload.append('\0');
    try {
        send(AdbMessage(A_OPEN, channel->localId, 0, payload));
    } catch (const AdbError&) {
        release(channel->localId);
        throw;
    }

    QElapsedTimer timer;
    timer.start();
    QMutexLocker locker(&channel->lock);
    while (channel->state == StreamChannel::Opening && !channel->connectionLost) {
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0 || !channel->changed.wait(&channel->lock, remaining)) {
            if (channel->state != StreamChannel::Opening || channel->connectionLost) {
                break;
            }
            locker.unlock();
            release(channel->localId);
            throw TimeoutError(QString("device did not answer OPEN '%1' within %2ms")
                                   .arg(destination).arg(timeoutMs));
        }
    }

    if (channel->connectionLost) {
        QString reason = channel->lostReason;
        locker.unlock();
        release(channel->localId);
        throw ConnectionClosedError(reason);
    }
    if (channel->state == StreamChannel::Closed) {
        locker.unlock();
        release(channel->localId);
        throw StreamRejectedError(QString("device refused to open '%1'").arg(destination));
    }
    locker.unlock();

    return std::unique_ptr<AdbStream>(new AdbStream(this, channel, timeoutMs));
}

void AdbMultiplexer::dispatchLoop()
{
    while (!stopping.loadAcquire()) {
        AdbMessage message;
        try {
            if (!wire->receive(&message, options.pollIntervalMs)) {
                continue;
            }
            dispatch(message);
        } catch (const AdbError& e) {
            if (!stopping.loadAcquire()) {
                qCWarning(lcAdbStream) << "connection lost:" << e.message();
            }
            failAll(e.message());
            return;
        }
    }
}

void AdbMultiplexer::dispatch(const AdbMessage& message)
{
    switch (message.command) {
    case A_OKAY:
        onOkay(message);
        break;
    case A_WRTE:
        onWrite(message);
        break;
    case A_CLSE:
        onClose(message);
        break;
    case A_OPEN:
        qCDebug(lcAdbStream) << "refusing device-initiated OPEN" << message.payload;
        send(AdbMessage(A_CLSE, 0, message.arg0));
        break;
    case A_CNXN:
    case A_AUTH:
        throw ProtocolError(ProtocolError::UnexpectedCommand,
                            QString("%1 on an established connection").arg(commandName(message.command)));
    default:
        qCWarning(lcAdbStream) << "ignoring" << describeMessage(message);
        break;
    }
}

void AdbMultiplexer::onOkay(const AdbMessage& message)
{
    std::shared_ptr<StreamChannel> channel = find(message.arg1);
    if (!channel) {
        qCWarning(lcAdbStream) << "OKAY for unknown stream" << message.arg1;
        return;
    }

    QMutexLocker locker(&channel->lock);
    if (channel->state == StreamChannel::Opening) {
        channel->remoteId = message.arg0;
        channel->state = StreamChannel::Open;
        channel->writeCredit = true;
        qCDebug(lcAdbStream) << channel->destination << "bound to remote" << message.arg0;
    } else {
        if (message.arg0 != channel->remoteId) {
            qCWarning(lcAdbStream) << "OKAY from remote" << message.arg0 << "for stream"
                                   << channel->localId << "bound to" << channel->remoteId;
        }
        channel->writeCredit = true;
    }
    channel->changed.wakeAll();
}

void AdbMultiplexer::onWrite(const AdbMessage& message)
{
    std::shared_ptr<StreamChannel> channel = find(message.arg1);
    if (!channel) {
        qCWarning(lcAdbStream) << "WRTE for unknown stream" << message.arg1;
        return;
    }

    bool ack = false;
    {
        QMutexLocker locker(&channel->lock);
        if (channel->state != StreamChannel::Open) {
            qCDebug(lcAdbStream) << "dropping WRTE for stream" << channel->localId << "that is not open";
            return;
        }
        channel->inbound.enqueue(message.payload);
        if (channel->inbound.size() < options.streamQueueDepth) {
            ack = true;
        } else {
            channel->ackOwed = true;
        }
        channel->changed.wakeAll();
    }
    if (ack) {
        send(AdbMessage(A_OKAY, message.arg1, message.arg0));
    }
}

void AdbMultiplexer::onClose(const AdbMessage& message)
{
    std::shared_ptr<StreamChannel> channel = find(message.arg1);
    if (!channel) {
        qCDebug(lcAdbStream) << "CLSE for unknown stream" << message.arg1;
        return;
    }

    bool answer = false;
    quint32 remoteId;
    {
        QMutexLocker locker(&channel->lock);
        answer = channel->state == StreamChannel::Open;
        remoteId = channel->remoteId;
        channel->state = StreamChannel::Closed;
        channel->changed.wakeAll();
    }
    qCDebug(lcAdbStream) << "device closed stream" << channel->localId << channel->destination;
    if (answer) {
        send(AdbMessage(A_CLSE, channel->localId, remoteId));
    }
}

void AdbMultiplexer::failAll(const QString& reason)
{
    std::map<quint32, std::shared_ptr<StreamChannel> > snapshot;
    QString why;
    {
        QMutexLocker locker(&tableLock);
        if (!failed) {
            failed = true;
            failure = reason;
        }
        why = failure;
        snapshot = streams;
    }

    wire->transport()->close();

    std::map<quint32, std::shared_ptr<StreamChannel> >::iterator it;
    for (it = snapshot.begin(); it != snapshot.end(); ++it) {
        StreamChannel* channel = it->second.get();
        QMutexLocker locker(&channel->lock);
        if (!channel->connectionLost) {
            channel->connectionLost = true;
            channel->lostReason = why;
        }
        channel->changed.wakeAll();
    }
}
