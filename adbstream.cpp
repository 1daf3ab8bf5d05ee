#include "adbstream.h"
#include "adberror.h"
#include "adblogging.h"
#include "adbmultiplexer.h"
#include <QElapsedTimer>
#include <QMutexLocker>

AdbStream::AdbStream(AdbMultiplexer* mux, const std::shared_ptr<StreamChannel>& channel, int timeoutMs)
    : mux(mux), channel(channel), timeoutMs(timeoutMs)
{
}

AdbStream::~AdbStream()
{
    try {
        close();
    } catch (const AdbError& e) {
        qCWarning(lcAdbStream) << "closing" << channel->destination << "failed:" << e.message();
    }
}

StreamChannel::State AdbStream::state() const
{
    QMutexLocker locker(&channel->lock);
    return channel->state;
}

quint32 AdbStream::remoteId() const
{
    QMutexLocker locker(&channel->lock);
    return channel->remoteId;
}

quint32 AdbStream::maxPayload() const
{
    return mux->maxPayload();
}

// Called with channel->lock held.
static void checkWritable(StreamChannel* channel)
{
    if (channel->connectionLost) {
        throw ConnectionClosedError(channel->lostReason);
    }
    if (channel->state != StreamChannel::Open) {
        throw StreamClosedError(QString("stream '%1' is closed").arg(channel->destination));
    }
}

// Called with channel->lock held; waits until a WRTE may be sent.
static void waitForCredit(StreamChannel* channel, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    for (;;) {
        checkWritable(channel);
        if (channel->writeCredit) {
            return;
        }
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            throw TimeoutError(QString("device did not acknowledge data on '%1' within %2ms")
                                   .arg(channel->destination).arg(timeoutMs));
        }
        channel->changed.wait(&channel->lock, remaining);
    }
}

void AdbStream::write(const QByteArray& data)
{
    if (data.isEmpty()) {
        QMutexLocker locker(&channel->lock);
        checkWritable(channel.get());
        return;
    }
    QMutexLocker writer(&channel->writeLock);

    int chunkSize = mux->maxPayload();
    int offset = 0;
    do {
        QByteArray chunk = data.mid(offset, chunkSize);
        quint32 remote;
        {
            QMutexLocker locker(&channel->lock);
            waitForCredit(channel.get(), timeoutMs);
            channel->writeCredit = false;
            remote = channel->remoteId;
        }
        mux->send(AdbMessage(A_WRTE, channel->localId, remote, chunk));
        offset += chunk.size();
    } while (offset < data.size());

    QMutexLocker locker(&channel->lock);
    waitForCredit(channel.get(), timeoutMs);
}

bool AdbStream::read(QByteArray* data)
{
    return read(data, timeoutMs);
}

bool AdbStream::read(QByteArray* data, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    QMutexLocker locker(&channel->lock);
    while (channel->inbound.isEmpty()) {
        if (channel->connectionLost) {
            throw ConnectionClosedError(channel->lostReason);
        }
        if (channel->state == StreamChannel::Closed) {
            return false;
        }
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            throw TimeoutError(QString("no data on '%1' within %2ms").arg(channel->destination).arg(timeoutMs));
        }
        channel->changed.wait(&channel->lock, remaining);
    }

    *data = channel->inbound.dequeue();

    bool ack = channel->ackOwed && channel->inbound.size() < mux->queueDepth()
               && channel->state == StreamChannel::Open;
    if (ack) {
        channel->ackOwed = false;
    }
    quint32 remote = channel->remoteId;
    locker.unlock();

    if (ack) {
        mux->send(AdbMessage(A_OKAY, channel->localId, remote));
    }
    return true;
}

QByteArray AdbStream::readAll()
{
    QByteArray all;
    QByteArray data;
    while (read(&data)) {
        all += data;
    }
    return all;
}

void AdbStream::close()
{
    quint32 remote;
    {
        QMutexLocker locker(&channel->lock);
        if (channel->connectionLost || channel->state == StreamChannel::Closed) {
            locker.unlock();
            mux->release(channel->localId);
            return;
        }
        channel->state = StreamChannel::Closing;
        remote = channel->remoteId;
        channel->changed.wakeAll();
    }

    qCDebug(lcAdbStream) << "closing stream" << channel->localId << channel->destination;
    try {
        mux->send(AdbMessage(A_CLSE, channel->localId, remote));
    } catch (const AdbError&) {
        mux->release(channel->localId);
        throw;
    }

    QElapsedTimer timer;
    timer.start();
    QMutexLocker locker(&channel->lock);
    while (channel->state != StreamChannel::Closed && !channel->connectionLost) {
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            qCWarning(lcAdbStream) << "device did not confirm closing" << channel->destination;
            channel->state = StreamChannel::Closed;
            break;
        }
        channel->changed.wait(&channel->lock, remaining);
    }
    locker.unlock();
    mux->release(channel->localId);
}
